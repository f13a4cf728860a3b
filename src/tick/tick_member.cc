#include "tick_member.h"

#include <stdexcept>
#include <string>

#include <glog/logging.h>

#include "tick/member_registry.h"

namespace Lockstep {

TickMember::TickMember(TickManagerHandle handle, SpeedFactor speed_factor,
                       std::chrono::milliseconds reply_timeout)
    : handle_(std::move(handle)),
      reply_(std::make_shared<ReplyChannel>(kReplyChannelCapacity)),
      speed_factor_(NormalizeSpeedFactor(speed_factor)),
      reply_timeout_(reply_timeout),
      id_(0) {
    if (!handle_.Register(speed_factor_, reply_)) {
        LOG(ERROR) << "[TickMember] Cannot register, tick manager is shut down";
        throw std::runtime_error("TickMember: tick manager is shut down");
    }
    id_ = ExpectId();
    VLOG(1) << "[TickMember] Registered as " << id_ << " speed_factor=" << speed_factor_;
}

TickMember::~TickMember() {
    // Don't fail if the manager is already gone
    if (!handle_.Unregister(id_)) {
        VLOG(1) << "[TickMember] " << id_ << " not unregistered, manager already stopped";
    }
}

MemberId TickMember::ExpectId() {
    TickReply reply;
    RecvStatus status = reply_->RecvFor(reply_timeout_, reply);
    if (status == RecvStatus::OK && reply.kind == TickReply::Kind::SELF_ID) {
        return reply.value;
    }

    // Tell the loop we stopped listening so a late registration gets dropped
    reply_->Close();
    TickReply late;
    if (reply_->TryRecv(late) && late.kind == TickReply::Kind::SELF_ID &&
        !handle_.Unregister(late.value)) {
        VLOG(1) << "[TickMember] Late id " << late.value << " not unregistered, manager gone";
    }

    std::string reason;
    if (status == RecvStatus::OK) {
        reason = "expected SelfId, got a tick";
    } else if (status == RecvStatus::TIMEOUT) {
        reason = "no id within " + std::to_string(reply_timeout_.count()) + "ms";
    } else {
        reason = "reply channel closed";
    }
    LOG(ERROR) << "[TickMember] Registration failed: " << reason;
    throw std::runtime_error("TickMember: registration failed: " + reason);
}

bool TickMember::WaitForTick() {
    SetState(MemberState::FINISHED);
    while (true) {
        TickReply reply;
        switch (reply_->RecvFor(reply_timeout_, reply)) {
            case RecvStatus::OK:
                if (reply.kind == TickReply::Kind::TICK) {
                    last_step_.store(reply.value, std::memory_order_release);
                    return true;
                }
                if (reply.kind == TickReply::Kind::HIDDEN_TICK) {
                    VLOG(3) << "[TickMember] " << id_ << " skipped step " << reply.value << " from while Hidden";
                    break;
                }
                LOG(WARNING) << "[TickMember] " << id_ << " got an unexpected reply while waiting for a tick";
                break;
            case RecvStatus::TIMEOUT:
                VLOG(3) << "[TickMember] " << id_ << " still waiting for a tick";
                break;
            case RecvStatus::CLOSED:
                VLOG(1) << "[TickMember] " << id_ << " stopped waiting, manager shut down";
                return false;
        }
    }
}

void TickMember::SetState(MemberState state) {
    if (!handle_.ChangeMemberState(id_, state)) {
        VLOG(2) << "[TickMember] " << id_ << " state change to " << state << " dropped, manager gone";
    }
}

} // namespace Lockstep
