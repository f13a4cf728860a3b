#include "member_registry.h"

#include <glog/logging.h>

namespace Lockstep {

MemberId MemberRegistry::Register(SpeedFactor speed_factor, std::shared_ptr<ReplyChannel> reply,
                                  Clock::time_point now) {
    MemberId id = next_id_++;
    MemberRecord record;
    record.speed_factor = NormalizeSpeedFactor(speed_factor);
    record.state = MemberState::RUNNING;
    record.reply = std::move(reply);
    record.last_tick = now;
    members_.emplace(id, std::move(record));
    return id;
}

bool MemberRegistry::Unregister(MemberId id) {
    return members_.erase(id) > 0;
}

bool MemberRegistry::ChangeState(MemberId id, MemberState state) {
    auto it = members_.find(id);
    if (it == members_.end()) {
        return false;
    }
    MemberRecord& record = it->second;
    if (record.state == MemberState::HIDDEN && state != MemberState::HIDDEN && record.reply) {
        // Only the loop writes this channel, nothing can refill it before the state changes
        TickReply stale;
        while (record.reply->TryRecv(stale)) {
            VLOG(3) << "Member " << id << " dropped step " << stale.value << " queued while Hidden";
        }
    }
    record.state = state;
    return true;
}

const MemberRecord* MemberRegistry::Find(MemberId id) const {
    auto it = members_.find(id);
    return it == members_.end() ? nullptr : &it->second;
}

std::vector<MemberId> MemberRegistry::CollectDue(StepCount step) const {
    std::vector<MemberId> due;
    for (const auto& [id, record] : members_) {
        if (IsDue(step, record.speed_factor)) {
            due.push_back(id);
        }
    }
    return due;
}

bool MemberRegistry::AllReady(const std::vector<MemberId>& ids) const {
    for (MemberId id : ids) {
        const MemberRecord* record = Find(id);
        if (record != nullptr && !IsReady(record->state)) {
            return false;
        }
    }
    return true;
}

std::vector<TickDelivery> MemberRegistry::MarkTicked(const std::vector<MemberId>& ids,
                                                     Clock::time_point now) {
    std::vector<TickDelivery> deliveries;
    deliveries.reserve(ids.size());
    for (MemberId id : ids) {
        auto it = members_.find(id);
        if (it == members_.end()) {
            continue;
        }
        MemberRecord& record = it->second;
        switch (record.state) {
            case MemberState::FINISHED:
                record.state = MemberState::RUNNING;
                break;
            case MemberState::HIDDEN:
                break;
            case MemberState::RUNNING:
                // Callers gate on AllReady first
                VLOG(3) << "Member " << id << " ticked while Running, skipping";
                continue;
        }
        record.last_tick = now;
        deliveries.push_back(TickDelivery{record.reply, record.state == MemberState::HIDDEN});
    }
    return deliveries;
}

void MemberRegistry::CloseAll() {
    for (auto& [id, record] : members_) {
        if (record.reply) {
            record.reply->Close();
        }
    }
}

} // namespace Lockstep
