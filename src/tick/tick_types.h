#ifndef LOCKSTEP_TICK_TYPES_H_
#define LOCKSTEP_TICK_TYPES_H_

#include <cstdint>
#include <memory>
#include <ostream>

#include "tick/channel.h"

namespace Lockstep {

using MemberId = uint64_t;
using SpeedFactor = uint64_t;
using StepCount = uint64_t;

enum class MemberState {
    RUNNING,   // still working, blocks the step it is due on
    FINISHED,  // ready; goes back to RUNNING after the next tick
    HIDDEN     // always ready, never blocks
};

const char* MemberStateName(MemberState state);

inline std::ostream& operator<<(std::ostream& os, MemberState state) {
    return os << MemberStateName(state);
}

/// Sent from the coordination loop to a single member
struct TickReply {
    enum class Kind {
        SELF_ID,
        TICK,
        HIDDEN_TICK  // delivered while the member was Hidden, never releases a wait
    };

    Kind kind = Kind::TICK;
    // Assigned id for SELF_ID, step number for TICK and HIDDEN_TICK
    uint64_t value = 0;

    static TickReply SelfId(MemberId id) { return TickReply{Kind::SELF_ID, id}; }
    static TickReply Tick(StepCount step) { return TickReply{Kind::TICK, step}; }
    static TickReply HiddenTick(StepCount step) { return TickReply{Kind::HIDDEN_TICK, step}; }
};

// Single slot: at most one undelivered reply per member
using ReplyChannel = Channel<TickReply>;
inline constexpr size_t kReplyChannelCapacity = 1;

/// Commands accepted by the coordination loop
struct TickCommand {
    enum class Type {
        REGISTER,
        UNREGISTER,
        CHANGE_MEMBER_STATE,
        SHUTDOWN
    };

    Type type = Type::SHUTDOWN;
    MemberId id = 0;
    SpeedFactor speed_factor = 1;
    MemberState state = MemberState::RUNNING;
    std::shared_ptr<ReplyChannel> reply;

    static TickCommand Register(SpeedFactor speed_factor, std::shared_ptr<ReplyChannel> reply) {
        TickCommand cmd;
        cmd.type = Type::REGISTER;
        cmd.speed_factor = speed_factor;
        cmd.reply = std::move(reply);
        return cmd;
    }

    static TickCommand Unregister(MemberId id) {
        TickCommand cmd;
        cmd.type = Type::UNREGISTER;
        cmd.id = id;
        return cmd;
    }

    static TickCommand ChangeMemberState(MemberId id, MemberState state) {
        TickCommand cmd;
        cmd.type = Type::CHANGE_MEMBER_STATE;
        cmd.id = id;
        cmd.state = state;
        return cmd;
    }

    static TickCommand Shutdown() { return TickCommand{}; }
};

using CommandChannel = Channel<TickCommand>;

} // namespace Lockstep

#endif // LOCKSTEP_TICK_TYPES_H_
