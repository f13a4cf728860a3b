#ifndef LOCKSTEP_TICK_MEMBER_REGISTRY_H_
#define LOCKSTEP_TICK_MEMBER_REGISTRY_H_

#include <chrono>
#include <memory>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "tick/tick_types.h"

namespace Lockstep {

struct MemberRecord {
    SpeedFactor speed_factor = 1;
    MemberState state = MemberState::RUNNING;
    std::shared_ptr<ReplyChannel> reply;
    /// last time this member was ticked (registration time until the first tick)
    std::chrono::steady_clock::time_point last_tick;
};

inline SpeedFactor NormalizeSpeedFactor(SpeedFactor speed_factor) {
    return speed_factor == 0 ? 1 : speed_factor;
}

inline bool IsDue(StepCount step, SpeedFactor speed_factor) {
    return step % NormalizeSpeedFactor(speed_factor) == 0;
}

/// Number of steps in 1..steps the member is due on
inline StepCount DueStepsUpTo(StepCount steps, SpeedFactor speed_factor) {
    return steps / NormalizeSpeedFactor(speed_factor);
}

inline bool IsReady(MemberState state) {
    return state == MemberState::FINISHED || state == MemberState::HIDDEN;
}

/// One tick to send: Hidden members get a HIDDEN_TICK so a later wait ignores it
struct TickDelivery {
    std::shared_ptr<ReplyChannel> reply;
    bool hidden = false;
};

/**
 * Live members keyed by id. Not thread-safe: the coordination loop is the only
 * owner. Ids come from a counter that is never decremented, so an id is never
 * handed out twice even after its member unregisters.
 */
class MemberRegistry {
public:
    using Clock = std::chrono::steady_clock;

    MemberRegistry() = default;
    MemberRegistry(const MemberRegistry&) = delete;
    MemberRegistry& operator=(const MemberRegistry&) = delete;

    /// Inserts a RUNNING member and returns its freshly assigned id
    MemberId Register(SpeedFactor speed_factor, std::shared_ptr<ReplyChannel> reply,
                      Clock::time_point now);

    /// @return false if the id is not registered (not an error)
    bool Unregister(MemberId id);

    /**
     * Leaving HIDDEN empties the member's reply slot first, so the next tick it
     * waits for is one taken while it gated the step.
     * @return false if the id is not registered (not an error)
     */
    bool ChangeState(MemberId id, MemberState state);

    const MemberRecord* Find(MemberId id) const;

    /// Ids of every member due on the given step
    std::vector<MemberId> CollectDue(StepCount step) const;

    /// True if every listed member is FINISHED or HIDDEN. Unknown ids count as ready.
    bool AllReady(const std::vector<MemberId>& ids) const;

    /**
     * Records a delivered tick for the listed members: FINISHED goes back to
     * RUNNING, HIDDEN stays HIDDEN, last_tick becomes now.
     * @return where to send the tick, Running members excluded
     */
    std::vector<TickDelivery> MarkTicked(const std::vector<MemberId>& ids, Clock::time_point now);

    // Closes every member's reply channel, waking any blocked waiter
    void CloseAll();

    size_t size() const { return members_.size(); }
    bool empty() const { return members_.empty(); }
    MemberId next_id() const { return next_id_; }

private:
    absl::flat_hash_map<MemberId, MemberRecord> members_;
    MemberId next_id_ = 0;
};

} // namespace Lockstep

#endif // LOCKSTEP_TICK_MEMBER_REGISTRY_H_
