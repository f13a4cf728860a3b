#ifndef LOCKSTEP_TICK_MEMBER_H_
#define LOCKSTEP_TICK_MEMBER_H_

#include <atomic>
#include <chrono>
#include <memory>

#include "tick/tick_manager_handle.h"
#include "tick/tick_types.h"

namespace Lockstep {

/**
 * One participant of the barrier, owned by the thread that does the work.
 *
 * Registers itself on construction and unregisters on destruction. A typical
 * worker loops on WaitForTick() and does one unit of work per tick.
 */
class TickMember {
public:
    static constexpr std::chrono::milliseconds kDefaultReplyTimeout{1000};

    /**
     * Registers with the manager and blocks until the id arrives.
     * Throws std::runtime_error if no valid id arrives within reply_timeout.
     */
    explicit TickMember(TickManagerHandle handle, SpeedFactor speed_factor = 1,
                        std::chrono::milliseconds reply_timeout = kDefaultReplyTimeout);
    ~TickMember();

    TickMember(const TickMember&) = delete;
    TickMember& operator=(const TickMember&) = delete;

    /**
     * Marks this member Finished and blocks until the next tick.
     * Timeouts are retried; only a tick taken while this member was visible
     * ends the wait, ticks queued while it was Hidden are skipped.
     * @return true on a tick, false once the manager has shut down
     */
    bool WaitForTick();

    /// Best effort; silently does nothing if the manager is gone
    void SetState(MemberState state);

    MemberId id() const { return id_; }
    SpeedFactor speed_factor() const { return speed_factor_; }
    /// Step number of the last tick received, 0 before the first one
    StepCount last_step() const { return last_step_.load(std::memory_order_acquire); }

private:
    MemberId ExpectId();

    TickManagerHandle handle_;
    std::shared_ptr<ReplyChannel> reply_;
    const SpeedFactor speed_factor_;
    const std::chrono::milliseconds reply_timeout_;
    MemberId id_;
    std::atomic<StepCount> last_step_{0};
};

} // namespace Lockstep

#endif // LOCKSTEP_TICK_MEMBER_H_
