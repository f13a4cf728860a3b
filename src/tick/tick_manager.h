#ifndef LOCKSTEP_TICK_MANAGER_H_
#define LOCKSTEP_TICK_MANAGER_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <utility>

#include "tick/cadence.h"
#include "tick/member_registry.h"
#include "tick/tick_manager_handle.h"
#include "tick/tick_types.h"

namespace Lockstep {

struct LockstepConfig;

struct TickManagerOptions {
    size_t command_queue_capacity = 10;
    // Longest the loop waits for a command before re-evaluating the gate
    std::chrono::microseconds poll_interval{1000};

    static TickManagerOptions FromConfig(const LockstepConfig& config);
};

/**
 * Owns the coordination loop: a background thread that drains commands,
 * advances the global step counter on the configured cadence, and releases
 * every member due on a step once all of them are ready.
 *
 * The member registry lives on the loop thread and is never shared, so no
 * lock is held while ticks are delivered. Destroying the manager sends
 * Shutdown and joins the loop.
 */
class TickManager {
public:
    using Clock = std::chrono::steady_clock;

    static std::pair<std::unique_ptr<TickManager>, TickManagerHandle> Create(
        const CadencePolicy& cadence, const TickManagerOptions& options = TickManagerOptions());

    ~TickManager();

    TickManager(const TickManager&) = delete;
    TickManager& operator=(const TickManager&) = delete;

    /// Number of accepted steps (wraps)
    StepCount GetStepCount() const { return published_step_.load(std::memory_order_acquire); }

    /// Number of currently registered members
    size_t GetMemberCount() const { return published_members_.load(std::memory_order_acquire); }

    bool IsRunning() const { return !commands_->IsClosed(); }

    const CadencePolicy& cadence() const { return cadence_; }

private:
    TickManager(const CadencePolicy& cadence, const TickManagerOptions& options);

    void Start();
    void CoordinationLoop();

    // Returns false when Shutdown was dequeued
    bool DrainCommands(MemberRegistry& registry);
    bool HandleCommand(MemberRegistry& registry, TickCommand& command);

    // Evaluates the gate for the next step and delivers ticks if it opens
    void TryAdvanceStep(MemberRegistry& registry, Clock::time_point now);
    void DeliverTicks(const std::vector<TickDelivery>& deliveries, StepCount step);

    const CadencePolicy cadence_;
    const TickManagerOptions options_;
    std::shared_ptr<CommandChannel> commands_;

    // Loop thread state
    StepCount step_ = 0;
    Clock::time_point last_step_;

    std::atomic<StepCount> published_step_{0};
    std::atomic<size_t> published_members_{0};

    std::thread loop_thread_;
};

} // namespace Lockstep

#endif // LOCKSTEP_TICK_MANAGER_H_
