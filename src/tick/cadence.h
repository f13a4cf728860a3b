#ifndef LOCKSTEP_TICK_CADENCE_H_
#define LOCKSTEP_TICK_CADENCE_H_

#include <chrono>
#include <cstdint>
#include <string>

namespace Lockstep {

struct LockstepConfig;

/**
 * Decides whether the master clock may start a new step.
 *
 * Configured either by a target rate (period = 1 / fps) or by an explicit
 * interval. The boundary is inclusive: a step is due once
 * now >= last_step + period.
 */
class CadencePolicy {
public:
    using Clock = std::chrono::steady_clock;

    enum class Mode {
        FPS,
        INTERVAL
    };

    /// Throws std::invalid_argument if fps is 0
    static CadencePolicy Fps(uint32_t fps);

    /// Throws std::invalid_argument if interval is not positive
    static CadencePolicy Interval(std::chrono::nanoseconds interval);

    /// Builds the policy from the cadence section of the configuration
    static CadencePolicy FromConfig(const LockstepConfig& config);

    bool IsStepDue(Clock::time_point last_step, Clock::time_point now) const {
        return now >= last_step + period_;
    }

    Clock::time_point NextStepAt(Clock::time_point last_step) const {
        return last_step + period_;
    }

    std::chrono::nanoseconds Period() const { return period_; }
    Mode mode() const { return mode_; }
    uint32_t fps() const { return fps_; }

    std::string ToString() const;

private:
    CadencePolicy(Mode mode, uint32_t fps, std::chrono::nanoseconds period)
        : mode_(mode), fps_(fps), period_(period) {}

    Mode mode_;
    uint32_t fps_;  // 0 in INTERVAL mode
    std::chrono::nanoseconds period_;
};

} // namespace Lockstep

#endif // LOCKSTEP_TICK_CADENCE_H_
