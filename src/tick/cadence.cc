#include "cadence.h"

#include <sstream>
#include <stdexcept>

#include "common/configuration.h"

namespace Lockstep {

CadencePolicy CadencePolicy::Fps(uint32_t fps) {
    if (fps == 0) {
        throw std::invalid_argument("Cadence fps must be positive");
    }
    auto period = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::duration<double>(1.0 / static_cast<double>(fps)));
    return CadencePolicy(Mode::FPS, fps, period);
}

CadencePolicy CadencePolicy::Interval(std::chrono::nanoseconds interval) {
    if (interval <= std::chrono::nanoseconds::zero()) {
        throw std::invalid_argument("Cadence interval must be positive");
    }
    return CadencePolicy(Mode::INTERVAL, 0, interval);
}

CadencePolicy CadencePolicy::FromConfig(const LockstepConfig& config) {
    const std::string mode = config.cadence.normalized_mode();
    if (mode == "fps") {
        int fps = config.cadence.fps.get();
        if (fps <= 0) {
            throw std::invalid_argument("Cadence fps must be positive, got " + std::to_string(fps));
        }
        return Fps(static_cast<uint32_t>(fps));
    }
    if (mode == "interval") {
        return Interval(std::chrono::milliseconds(config.cadence.interval_ms.get()));
    }
    throw std::invalid_argument("Unknown cadence mode: " + mode);
}

std::string CadencePolicy::ToString() const {
    std::ostringstream os;
    if (mode_ == Mode::FPS) {
        os << "fps=" << fps_;
    } else {
        os << "interval";
    }
    os << " period=" << period_.count() << "ns";
    return os.str();
}

} // namespace Lockstep
