#ifndef LOCKSTEP_CONFIGURATION_H_
#define LOCKSTEP_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace YAML {
class Node;
}

namespace Lockstep {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct LockstepConfig {
    // Master clock
    struct Cadence {
        // Supported modes: fps, interval
        ConfigValue<std::string> mode{"fps", "LOCKSTEP_CADENCE_MODE"};
        ConfigValue<int> fps{60, "LOCKSTEP_CADENCE_FPS"};
        ConfigValue<int> interval_ms{16, "LOCKSTEP_CADENCE_INTERVAL_MS"};

        // mode, lowercased; "FPS" and "fps" select the same cadence
        std::string normalized_mode() const;
    } cadence;

    // Coordination loop
    struct Manager {
        ConfigValue<size_t> command_queue_capacity{10, "LOCKSTEP_COMMAND_QUEUE_CAPACITY"};
        // Upper bound on how long the loop waits for a command before re-checking the gate
        ConfigValue<int> poll_interval_us{1000, "LOCKSTEP_POLL_INTERVAL_US"};
    } manager;

    // Member proxies
    struct Member {
        ConfigValue<int> reply_timeout_ms{1000, "LOCKSTEP_REPLY_TIMEOUT_MS"};
        ConfigValue<size_t> default_speed_factor{1, "LOCKSTEP_DEFAULT_SPEED_FACTOR"};
    } member;
};

/**
 * Configuration loader. getInstance() serves binaries that want one shared
 * configuration; libraries and tests construct their own.
 */
class Configuration {
public:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Override with command line arguments
    void overrideFromCommandLine(int argc, char* argv[]);

    // Get the configuration
    const LockstepConfig& config() const { return config_; }
    LockstepConfig& config() { return config_; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    LockstepConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace Lockstep

#endif // LOCKSTEP_CONFIGURATION_H_
