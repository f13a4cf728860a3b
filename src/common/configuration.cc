#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <getopt.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Lockstep {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

std::string LockstepConfig::Cadence::normalized_mode() const {
    std::string value = mode.get();
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["lockstep"]) {
        LOG(WARNING) << "Configuration has no 'lockstep' root, keeping defaults";
        return;
    }
    auto root = yaml["lockstep"];

    // Cadence
    if (root["cadence"]) {
        auto cadence = root["cadence"];
        if (cadence["mode"]) config_.cadence.mode.set(cadence["mode"].as<std::string>());
        if (cadence["fps"]) config_.cadence.fps.set(cadence["fps"].as<int>());
        if (cadence["interval_ms"]) config_.cadence.interval_ms.set(cadence["interval_ms"].as<int>());
    }

    // Manager
    if (root["manager"]) {
        auto manager = root["manager"];
        if (manager["command_queue_capacity"]) config_.manager.command_queue_capacity.set(manager["command_queue_capacity"].as<size_t>());
        if (manager["poll_interval_us"]) config_.manager.poll_interval_us.set(manager["poll_interval_us"].as<int>());
    }

    // Member
    if (root["member"]) {
        auto member = root["member"];
        if (member["reply_timeout_ms"]) config_.member.reply_timeout_ms.set(member["reply_timeout_ms"].as<int>());
        if (member["default_speed_factor"]) config_.member.default_speed_factor.set(member["default_speed_factor"].as<size_t>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::overrideFromCommandLine(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"config", required_argument, 0, 'f'},
        {"cadence_mode", required_argument, 0, 'm'},
        {"fps", required_argument, 0, 'r'},
        {"interval_ms", required_argument, 0, 'i'},
        {"command_queue_capacity", required_argument, 0, 'q'},
        {"poll_interval_us", required_argument, 0, 'p'},
        {"reply_timeout_ms", required_argument, 0, 't'},
        // Accept the demo's own flags so getopt_long doesn't error
        {"members", required_argument, 0, 0},
        {"speed_factors", required_argument, 0, 0},
        {"hidden", required_argument, 0, 0},
        {"ticks", required_argument, 0, 0},
        {"log_level", required_argument, 0, 0},
        {"help", no_argument, 0, 0},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;
    // Suppress getopt_long default error messages for unknown options
    opterr = 0;
    // Reset getopt state in case other parsers were used earlier
    optind = 1;

    while ((c = getopt_long(argc, argv, "f:m:r:i:q:p:t:", long_options, &option_index)) != -1) {
        try {
            switch (c) {
                case 'f':
                    loadFromFile(optarg);
                    break;
                case 'm':
                    config_.cadence.mode.set(optarg);
                    break;
                case 'r':
                    config_.cadence.fps.set(std::stoi(optarg));
                    break;
                case 'i':
                    config_.cadence.interval_ms.set(std::stoi(optarg));
                    break;
                case 'q':
                    config_.manager.command_queue_capacity.set(std::stoull(optarg));
                    break;
                case 'p':
                    config_.manager.poll_interval_us.set(std::stoi(optarg));
                    break;
                case 't':
                    config_.member.reply_timeout_ms.set(std::stoi(optarg));
                    break;
                case 0:
                    // Known app flags we intentionally ignore here (handled elsewhere)
                    break;
                default:
                    // Ignore unknown flags to avoid noisy logs; app parser handles them
                    break;
            }
        } catch (const std::exception& e) {
            LOG(WARNING) << "Ignoring malformed value '" << optarg << "' for option "
                         << static_cast<char>(c) << ": " << e.what();
        }
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    const std::string mode = config_.cadence.normalized_mode();
    if (mode != "fps" && mode != "interval") {
        validation_errors_.push_back("Cadence mode must be 'fps' or 'interval', got '" + mode + "'");
    }

    if (mode == "fps" && config_.cadence.fps.get() < 1) {
        validation_errors_.push_back("Cadence fps must be at least 1");
    }

    if (mode == "interval" && config_.cadence.interval_ms.get() < 1) {
        validation_errors_.push_back("Cadence interval_ms must be at least 1");
    }

    if (config_.manager.command_queue_capacity.get() < 1) {
        validation_errors_.push_back("Command queue capacity must be at least 1");
    }

    if (config_.manager.poll_interval_us.get() < 1) {
        validation_errors_.push_back("Poll interval must be at least 1us");
    }

    if (config_.member.reply_timeout_ms.get() < 1) {
        validation_errors_.push_back("Reply timeout must be at least 1ms");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Lockstep
