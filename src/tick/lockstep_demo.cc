#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "common/configuration.h"
#include "tick/cadence.h"
#include "tick/member_registry.h"
#include "tick/tick_manager.h"
#include "tick/tick_member.h"

namespace {

using Clock = std::chrono::steady_clock;

// Waits for ticks/speed_factor ticks, then turns hidden so it stops gating the others
bool RunWorker(const Lockstep::TickManagerHandle& handle, Lockstep::SpeedFactor speed_factor,
               int ticks, std::chrono::milliseconds reply_timeout) {
    try {
        Lockstep::TickMember member(handle, speed_factor, reply_timeout);
        Lockstep::StepCount waits = Lockstep::DueStepsUpTo(static_cast<Lockstep::StepCount>(ticks),
                                                          member.speed_factor());
        Clock::time_point start = Clock::now();
        for (Lockstep::StepCount i = 0; i < waits; ++i) {
            if (!member.WaitForTick()) {
                LOG(WARNING) << "Member " << member.id() << " lost the manager after " << i << " ticks";
                return false;
            }
        }
        member.SetState(Lockstep::MemberState::HIDDEN);

        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
        LOG(INFO) << "Member " << member.id() << " (speed_factor=" << member.speed_factor() << ") "
                  << waits << " ticks in " << elapsed.count() / 1000.0 << "ms, last step "
                  << member.last_step()
                  << ", avg interval " << (waits > 0 ? elapsed.count() / 1000.0 / static_cast<double>(waits) : 0.0) << "ms";
        return true;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Worker failed: " << e.what();
        return false;
    }
}

// Receives ticks without ever blocking a step
bool RunObserver(const Lockstep::TickManagerHandle& handle, const std::atomic<bool>& done,
                 std::chrono::milliseconds reply_timeout) {
    try {
        Lockstep::TickMember member(handle, 1, reply_timeout);
        member.SetState(Lockstep::MemberState::HIDDEN);
        while (!done.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return true;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Observer failed: " << e.what();
        return false;
    }
}

} // end of namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();

    cxxopts::Options options("lockstep_demo", "Runs worker threads in lockstep on a fixed cadence");

    options.add_options()
        ("f,config", "YAML configuration file", cxxopts::value<std::string>())
        ("cadence_mode", "fps or interval", cxxopts::value<std::string>())
        ("fps", "Steps per second in fps mode", cxxopts::value<int>())
        ("interval_ms", "Step interval in interval mode", cxxopts::value<int>())
        ("command_queue_capacity", "Bounded command queue size", cxxopts::value<size_t>())
        ("poll_interval_us", "Longest idle wait of the coordination loop", cxxopts::value<int>())
        ("reply_timeout_ms", "Per-attempt reply timeout of members", cxxopts::value<int>())
        ("members", "Number of worker members", cxxopts::value<int>()->default_value("2"))
        ("speed_factors", "Comma separated speed factors, cycled over the members "
         "(default: member.default_speed_factor)", cxxopts::value<std::vector<size_t>>())
        ("hidden", "Number of hidden observer members", cxxopts::value<int>()->default_value("0"))
        ("ticks", "Master steps each worker runs for", cxxopts::value<int>()->default_value("60"))
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("h,help", "Print usage");

    auto arguments = options.parse(argc, argv);

    if (arguments.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    FLAGS_v = arguments["log_level"].as<int>();
    FLAGS_logtostderr = 1; // log only to console, no files

    // Configuration flags (including --config) are applied by the configuration layer
    Lockstep::Configuration& config = Lockstep::Configuration::getInstance();
    config.overrideFromCommandLine(argc, argv);
    if (!config.validate()) {
        for (const auto& error : config.getValidationErrors()) {
            LOG(ERROR) << "Config validation error: " << error;
        }
        return 1;
    }

    int num_members = arguments["members"].as<int>();
    int num_hidden = arguments["hidden"].as<int>();
    int ticks = arguments["ticks"].as<int>();
    const Lockstep::LockstepConfig& cfg = config.config();
    std::vector<size_t> speed_factors;
    if (arguments.count("speed_factors")) {
        speed_factors = arguments["speed_factors"].as<std::vector<size_t>>();
    } else {
        speed_factors.push_back(cfg.member.default_speed_factor.get());
    }
    if (num_members < 1 || num_hidden < 0 || ticks < 1 || speed_factors.empty()) {
        LOG(ERROR) << "--members and --ticks must be positive, --hidden non-negative, "
                   << "--speed_factors non-empty";
        return 1;
    }

    std::chrono::milliseconds reply_timeout(cfg.member.reply_timeout_ms.get());

    Lockstep::CadencePolicy cadence = Lockstep::CadencePolicy::FromConfig(cfg);
    auto [manager, handle] = Lockstep::TickManager::Create(
        cadence, Lockstep::TickManagerOptions::FromConfig(cfg));
    LOG(INFO) << "Running " << num_members << " members (" << num_hidden << " hidden) for "
              << ticks << " steps, " << cadence.ToString();

    std::atomic<bool> done{false};
    std::atomic<int> failures{0};
    std::vector<std::thread> observers;
    for (int i = 0; i < num_hidden; ++i) {
        observers.emplace_back([&handle = handle, &done, &failures, reply_timeout]() {
            if (!RunObserver(handle, done, reply_timeout)) failures++;
        });
    }

    std::vector<std::thread> workers;
    for (int i = 0; i < num_members; ++i) {
        Lockstep::SpeedFactor speed_factor = speed_factors[i % speed_factors.size()];
        workers.emplace_back([&handle = handle, &failures, speed_factor, ticks, reply_timeout]() {
            if (!RunWorker(handle, speed_factor, ticks, reply_timeout)) failures++;
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }
    done.store(true, std::memory_order_release);
    for (auto& observer : observers) {
        observer.join();
    }

    LOG(INFO) << "Manager advanced " << manager->GetStepCount() << " steps";
    manager.reset();

    return failures.load() == 0 ? 0 : 1;
}
