#include "tick_manager.h"

#include <glog/logging.h>

#include "common/configuration.h"

namespace Lockstep {

TickManagerOptions TickManagerOptions::FromConfig(const LockstepConfig& config) {
    TickManagerOptions options;
    options.command_queue_capacity = config.manager.command_queue_capacity.get();
    options.poll_interval = std::chrono::microseconds(config.manager.poll_interval_us.get());
    return options;
}

std::pair<std::unique_ptr<TickManager>, TickManagerHandle> TickManager::Create(
        const CadencePolicy& cadence, const TickManagerOptions& options) {
    std::unique_ptr<TickManager> manager(new TickManager(cadence, options));
    TickManagerHandle handle(manager->commands_);
    manager->Start();
    return {std::move(manager), std::move(handle)};
}

TickManager::TickManager(const CadencePolicy& cadence, const TickManagerOptions& options)
    : cadence_(cadence),
      options_(options),
      commands_(std::make_shared<CommandChannel>(
          options.command_queue_capacity == 0 ? 1 : options.command_queue_capacity)) {}

TickManager::~TickManager() {
    if (loop_thread_.joinable()) {
        // Fails only if the loop already stopped through a handle
        if (!commands_->Send(TickCommand::Shutdown())) {
            VLOG(1) << "[TickManager] Loop already stopped";
        }
        loop_thread_.join();
    }
}

void TickManager::Start() {
    loop_thread_ = std::thread([this]() {
        this->CoordinationLoop();
    });
}

void TickManager::CoordinationLoop() {
    MemberRegistry registry;
    last_step_ = Clock::now();
    LOG(INFO) << "[TickManager] Coordination loop started (" << cadence_.ToString() << ")";

    while (true) {
        try {
            if (!DrainCommands(registry)) {
                break;
            }

            Clock::time_point now = Clock::now();
            if (cadence_.IsStepDue(last_step_, now)) {
                TryAdvanceStep(registry, now);
            }
            published_members_.store(registry.size(), std::memory_order_release);

            // Sleep until the next step is due or a command arrives. Once the step
            // is due only a command can open the gate; the poll interval bounds the wait.
            now = Clock::now();
            Clock::time_point next_step = cadence_.NextStepAt(last_step_);
            Clock::time_point deadline = next_step > now ? next_step : now + options_.poll_interval;

            TickCommand command;
            if (commands_->RecvUntil(deadline, command) == RecvStatus::OK &&
                !HandleCommand(registry, command)) {
                break;
            }
        } catch (const std::exception& e) {
            LOG(ERROR) << "[TickManager] Error in coordination loop: " << e.what();
        }
    }

    commands_->Close();
    registry.CloseAll();
    published_members_.store(0, std::memory_order_release);
    LOG(INFO) << "[TickManager] Coordination loop stopped after " << step_ << " steps";
}

bool TickManager::DrainCommands(MemberRegistry& registry) {
    TickCommand command;
    while (commands_->TryRecv(command)) {
        if (!HandleCommand(registry, command)) {
            return false;
        }
    }
    return true;
}

bool TickManager::HandleCommand(MemberRegistry& registry, TickCommand& command) {
    switch (command.type) {
        case TickCommand::Type::REGISTER: {
            if (!command.reply) {
                LOG(WARNING) << "[TickManager] Register without a reply channel, ignoring";
                break;
            }
            MemberId id = registry.Register(command.speed_factor, command.reply, Clock::now());
            // The member gave up waiting (closed its channel) or the slot is taken;
            // a member that never learns its id would block every step it is due on.
            // Close() may land between TrySend's check and its write, hence the re-check.
            if (!command.reply->TrySend(TickReply::SelfId(id)) || command.reply->IsClosed()) {
                LOG(WARNING) << "[TickManager] Could not deliver id " << id << ", dropping member";
                registry.Unregister(id);
                break;
            }
            VLOG(1) << "[TickManager] Registered member " << id
                    << " speed_factor=" << NormalizeSpeedFactor(command.speed_factor);
            break;
        }
        case TickCommand::Type::UNREGISTER:
            if (registry.Unregister(command.id)) {
                VLOG(1) << "[TickManager] Unregistered member " << command.id;
            }
            break;
        case TickCommand::Type::CHANGE_MEMBER_STATE:
            if (registry.ChangeState(command.id, command.state)) {
                VLOG(3) << "[TickManager] Member " << command.id << " -> " << command.state;
            }
            break;
        case TickCommand::Type::SHUTDOWN:
            VLOG(1) << "[TickManager] Shutdown requested";
            return false;
    }
    return true;
}

void TickManager::TryAdvanceStep(MemberRegistry& registry, Clock::time_point now) {
    if (registry.empty()) {
        return;
    }

    StepCount candidate = step_ + 1;
    std::vector<MemberId> due = registry.CollectDue(candidate);
    if (!registry.AllReady(due)) {
        VLOG(3) << "[TickManager] Step " << candidate << " waiting on " << due.size() << " due members";
        return;
    }

    step_ = candidate;
    last_step_ = now;
    published_step_.store(step_, std::memory_order_release);

    if (due.empty()) {
        VLOG(3) << "[TickManager] Step " << step_ << " has no due members";
        return;
    }

    DeliverTicks(registry.MarkTicked(due, now), step_);
}

void TickManager::DeliverTicks(const std::vector<TickDelivery>& deliveries, StepCount step) {
    for (const auto& delivery : deliveries) {
        TickReply tick = delivery.hidden ? TickReply::HiddenTick(step) : TickReply::Tick(step);
        // A full slot still holds an unconsumed tick; the member sees that one instead
        if (!delivery.reply->TrySend(tick)) {
            VLOG(2) << "[TickManager] Tick " << step << " not delivered (slot full or member gone)";
        }
    }
    VLOG(2) << "[TickManager] Step " << step << " released " << deliveries.size() << " members";
}

} // namespace Lockstep
