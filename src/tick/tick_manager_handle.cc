#include "tick_manager_handle.h"

namespace Lockstep {

TickManagerHandle::TickManagerHandle(std::shared_ptr<CommandChannel> commands)
    : commands_(std::move(commands)) {}

bool TickManagerHandle::Send(TickCommand command) const {
    return commands_->Send(std::move(command));
}

bool TickManagerHandle::Register(SpeedFactor speed_factor, std::shared_ptr<ReplyChannel> reply) const {
    return Send(TickCommand::Register(speed_factor, std::move(reply)));
}

bool TickManagerHandle::Unregister(MemberId id) const {
    return Send(TickCommand::Unregister(id));
}

bool TickManagerHandle::ChangeMemberState(MemberId id, MemberState state) const {
    return Send(TickCommand::ChangeMemberState(id, state));
}

bool TickManagerHandle::Shutdown() const {
    return Send(TickCommand::Shutdown());
}

} // namespace Lockstep
