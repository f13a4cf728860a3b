#ifndef LOCKSTEP_TICK_MANAGER_HANDLE_H_
#define LOCKSTEP_TICK_MANAGER_HANDLE_H_

#include <memory>

#include "tick/tick_types.h"

namespace Lockstep {

/**
 * Cheap, copyable capability for talking to a TickManager from any thread.
 * All sends return false once the manager has shut down.
 */
class TickManagerHandle {
public:
    explicit TickManagerHandle(std::shared_ptr<CommandChannel> commands);

    /// Sends a command to the coordination loop, blocking while the queue is full
    bool Send(TickCommand command) const;

    /// The assigned id arrives as a SELF_ID reply on `reply`
    bool Register(SpeedFactor speed_factor, std::shared_ptr<ReplyChannel> reply) const;
    bool Unregister(MemberId id) const;
    bool ChangeMemberState(MemberId id, MemberState state) const;
    bool Shutdown() const;

    bool IsConnected() const { return !commands_->IsClosed(); }

private:
    std::shared_ptr<CommandChannel> commands_;
};

} // namespace Lockstep

#endif // LOCKSTEP_TICK_MANAGER_HANDLE_H_
