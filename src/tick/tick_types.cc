#include "tick_types.h"

namespace Lockstep {

const char* MemberStateName(MemberState state) {
    switch (state) {
        case MemberState::RUNNING:
            return "Running";
        case MemberState::FINISHED:
            return "Finished";
        case MemberState::HIDDEN:
            return "Hidden";
    }
    return "Unknown";
}

} // namespace Lockstep
