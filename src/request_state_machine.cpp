#include "request_state_machine.h"
#include <stdexcept>

namespace chatgate {

auto StateToString(RequestState state) -> std::string {
    switch (state) {
        case RequestState::RECEIVED: return "RECEIVED";
        case RequestState::NORMALIZING: return "NORMALIZING";
        case RequestState::INVOKING: return "INVOKING";
        case RequestState::NORMALIZING_RESPONSE: return "NORMALIZING_RESPONSE";
        case RequestState::RESPONDING: return "RESPONDING";
        case RequestState::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

auto RequestStateMachine::IsTransitionAllowed(RequestState current, RequestState next) -> bool {
    switch (current) {
        case RequestState::RECEIVED:
            return next == RequestState::NORMALIZING;
        case RequestState::NORMALIZING:
            return next == RequestState::INVOKING || next == RequestState::FAILED;
        case RequestState::INVOKING:
            return next == RequestState::NORMALIZING_RESPONSE || next == RequestState::FAILED;
        case RequestState::NORMALIZING_RESPONSE:
        case RequestState::FAILED:
            return next == RequestState::RESPONDING;
        case RequestState::RESPONDING:
        default:
            return false;
    }
}

auto RequestStateMachine::IsTerminal(RequestState state) -> bool {
    return state == RequestState::RESPONDING;
}

auto RequestLifecycle::Advance(RequestState next) -> void {
    if (Answered()) {
        throw std::logic_error("Request already answered; cannot move to " + StateToString(next));
    }
    if (!RequestStateMachine::IsTransitionAllowed(Current(), next)) {
        throw std::logic_error("Invalid request state transition: " + StateToString(Current()) +
                               " -> " + StateToString(next));
    }
    history_.push_back(next);
}

} // namespace chatgate
