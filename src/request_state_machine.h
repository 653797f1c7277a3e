#pragma once

#include <string>
#include <vector>

namespace chatgate {

/**
 * @brief Stages a proxied request passes through.
 */
enum class RequestState {
    RECEIVED,
    NORMALIZING,
    INVOKING,
    NORMALIZING_RESPONSE,
    RESPONDING,
    FAILED
};

auto StateToString(RequestState state) -> std::string;

/**
 * @brief Valid transitions for a single request.
 *
 * RECEIVED -> NORMALIZING -> INVOKING -> NORMALIZING_RESPONSE -> RESPONDING,
 * with FAILED reachable from NORMALIZING or INVOKING and leading only to RESPONDING.
 */
class RequestStateMachine {
public:
    static auto IsTransitionAllowed(RequestState current, RequestState next) -> bool;

    /**
     * @brief Checks if a state is terminal (no further transitions allowed).
     */
    static auto IsTerminal(RequestState state) -> bool;
};

/**
 * @brief Records the path one request takes; rejects illegal transitions.
 */
class RequestLifecycle {
public:
    RequestLifecycle() : history_{RequestState::RECEIVED} {}

    // Throws std::logic_error once the request has been answered, or on a
    // transition the state machine does not allow.
    auto Advance(RequestState next) -> void;

    auto Answered() const -> bool { return RequestStateMachine::IsTerminal(Current()); }

    auto Current() const -> RequestState { return history_.back(); }
    auto History() const -> const std::vector<RequestState>& { return history_; }

private:
    std::vector<RequestState> history_;
};

} // namespace chatgate
