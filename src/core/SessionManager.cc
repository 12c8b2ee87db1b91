#include "vault/core/SessionManager.hh"
#include "vault/core/Log.hh"
#include "vault/utils/ErrorHandling.hh"

namespace vault {

std::string sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::Idle:
            return "Idle";
        case SessionState::Running:
            return "Running";
        case SessionState::Paused:
            return "Paused";
        case SessionState::Won:
            return "Won";
        case SessionState::Lost:
            return "Lost";
        default:
            return "Unknown";
    }
}

bool SessionManager::isValidTransition(SessionState from, SessionState to) {
    if (from == to) {
        return true;
    }
    switch (from) {
        case SessionState::Idle:
            return to == SessionState::Running;
        case SessionState::Running:
            return to == SessionState::Paused || to == SessionState::Won || to == SessionState::Lost;
        case SessionState::Paused:
            return to == SessionState::Running;
        // Restart goes back through Idle
        case SessionState::Won:
        case SessionState::Lost:
            return to == SessionState::Idle;
        default:
            return false;
    }
}

void SessionManager::transition(SessionState target) {
    if (current_ == target) {
        return;
    }
    if (!isValidTransition(current_, target)) {
        throwError("Invalid session transition from " + sessionStateToString(current_) + " to " +
                   sessionStateToString(target));
    }

    VAULT_LOG_SESSION("Session: {} -> {}", sessionStateToString(current_), sessionStateToString(target));
    current_ = target;
}

} // namespace vault
