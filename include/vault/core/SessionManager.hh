#pragma once

#include <cstdint>
#include <string>

namespace vault {

enum class SessionState : std::uint8_t {
    Idle,
    Running,
    Paused,
    Won,
    Lost,
};

std::string sessionStateToString(SessionState state);

// Owns the session lifecycle. Won and Lost are terminal for a run; the only
// way out is back to Idle, from where a new run may start.
class SessionManager {
  public:
    // Throws VaultException on a transition outside the table. A transition
    // to the current state is a no-op.
    void transition(SessionState target);

    SessionState current() const { return current_; }
    bool isRunning() const { return current_ == SessionState::Running; }

    static bool isValidTransition(SessionState from, SessionState to);

  private:
    SessionState current_ = SessionState::Idle;
};

} // namespace vault
