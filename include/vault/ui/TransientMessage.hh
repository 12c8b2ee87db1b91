#pragma once

#include "vault/core/Interaction.hh"

#include <string>

namespace vault {

/// Single-slot timed message. A new message replaces the current one and
/// restarts its timer. Times are simulation-clock seconds.
class TransientMessage {
  public:
    /// Display `text` until `now + duration`.
    void show(const std::string& text, MessageTone tone, double now, double duration);

    /// Expire the message once `now` reaches its deadline.
    void update(double now);

    bool active() const;

    /// Empty when nothing is shown.
    const std::string& text() const;
    MessageTone tone() const;
    double expiresAt() const;

    void clear();

  private:
    std::string text_;
    MessageTone tone_ = MessageTone::Info;
    double expiresAt_ = 0.0;
};

} // namespace vault
