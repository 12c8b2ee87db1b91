#pragma once

#include "vault/core/GameConfig.hh"
#include "vault/core/Presence.hh"
#include "vault/core/World.hh"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vault {

struct ProgressState {
    int keysFound = 0;
    int totalKeys = 0;
    bool jumpscarePlayed = false;

    bool allKeysFound() const { return keysFound >= totalKeys; }
};

// Presentation hint carried alongside each message
enum class MessageTone : std::uint8_t {
    Info,
    Reward,
    Danger,
    Muted,
};

enum class OutcomeKind : std::uint8_t {
    Ignored,      // not running, or the target vanished
    Missed,       // nothing under the crosshair
    ExitLocked,
    Escaped,
    Repeat,
    KeyFound,
    Examined,     // first look at an object with no key
    Scare,
    Unconfigured, // interactable without a rule record
};

std::string messageToneToString(MessageTone tone);
std::string outcomeKindToString(OutcomeKind kind);

struct VisualEffect {
    std::string objectId;
    VisualFeedback feedback = VisualFeedback::Normal;
};

struct InteractionOutcome {
    OutcomeKind kind = OutcomeKind::Ignored;
    std::string message;
    MessageTone tone = MessageTone::Info;
    float cost = 0.0f; // presence added by this interaction
    std::vector<VisualEffect> effects;
    bool scare = false; // fire the discrete audio cue
    bool win = false;
};

// Applies the progression rules to one deliberate interaction. Mutates the
// level's records and feedback, the presence level and the progress state;
// the session transition on a win is left to the caller.
class InteractionSystem {
  public:
    explicit InteractionSystem(const PresenceConfig& costs);

    InteractionOutcome interact(const std::optional<std::string>& targetId, Level& level, PresenceModel& presence,
                                ProgressState& progress) const;

  private:
    InteractionOutcome interactWithExit(const InteractionRecord& record, PresenceModel& presence,
                                        const ProgressState& progress) const;
    InteractionOutcome interactFirstTime(WorldObject& object, InteractionRecord& record, PresenceModel& presence,
                                         ProgressState& progress) const;

    PresenceConfig costs_;
};

} // namespace vault
