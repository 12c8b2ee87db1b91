#include "vault/core/Interaction.hh"

#include "vault/core/Log.hh"

namespace vault {

namespace {

constexpr std::string_view kMissedMessage = "You touch the air. Nothing happens.";
constexpr std::string_view kRepeatFallback = "You've already searched here.";
constexpr std::string_view kScareMessage = "A cold terror grips you!";
constexpr std::string_view kUnconfiguredMessage = "Nothing happens.";
constexpr std::string_view kEscapedMessage = "All keys inserted. The final lock clicks open.";

} // namespace

std::string messageToneToString(MessageTone tone) {
    switch (tone) {
        case MessageTone::Info:
            return "Info";
        case MessageTone::Reward:
            return "Reward";
        case MessageTone::Danger:
            return "Danger";
        case MessageTone::Muted:
            return "Muted";
        default:
            return "Unknown";
    }
}

std::string outcomeKindToString(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Ignored:
            return "Ignored";
        case OutcomeKind::Missed:
            return "Missed";
        case OutcomeKind::ExitLocked:
            return "ExitLocked";
        case OutcomeKind::Escaped:
            return "Escaped";
        case OutcomeKind::Repeat:
            return "Repeat";
        case OutcomeKind::KeyFound:
            return "KeyFound";
        case OutcomeKind::Examined:
            return "Examined";
        case OutcomeKind::Scare:
            return "Scare";
        case OutcomeKind::Unconfigured:
            return "Unconfigured";
        default:
            return "Unknown";
    }
}

InteractionSystem::InteractionSystem(const PresenceConfig& costs) : costs_(costs) {}

InteractionOutcome InteractionSystem::interact(const std::optional<std::string>& targetId, Level& level,
                                               PresenceModel& presence, ProgressState& progress) const {
    InteractionOutcome outcome;

    if (!targetId) {
        outcome.kind = OutcomeKind::Missed;
        outcome.message = kMissedMessage;
        outcome.tone = MessageTone::Muted;
        outcome.cost = costs_.minorCost;
        presence.applyCost(outcome.cost);
        return outcome;
    }

    WorldObject* object = level.find(*targetId);
    if (object == nullptr || object->kind != ObjectKind::Interactable) {
        return outcome;
    }

    InteractionRecord* record = level.record(*targetId);
    if (record == nullptr) {
        VAULT_LOG_WARN("Interactable '{}' has no interaction record", *targetId);
        outcome.kind = OutcomeKind::Unconfigured;
        outcome.message = kUnconfiguredMessage;
        outcome.tone = MessageTone::Muted;
        return outcome;
    }

    if (record->isExit) {
        return interactWithExit(*record, presence, progress);
    }

    if (record->examined) {
        outcome.kind = OutcomeKind::Repeat;
        outcome.message = record->repeatMessage.value_or(std::string(kRepeatFallback));
        outcome.cost = costs_.minorCost;
        presence.applyCost(outcome.cost);
        return outcome;
    }

    return interactFirstTime(*object, *record, presence, progress);
}

InteractionOutcome InteractionSystem::interactWithExit(const InteractionRecord& record, PresenceModel& presence,
                                                       const ProgressState& progress) const {
    InteractionOutcome outcome;
    if (progress.allKeysFound()) {
        outcome.kind = OutcomeKind::Escaped;
        outcome.message = kEscapedMessage;
        outcome.tone = MessageTone::Reward;
        outcome.win = true;
        return outcome;
    }

    outcome.kind = OutcomeKind::ExitLocked;
    outcome.message = record.rewardMessage;
    outcome.cost = costs_.interactCost;
    presence.applyCost(outcome.cost);
    return outcome;
}

InteractionOutcome InteractionSystem::interactFirstTime(WorldObject& object, InteractionRecord& record,
                                                        PresenceModel& presence, ProgressState& progress) const {
    InteractionOutcome outcome;
    record.examined = true;

    outcome.kind = OutcomeKind::Examined;
    outcome.message = record.rewardMessage;

    if (record.hasKey) {
        ++progress.keysFound;
        outcome.kind = OutcomeKind::KeyFound;
        outcome.tone = MessageTone::Reward;
        object.feedback = VisualFeedback::Consumed;
        outcome.effects.push_back({object.id, VisualFeedback::Consumed});
        VAULT_LOG_DEBUG("Key found at '{}' ({}/{})", object.id, progress.keysFound, progress.totalKeys);
    }

    if (record.scareTrigger && !progress.jumpscarePlayed) {
        progress.jumpscarePlayed = true;
        VAULT_LOG_DEBUG("Scare triggered at '{}': {}", object.id, record.rewardMessage);
        outcome.kind = OutcomeKind::Scare;
        outcome.message = kScareMessage;
        outcome.tone = MessageTone::Danger;
        outcome.scare = true;
        outcome.cost = costs_.scarePenalty;
        object.visible = false;
        object.feedback = VisualFeedback::Hidden;
        outcome.effects.push_back({object.id, VisualFeedback::Hidden});
    } else {
        outcome.cost = costs_.interactCost;
    }

    presence.applyCost(outcome.cost);
    return outcome;
}

} // namespace vault
