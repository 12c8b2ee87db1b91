#include "vault/core/Snapshot.hh"

#include "vault/core/JsonTypes.hh"

namespace vault {

std::optional<Headline> headlineFor(SessionState state, int totalKeys) {
    switch (state) {
        case SessionState::Idle:
            return Headline{"THE SILENT VAULT", "You are trapped. Find the " + keyCountPhrase(totalKeys) +
                                                    " to escape before the entity's presence consumes you. "
                                                    "Movement and interaction increase the risk."};
        case SessionState::Won:
            return Headline{"ACCESS GRANTED", "All keys inserted. The final lock clicks open. You survived the vault."};
        case SessionState::Lost:
            return Headline{"SEALED IN", "The Presence consumed you. The vault door slams shut. Game Over."};
        default:
            return std::nullopt;
    }
}

void to_json(nlohmann::json& j, const ObjectView& view) {
    j = nlohmann::json{{"id", view.id}, {"visible", view.visible}, {"feedback", visualFeedbackToString(view.feedback)}};
}

void to_json(nlohmann::json& j, const MessageView& view) {
    j = nlohmann::json{
        {"text", view.text}, {"tone", messageToneToString(view.tone)}, {"expiresAt", view.expiresAt}};
}

void to_json(nlohmann::json& j, const Headline& headline) {
    j = nlohmann::json{{"title", headline.title}, {"body", headline.body}};
}

void to_json(nlohmann::json& j, const GameSnapshot& snapshot) {
    j = nlohmann::json{
        {"state", sessionStateToString(snapshot.state)},
        {"running", snapshot.running},
        {"time", snapshot.time},
        {"presence",
         {{"level", snapshot.presenceLevel}, {"max", snapshot.presenceMax}, {"normalized", snapshot.presenceNormalized}}},
        {"progress",
         {{"keysFound", snapshot.keysFound},
          {"totalKeys", snapshot.totalKeys},
          {"jumpscarePlayed", snapshot.jumpscarePlayed}}},
        {"player", {{"position", snapshot.playerPosition}, {"yaw", snapshot.yaw}, {"pitch", snapshot.pitch}}},
        {"muted", snapshot.muted},
        {"sessionId", snapshot.sessionId},
        {"objects", snapshot.objects},
    };

    j["transientMessage"] = snapshot.transientMessage ? nlohmann::json(*snapshot.transientMessage) : nlohmann::json();
    j["hoverTarget"] = snapshot.hoverTarget ? nlohmann::json(*snapshot.hoverTarget) : nlohmann::json();
    j["headline"] = snapshot.headline ? nlohmann::json(*snapshot.headline) : nlohmann::json();
}

} // namespace vault
