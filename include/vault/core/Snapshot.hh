#pragma once

#include "vault/core/Interaction.hh"
#include "vault/core/SessionManager.hh"
#include "vault/core/Spatial.hh"
#include "vault/core/World.hh"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace vault {

struct ObjectView {
    std::string id;
    bool visible = true;
    VisualFeedback feedback = VisualFeedback::Normal;
};

struct MessageView {
    std::string text;
    MessageTone tone = MessageTone::Info;
    double expiresAt = 0.0; // simulation-clock seconds
};

// Modal text for the states that show one
struct Headline {
    std::string title;
    std::string body;
};

// The idle body names `totalKeys`
std::optional<Headline> headlineFor(SessionState state, int totalKeys);

// Read-only view handed to presentation layers each tick
struct GameSnapshot {
    SessionState state = SessionState::Idle;
    bool running = false;
    double time = 0.0;

    float presenceLevel = 0.0f;
    float presenceMax = 0.0f;
    float presenceNormalized = 0.0f;

    int keysFound = 0;
    int totalKeys = 0;
    bool jumpscarePlayed = false;

    std::optional<MessageView> transientMessage;
    std::optional<std::string> hoverTarget;
    std::optional<Headline> headline;

    Vec3f playerPosition;
    float yaw = 0.0f;
    float pitch = 0.0f;

    bool muted = false;
    std::string sessionId;

    std::vector<ObjectView> objects;
};

void to_json(nlohmann::json& j, const ObjectView& view);
void to_json(nlohmann::json& j, const MessageView& view);
void to_json(nlohmann::json& j, const Headline& headline);
void to_json(nlohmann::json& j, const GameSnapshot& snapshot);

} // namespace vault
