#pragma once

#include "vault/utils/ErrorHandling.hh"

#include <filesystem>
#include <string_view>

namespace vault {

struct PlayerConfig {
    float height = 1.6f;          // eye height; the collision box is this tall, centred on the eye
    float moveSpeed = 4.0f;       // units per second
    float lookSensitivity = 0.002f; // radians per look-input unit
    float collisionRadius = 0.4f;
    float interactRange = 3.0f;
    float spawnX = 0.0f;
    float spawnZ = 5.0f;
    float spawnYaw = 3.14159265f; // facing +Z, toward the exit
};

struct PresenceConfig {
    float maxLevel = 100.0f;
    float decayRate = 0.5f;     // per second
    float moveCost = 0.005f;    // per tick with movement input
    float interactCost = 3.0f;
    float minorCost = 1.0f;     // missed or repeated interactions
    float scarePenalty = 30.0f;
};

struct WorldConfig {
    float sizeX = 12.0f;
    float sizeY = 5.0f;
    float sizeZ = 12.0f;
};

struct SessionConfig {
    float messageDuration = 3.5f; // seconds
    float maxDeltaTime = 0.1f;    // seconds; larger host stalls are clamped
};

struct AudioConfig {
    float ambientBaseDb = -30.0f;
    float ambientTenseDb = -20.0f;
    float pulseBaseHz = 1.0f;
    float pulseTenseHz = 5.0f;
    float pulseBaseDb = -20.0f;
    float pulseTenseDb = -5.0f;
    float scareCueDb = -10.0f;
    float rampDownSeconds = 1.0f;
};

struct GameConfig {
    PlayerConfig player;
    PresenceConfig presence;
    WorldConfig world;
    SessionConfig session;
    AudioConfig audio;
};

// Parse TOML text into a GameConfig. Absent keys keep their defaults;
// wrong types and out-of-range values are errors.
Result<GameConfig> parseGameConfig(std::string_view tomlContent, std::string_view sourceName = "string");

Result<GameConfig> loadGameConfig(const std::filesystem::path& path);

// Range checks shared by both entry points.
Result<void> validateGameConfig(const GameConfig& config);

} // namespace vault
