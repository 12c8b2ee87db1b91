#include "vault/core/GameConfig.hh"

#include "vault/core/DataLoader.hh"
#include "vault/core/Log.hh"

#include <string>

namespace vault {

namespace {

// Overwrite `out` when the key is present; a type mismatch is an error.
Result<void> readFloat(const DataLoader& doc, std::string_view key, float& out) {
    if (!doc.hasKey(key)) {
        return Result<void>::ok();
    }
    auto value = doc.getFloat(key);
    if (value.isError()) {
        return Result<void>::error(value.code(), value.message());
    }
    out = static_cast<float>(value.value());
    return Result<void>::ok();
}

Result<GameConfig> fromDocument(const DataLoader& doc) {
    GameConfig config;

    const std::pair<std::string_view, float*> keys[] = {
        {"player.height", &config.player.height},
        {"player.move_speed", &config.player.moveSpeed},
        {"player.look_sensitivity", &config.player.lookSensitivity},
        {"player.collision_radius", &config.player.collisionRadius},
        {"player.interact_range", &config.player.interactRange},
        {"player.spawn_x", &config.player.spawnX},
        {"player.spawn_z", &config.player.spawnZ},
        {"player.spawn_yaw", &config.player.spawnYaw},
        {"presence.max_level", &config.presence.maxLevel},
        {"presence.decay_rate", &config.presence.decayRate},
        {"presence.move_cost", &config.presence.moveCost},
        {"presence.interact_cost", &config.presence.interactCost},
        {"presence.minor_cost", &config.presence.minorCost},
        {"presence.scare_penalty", &config.presence.scarePenalty},
        {"world.size_x", &config.world.sizeX},
        {"world.size_y", &config.world.sizeY},
        {"world.size_z", &config.world.sizeZ},
        {"session.message_duration", &config.session.messageDuration},
        {"session.max_delta_time", &config.session.maxDeltaTime},
        {"audio.ambient_base_db", &config.audio.ambientBaseDb},
        {"audio.ambient_tense_db", &config.audio.ambientTenseDb},
        {"audio.pulse_base_hz", &config.audio.pulseBaseHz},
        {"audio.pulse_tense_hz", &config.audio.pulseTenseHz},
        {"audio.pulse_base_db", &config.audio.pulseBaseDb},
        {"audio.pulse_tense_db", &config.audio.pulseTenseDb},
        {"audio.scare_cue_db", &config.audio.scareCueDb},
        {"audio.ramp_down_seconds", &config.audio.rampDownSeconds},
    };

    for (const auto& [key, field] : keys) {
        auto read = readFloat(doc, key, *field);
        if (read.isError()) {
            return Result<GameConfig>::error(read.code(), read.message());
        }
    }

    auto valid = validateGameConfig(config);
    if (valid.isError()) {
        return Result<GameConfig>::error(valid.code(), doc.sourceName() + ": " + valid.message());
    }
    return Result<GameConfig>::ok(config);
}

Result<void> requirePositive(float value, const char* name) {
    if (!(value > 0.0f)) {
        return Result<void>::error(ErrorCode::InvalidArgument, std::string(name) + " must be positive");
    }
    return Result<void>::ok();
}

Result<void> requireNonNegative(float value, const char* name) {
    if (!(value >= 0.0f)) {
        return Result<void>::error(ErrorCode::InvalidArgument, std::string(name) + " must not be negative");
    }
    return Result<void>::ok();
}

} // namespace

Result<void> validateGameConfig(const GameConfig& config) {
    const std::pair<float, const char*> positives[] = {
        {config.player.height, "player.height"},
        {config.player.moveSpeed, "player.move_speed"},
        {config.player.lookSensitivity, "player.look_sensitivity"},
        {config.player.collisionRadius, "player.collision_radius"},
        {config.player.interactRange, "player.interact_range"},
        {config.presence.maxLevel, "presence.max_level"},
        {config.world.sizeX, "world.size_x"},
        {config.world.sizeY, "world.size_y"},
        {config.world.sizeZ, "world.size_z"},
        {config.session.maxDeltaTime, "session.max_delta_time"},
    };
    for (const auto& [value, name] : positives) {
        auto r = requirePositive(value, name);
        if (r.isError())
            return r;
    }

    const std::pair<float, const char*> nonNegatives[] = {
        {config.presence.decayRate, "presence.decay_rate"},
        {config.presence.moveCost, "presence.move_cost"},
        {config.presence.interactCost, "presence.interact_cost"},
        {config.presence.minorCost, "presence.minor_cost"},
        {config.presence.scarePenalty, "presence.scare_penalty"},
        {config.session.messageDuration, "session.message_duration"},
        {config.audio.pulseBaseHz, "audio.pulse_base_hz"},
        {config.audio.pulseTenseHz, "audio.pulse_tense_hz"},
        {config.audio.rampDownSeconds, "audio.ramp_down_seconds"},
    };
    for (const auto& [value, name] : nonNegatives) {
        auto r = requireNonNegative(value, name);
        if (r.isError())
            return r;
    }

    return Result<void>::ok();
}

Result<GameConfig> parseGameConfig(std::string_view tomlContent, std::string_view sourceName) {
    auto doc = DataLoader::parse(tomlContent, sourceName);
    if (doc.isError()) {
        return Result<GameConfig>::error(doc.code(), doc.message());
    }
    return fromDocument(doc.value());
}

Result<GameConfig> loadGameConfig(const std::filesystem::path& path) {
    auto doc = DataLoader::load(path);
    if (doc.isError()) {
        VAULT_LOG_ERROR("Failed to load config: {}", doc.message());
        return Result<GameConfig>::error(doc.code(), doc.message());
    }
    auto config = fromDocument(doc.value());
    if (config.isOk()) {
        VAULT_LOG_INFO("Loaded game config from {}", path.string());
    } else {
        VAULT_LOG_ERROR("Invalid game config: {}", config.message());
    }
    return config;
}

} // namespace vault
