#include "vault/audio/MiniaudioBackend.hh"
#include "vault/core/Autopilot.hh"
#include "vault/core/Collaborators.hh"
#include "vault/core/Constants.g.hh"
#include "vault/core/Game.hh"
#include "vault/core/GameConfig.hh"
#include "vault/core/Log.hh"
#include "vault/parser/ArgumentParser.hh"

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr double kTickRate = 60.0;
constexpr long kDefaultTicks = 60L * 60L * 2L;

// Stand-in renderer for the headless driver: reports state changes and a
// once-per-second heartbeat instead of drawing.
class LoggingRenderer : public vault::RenderBackend {
  public:
    void renderFrame(const vault::GameSnapshot& snapshot, const vault::PlayerPose& pose) override {
        ++frames_;
        bool changed = snapshot.state != lastState_ || snapshot.keysFound != lastKeys_;
        if (changed || frames_ % static_cast<long>(kTickRate) == 0) {
            VAULT_LOG_INFO("[frame {}] {} presence {:.2f}/{:.0f} keys {}/{} at ({:.2f}, {:.2f}){}", frames_,
                           vault::sessionStateToString(snapshot.state), snapshot.presenceLevel, snapshot.presenceMax,
                           snapshot.keysFound, snapshot.totalKeys, pose.position().x, pose.position().z,
                           snapshot.hoverTarget ? " aiming at " + *snapshot.hoverTarget : std::string());
        }
        lastState_ = snapshot.state;
        lastKeys_ = snapshot.keysFound;
    }

  private:
    long frames_ = 0;
    vault::SessionState lastState_ = vault::SessionState::Idle;
    int lastKeys_ = 0;
};

} // namespace

int main(int argc, char* argv[]) {
    vault::ArgumentParser argParser;
    argParser.addArgument("--config", "Load tuning from a TOML file", true);
    argParser.addArgument("--log", "Also write the log to this file", true);
    argParser.addArgument("--audio", "Play the soundscape on the default audio device");
    argParser.addArgument("--ticks", "Give up after this many 60 Hz ticks", true);
    argParser.addArgument("--version", "Display version information");
    argParser.addArgument("--help", "Display help information");

    auto parsed = argParser.parse(argc, argv);
    if (parsed.isError()) {
        std::cerr << parsed.message() << std::endl;
        std::cerr << "Usage: " << vault::APP_EXECUTABLE_NAME << " [options]" << std::endl << argParser.usage();
        return 2;
    }

    if (argParser.hasArgument("--version")) {
        std::cout << vault::APP_NAME << " version " << vault::APP_VERSION << std::endl;
        return 0;
    }

    if (argParser.hasArgument("--help")) {
        std::cout << "Usage: " << vault::APP_EXECUTABLE_NAME << " [options]" << std::endl;
        std::cout << "Options:" << std::endl << argParser.usage();
        return 0;
    }

    auto logPath = argParser.value("--log");
    if (logPath) {
        vault::log::init(logPath->c_str());
    } else {
        vault::log::init();
    }
    VAULT_LOG_INFO("Starting {} {}", vault::APP_NAME, vault::APP_VERSION);

    vault::GameConfig config;
    if (auto path = argParser.value("--config")) {
        auto loaded = vault::loadGameConfig(*path);
        if (loaded.isError()) {
            VAULT_LOG_CRITICAL("Configuration error: {}", loaded.message());
            vault::log::shutdown();
            return 2;
        }
        config = loaded.value();
    }

    long maxTicks = kDefaultTicks;
    if (auto ticks = argParser.value("--ticks")) {
        try {
            maxTicks = std::stol(*ticks);
        } catch (const std::exception& e) {
            VAULT_LOG_CRITICAL("Invalid --ticks value '{}': {}", *ticks, e.what());
            vault::log::shutdown();
            return 2;
        }
    }

    int exitCode = 1;
    try {
        vault::Game game(config);
        if (!game.worldValid()) {
            VAULT_LOG_CRITICAL("World layout is invalid");
            vault::log::shutdown();
            return 2;
        }

        LoggingRenderer renderer;
        game.setRenderBackend(&renderer);

        std::unique_ptr<vault::MiniaudioBackend> audio;
        if (argParser.hasArgument("--audio")) {
            audio = std::make_unique<vault::MiniaudioBackend>(config.audio);
            auto ready = audio->init();
            if (ready.isError()) {
                VAULT_LOG_ERROR("Continuing without audio: {}", ready.message());
                audio.reset();
            } else {
                game.setAudioBackend(audio.get());
            }
        }

        vault::Autopilot pilot = vault::Autopilot::defaultRoute();
        game.start();

        for (long tick = 0; tick < maxTicks && game.state() == vault::SessionState::Running; ++tick) {
            pilot.update(game);
            game.tick(static_cast<double>(tick) / kTickRate);
        }

        auto snapshot = game.snapshot();
        std::cout << nlohmann::json(snapshot).dump(2) << std::endl;

        switch (game.state()) {
            case vault::SessionState::Won:
                exitCode = 0;
                break;
            case vault::SessionState::Lost:
                exitCode = 1;
                break;
            default:
                VAULT_LOG_WARN("Gave up after {} ticks in state {}", maxTicks,
                               vault::sessionStateToString(game.state()));
                exitCode = 1;
                break;
        }

        game.setAudioBackend(nullptr);
        if (audio) {
            audio->shutdown();
        }
    } catch (const std::exception& e) {
        VAULT_LOG_CRITICAL("Fatal error: {}", e.what());
        exitCode = 1;
    }

    VAULT_LOG_INFO("Shutting down");
    vault::log::shutdown();
    return exitCode;
}
