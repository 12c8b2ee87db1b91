#pragma once

#include "vault/audio/TensionAudio.hh"
#include "vault/core/Collaborators.hh"
#include "vault/core/GameConfig.hh"
#include "vault/core/InputState.hh"
#include "vault/core/Interaction.hh"
#include "vault/core/MovementSolver.hh"
#include "vault/core/PlayerPose.hh"
#include "vault/core/Presence.hh"
#include "vault/core/SessionManager.hh"
#include "vault/core/Snapshot.hh"
#include "vault/core/World.hh"
#include "vault/ui/TransientMessage.hh"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace vault {

using HoverCallback = std::function<void(const std::optional<std::string>& targetId)>;

// Owns all simulation state and drives it from the host's frame clock.
// Single-threaded: tick() and the discrete events (interact, start, pause,
// mute) must be called from the same thread.
class Game {
  public:
    explicit Game(const GameConfig& config = {});
    // Runs an arbitrary level; used by tests and custom layouts
    Game(const GameConfig& config, Level level);

    // Collaborators are borrowed and may be null
    void setAudioBackend(AudioBackend* backend);
    void setRenderBackend(RenderBackend* backend);
    void setIdentityProvider(IdentityProvider* provider);

    // Idle, Won or Lost -> Running with a full reset. Ignored otherwise.
    bool start();
    bool pause();
    bool resume();

    // `now` is the host clock in seconds
    void tick(double now);

    // Interact with whatever the crosshair is on
    InteractionOutcome interact();
    // Interact with an explicit target (nullopt = empty air)
    InteractionOutcome interactWith(const std::optional<std::string>& targetId);

    void setMuted(bool muted);
    bool muted() const { return muted_; }

    InputState& input() { return input_; }

    GameSnapshot snapshot() const;

    std::string addHoverObserver(const HoverCallback& callback);
    bool removeHoverObserver(const std::string& observerId);

    SessionState state() const { return session_.current(); }

    const Level& level() const { return level_; }
    const PlayerPose& pose() const { return pose_; }
    const PresenceModel& presence() const { return presence_; }
    const ProgressState& progress() const { return progress_; }
    const TransientMessage& message() const { return message_; }
    const std::optional<std::string>& hoverTarget() const { return hover_; }
    const GameConfig& config() const { return config_; }
    double simulationTime() const { return simTime_; }
    bool worldValid() const { return worldValid_; }

  private:
    void resetSession();
    void updateHover();
    void notifyHover();
    void showMessage(const std::string& text, MessageTone tone);
    void finishSession(SessionState outcome);
    void render();

    struct HoverObserver {
        std::string id;
        HoverCallback callback;
    };

    GameConfig config_;
    Level level_;
    bool worldValid_ = false;

    SessionManager session_;
    MovementSolver solver_;
    PresenceModel presence_;
    InteractionSystem interactions_;
    TensionAudioMapper audio_;
    TransientMessage message_;

    // Geometry is fixed for the lifetime of the level
    std::vector<AABB> collisionVolumes_;

    PlayerPose pose_;
    InputState input_;
    ProgressState progress_;
    std::optional<std::string> hover_;

    RenderBackend* renderer_ = nullptr;
    IdentityProvider* identity_ = nullptr;
    LocalIdentityProvider localIdentity_;

    std::vector<HoverObserver> hoverObservers_;

    double simTime_ = 0.0;
    std::optional<double> lastNow_;
    bool resyncClock_ = true;
    bool muted_ = false;
};

} // namespace vault
