#include "vault/core/Game.hh"

#include "vault/core/Log.hh"
#include "vault/core/Targeting.hh"
#include "vault/utils/ErrorHandling.hh"
#include "vault/utils/Profiler.hh"
#include "vault/utils/Utils.hh"

#include <algorithm>

namespace vault {

Game::Game(const GameConfig& config) : Game(config, buildWorld(config)) {}

Game::Game(const GameConfig& config, Level level)
    : config_(config),
      level_(std::move(level)),
      solver_(config.player.moveSpeed, config.player.height, config.player.collisionRadius),
      presence_(config.presence.maxLevel, config.presence.decayRate, config.presence.moveCost),
      interactions_(config.presence),
      audio_(config.audio),
      collisionVolumes_(level_.collisionVolumes()) {
    auto valid = validateWorld(level_);
    worldValid_ = valid.isOk();
    if (!worldValid_) {
        VAULT_LOG_WARN("World failed validation: {}", valid.message());
    }

    progress_.totalKeys = level_.totalKeys();
    pose_ = PlayerPose(Vec3f(config_.player.spawnX, config_.player.height, config_.player.spawnZ),
                       config_.player.spawnYaw);
}

void Game::setAudioBackend(AudioBackend* backend) {
    audio_.setBackend(backend);
    audio_.setMuted(muted_);
}

void Game::setRenderBackend(RenderBackend* backend) {
    renderer_ = backend;
}

void Game::setIdentityProvider(IdentityProvider* provider) {
    identity_ = provider;
}

void Game::resetSession() {
    resetWorld(level_);
    progress_ = ProgressState{};
    progress_.totalKeys = level_.totalKeys();
    presence_.reset();
    pose_ = PlayerPose(Vec3f(config_.player.spawnX, config_.player.height, config_.player.spawnZ),
                       config_.player.spawnYaw);
    input_.releaseAll();
    message_.clear();
    resyncClock_ = true;

    if (hover_) {
        hover_.reset();
        notifyHover();
    }
}

bool Game::start() {
    auto current = session_.current();
    if (current == SessionState::Running || current == SessionState::Paused) {
        VAULT_LOG_DEBUG("Start ignored while {}", sessionStateToString(current));
        return false;
    }

    if (current != SessionState::Idle) {
        session_.transition(SessionState::Idle);
    }

    // The reset completes before Running gates the next tick
    resetSession();
    session_.transition(SessionState::Running);

    showMessage("The vault is open. Find the " + keyCountPhrase(progress_.totalKeys) + ".", MessageTone::Reward);
    audio_.onSessionStart();
    VAULT_LOG_INFO("Session started: {} keys to find", progress_.totalKeys);
    return true;
}

bool Game::pause() {
    if (session_.current() != SessionState::Running)
        return false;
    session_.transition(SessionState::Paused);
    input_.releaseAll();
    return true;
}

bool Game::resume() {
    if (session_.current() != SessionState::Paused)
        return false;
    session_.transition(SessionState::Running);
    input_.clearLook();
    resyncClock_ = true;
    return true;
}

void Game::tick(double now) {
    VAULT_ZONE_SCOPED;

    float dt = 0.0f;
    if (lastNow_ && !resyncClock_) {
        dt = static_cast<float>(std::clamp(now - *lastNow_, 0.0, static_cast<double>(config_.session.maxDeltaTime)));
    }
    lastNow_ = now;

    if (session_.current() != SessionState::Running) {
        render();
        return;
    }
    resyncClock_ = false;
    simTime_ += dt;

    pose_.applyLook(input_.lookDeltaX, input_.lookDeltaY, config_.player.lookSensitivity);
    input_.clearLook();

    auto movement = solver_.step(pose_, collisionVolumes_, input_, dt);
    updateHover();

    presence_.tick(dt, movement.moved);
    audio_.update(presence_.normalized());
    message_.update(simTime_);

    VAULT_PLOT("presence", presence_.level());

    if (presence_.isExhausted() && session_.isRunning()) {
        finishSession(SessionState::Lost);
    }

    render();
    VAULT_FRAME_MARK;
}

InteractionOutcome Game::interact() {
    if (session_.current() != SessionState::Running) {
        return InteractionOutcome{};
    }
    auto hit = findTarget(pose_, level_.objects, config_.player.interactRange);
    return interactWith(hit ? std::optional<std::string>(hit->objectId) : std::nullopt);
}

InteractionOutcome Game::interactWith(const std::optional<std::string>& targetId) {
    if (session_.current() != SessionState::Running) {
        VAULT_LOG_DEBUG("Interaction ignored while {}", sessionStateToString(session_.current()));
        return InteractionOutcome{};
    }

    auto outcome = interactions_.interact(targetId, level_, presence_, progress_);
    VAULT_LOG_DEBUG("Interaction with '{}': {} (+{:.1f} presence)", targetId.value_or("<air>"),
                    outcomeKindToString(outcome.kind), outcome.cost);

    if (!outcome.message.empty()) {
        showMessage(outcome.message, outcome.tone);
    }
    if (outcome.scare) {
        audio_.playScare();
    }
    if (outcome.win) {
        finishSession(SessionState::Won);
    }
    return outcome;
}

void Game::finishSession(SessionState outcome) {
    session_.transition(outcome);
    input_.releaseAll();
    audio_.onSessionEnd();

    if (outcome == SessionState::Lost) {
        audio_.playScare();
        VAULT_LOG_INFO("Session lost after {:.1f}s with {}/{} keys", simTime_, progress_.keysFound,
                       progress_.totalKeys);
    } else {
        VAULT_LOG_INFO("Session won after {:.1f}s at presence {:.1f}", simTime_, presence_.level());
    }
}

void Game::setMuted(bool muted) {
    muted_ = muted;
    audio_.setMuted(muted);
}

void Game::updateHover() {
    auto hit = findTarget(pose_, level_.objects, config_.player.interactRange);
    std::optional<std::string> target = hit ? std::optional<std::string>(hit->objectId) : std::nullopt;
    if (target == hover_)
        return;

    hover_ = std::move(target);
    notifyHover();
}

void Game::notifyHover() {
    // Observers may add or remove observers from inside the callback
    std::vector<HoverCallback> callbacks;
    callbacks.reserve(hoverObservers_.size());
    for (const auto& observer : hoverObservers_) {
        callbacks.push_back(observer.callback);
    }

    for (const auto& callback : callbacks) {
        try {
            callback(hover_);
        } catch (const std::exception& e) {
            VAULT_LOG_ERROR("Exception in hover observer: {}", e.what());
        }
    }
}

void Game::showMessage(const std::string& text, MessageTone tone) {
    message_.show(text, tone, simTime_, config_.session.messageDuration);
}

void Game::render() {
    if (renderer_ == nullptr)
        return;
    renderer_->renderFrame(snapshot(), pose_);
}

GameSnapshot Game::snapshot() const {
    GameSnapshot snap;
    snap.state = session_.current();
    snap.running = snap.state == SessionState::Running;
    snap.time = simTime_;

    snap.presenceLevel = presence_.level();
    snap.presenceMax = presence_.maxLevel();
    snap.presenceNormalized = presence_.normalized();

    snap.keysFound = progress_.keysFound;
    snap.totalKeys = progress_.totalKeys;
    snap.jumpscarePlayed = progress_.jumpscarePlayed;

    if (message_.active()) {
        snap.transientMessage = MessageView{message_.text(), message_.tone(), message_.expiresAt()};
    }
    snap.hoverTarget = hover_;
    snap.headline = headlineFor(snap.state, progress_.totalKeys);

    snap.playerPosition = pose_.position();
    snap.yaw = pose_.yaw();
    snap.pitch = pose_.pitch();

    snap.muted = muted_;
    snap.sessionId = identity_ != nullptr ? identity_->sessionId() : localIdentity_.sessionId();

    snap.objects.reserve(level_.objects.size());
    for (const auto& obj : level_.objects) {
        snap.objects.push_back({obj.id, obj.visible, obj.feedback});
    }
    return snap;
}

std::string Game::addHoverObserver(const HoverCallback& callback) {
    if (!callback) {
        throwError("Hover observer callback cannot be null");
    }
    auto id = makeHexId("hover_");
    hoverObservers_.push_back({id, callback});
    return id;
}

bool Game::removeHoverObserver(const std::string& observerId) {
    auto it = std::find_if(hoverObservers_.begin(), hoverObservers_.end(),
                           [&observerId](const HoverObserver& o) { return o.id == observerId; });
    if (it != hoverObservers_.end()) {
        hoverObservers_.erase(it);
        return true;
    }
    return false;
}

} // namespace vault
