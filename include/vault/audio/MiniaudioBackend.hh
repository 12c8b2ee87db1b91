#pragma once

#include "vault/audio/AudioBackend.hh"
#include "vault/core/GameConfig.hh"
#include "vault/utils/ErrorHandling.hh"

#include <memory>

struct ma_engine;

namespace vault {

// Synthesised soundscape on a miniaudio engine: a looping brown-noise bed,
// a sine pulse and a pink-noise scare burst. No assets are loaded.
class MiniaudioBackend : public AudioBackend {
  public:
    explicit MiniaudioBackend(const AudioConfig& config = {});
    ~MiniaudioBackend() override;

    MiniaudioBackend(const MiniaudioBackend&) = delete;
    MiniaudioBackend& operator=(const MiniaudioBackend&) = delete;

    // Lifecycle
    Result<void> init();
    Result<void> initHeadless();
    void shutdown();

    bool isInitialized() const;

    void setAmbientVolume(float db) override;
    void setPulse(float frequencyHz, float volumeDb) override;
    void playScareCue() override;
    void rampDownAndStop(float durationSec) override;
    void setMuted(bool muted) override;

    bool isMuted() const { return muted_; }
    bool isLoopPlaying() const;

  private:
    struct Voices;

    Result<void> initEngine(bool headless);
    Result<void> initVoices();
    void startLoops();

    AudioConfig config_;
    ma_engine* engine_ = nullptr;
    std::unique_ptr<Voices> voices_;
    bool initialized_ = false;
    bool loopsRunning_ = false;
    bool muted_ = false;
};

} // namespace vault
