#pragma once

#include "vault/audio/AudioBackend.hh"
#include "vault/core/GameConfig.hh"

namespace vault {

struct TensionParams {
    float ambientDb = 0.0f;
    float pulseHz = 0.0f;
    float pulseDb = 0.0f;
};

// Linear interpolation from the quiet baseline (0) to the tense ceiling
// (1). Input outside [0, 1] is clamped.
TensionParams mapTension(float normalized, const AudioConfig& config);

// Routes presence changes to an AudioBackend. Without a backend every
// call is a no-op; the only state kept is the last mapped parameters.
class TensionAudioMapper {
  public:
    explicit TensionAudioMapper(const AudioConfig& config, AudioBackend* backend = nullptr);

    void setBackend(AudioBackend* backend);
    bool hasBackend() const { return backend_ != nullptr; }

    const TensionParams& update(float normalized);
    void playScare();

    // Back to the baseline mix for a fresh run
    void onSessionStart();
    // Fade out over the configured ramp duration
    void onSessionEnd();

    void setMuted(bool muted);

    const TensionParams& lastParams() const { return last_; }

  private:
    AudioBackend& backend();

    AudioConfig config_;
    AudioBackend* backend_;
    NullAudioBackend null_;
    TensionParams last_;
};

} // namespace vault
