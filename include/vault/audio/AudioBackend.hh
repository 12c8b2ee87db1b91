#pragma once

namespace vault {

// Sink for the tension soundscape. Calls are fire-and-forget: an
// implementation that cannot play must silently do nothing.
class AudioBackend {
  public:
    virtual ~AudioBackend() = default;

    virtual void setAmbientVolume(float db) = 0;
    virtual void setPulse(float frequencyHz, float volumeDb) = 0;
    virtual void playScareCue() = 0;
    virtual void rampDownAndStop(float durationSec) = 0;
    virtual void setMuted(bool muted) = 0;
};

class NullAudioBackend : public AudioBackend {
  public:
    void setAmbientVolume(float) override {}
    void setPulse(float, float) override {}
    void playScareCue() override {}
    void rampDownAndStop(float) override {}
    void setMuted(bool) override {}
};

} // namespace vault
