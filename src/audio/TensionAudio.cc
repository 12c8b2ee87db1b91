#include "vault/audio/TensionAudio.hh"

#include "vault/core/Log.hh"

#include <algorithm>

namespace vault {

namespace {

float lerp(float a, float b, float t) {
    return a + (b - a) * t;
}

} // namespace

TensionParams mapTension(float normalized, const AudioConfig& config) {
    float t = std::clamp(normalized, 0.0f, 1.0f);
    TensionParams params;
    params.ambientDb = lerp(config.ambientBaseDb, config.ambientTenseDb, t);
    params.pulseHz = lerp(config.pulseBaseHz, config.pulseTenseHz, t);
    params.pulseDb = lerp(config.pulseBaseDb, config.pulseTenseDb, t);
    return params;
}

TensionAudioMapper::TensionAudioMapper(const AudioConfig& config, AudioBackend* backend)
    : config_(config), backend_(backend), last_(mapTension(0.0f, config)) {}

void TensionAudioMapper::setBackend(AudioBackend* backend) {
    backend_ = backend;
}

AudioBackend& TensionAudioMapper::backend() {
    if (backend_ == nullptr)
        return null_;
    return *backend_;
}

const TensionParams& TensionAudioMapper::update(float normalized) {
    last_ = mapTension(normalized, config_);
    backend().setAmbientVolume(last_.ambientDb);
    backend().setPulse(last_.pulseHz, last_.pulseDb);
    return last_;
}

void TensionAudioMapper::playScare() {
    backend().playScareCue();
}

void TensionAudioMapper::onSessionStart() {
    update(0.0f);
}

void TensionAudioMapper::onSessionEnd() {
    VAULT_LOG_DEBUG("Ramping tension audio down over {:.1f}s", config_.rampDownSeconds);
    last_ = mapTension(0.0f, config_);
    backend().rampDownAndStop(config_.rampDownSeconds);
}

void TensionAudioMapper::setMuted(bool muted) {
    backend().setMuted(muted);
}

} // namespace vault
