#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>

#include "vault/audio/MiniaudioBackend.hh"
#include "vault/core/Log.hh"

#include <string>

namespace vault {

namespace {

constexpr double kNoiseAmplitude = 0.5;
constexpr double kPulseAmplitude = 0.6;
constexpr ma_uint64 kScareBurstMs = 500;
constexpr ma_uint64 kNeverStop = ~static_cast<ma_uint64>(0);

} // namespace

struct MiniaudioBackend::Voices {
    ma_noise ambientNoise;
    ma_waveform pulseWave;
    ma_noise scareNoise;

    ma_sound ambient;
    ma_sound pulse;
    ma_sound scare;

    bool ambientNoiseReady = false;
    bool pulseWaveReady = false;
    bool scareNoiseReady = false;
    bool ambientReady = false;
    bool pulseReady = false;
    bool scareReady = false;

    ~Voices() {
        // Sounds read from the data sources, so they go first
        if (scareReady)
            ma_sound_uninit(&scare);
        if (pulseReady)
            ma_sound_uninit(&pulse);
        if (ambientReady)
            ma_sound_uninit(&ambient);
        if (scareNoiseReady)
            ma_noise_uninit(&scareNoise, nullptr);
        if (pulseWaveReady)
            ma_waveform_uninit(&pulseWave);
        if (ambientNoiseReady)
            ma_noise_uninit(&ambientNoise, nullptr);
    }
};

MiniaudioBackend::MiniaudioBackend(const AudioConfig& config) : config_(config) {}

MiniaudioBackend::~MiniaudioBackend() {
    if (initialized_) {
        shutdown();
    }
}

Result<void> MiniaudioBackend::init() {
    return initEngine(false);
}

Result<void> MiniaudioBackend::initHeadless() {
    return initEngine(true);
}

Result<void> MiniaudioBackend::initEngine(bool headless) {
    if (initialized_) {
        VAULT_LOG_WARN("MiniaudioBackend already initialized");
        return Result<void>::ok();
    }

    engine_ = new ma_engine;

    ma_engine_config config = ma_engine_config_init();
    config.listenerCount = 1;
    if (headless) {
        config.noDevice = MA_TRUE;
        config.channels = 2;
        config.sampleRate = 48000;
    }

    ma_result result = ma_engine_init(&config, engine_);
    if (result != MA_SUCCESS) {
        delete engine_;
        engine_ = nullptr;
        VAULT_LOG_ERROR("Failed to initialize miniaudio engine: {}", static_cast<int>(result));
        return Result<void>::error(ErrorCode::DeviceUnavailable,
                                   "Failed to initialize miniaudio engine: " + std::to_string(result));
    }

    auto voices = initVoices();
    if (voices.isError()) {
        voices_.reset();
        ma_engine_uninit(engine_);
        delete engine_;
        engine_ = nullptr;
        VAULT_LOG_ERROR("{}", voices.message());
        return voices;
    }

    ma_engine_set_volume(engine_, muted_ ? 0.0f : 1.0f);
    initialized_ = true;
    VAULT_LOG_INFO("MiniaudioBackend initialized{}", headless ? " in headless mode" : " with device audio");
    return Result<void>::ok();
}

Result<void> MiniaudioBackend::initVoices() {
    voices_ = std::make_unique<Voices>();
    auto& v = *voices_;

    const ma_uint32 channels = ma_engine_get_channels(engine_);
    const ma_uint32 sampleRate = ma_engine_get_sample_rate(engine_);
    const ma_uint32 flags = MA_SOUND_FLAG_NO_SPATIALIZATION;

    auto fail = [](const char* what, ma_result r) {
        return Result<void>::error(ErrorCode::DeviceUnavailable,
                                   std::string("Failed to create ") + what + ": " + std::to_string(r));
    };

    ma_noise_config ambientConfig =
        ma_noise_config_init(ma_format_f32, channels, ma_noise_type_brownian, 0, kNoiseAmplitude);
    ma_result r = ma_noise_init(&ambientConfig, nullptr, &v.ambientNoise);
    if (r != MA_SUCCESS)
        return fail("ambient noise", r);
    v.ambientNoiseReady = true;

    ma_waveform_config pulseConfig = ma_waveform_config_init(ma_format_f32, channels, sampleRate,
                                                             ma_waveform_type_sine, kPulseAmplitude,
                                                             config_.pulseBaseHz);
    r = ma_waveform_init(&pulseConfig, &v.pulseWave);
    if (r != MA_SUCCESS)
        return fail("pulse oscillator", r);
    v.pulseWaveReady = true;

    ma_noise_config scareConfig = ma_noise_config_init(ma_format_f32, channels, ma_noise_type_pink, 0, 1.0);
    r = ma_noise_init(&scareConfig, nullptr, &v.scareNoise);
    if (r != MA_SUCCESS)
        return fail("scare noise", r);
    v.scareNoiseReady = true;

    r = ma_sound_init_from_data_source(engine_, &v.ambientNoise, flags, nullptr, &v.ambient);
    if (r != MA_SUCCESS)
        return fail("ambient voice", r);
    v.ambientReady = true;

    r = ma_sound_init_from_data_source(engine_, &v.pulseWave, flags, nullptr, &v.pulse);
    if (r != MA_SUCCESS)
        return fail("pulse voice", r);
    v.pulseReady = true;

    r = ma_sound_init_from_data_source(engine_, &v.scareNoise, flags, nullptr, &v.scare);
    if (r != MA_SUCCESS)
        return fail("scare voice", r);
    v.scareReady = true;

    ma_sound_set_volume(&v.ambient, ma_volume_db_to_linear(config_.ambientBaseDb));
    // Silent until the first tension update
    ma_sound_set_volume(&v.pulse, 0.0f);
    ma_sound_set_volume(&v.scare, ma_volume_db_to_linear(config_.scareCueDb));
    return Result<void>::ok();
}

void MiniaudioBackend::shutdown() {
    if (!initialized_) {
        return;
    }

    voices_.reset();
    ma_engine_uninit(engine_);
    delete engine_;
    engine_ = nullptr;
    initialized_ = false;
    loopsRunning_ = false;
    VAULT_LOG_INFO("MiniaudioBackend shut down");
}

bool MiniaudioBackend::isInitialized() const {
    return initialized_;
}

bool MiniaudioBackend::isLoopPlaying() const {
    if (!initialized_)
        return false;
    return ma_sound_is_playing(&voices_->ambient) != 0;
}

void MiniaudioBackend::startLoops() {
    if (loopsRunning_)
        return;

    for (ma_sound* sound : {&voices_->ambient, &voices_->pulse}) {
        // Undo a previous rampDownAndStop
        ma_sound_set_stop_time_in_pcm_frames(sound, kNeverStop);
        ma_sound_set_fade_in_pcm_frames(sound, 1.0f, 1.0f, 0);
        ma_result r = ma_sound_start(sound);
        if (r != MA_SUCCESS) {
            VAULT_LOG_ERROR("Failed to start tension loop: {}", static_cast<int>(r));
            return;
        }
    }
    loopsRunning_ = true;
}

void MiniaudioBackend::setAmbientVolume(float db) {
    if (!initialized_)
        return;
    startLoops();
    ma_sound_set_volume(&voices_->ambient, ma_volume_db_to_linear(db));
}

void MiniaudioBackend::setPulse(float frequencyHz, float volumeDb) {
    if (!initialized_)
        return;
    startLoops();
    ma_waveform_set_frequency(&voices_->pulseWave, frequencyHz);
    ma_sound_set_volume(&voices_->pulse, ma_volume_db_to_linear(volumeDb));
}

void MiniaudioBackend::playScareCue() {
    if (!initialized_)
        return;

    ma_sound* scare = &voices_->scare;
    ma_sound_stop(scare);
    ma_sound_set_volume(scare, ma_volume_db_to_linear(config_.scareCueDb));
    // Sharp attack, decay to silence over the burst
    ma_sound_set_fade_in_milliseconds(scare, 1.0f, 0.0f, kScareBurstMs);
    ma_uint64 stopAt = ma_engine_get_time_in_pcm_frames(engine_) +
                       kScareBurstMs * ma_engine_get_sample_rate(engine_) / 1000;
    ma_sound_set_stop_time_in_pcm_frames(scare, stopAt);
    ma_result r = ma_sound_start(scare);
    if (r != MA_SUCCESS) {
        VAULT_LOG_ERROR("Failed to play scare cue: {}", static_cast<int>(r));
    }
}

void MiniaudioBackend::rampDownAndStop(float durationSec) {
    if (!initialized_ || !loopsRunning_)
        return;

    const ma_uint64 fadeMs = durationSec > 0.0f ? static_cast<ma_uint64>(durationSec * 1000.0f) : 0;
    const ma_uint64 stopAt =
        ma_engine_get_time_in_pcm_frames(engine_) + fadeMs * ma_engine_get_sample_rate(engine_) / 1000;

    for (ma_sound* sound : {&voices_->ambient, &voices_->pulse}) {
        ma_sound_set_fade_in_milliseconds(sound, -1.0f, 0.0f, fadeMs);
        ma_sound_set_stop_time_in_pcm_frames(sound, stopAt);
    }
    loopsRunning_ = false;
    VAULT_LOG_DEBUG("Tension loops fading out over {}ms", fadeMs);
}

void MiniaudioBackend::setMuted(bool muted) {
    muted_ = muted;
    if (initialized_) {
        ma_engine_set_volume(engine_, muted ? 0.0f : 1.0f);
    }
    VAULT_LOG_INFO("Audio {}", muted ? "muted" : "unmuted");
}

} // namespace vault
