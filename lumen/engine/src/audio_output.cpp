/**
 * @file audio_output.cpp
 * @brief SDL audio device wrapper
 */

#include <lumen/engine/audio_output.hpp>

#include <lumen/core/logger.hpp>

#include <SDL2/SDL.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace lumen::engine {

namespace {

constexpr int kMinBufferSamples = 512;
constexpr int kMaxCallbacksPerSecond = 30;

/// Power-of-two device buffer giving at most kMaxCallbacksPerSecond callbacks
Uint16 deviceBufferSamples(int sampleRate) {
    int target = sampleRate / kMaxCallbacksPerSecond;
    int samples = kMinBufferSamples;
    while (samples * 2 <= target && samples < 8192) {
        samples *= 2;
    }
    return static_cast<Uint16>(samples);
}

} // namespace

AudioOutput::AudioOutput(AudioGraph& graph, const MasterClock& clock)
    : m_graph(graph)
    , m_clock(clock) {}

AudioOutput::~AudioOutput() {
    close();
}

Result<void> AudioOutput::open() {
    close();

    if (SDL_WasInit(SDL_INIT_AUDIO) == 0) {
        if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0) {
            return Err(ErrorCode::AudioDeviceError,
                       std::string("SDL audio init failed: ") + SDL_GetError());
        }
        m_ownsSubsystem = true;
    }

    SDL_AudioSpec desired{};
    SDL_AudioSpec obtained{};
    desired.freq = m_graph.sampleRate();
    desired.format = AUDIO_F32SYS;
    desired.channels = static_cast<Uint8>(m_graph.channels());
    desired.samples = deviceBufferSamples(m_graph.sampleRate());
    desired.callback = &AudioOutput::sdlCallback;
    desired.userdata = this;

    // No allowed changes: SDL converts if the hardware differs
    m_deviceId = SDL_OpenAudioDevice(nullptr, 0, &desired, &obtained, 0);
    if (m_deviceId == 0) {
        std::string message = std::string("SDL_OpenAudioDevice failed: ") + SDL_GetError();
        if (m_ownsSubsystem) {
            SDL_QuitSubSystem(SDL_INIT_AUDIO);
            m_ownsSubsystem = false;
        }
        return Err(ErrorCode::AudioDeviceError, message);
    }

    LUMEN_LOG_INFO("Audio device opened: {} Hz, {} ch, {} samples per buffer",
                   obtained.freq, static_cast<int>(obtained.channels), obtained.samples);
    return Ok();
}

void AudioOutput::close() {
    if (m_deviceId != 0) {
        SDL_CloseAudioDevice(m_deviceId);
        m_deviceId = 0;
        LUMEN_LOG_DEBUG("Audio device closed");
    }
    if (m_ownsSubsystem) {
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        m_ownsSubsystem = false;
    }
    m_cursor.store(kNoTimestamp);
}

void AudioOutput::resume() {
    if (m_deviceId != 0) {
        SDL_PauseAudioDevice(m_deviceId, 0);
    }
}

void AudioOutput::pause() {
    if (m_deviceId != 0) {
        SDL_PauseAudioDevice(m_deviceId, 1);
    }
    m_cursor.store(kNoTimestamp);
}

void AudioOutput::fill(float* out, size_t frames) {
    const size_t total = frames * static_cast<size_t>(m_graph.channels());

    if (!m_clock.isPlaying()) {
        std::fill(out, out + total, 0.0f);
        m_cursor.store(kNoTimestamp);
        return;
    }

    const Timestamp now = m_clock.currentTime();
    Timestamp cursor = m_cursor.load();
    if (cursor == kNoTimestamp || std::llabs(cursor - now) > kResyncThreshold) {
        if (cursor != kNoTimestamp) {
            m_resyncs.fetch_add(1);
        }
        cursor = now;
    }

    const double rate = m_clock.playbackRate();
    m_graph.render(out, frames, cursor, rate);

    auto advanced = static_cast<Duration>(std::llround(
        static_cast<double>(frames) * static_cast<double>(kTimeBaseUs) * rate / m_graph.sampleRate()));
    m_cursor.store(cursor + advanced);
}

void AudioOutput::sdlCallback(void* userdata, uint8_t* stream, int len) {
    auto* self = static_cast<AudioOutput*>(userdata);
    const size_t frameBytes = sizeof(float) * static_cast<size_t>(self->m_graph.channels());
    const size_t frames = static_cast<size_t>(len) / frameBytes;
    self->fill(reinterpret_cast<float*>(stream), frames);
}

} // namespace lumen::engine
