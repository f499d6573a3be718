/**
 * @file audio_effects.cpp
 * @brief Compressor, EQ, delay and reverb processors
 */

#include <lumen/engine/audio_effects.hpp>

#include <lumen/core/logger.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>

namespace lumen::engine {

namespace {

double dbToGain(double db) { return std::pow(10.0, db / 20.0); }

double gainToDb(double gain) { return 20.0 * std::log10(std::max(gain, 1e-9)); }

/// One-pole smoothing coefficient for a time constant in seconds
double smoothingCoeff(double seconds, int sampleRate) {
    if (seconds <= 0.0 || sampleRate <= 0) {
        return 0.0;
    }
    return std::exp(-1.0 / (seconds * sampleRate));
}

} // namespace

// ============================================================================
// Compressor
// ============================================================================

CompressorParams CompressorParams::fromEffect(const model::Effect& effect) {
    CompressorParams p;
    p.thresholdDb = std::clamp(effect.param("threshold", p.thresholdDb), -100.0, 0.0);
    p.ratio = std::clamp(effect.param("ratio", p.ratio), 1.0, 20.0);
    p.attack = std::clamp(effect.param("attack", p.attack), 0.0, 1.0);
    p.release = std::clamp(effect.param("release", p.release), 0.0, 1.0);
    p.kneeDb = std::clamp(effect.param("knee", p.kneeDb), 0.0, 40.0);
    return p;
}

Compressor::Compressor(const CompressorParams& params, int sampleRate)
    : m_params(params)
    , m_attackCoeff(smoothingCoeff(params.attack, sampleRate))
    , m_releaseCoeff(smoothingCoeff(params.release, sampleRate)) {}

double Compressor::gainReductionDb(double inputDb) const {
    const double slope = 1.0 / m_params.ratio - 1.0;
    const double over = inputDb - m_params.thresholdDb;
    const double knee = m_params.kneeDb;

    if (knee > 0.0 && std::abs(over) * 2.0 <= knee) {
        double x = over + knee / 2.0;
        return slope * x * x / (2.0 * knee);
    }
    return over > 0.0 ? slope * over : 0.0;
}

void Compressor::process(float* samples, size_t frames, int channels) {
    for (size_t f = 0; f < frames; ++f) {
        float* frame = samples + f * static_cast<size_t>(channels);

        float peak = 0.0f;
        for (int c = 0; c < channels; ++c) {
            peak = std::max(peak, std::abs(frame[c]));
        }

        double target = gainReductionDb(gainToDb(peak));
        // More reduction -> attack, less -> release
        double coeff = target < m_envelopeDb ? m_attackCoeff : m_releaseCoeff;
        m_envelopeDb = coeff * m_envelopeDb + (1.0 - coeff) * target;

        auto gain = static_cast<float>(dbToGain(m_envelopeDb));
        for (int c = 0; c < channels; ++c) {
            frame[c] *= gain;
        }
    }
}

// ============================================================================
// Equalizer
// ============================================================================

BiquadType parseBiquadType(const std::string& name) {
    if (name == "lowshelf") return BiquadType::LowShelf;
    if (name == "highshelf") return BiquadType::HighShelf;
    if (name == "lowpass") return BiquadType::LowPass;
    if (name == "highpass") return BiquadType::HighPass;
    return BiquadType::Peaking;
}

Biquad::Biquad(const EqBand& band, int sampleRate) {
    const double fs = sampleRate > 0 ? sampleRate : 48000.0;
    const double freq = std::min(band.frequency, fs * 0.49);
    const double w0 = 2.0 * std::numbers::pi * freq / fs;
    const double cosw = std::cos(w0);
    const double sinw = std::sin(w0);
    const double A = std::pow(10.0, band.gainDb / 40.0);
    const double alpha = sinw / (2.0 * band.q);
    // Shelves use a fixed slope of 1
    const double shelfAlpha = sinw / 2.0 * std::numbers::sqrt2;
    const double sqrtA2 = 2.0 * std::sqrt(A) * shelfAlpha;

    double b0 = 1.0, b1 = 0.0, b2 = 0.0, a0 = 1.0, a1 = 0.0, a2 = 0.0;

    switch (band.type) {
        case BiquadType::Peaking:
            b0 = 1.0 + alpha * A;
            b1 = -2.0 * cosw;
            b2 = 1.0 - alpha * A;
            a0 = 1.0 + alpha / A;
            a1 = -2.0 * cosw;
            a2 = 1.0 - alpha / A;
            break;
        case BiquadType::LowShelf:
            b0 = A * ((A + 1.0) - (A - 1.0) * cosw + sqrtA2);
            b1 = 2.0 * A * ((A - 1.0) - (A + 1.0) * cosw);
            b2 = A * ((A + 1.0) - (A - 1.0) * cosw - sqrtA2);
            a0 = (A + 1.0) + (A - 1.0) * cosw + sqrtA2;
            a1 = -2.0 * ((A - 1.0) + (A + 1.0) * cosw);
            a2 = (A + 1.0) + (A - 1.0) * cosw - sqrtA2;
            break;
        case BiquadType::HighShelf:
            b0 = A * ((A + 1.0) + (A - 1.0) * cosw + sqrtA2);
            b1 = -2.0 * A * ((A - 1.0) + (A + 1.0) * cosw);
            b2 = A * ((A + 1.0) + (A - 1.0) * cosw - sqrtA2);
            a0 = (A + 1.0) - (A - 1.0) * cosw + sqrtA2;
            a1 = 2.0 * ((A - 1.0) - (A + 1.0) * cosw);
            a2 = (A + 1.0) - (A - 1.0) * cosw - sqrtA2;
            break;
        case BiquadType::LowPass:
            b0 = (1.0 - cosw) / 2.0;
            b1 = 1.0 - cosw;
            b2 = (1.0 - cosw) / 2.0;
            a0 = 1.0 + alpha;
            a1 = -2.0 * cosw;
            a2 = 1.0 - alpha;
            break;
        case BiquadType::HighPass:
            b0 = (1.0 + cosw) / 2.0;
            b1 = -(1.0 + cosw);
            b2 = (1.0 + cosw) / 2.0;
            a0 = 1.0 + alpha;
            a1 = -2.0 * cosw;
            a2 = 1.0 - alpha;
            break;
    }

    m_b0 = b0 / a0;
    m_b1 = b1 / a0;
    m_b2 = b2 / a0;
    m_a1 = a1 / a0;
    m_a2 = a2 / a0;
}

float Biquad::processSample(float x, int channel) {
    if (static_cast<size_t>(channel) >= m_state.size()) {
        m_state.resize(static_cast<size_t>(channel) + 1);
    }
    State& s = m_state[static_cast<size_t>(channel)];
    double y = m_b0 * x + m_b1 * s.x1 + m_b2 * s.x2 - m_a1 * s.y1 - m_a2 * s.y2;
    s.x2 = s.x1;
    s.x1 = x;
    s.y2 = s.y1;
    s.y1 = y;
    return static_cast<float>(y);
}

void Biquad::reset() {
    std::fill(m_state.begin(), m_state.end(), State{});
}

std::vector<EqBand> Equalizer::bandsFromEffect(const model::Effect& effect) {
    std::vector<EqBand> bands;
    auto it = effect.params.find("bands");
    if (it == effect.params.end() || !it->is_array()) {
        return bands;
    }

    for (const auto& b : *it) {
        if (!b.is_object()) {
            continue;
        }
        EqBand band;
        band.type = parseBiquadType(model::stringParam(b, "type", "peaking"));
        band.frequency = std::clamp(model::numberParam(b, "frequency", 1000.0), 20.0, 20000.0);
        band.gainDb = std::clamp(model::numberParam(b, "gain", 0.0), -24.0, 24.0);
        band.q = std::clamp(model::numberParam(b, "q", 1.0), 0.1, 18.0);
        bands.push_back(band);
    }
    return bands;
}

Equalizer::Equalizer(std::vector<EqBand> bands, int sampleRate)
    : m_bands(std::move(bands)) {
    m_filters.reserve(m_bands.size());
    for (const auto& band : m_bands) {
        m_filters.emplace_back(band, sampleRate);
    }
}

void Equalizer::process(float* samples, size_t frames, int channels) {
    for (auto& filter : m_filters) {
        for (size_t f = 0; f < frames; ++f) {
            float* frame = samples + f * static_cast<size_t>(channels);
            for (int c = 0; c < channels; ++c) {
                frame[c] = filter.processSample(frame[c], c);
            }
        }
    }
}

void Equalizer::reset() {
    for (auto& filter : m_filters) {
        filter.reset();
    }
}

// ============================================================================
// Delay
// ============================================================================

DelayParams DelayParams::fromEffect(const model::Effect& effect) {
    DelayParams p;
    p.time = std::clamp(effect.param("time", p.time), 0.0, 2.0);
    p.feedback = std::clamp(effect.param("feedback", p.feedback), 0.0, 0.95);
    p.wetLevel = std::clamp(effect.param("wetLevel", p.wetLevel), 0.0, 1.0);
    return p;
}

Delay::Delay(const DelayParams& params, int sampleRate, int channels)
    : m_params(params)
    , m_channels(std::max(channels, 1))
    , m_delayFrames(std::max<size_t>(1, static_cast<size_t>(std::llround(params.time * sampleRate)))) {
    m_line.assign(m_delayFrames * static_cast<size_t>(m_channels), 0.0f);
}

void Delay::process(float* samples, size_t frames, int channels) {
    if (channels != m_channels) {
        m_channels = std::max(channels, 1);
        m_line.assign(m_delayFrames * static_cast<size_t>(m_channels), 0.0f);
        m_cursor = 0;
    }

    const auto wet = static_cast<float>(m_params.wetLevel);
    const auto dry = 1.0f - wet;
    const auto feedback = static_cast<float>(m_params.feedback);

    for (size_t f = 0; f < frames; ++f) {
        float* frame = samples + f * static_cast<size_t>(channels);
        float* tap = m_line.data() + m_cursor * static_cast<size_t>(channels);
        for (int c = 0; c < channels; ++c) {
            float delayed = tap[c];
            float in = frame[c];
            frame[c] = in * dry + delayed * wet;
            tap[c] = in + delayed * feedback;
        }
        m_cursor = (m_cursor + 1) % m_delayFrames;
    }
}

void Delay::reset() {
    std::fill(m_line.begin(), m_line.end(), 0.0f);
    m_cursor = 0;
}

// ============================================================================
// Reverb
// ============================================================================

namespace {

// Mutually prime comb / allpass lengths at 44.1 kHz
constexpr std::array<int, 4> kCombTuning{1116, 1188, 1277, 1356};
constexpr std::array<int, 2> kAllpassTuning{556, 441};
constexpr int kStereoSpread = 23;
constexpr float kAllpassFeedback = 0.5f;
constexpr float kInputGain = 0.25f;

struct Comb {
    std::vector<float> buffer;
    size_t index = 0;
    float feedback = 0.0f;
    float damp = 0.0f;
    float store = 0.0f;

    float process(float input) {
        float out = buffer[index];
        store = out * (1.0f - damp) + store * damp;
        buffer[index] = input + store * feedback;
        index = (index + 1) % buffer.size();
        return out;
    }
};

struct Allpass {
    std::vector<float> buffer;
    size_t index = 0;

    float process(float input) {
        float buffered = buffer[index];
        float out = buffered - input;
        buffer[index] = input + buffered * kAllpassFeedback;
        index = (index + 1) % buffer.size();
        return out;
    }
};

} // namespace

struct Reverb::Channel {
    std::array<Comb, 4> combs;
    std::array<Allpass, 2> allpasses;

    float process(float input) {
        float acc = 0.0f;
        for (auto& comb : combs) {
            acc += comb.process(input * kInputGain);
        }
        for (auto& ap : allpasses) {
            acc = ap.process(acc);
        }
        return acc;
    }

    void clear() {
        for (auto& comb : combs) {
            std::fill(comb.buffer.begin(), comb.buffer.end(), 0.0f);
            comb.index = 0;
            comb.store = 0.0f;
        }
        for (auto& ap : allpasses) {
            std::fill(ap.buffer.begin(), ap.buffer.end(), 0.0f);
            ap.index = 0;
        }
    }
};

ReverbParams ReverbParams::fromEffect(const model::Effect& effect) {
    ReverbParams p;
    p.roomSize = std::clamp(effect.param("roomSize", p.roomSize), 0.0, 1.0);
    p.damping = std::clamp(effect.param("damping", p.damping), 0.0, 1.0);
    p.wetLevel = std::clamp(effect.param("wetLevel", p.wetLevel), 0.0, 1.0);
    p.dryLevel = std::clamp(effect.param("dryLevel", p.dryLevel), 0.0, 1.0);
    return p;
}

Reverb::Reverb(const ReverbParams& params, int sampleRate, int channels)
    : m_params(params) {
    const double fs = sampleRate > 0 ? sampleRate : 48000.0;
    const double scale = fs / 44100.0;
    const double rt60 = decayTime();

    for (int ch = 0; ch < std::max(channels, 1); ++ch) {
        auto channel = std::make_unique<Channel>();
        const int spread = ch % 2 == 1 ? kStereoSpread : 0;

        for (size_t i = 0; i < kCombTuning.size(); ++i) {
            auto len = static_cast<size_t>((kCombTuning[i] + spread) * scale);
            Comb& comb = channel->combs[i];
            comb.buffer.assign(std::max<size_t>(len, 1), 0.0f);
            // -60 dB after rt60 seconds of recirculation
            double delaySeconds = static_cast<double>(comb.buffer.size()) / fs;
            comb.feedback = static_cast<float>(std::pow(10.0, -3.0 * delaySeconds / rt60));
            comb.damp = static_cast<float>(params.damping * 0.4);
        }
        for (size_t i = 0; i < kAllpassTuning.size(); ++i) {
            auto len = static_cast<size_t>((kAllpassTuning[i] + spread) * scale);
            channel->allpasses[i].buffer.assign(std::max<size_t>(len, 1), 0.0f);
        }
        m_channels.push_back(std::move(channel));
    }
}

Reverb::~Reverb() = default;

void Reverb::process(float* samples, size_t frames, int channels) {
    const auto wet = static_cast<float>(m_params.wetLevel);
    const auto dry = static_cast<float>(m_params.dryLevel);

    for (size_t f = 0; f < frames; ++f) {
        float* frame = samples + f * static_cast<size_t>(channels);
        for (int c = 0; c < channels; ++c) {
            Channel& ch = *m_channels[static_cast<size_t>(c) % m_channels.size()];
            float in = frame[c];
            frame[c] = in * dry + ch.process(in) * wet;
        }
    }
}

void Reverb::reset() {
    for (auto& ch : m_channels) {
        ch->clear();
    }
}

// ============================================================================
// Chain
// ============================================================================

std::unique_ptr<AudioProcessor> createAudioProcessor(const model::Effect& effect,
                                                     int sampleRate, int channels) {
    if (!effect.enabled) {
        return nullptr;
    }

    if (effect.type == "compressor") {
        return std::make_unique<Compressor>(CompressorParams::fromEffect(effect), sampleRate);
    }
    if (effect.type == "eq") {
        auto bands = Equalizer::bandsFromEffect(effect);
        if (bands.empty()) {
            return nullptr;
        }
        return std::make_unique<Equalizer>(std::move(bands), sampleRate);
    }
    if (effect.type == "delay") {
        return std::make_unique<Delay>(DelayParams::fromEffect(effect), sampleRate, channels);
    }
    if (effect.type == "reverb") {
        return std::make_unique<Reverb>(ReverbParams::fromEffect(effect), sampleRate, channels);
    }

    LUMEN_LOG_DEBUG("Audio effect '{}' ({}) has no processor, passing through",
                    effect.type, effect.id);
    return nullptr;
}

EffectChain::EffectChain(const std::vector<model::Effect>& effects, int sampleRate, int channels) {
    for (const auto& effect : effects) {
        if (auto processor = createAudioProcessor(effect, sampleRate, channels)) {
            m_processors.push_back(std::move(processor));
        }
    }
}

void EffectChain::process(float* samples, size_t frames, int channels) {
    for (auto& p : m_processors) {
        p->process(samples, frames, channels);
    }
}

void EffectChain::reset() {
    for (auto& p : m_processors) {
        p->reset();
    }
}

std::vector<std::string> EffectChain::types() const {
    std::vector<std::string> out;
    out.reserve(m_processors.size());
    for (const auto& p : m_processors) {
        out.emplace_back(p->type());
    }
    return out;
}

} // namespace lumen::engine
