/**
 * @file audio_effects.hpp
 * @brief Built-in audio processors for a track bus effect chain
 *
 * Processors work in place on interleaved float blocks at the graph sample
 * rate. Every processor is deterministic; the reverb tail comes from a
 * fixed comb/allpass network rather than a noise impulse response.
 */

#pragma once

#include <lumen/model/effect.hpp>

#include <memory>
#include <string>
#include <vector>

namespace lumen::engine {

class AudioProcessor {
public:
    virtual ~AudioProcessor() = default;

    /// Process frames * channels interleaved samples in place
    virtual void process(float* samples, size_t frames, int channels) = 0;

    /// Drop any state carried between blocks (filter memory, delay lines)
    virtual void reset() = 0;

    [[nodiscard]] virtual const char* type() const = 0;
};

// ========== Compressor ==========

struct CompressorParams {
    double thresholdDb = -24.0;
    double ratio = 4.0;
    double attack = 0.003;    // seconds
    double release = 0.25;    // seconds
    double kneeDb = 30.0;

    static CompressorParams fromEffect(const model::Effect& effect);
};

/// Feed-forward peak compressor with a soft knee, linked across channels
class Compressor : public AudioProcessor {
public:
    Compressor(const CompressorParams& params, int sampleRate);

    void process(float* samples, size_t frames, int channels) override;
    void reset() override { m_envelopeDb = 0.0; }
    [[nodiscard]] const char* type() const override { return "compressor"; }

    /// Static gain reduction (dB, <= 0) for an input level
    [[nodiscard]] double gainReductionDb(double inputDb) const;

private:
    CompressorParams m_params;
    double m_attackCoeff;
    double m_releaseCoeff;
    double m_envelopeDb = 0.0;   // smoothed gain reduction
};

// ========== Equalizer ==========

enum class BiquadType {
    Peaking,
    LowShelf,
    HighShelf,
    LowPass,
    HighPass,
};

/// "lowshelf", "highshelf", "lowpass", "highpass"; anything else is peaking
BiquadType parseBiquadType(const std::string& name);

struct EqBand {
    BiquadType type = BiquadType::Peaking;
    double frequency = 1000.0;   // [20, 20000]
    double gainDb = 0.0;         // [-24, 24]
    double q = 1.0;              // [0.1, 18]
};

/// Direct form I biquad, one state per channel
class Biquad {
public:
    Biquad(const EqBand& band, int sampleRate);

    float processSample(float x, int channel);
    void reset();

private:
    struct State {
        double x1 = 0.0, x2 = 0.0, y1 = 0.0, y2 = 0.0;
    };

    double m_b0 = 1.0, m_b1 = 0.0, m_b2 = 0.0, m_a1 = 0.0, m_a2 = 0.0;
    std::vector<State> m_state;
};

class Equalizer : public AudioProcessor {
public:
    Equalizer(std::vector<EqBand> bands, int sampleRate);

    /// Bands from params.bands, clamped to their legal ranges
    static std::vector<EqBand> bandsFromEffect(const model::Effect& effect);

    void process(float* samples, size_t frames, int channels) override;
    void reset() override;
    [[nodiscard]] const char* type() const override { return "eq"; }

    [[nodiscard]] const std::vector<EqBand>& bands() const { return m_bands; }

private:
    std::vector<EqBand> m_bands;
    std::vector<Biquad> m_filters;
};

// ========== Delay ==========

struct DelayParams {
    double time = 0.5;       // seconds, [0, 2]
    double feedback = 0.3;   // [0, 0.95]
    double wetLevel = 0.5;   // dry = 1 - wet

    static DelayParams fromEffect(const model::Effect& effect);
};

class Delay : public AudioProcessor {
public:
    Delay(const DelayParams& params, int sampleRate, int channels);

    void process(float* samples, size_t frames, int channels) override;
    void reset() override;
    [[nodiscard]] const char* type() const override { return "delay"; }

private:
    DelayParams m_params;
    int m_channels;
    size_t m_delayFrames;
    std::vector<float> m_line;   // interleaved ring
    size_t m_cursor = 0;
};

// ========== Reverb ==========

struct ReverbParams {
    double roomSize = 0.5;
    double damping = 0.5;
    double wetLevel = 0.5;
    double dryLevel = 0.7;

    static ReverbParams fromEffect(const model::Effect& effect);
};

/**
 * @brief Schroeder/Moorer style reverb
 *
 * Four damped feedback combs in parallel followed by two allpasses per
 * channel. Room size maps to comb feedback so the tail length follows the
 * 0.5 + roomSize * 3.5 seconds decay of a measured room.
 */
class Reverb : public AudioProcessor {
public:
    Reverb(const ReverbParams& params, int sampleRate, int channels);
    ~Reverb() override;

    void process(float* samples, size_t frames, int channels) override;
    void reset() override;
    [[nodiscard]] const char* type() const override { return "reverb"; }

    /// Seconds for the tail to decay by 60 dB
    [[nodiscard]] double decayTime() const { return 0.5 + m_params.roomSize * 3.5; }

private:
    struct Channel;

    ReverbParams m_params;
    std::vector<std::unique_ptr<Channel>> m_channels;
};

// ========== Chain ==========

/**
 * @brief Build a processor for an effect entry
 *
 * @return null for disabled effects and unknown types (they pass through)
 */
[[nodiscard]] std::unique_ptr<AudioProcessor> createAudioProcessor(const model::Effect& effect,
                                                                   int sampleRate, int channels);

/**
 * @brief Ordered processors of one track bus
 */
class EffectChain {
public:
    EffectChain() = default;
    EffectChain(const std::vector<model::Effect>& effects, int sampleRate, int channels);

    void process(float* samples, size_t frames, int channels);
    void reset();

    [[nodiscard]] bool empty() const { return m_processors.empty(); }
    [[nodiscard]] size_t size() const { return m_processors.size(); }

    /// Processor type names in chain order
    [[nodiscard]] std::vector<std::string> types() const;

private:
    std::vector<std::unique_ptr<AudioProcessor>> m_processors;
};

} // namespace lumen::engine
