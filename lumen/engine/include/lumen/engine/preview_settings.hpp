/**
 * @file preview_settings.hpp
 * @brief Per-session tunables read from the configuration store
 */

#pragma once

#include <lumen/core/config.hpp>
#include <lumen/core/types.hpp>
#include <lumen/engine/audio_scheduler.hpp>
#include <lumen/engine/render_backend.hpp>
#include <lumen/media/decoder.hpp>

#include <string>

namespace lumen::engine {

struct PreviewSettings {
    Size canvas{1280, 720};
    double frameRate = 30.0;
    Color background = Color::black();
    BackendPreference backend = BackendPreference::Auto;

    size_t videoDecoders = kDefaultVideoDecoderCapacity;
    media::DecodeLimits decodeLimits;
    Duration streamingDrift = kStreamingDriftThreshold;

    int sampleRate = 48000;
    int channels = 2;
    AudioSchedulerSettings audio;
    double masterVolume = 1.0;

    Duration commitInterval = msToUs(32);
    std::string fontFile;

    /**
     * @brief Read every preview key, falling back to the defaults above
     *
     * Out-of-range values are clamped to something usable rather than
     * rejected.
     */
    static PreviewSettings fromConfig(const Config& config);

    [[nodiscard]] Duration frameDuration() const;
};

} // namespace lumen::engine
