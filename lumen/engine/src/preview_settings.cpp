/**
 * @file preview_settings.cpp
 * @brief PreviewSettings loader
 */

#include <lumen/engine/preview_settings.hpp>

#include <algorithm>
#include <cmath>

namespace lumen::engine {

namespace {

Duration msKey(const Config& config, const std::string& key, int64_t fallbackMs, int64_t minMs) {
    return msToUs(std::max(config.get<int64_t>(key, fallbackMs), minMs));
}

} // namespace

PreviewSettings PreviewSettings::fromConfig(const Config& config) {
    PreviewSettings s;

    s.canvas.width = std::max(config.get<int>("preview.width", s.canvas.width), 1);
    s.canvas.height = std::max(config.get<int>("preview.height", s.canvas.height), 1);
    s.frameRate = std::clamp(config.get<double>("preview.frame_rate", s.frameRate), 1.0, 240.0);
    s.background = Color::fromHex(config.get<std::string>("preview.background", "#000000"));
    s.backend = parseBackendPreference(config.get<std::string>("render.backend", "auto"));

    s.videoDecoders = static_cast<size_t>(
        std::max<int64_t>(config.get<int64_t>("cache.video_decoders", 8), 1));
    s.decodeLimits.seekEpsilon = msKey(config, "cache.seek_epsilon_ms", 50, 0);
    s.decodeLimits.decodeTimeout = msKey(config, "cache.decode_timeout_ms", 10000, 1);
    s.decodeLimits.seekTimeout = msKey(config, "cache.seek_timeout_ms", 500, 1);
    s.decodeLimits.maxForwardDecode = msKey(config, "cache.max_forward_decode_ms", 2000, 0);
    s.streamingDrift = msKey(config, "streaming.drift_threshold_ms", 100, 1);

    s.sampleRate = std::clamp(config.get<int>("audio.sample_rate", s.sampleRate), 8000, 192000);
    s.channels = std::clamp(config.get<int>("audio.channels", s.channels), 1, 2);
    s.audio.scheduleAhead = msKey(config, "audio.schedule_ahead_ms", 200, 1);
    s.audio.interval = msKey(config, "audio.scheduler_interval_ms", 100, 1);
    s.audio.linkedClipTolerance = msKey(config, "audio.linked_clip_tolerance_ms", 10, 0);
    s.masterVolume = std::clamp(config.get<double>("audio.master_volume", s.masterVolume), 0.0, 4.0);

    s.commitInterval = msKey(config, "interaction.commit_interval_ms", 32, 1);
    s.fontFile = config.get<std::string>("overlay.font_file", "");
    return s;
}

Duration PreviewSettings::frameDuration() const {
    return static_cast<Duration>(std::llround(static_cast<double>(kTimeBaseUs) / frameRate));
}

} // namespace lumen::engine
