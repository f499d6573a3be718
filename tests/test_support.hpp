/**
 * @file test_support.hpp
 * @brief Fakes and builders shared by the unit tests
 *
 * Everything here runs in memory: decoders hand out solid-colour frames,
 * the rasterizer paints solid boxes and time only moves when a test says so.
 */

#pragma once

#include <lumen/core/clock.hpp>
#include <lumen/core/frame_scheduler.hpp>
#include <lumen/core/types.hpp>
#include <lumen/engine/overlay_rasterizer.hpp>
#include <lumen/media/decoder.hpp>
#include <lumen/model/project_store.hpp>

#include <algorithm>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace lumen::test {

inline constexpr Size kTestCanvas{64, 36};

// ============================================================================
// Time
// ============================================================================

/// Wall clock advanced by hand, shared by clocks and timer queues
class ManualTime {
public:
    [[nodiscard]] TimeSource source() const {
        auto now = m_now;
        return [now] { return now->load(); };
    }

    [[nodiscard]] int64_t now() const { return m_now->load(); }
    void advance(Duration delta) { m_now->fetch_add(delta); }
    void set(int64_t value) { m_now->store(value); }

private:
    std::shared_ptr<std::atomic<int64_t>> m_now = std::make_shared<std::atomic<int64_t>>(0);
};

/// Advance time in steps, draining the queue after every step
inline void pump(ManualTime& time, TimerQueue& queue, Duration total, Duration step = msToUs(10)) {
    queue.runDue();
    for (Duration elapsed = 0; elapsed < total; elapsed += step) {
        time.advance(step);
        queue.runDue();
    }
}

// ============================================================================
// Decoders
// ============================================================================

struct DecoderCounters {
    std::atomic<int> opened{0};
    std::atomic<int> live{0};
    std::atomic<int> frameAtCalls{0};
    std::atomic<int> nextFrameCalls{0};
    std::atomic<int> seeks{0};
    std::atomic<int> imageDecodes{0};
    std::atomic<int> audioDecodes{0};
};

/**
 * @brief Decoder producing solid frames on a fixed frame grid
 */
class FakeVideoDecoder : public media::VideoDecoder {
public:
    FakeVideoDecoder(Color color, Size resolution, Duration duration, Duration frameDuration,
                     bool failing, std::shared_ptr<DecoderCounters> counters)
        : m_color(color)
        , m_resolution(resolution)
        , m_duration(duration)
        , m_frameDuration(frameDuration)
        , m_failing(failing)
        , m_counters(std::move(counters)) {}

    ~FakeVideoDecoder() override { m_counters->live.fetch_sub(1); }

    Result<media::DecodedFrame> frameAt(Timestamp mediaTime, Size) override {
        m_counters->frameAtCalls.fetch_add(1);
        if (m_failing) {
            return Err<media::DecodedFrame>(ErrorCode::DecoderError, "fake decode failure");
        }
        const Timestamp clamped = std::clamp<Timestamp>(mediaTime, 0, m_duration - 1);
        m_position = clamped / m_frameDuration * m_frameDuration;
        return Ok(makeFrame(m_position));
    }

    Result<media::DecodedFrame> nextFrame(Size) override {
        m_counters->nextFrameCalls.fetch_add(1);
        if (m_failing) {
            return Err<media::DecodedFrame>(ErrorCode::DecoderError, "fake decode failure");
        }
        const Timestamp next = m_position == kNoTimestamp ? 0 : m_position + m_frameDuration;
        if (next >= m_duration) {
            return Err<media::DecodedFrame>(ErrorCode::EndOfFile);
        }
        m_position = next;
        return Ok(makeFrame(m_position));
    }

    Result<void> seek(Timestamp) override {
        m_counters->seeks.fetch_add(1);
        m_position = kNoTimestamp;
        return Ok();
    }

    [[nodiscard]] Timestamp position() const override { return m_position; }
    [[nodiscard]] Duration duration() const override { return m_duration; }
    [[nodiscard]] Size resolution() const override { return m_resolution; }
    [[nodiscard]] Duration frameDuration() const override { return m_frameDuration; }

private:
    media::DecodedFrame makeFrame(Timestamp pts) const {
        return {media::makeBitmap(m_resolution.width, m_resolution.height, m_color), pts};
    }

    Color m_color;
    Size m_resolution;
    Duration m_duration;
    Duration m_frameDuration;
    bool m_failing;
    std::shared_ptr<DecoderCounters> m_counters;
    Timestamp m_position = kNoTimestamp;
};

/**
 * @brief In-memory decoder factory
 *
 * Every media item decodes to its configured colour (white by default).
 * Audio decodes to a constant level for the item's duration.
 */
class FakeDecoderFactory : public media::DecoderFactory {
public:
    static constexpr Duration kFrameDuration = kTimeBaseUs / 30;
    static constexpr Duration kDefaultDuration = 60 * kTimeBaseUs;

    explicit FakeDecoderFactory(Size resolution = kTestCanvas) : m_resolution(resolution) {}

    void setColor(const std::string& mediaId, Color color) {
        std::lock_guard lock(m_mutex);
        m_colors[mediaId] = color;
    }

    /// openVideo, decodeImage and decodeAudio fail for this media
    void failOpen(const std::string& mediaId) {
        std::lock_guard lock(m_mutex);
        m_failOpen.insert(mediaId);
    }

    /// Decoders open fine but every frame request fails
    void failFrames(const std::string& mediaId) {
        std::lock_guard lock(m_mutex);
        m_failFrames.insert(mediaId);
    }

    void setAudioLevel(float level) { m_audioLevel = level; }

    Result<std::unique_ptr<media::VideoDecoder>> openVideo(const model::MediaItem& item) override {
        using Ptr = std::unique_ptr<media::VideoDecoder>;
        std::lock_guard lock(m_mutex);
        if (m_failOpen.count(item.id)) {
            return Err<Ptr>(ErrorCode::FileOpenFailed, "cannot open " + item.id);
        }
        counters->opened.fetch_add(1);
        counters->live.fetch_add(1);
        return Ok<Ptr>(std::make_unique<FakeVideoDecoder>(
            colorFor(item.id), m_resolution, durationOf(item), kFrameDuration,
            m_failFrames.count(item.id) > 0, counters));
    }

    Result<media::BitmapPtr> decodeImage(const model::MediaItem& item) override {
        std::lock_guard lock(m_mutex);
        counters->imageDecodes.fetch_add(1);
        if (m_failOpen.count(item.id)) {
            return Err<media::BitmapPtr>(ErrorCode::InvalidData, "cannot decode " + item.id);
        }
        return Ok(media::makeBitmap(m_resolution.width, m_resolution.height, colorFor(item.id)));
    }

    Result<media::AudioBufferPtr> decodeAudio(const model::MediaItem& item, int sampleRate,
                                              int channels) override {
        std::lock_guard lock(m_mutex);
        counters->audioDecodes.fetch_add(1);
        if (m_failOpen.count(item.id)) {
            return Err<media::AudioBufferPtr>(ErrorCode::DecoderError, "cannot decode " + item.id);
        }
        auto buffer = std::make_shared<media::AudioBuffer>();
        buffer->sampleRate = sampleRate;
        buffer->channels = channels;
        const auto frames = static_cast<size_t>(durationOf(item) * sampleRate / kTimeBaseUs);
        buffer->samples.assign(frames * static_cast<size_t>(channels), m_audioLevel);
        return Ok<media::AudioBufferPtr>(std::move(buffer));
    }

    std::shared_ptr<DecoderCounters> counters = std::make_shared<DecoderCounters>();

private:
    Color colorFor(const std::string& mediaId) const {
        auto it = m_colors.find(mediaId);
        return it != m_colors.end() ? it->second : Color::white();
    }

    static Duration durationOf(const model::MediaItem& item) {
        return item.metadata.duration > 0 ? item.metadata.duration : kDefaultDuration;
    }

    Size m_resolution;
    std::mutex m_mutex;
    std::map<std::string, Color> m_colors;
    std::set<std::string> m_failOpen;
    std::set<std::string> m_failFrames;
    float m_audioLevel = 0.5f;
};

// ============================================================================
// Rasterizer
// ============================================================================

/// Solid boxes in the entity colour; subtitles as a bottom band
class FakeRasterizer : public engine::OverlayRasterizer {
public:
    static constexpr int kTextWidth = 16;
    static constexpr int kTextHeight = 8;
    static constexpr int kGraphicSize = 8;

    media::BitmapPtr renderText(const model::TextClip& text, Size) override {
        ++textCalls;
        if (text.text.empty()) {
            return nullptr;
        }
        return media::makeBitmap(kTextWidth, kTextHeight, text.style.color);
    }

    media::BitmapPtr renderShape(const model::ShapeClip& shape, Size) override {
        ++shapeCalls;
        return media::makeBitmap(kGraphicSize, kGraphicSize, shape.style.fill.value_or(Color::transparent()));
    }

    media::BitmapPtr renderSvg(const model::SvgClip& svg, Size) override {
        ++svgCalls;
        return media::makeBitmap(kGraphicSize, kGraphicSize, svg.tintColor.value_or(Color::white()));
    }

    media::BitmapPtr renderSticker(const model::StickerClip&, Size) override {
        ++stickerCalls;
        return media::makeBitmap(kGraphicSize, kGraphicSize, Color::white());
    }

    media::BitmapPtr renderSubtitle(const model::Subtitle& subtitle, Size canvas) override {
        ++subtitleCalls;
        auto bitmap = media::makeBitmap(canvas.width, canvas.height);
        for (int y = canvas.height * 3 / 4; y < canvas.height; ++y) {
            for (int x = 0; x < canvas.width; ++x) {
                bitmap->setPixel(x, y, subtitle.style.color);
            }
        }
        return bitmap;
    }

    int textCalls = 0;
    int shapeCalls = 0;
    int svgCalls = 0;
    int stickerCalls = 0;
    int subtitleCalls = 0;
};

// ============================================================================
// Builders
// ============================================================================

inline model::MediaItem mediaItem(const std::string& id, MediaType type,
                                  Duration duration = FakeDecoderFactory::kDefaultDuration) {
    model::MediaItem item;
    item.id = id;
    item.name = id;
    item.type = type;
    item.path = "/media/" + id;
    item.metadata.duration = duration;
    item.metadata.width = kTestCanvas.width;
    item.metadata.height = kTestCanvas.height;
    item.metadata.frameRate = 30.0;
    item.metadata.sampleRate = 48000;
    item.metadata.channels = 2;
    return item;
}

inline model::MediaClip makeClip(const std::string& id, const std::string& mediaId,
                                 model::ClipKind kind, Timestamp start, Duration duration,
                                 Timestamp inPoint = 0) {
    model::MediaClip clip;
    clip.id = id;
    clip.mediaId = mediaId;
    clip.kind = kind;
    clip.startTime = start;
    clip.duration = duration;
    clip.inPoint = inPoint;
    clip.outPoint = inPoint + duration;
    return clip;
}

inline model::Track makeTrack(const std::string& id, model::TrackType type,
                              std::vector<model::MediaClip> clips = {}) {
    model::Track track;
    track.id = id;
    track.name = id;
    track.type = type;
    for (auto& clip : clips) {
        clip.trackId = id;
        track.clips.push_back(std::move(clip));
    }
    return track;
}

inline model::TextClip makeText(const std::string& id, const std::string& trackId, Timestamp start,
                                Duration duration, Color color) {
    model::TextClip text;
    text.id = id;
    text.trackId = trackId;
    text.startTime = start;
    text.duration = duration;
    text.text = id;
    text.style.color = color;
    return text;
}

inline model::ShapeClip makeShape(const std::string& id, const std::string& trackId, Timestamp start,
                                  Duration duration, Color fill) {
    model::ShapeClip shape;
    shape.id = id;
    shape.trackId = trackId;
    shape.startTime = start;
    shape.duration = duration;
    shape.style.fill = fill;
    return shape;
}

inline Color centre(const media::Bitmap& bitmap) {
    return bitmap.pixel(bitmap.width() / 2, bitmap.height() / 2);
}

} // namespace lumen::test
