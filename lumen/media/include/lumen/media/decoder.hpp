/**
 * @file decoder.hpp
 * @brief Decoder interfaces consumed by the frame and audio caches
 *
 * The caches only see these interfaces. The FFmpeg implementation lives in
 * ffmpeg_decoder_factory.hpp; tests substitute in-memory fakes.
 */

#pragma once

#include <lumen/core/result.hpp>
#include <lumen/core/types.hpp>
#include <lumen/media/audio_buffer.hpp>
#include <lumen/media/bitmap.hpp>
#include <lumen/model/media_item.hpp>

#include <memory>

namespace lumen::media {

/// A decoded video frame with its media timestamp
struct DecodedFrame {
    BitmapPtr bitmap;
    Timestamp pts = kNoTimestamp;
};

/**
 * @brief Decode timeouts and seek thresholds
 */
struct DecodeLimits {
    Duration seekEpsilon = msToUs(50);          // tolerated backward jitter
    Duration maxForwardDecode = msToUs(2000);   // beyond this, seek instead
    Duration decodeTimeout = msToUs(10000);     // open and forward decode
    Duration seekTimeout = msToUs(500);         // seek until the target frame settles
};

enum class SeekAction {
    Reuse,          // Current frame already covers the target
    DecodeForward,  // Decode sequentially up to the target
    Seek,           // Reposition the demuxer first
};

/**
 * @brief Decide how to reach a target from the current decode position
 *
 * @param position      Timestamp of the last decoded frame (kNoTimestamp if none)
 * @param frameDuration Nominal frame duration of the stream
 */
SeekAction decideSeek(Timestamp position, Timestamp target, Duration frameDuration,
                      const DecodeLimits& limits);

/**
 * @brief Random-access and sequential video decoding
 *
 * Output bitmaps fit inside the requested size (aspect preserved, never
 * upscaled); an empty size means native resolution.
 */
class VideoDecoder {
public:
    virtual ~VideoDecoder() = default;

    /// Frame displayed at mediaTime (the last frame with pts <= mediaTime)
    virtual Result<DecodedFrame> frameAt(Timestamp mediaTime, Size maxSize) = 0;

    /// Next frame in decode order
    virtual Result<DecodedFrame> nextFrame(Size maxSize) = 0;

    virtual Result<void> seek(Timestamp mediaTime) = 0;

    /// Timestamp of the last decoded frame, kNoTimestamp before the first
    [[nodiscard]] virtual Timestamp position() const = 0;

    [[nodiscard]] virtual Duration duration() const = 0;
    [[nodiscard]] virtual Size resolution() const = 0;
    [[nodiscard]] virtual Duration frameDuration() const = 0;
};

/**
 * @brief Opens decoders for media items
 *
 * Every returned object owns its native resources and releases them on
 * destruction.
 */
class DecoderFactory {
public:
    virtual ~DecoderFactory() = default;

    virtual Result<std::unique_ptr<VideoDecoder>> openVideo(const model::MediaItem& item) = 0;

    /// Decode a still image (first video frame of the file) at native size
    virtual Result<BitmapPtr> decodeImage(const model::MediaItem& item) = 0;

    /// Decode the whole audio stream, resampled to float interleaved
    virtual Result<AudioBufferPtr> decodeAudio(const model::MediaItem& item,
                                               int sampleRate, int channels) = 0;
};

} // namespace lumen::media
