/**
 * @file ffmpeg_decoder_factory.hpp
 * @brief FFmpeg-backed decoders
 */

#pragma once

#include <lumen/media/decoder.hpp>

namespace lumen::media {

/**
 * @brief Opens FFmpeg decoders for project media
 *
 * Video decoders keep their demuxer open between calls and honour the
 * seek rules of decideSeek(). Every blocking call runs under an interrupt
 * deadline taken from DecodeLimits.
 */
class FFmpegDecoderFactory : public DecoderFactory {
public:
    explicit FFmpegDecoderFactory(DecodeLimits limits = {});

    Result<std::unique_ptr<VideoDecoder>> openVideo(const model::MediaItem& item) override;
    Result<BitmapPtr> decodeImage(const model::MediaItem& item) override;
    Result<AudioBufferPtr> decodeAudio(const model::MediaItem& item,
                                       int sampleRate, int channels) override;

    [[nodiscard]] const DecodeLimits& limits() const { return m_limits; }

private:
    DecodeLimits m_limits;
};

} // namespace lumen::media
