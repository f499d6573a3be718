/**
 * @file ff_video_decoder.hpp
 * @brief VideoDecoder over libavcodec
 */

#pragma once

#include <lumen/media/decoder.hpp>

#include "ff_common.hpp"
#include "ff_input.hpp"

namespace lumen::media::ff {

/// Convert a decoded frame to an RGBA bitmap fitting inside maxSize
Result<BitmapPtr> frameToBitmap(const AVFrame* frame, Size maxSize, SwsContext*& sws);

class FFmpegVideoDecoder : public VideoDecoder {
public:
    explicit FFmpegVideoDecoder(DecodeLimits limits);
    ~FFmpegVideoDecoder() override;

    Result<void> open(const std::string& path);

    Result<DecodedFrame> frameAt(Timestamp mediaTime, Size maxSize) override;
    Result<DecodedFrame> nextFrame(Size maxSize) override;
    Result<void> seek(Timestamp mediaTime) override;

    [[nodiscard]] Timestamp position() const override { return m_position; }
    [[nodiscard]] Duration duration() const override;
    [[nodiscard]] Size resolution() const override;
    [[nodiscard]] Duration frameDuration() const override { return m_frameDuration; }

private:
    /// Decode one frame into m_frame and advance m_position
    Result<void> decodeOne();

    Result<DecodedFrame> present(Size maxSize);

    DecodeLimits m_limits;
    std::unique_ptr<InputFile> m_input;
    CodecContextPtr m_codec;
    int m_streamIndex = -1;
    AVRational m_timeBase{1, 1000000};

    PacketPtr m_packet;
    FramePtr m_frame;      // frame at m_position
    FramePtr m_scratch;
    SwsContext* m_sws = nullptr;   // sws_getCachedContext manages reuse

    Timestamp m_position = kNoTimestamp;
    Duration m_frameDuration = kTimeBaseUs / 30;
    bool m_eof = false;
    bool m_haveFrame = false;

    // Last bitmap handed out, reused while the target stays within its frame
    DecodedFrame m_presented;
    Size m_presentedSize;
};

} // namespace lumen::media::ff
