/**
 * @file ff_video_decoder.cpp
 * @brief FFmpegVideoDecoder implementation
 */

#include "ff_video_decoder.hpp"

#include <lumen/core/logger.hpp>

#include <algorithm>
#include <cmath>

namespace lumen::media::ff {

// ============================================================================
// Frame Conversion
// ============================================================================

namespace {

Size fitInside(Size source, Size maxSize) {
    if (maxSize.isEmpty() || (source.width <= maxSize.width && source.height <= maxSize.height)) {
        return source;
    }
    double scale = std::min(static_cast<double>(maxSize.width) / source.width,
                            static_cast<double>(maxSize.height) / source.height);
    return {std::max(1, static_cast<int>(std::lround(source.width * scale))),
            std::max(1, static_cast<int>(std::lround(source.height * scale)))};
}

} // namespace

Result<BitmapPtr> frameToBitmap(const AVFrame* frame, Size maxSize, SwsContext*& sws) {
    if (!frame || frame->width <= 0 || frame->height <= 0) {
        return Err<BitmapPtr>(ErrorCode::InvalidData, "Empty frame");
    }

    Size out = fitInside({frame->width, frame->height}, maxSize);

    sws = sws_getCachedContext(sws,
        frame->width, frame->height, static_cast<AVPixelFormat>(frame->format),
        out.width, out.height, AV_PIX_FMT_RGBA,
        SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!sws) {
        return Err<BitmapPtr>(ErrorCode::DecoderError, "Failed to create scaler");
    }

    auto bitmap = makeBitmap(out.width, out.height);
    uint8_t* dstData[4] = {bitmap->data(), nullptr, nullptr, nullptr};
    int dstLinesize[4] = {bitmap->stride(), 0, 0, 0};

    int rows = sws_scale(sws, frame->data, frame->linesize, 0, frame->height, dstData, dstLinesize);
    if (rows <= 0) {
        return Err<BitmapPtr>(ErrorCode::DecoderError, "Scaling failed");
    }
    return Ok(std::move(bitmap));
}

// ============================================================================
// FFmpegVideoDecoder
// ============================================================================

FFmpegVideoDecoder::FFmpegVideoDecoder(DecodeLimits limits)
    : m_limits(limits)
    , m_packet(av_packet_alloc())
    , m_frame(av_frame_alloc())
    , m_scratch(av_frame_alloc())
{}

FFmpegVideoDecoder::~FFmpegVideoDecoder() {
    if (m_sws) {
        sws_freeContext(m_sws);
    }
}

Result<void> FFmpegVideoDecoder::open(const std::string& path) {
    if (!m_packet || !m_frame || !m_scratch) {
        return Err(ErrorCode::OutOfMemory, "Failed to allocate decode buffers");
    }

    auto input = InputFile::open(path, m_limits.decodeTimeout);
    if (!input) {
        return Err(input.error());
    }
    m_input = std::move(input).value();

    auto codec = m_input->openDecoder(AVMEDIA_TYPE_VIDEO, m_streamIndex);
    if (!codec) {
        return Err(codec.error());
    }
    m_codec = std::move(codec).value();

    AVStream* stream = m_input->ctx()->streams[m_streamIndex];
    m_timeBase = stream->time_base;

    AVRational rate = stream->avg_frame_rate.num > 0 ? stream->avg_frame_rate : stream->r_frame_rate;
    if (rate.num > 0 && rate.den > 0) {
        m_frameDuration = av_rescale_q(1, av_inv_q(rate), {1, 1000000});
    }

    LUMEN_LOG_DEBUG("Opened video decoder {} ({}x{}, frame {}us)",
                    path, m_codec->width, m_codec->height, m_frameDuration);
    return Ok();
}

Result<void> FFmpegVideoDecoder::decodeOne() {
    auto received = receiveFrame(*m_input, m_codec.get(), m_streamIndex,
                                 m_packet.get(), m_scratch.get(), m_eof);
    if (!received) {
        return received;
    }

    av_frame_unref(m_frame.get());
    av_frame_move_ref(m_frame.get(), m_scratch.get());
    m_haveFrame = true;

    int64_t pts = m_frame->pts != AV_NOPTS_VALUE ? m_frame->pts : m_frame->best_effort_timestamp;
    Timestamp us = toMicroseconds(pts, m_timeBase);
    m_position = us != kNoTimestamp ? us
        : (m_position == kNoTimestamp ? 0 : m_position + m_frameDuration);
    return Ok();
}

Result<DecodedFrame> FFmpegVideoDecoder::present(Size maxSize) {
    if (!m_haveFrame) {
        return Err<DecodedFrame>(ErrorCode::EndOfFile, "No frame decoded");
    }
    if (m_presented.bitmap && m_presented.pts == m_position && m_presentedSize == maxSize) {
        return m_presented;
    }

    auto bitmap = frameToBitmap(m_frame.get(), maxSize, m_sws);
    if (!bitmap) {
        return Err<DecodedFrame>(bitmap.error());
    }
    m_presented = {std::move(bitmap).value(), m_position};
    m_presentedSize = maxSize;
    return m_presented;
}

Result<DecodedFrame> FFmpegVideoDecoder::frameAt(Timestamp mediaTime, Size maxSize) {
    if (!m_input) {
        return Err<DecodedFrame>(ErrorCode::InvalidArgument, "Decoder not open");
    }

    SeekAction action = decideSeek(m_position, mediaTime, m_frameDuration, m_limits);
    if (action == SeekAction::Reuse && m_haveFrame) {
        return present(maxSize);
    }

    if (action == SeekAction::Seek) {
        auto sought = seek(mediaTime);
        if (!sought) {
            return Err<DecodedFrame>(sought.error());
        }
    } else {
        m_input->armDeadline(m_limits.decodeTimeout);
    }

    for (int i = 0; i < kMaxDecodeLoopIterations; ++i) {
        if (m_haveFrame && mediaTime < m_position + m_frameDuration) {
            break;
        }
        auto decoded = decodeOne();
        if (!decoded) {
            m_input->disarm();
            // Past the last frame: hold it
            if (decoded.error().code() == ErrorCode::EndOfFile && m_haveFrame) {
                return present(maxSize);
            }
            return Err<DecodedFrame>(decoded.error());
        }
    }

    m_input->disarm();
    return present(maxSize);
}

Result<DecodedFrame> FFmpegVideoDecoder::nextFrame(Size maxSize) {
    if (!m_input) {
        return Err<DecodedFrame>(ErrorCode::InvalidArgument, "Decoder not open");
    }

    m_input->armDeadline(m_limits.decodeTimeout);
    auto decoded = decodeOne();
    m_input->disarm();
    if (!decoded) {
        return Err<DecodedFrame>(decoded.error());
    }
    return present(maxSize);
}

Result<void> FFmpegVideoDecoder::seek(Timestamp mediaTime) {
    if (!m_input) {
        return Err(ErrorCode::InvalidArgument, "Decoder not open");
    }

    m_input->armDeadline(m_limits.seekTimeout);
    int64_t target = fromMicroseconds(std::max<Timestamp>(mediaTime, 0), m_timeBase);
    int ret = av_seek_frame(m_input->ctx(), m_streamIndex, target, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
        m_input->disarm();
        return Err(avError(ret, "Seek failed"));
    }

    avcodec_flush_buffers(m_codec.get());
    m_eof = false;
    m_haveFrame = false;
    m_position = kNoTimestamp;
    LUMEN_LOG_TRACE("Seek {} -> {}us", m_input->path(), mediaTime);
    return Ok();
}

Duration FFmpegVideoDecoder::duration() const {
    if (!m_input || m_input->ctx()->duration == AV_NOPTS_VALUE) {
        return 0;
    }
    return av_rescale_q(m_input->ctx()->duration, AV_TIME_BASE_Q, {1, 1000000});
}

Size FFmpegVideoDecoder::resolution() const {
    if (!m_codec) {
        return {0, 0};
    }
    return {m_codec->width, m_codec->height};
}

} // namespace lumen::media::ff
