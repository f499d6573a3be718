/**
 * @file ff_common.hpp
 * @brief Common FFmpeg includes and utilities
 *
 * FFmpeg headers are only included from lumen/media/src, never from a
 * public header.
 */

#pragma once

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/channel_layout.h>
#include <libavutil/imgutils.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

#include <lumen/core/result.hpp>
#include <lumen/core/types.hpp>

#include <memory>
#include <string>

namespace lumen::media::ff {

inline std::string avErrorString(int errnum) {
    char buf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(errnum, buf, sizeof(buf));
    return buf;
}

/**
 * @brief Map an FFmpeg error to a Lumen Error
 *
 * AVERROR_EXIT only comes back when our interrupt callback fired, so it is
 * reported as a timeout.
 */
inline Error avError(int errnum, const std::string& context = "") {
    std::string msg = context;
    if (!msg.empty()) msg += ": ";
    msg += avErrorString(errnum);

    ErrorCode code = ErrorCode::DecoderError;
    if (errnum == AVERROR(ENOMEM)) {
        code = ErrorCode::OutOfMemory;
    } else if (errnum == AVERROR(ENOENT)) {
        code = ErrorCode::FileNotFound;
    } else if (errnum == AVERROR_STREAM_NOT_FOUND) {
        code = ErrorCode::NotFound;
    } else if (errnum == AVERROR_EOF) {
        code = ErrorCode::EndOfFile;
    } else if (errnum == AVERROR_DECODER_NOT_FOUND) {
        code = ErrorCode::CodecNotFound;
    } else if (errnum == AVERROR_INVALIDDATA) {
        code = ErrorCode::InvalidData;
    } else if (errnum == AVERROR_EXIT) {
        code = ErrorCode::Timeout;
    }

    return Error(code, msg);
}

/// Stream timestamp -> microseconds
inline Timestamp toMicroseconds(int64_t pts, AVRational timeBase) {
    if (pts == AV_NOPTS_VALUE) return kNoTimestamp;
    return av_rescale_q(pts, timeBase, {1, 1000000});
}

/// Microseconds -> stream timestamp
inline int64_t fromMicroseconds(Timestamp us, AVRational timeBase) {
    if (us == kNoTimestamp) return AV_NOPTS_VALUE;
    return av_rescale_q(us, {1, 1000000}, timeBase);
}

// ============================================================================
// RAII Deleters
// ============================================================================

struct AVFormatContextDeleter {
    void operator()(AVFormatContext* ctx) const {
        if (ctx) {
            avformat_close_input(&ctx);
        }
    }
};

struct AVCodecContextDeleter {
    void operator()(AVCodecContext* ctx) const {
        if (ctx) {
            avcodec_free_context(&ctx);
        }
    }
};

struct AVFrameDeleter {
    void operator()(AVFrame* frame) const {
        if (frame) {
            av_frame_free(&frame);
        }
    }
};

struct AVPacketDeleter {
    void operator()(AVPacket* pkt) const {
        if (pkt) {
            av_packet_free(&pkt);
        }
    }
};

struct SwsContextDeleter {
    void operator()(SwsContext* ctx) const {
        if (ctx) {
            sws_freeContext(ctx);
        }
    }
};

struct SwrContextDeleter {
    void operator()(SwrContext* ctx) const {
        if (ctx) {
            swr_free(&ctx);
        }
    }
};

using FormatContextPtr = std::unique_ptr<AVFormatContext, AVFormatContextDeleter>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, AVCodecContextDeleter>;
using FramePtr = std::unique_ptr<AVFrame, AVFrameDeleter>;
using PacketPtr = std::unique_ptr<AVPacket, AVPacketDeleter>;
using SwsContextPtr = std::unique_ptr<SwsContext, SwsContextDeleter>;
using SwrContextPtr = std::unique_ptr<SwrContext, SwrContextDeleter>;

} // namespace lumen::media::ff
