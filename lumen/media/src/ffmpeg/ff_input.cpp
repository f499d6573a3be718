/**
 * @file ff_input.cpp
 * @brief InputFile implementation
 */

#include "ff_input.hpp"

#include <chrono>

namespace lumen::media::ff {

int64_t InputFile::nowUs() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

int InputFile::interruptCallback(void* opaque) {
    auto* self = static_cast<InputFile*>(opaque);
    int64_t deadline = self->m_deadline.load(std::memory_order_acquire);
    return (deadline != 0 && nowUs() > deadline) ? 1 : 0;
}

void InputFile::armDeadline(Duration timeout) {
    m_deadline.store(nowUs() + timeout, std::memory_order_release);
}

Result<std::unique_ptr<InputFile>> InputFile::open(const std::string& path, Duration timeout) {
    using Ptr = std::unique_ptr<InputFile>;

    auto input = std::make_unique<InputFile>();
    input->m_path = path;

    AVFormatContext* raw = avformat_alloc_context();
    if (!raw) {
        return Err<Ptr>(ErrorCode::OutOfMemory, "Failed to allocate format context");
    }
    raw->interrupt_callback.callback = &InputFile::interruptCallback;
    raw->interrupt_callback.opaque = input.get();

    input->armDeadline(timeout);

    // Frees raw on failure
    int ret = avformat_open_input(&raw, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        return Err<Ptr>(avError(ret, "Failed to open " + path));
    }
    input->m_format.reset(raw);

    ret = avformat_find_stream_info(raw, nullptr);
    if (ret < 0) {
        return Err<Ptr>(avError(ret, "Failed to find stream info"));
    }

    input->disarm();
    return Ok(std::move(input));
}

Result<CodecContextPtr> InputFile::openDecoder(AVMediaType type, int& streamIndex) {
    streamIndex = av_find_best_stream(m_format.get(), type, -1, -1, nullptr, 0);
    if (streamIndex < 0) {
        return Err<CodecContextPtr>(avError(streamIndex, "No stream"));
    }

    AVStream* stream = m_format->streams[streamIndex];
    const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!codec) {
        return Err<CodecContextPtr>(ErrorCode::CodecNotFound, "Decoder not found");
    }

    CodecContextPtr codecCtx(avcodec_alloc_context3(codec));
    if (!codecCtx) {
        return Err<CodecContextPtr>(ErrorCode::OutOfMemory, "Failed to allocate codec context");
    }

    int ret = avcodec_parameters_to_context(codecCtx.get(), stream->codecpar);
    if (ret < 0) {
        return Err<CodecContextPtr>(avError(ret, "Failed to copy codec parameters"));
    }

    codecCtx->thread_count = 0;  // Auto
    codecCtx->thread_type = FF_THREAD_FRAME | FF_THREAD_SLICE;
    codecCtx->pkt_timebase = stream->time_base;

    ret = avcodec_open2(codecCtx.get(), codec, nullptr);
    if (ret < 0) {
        return Err<CodecContextPtr>(avError(ret, "Failed to open codec"));
    }

    // Drop everything the demuxer would otherwise read for other streams
    for (unsigned i = 0; i < m_format->nb_streams; ++i) {
        if (static_cast<int>(i) != streamIndex) {
            m_format->streams[i]->discard = AVDISCARD_ALL;
        }
    }

    return Ok(std::move(codecCtx));
}

Result<void> receiveFrame(InputFile& input, AVCodecContext* codec, int streamIndex,
                          AVPacket* packet, AVFrame* frame, bool& eof) {
    for (int iteration = 0; iteration < kMaxDecodeLoopIterations * 4; ++iteration) {
        av_frame_unref(frame);
        int ret = avcodec_receive_frame(codec, frame);
        if (ret == 0) {
            return Ok();
        }
        if (ret == AVERROR_EOF) {
            eof = true;
            return Err(ErrorCode::EndOfFile, "End of stream");
        }
        if (ret != AVERROR(EAGAIN)) {
            return Err(avError(ret, "Decode error"));
        }
        if (eof) {
            return Err(ErrorCode::EndOfFile, "End of stream");
        }

        av_packet_unref(packet);
        ret = av_read_frame(input.ctx(), packet);
        if (ret == AVERROR_EOF) {
            // Drain the decoder
            avcodec_send_packet(codec, nullptr);
            eof = true;
            continue;
        }
        if (ret < 0) {
            return Err(avError(ret, "Failed to read packet"));
        }
        if (packet->stream_index != streamIndex) {
            continue;
        }

        ret = avcodec_send_packet(codec, packet);
        if (ret < 0 && ret != AVERROR(EAGAIN)) {
            return Err(avError(ret, "Failed to send packet"));
        }
    }
    return Err(ErrorCode::DecoderError, "Decode loop limit reached");
}

} // namespace lumen::media::ff
