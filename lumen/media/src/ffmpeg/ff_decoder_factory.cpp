/**
 * @file ff_decoder_factory.cpp
 * @brief FFmpeg decoder factory: video handles, still images, audio buffers
 */

#include <lumen/media/ffmpeg_decoder_factory.hpp>

#include <lumen/core/logger.hpp>

#include "ff_common.hpp"
#include "ff_input.hpp"
#include "ff_video_decoder.hpp"

namespace lumen::media {

FFmpegDecoderFactory::FFmpegDecoderFactory(DecodeLimits limits)
    : m_limits(limits)
{}

Result<std::unique_ptr<VideoDecoder>> FFmpegDecoderFactory::openVideo(const model::MediaItem& item) {
    using Ptr = std::unique_ptr<VideoDecoder>;

    auto decoder = std::make_unique<ff::FFmpegVideoDecoder>(m_limits);
    auto opened = decoder->open(item.path);
    if (!opened) {
        return Err<Ptr>(opened.error());
    }
    return Ok<Ptr>(std::move(decoder));
}

Result<BitmapPtr> FFmpegDecoderFactory::decodeImage(const model::MediaItem& item) {
    auto input = ff::InputFile::open(item.path, m_limits.decodeTimeout);
    if (!input) {
        return Err<BitmapPtr>(input.error());
    }
    auto& file = *input.value();

    int streamIndex = -1;
    auto codec = file.openDecoder(AVMEDIA_TYPE_VIDEO, streamIndex);
    if (!codec) {
        return Err<BitmapPtr>(codec.error());
    }

    ff::PacketPtr packet(av_packet_alloc());
    ff::FramePtr frame(av_frame_alloc());
    if (!packet || !frame) {
        return Err<BitmapPtr>(ErrorCode::OutOfMemory, "Failed to allocate decode buffers");
    }

    file.armDeadline(m_limits.decodeTimeout);
    bool eof = false;
    auto received = ff::receiveFrame(file, codec.value().get(), streamIndex,
                                     packet.get(), frame.get(), eof);
    file.disarm();
    if (!received) {
        return Err<BitmapPtr>(received.error());
    }

    SwsContext* sws = nullptr;
    auto bitmap = ff::frameToBitmap(frame.get(), {}, sws);
    sws_freeContext(sws);

    if (bitmap) {
        LUMEN_LOG_DEBUG("Decoded image {} ({}x{})", item.path,
                        bitmap.value()->width(), bitmap.value()->height());
    }
    return bitmap;
}

Result<AudioBufferPtr> FFmpegDecoderFactory::decodeAudio(const model::MediaItem& item,
                                                         int sampleRate, int channels) {
    auto input = ff::InputFile::open(item.path, m_limits.decodeTimeout);
    if (!input) {
        return Err<AudioBufferPtr>(input.error());
    }
    auto& file = *input.value();

    int streamIndex = -1;
    auto codecResult = file.openDecoder(AVMEDIA_TYPE_AUDIO, streamIndex);
    if (!codecResult) {
        return Err<AudioBufferPtr>(codecResult.error());
    }
    AVCodecContext* codec = codecResult.value().get();

    // Resample whatever the stream carries to float interleaved
    AVChannelLayout outLayout;
    av_channel_layout_default(&outLayout, channels);

    SwrContext* rawSwr = nullptr;
    int ret = swr_alloc_set_opts2(&rawSwr,
        &outLayout, AV_SAMPLE_FMT_FLT, sampleRate,
        &codec->ch_layout, codec->sample_fmt, codec->sample_rate,
        0, nullptr);
    ff::SwrContextPtr swr(rawSwr);
    av_channel_layout_uninit(&outLayout);
    if (ret < 0) {
        return Err<AudioBufferPtr>(ff::avError(ret, "swr_alloc_set_opts2"));
    }
    ret = swr_init(swr.get());
    if (ret < 0) {
        return Err<AudioBufferPtr>(ff::avError(ret, "swr_init"));
    }

    ff::PacketPtr packet(av_packet_alloc());
    ff::FramePtr frame(av_frame_alloc());
    if (!packet || !frame) {
        return Err<AudioBufferPtr>(ErrorCode::OutOfMemory, "Failed to allocate decode buffers");
    }

    auto buffer = std::make_shared<AudioBuffer>();
    buffer->sampleRate = sampleRate;
    buffer->channels = channels;

    auto appendConverted = [&](const uint8_t** in, int inSamples) -> Result<void> {
        int maxOut = swr_get_out_samples(swr.get(), inSamples);
        if (maxOut <= 0) {
            return Ok();
        }
        size_t offset = buffer->samples.size();
        buffer->samples.resize(offset + static_cast<size_t>(maxOut) * static_cast<size_t>(channels));
        uint8_t* out[1] = {reinterpret_cast<uint8_t*>(buffer->samples.data() + offset)};
        int converted = swr_convert(swr.get(), out, maxOut, in, inSamples);
        if (converted < 0) {
            return Err(ff::avError(converted, "swr_convert"));
        }
        buffer->samples.resize(offset + static_cast<size_t>(converted) * static_cast<size_t>(channels));
        return Ok();
    };

    file.armDeadline(m_limits.decodeTimeout);
    bool eof = false;
    for (;;) {
        auto received = ff::receiveFrame(file, codec, streamIndex, packet.get(), frame.get(), eof);
        if (!received) {
            if (received.error().code() == ErrorCode::EndOfFile) {
                break;
            }
            file.disarm();
            return Err<AudioBufferPtr>(received.error());
        }
        auto appended = appendConverted(const_cast<const uint8_t**>(frame->extended_data),
                                        frame->nb_samples);
        if (!appended) {
            file.disarm();
            return Err<AudioBufferPtr>(appended.error());
        }
    }
    file.disarm();

    // Flush the resampler tail
    auto flushed = appendConverted(nullptr, 0);
    if (!flushed) {
        return Err<AudioBufferPtr>(flushed.error());
    }

    LUMEN_LOG_DEBUG("Decoded audio {} ({} frames @ {} Hz)", item.path,
                    buffer->frameCount(), sampleRate);
    return Ok<AudioBufferPtr>(std::move(buffer));
}

} // namespace lumen::media
