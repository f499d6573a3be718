/**
 * @file streaming_source.cpp
 * @brief StreamingSource implementation
 */

#include <lumen/media/streaming_source.hpp>

#include <lumen/core/logger.hpp>

#include <cstdlib>

namespace lumen::media {

StreamingSource::StreamingSource(std::string clipId, std::unique_ptr<VideoDecoder> decoder,
                                 Duration driftThreshold)
    : m_clipId(std::move(clipId))
    , m_decoder(std::move(decoder))
    , m_driftThreshold(driftThreshold)
{}

Result<std::unique_ptr<StreamingSource>> StreamingSource::open(DecoderFactory& factory,
                                                               const std::string& clipId,
                                                               const model::MediaItem& item,
                                                               Duration driftThreshold) {
    using Ptr = std::unique_ptr<StreamingSource>;

    auto decoder = factory.openVideo(item);
    if (!decoder) {
        return Err<Ptr>(decoder.error());
    }
    LUMEN_LOG_DEBUG("Streaming source for clip {} ({})", clipId, item.path);
    return Ok(std::make_unique<StreamingSource>(clipId, std::move(decoder).value(), driftThreshold));
}

Result<void> StreamingSource::seekTo(Timestamp mediaTime) {
    ++m_seekCount;
    auto sought = m_decoder->seek(mediaTime);
    if (!sought) {
        return sought;
    }
    m_current = {};
    return Ok();
}

Result<DecodedFrame> StreamingSource::sample(Timestamp expectedMediaTime, Size maxSize) {
    if (!m_decoder) {
        return Err<DecodedFrame>(ErrorCode::InvalidArgument, "Streaming source closed");
    }

    auto fail = [this](const Error& error) {
        ++m_consecutiveErrors;
        if (failed()) {
            LUMEN_LOG_WARN("Streaming source {} gave up after {} errors: {}",
                           m_clipId, m_consecutiveErrors, error.what());
        }
        return Err<DecodedFrame>(error);
    };

    if (m_current.bitmap) {
        m_lastDrift = expectedMediaTime - m_current.pts;
        if (std::llabs(m_lastDrift) > m_driftThreshold) {
            LUMEN_LOG_DEBUG("Streaming drift {}us on {}, seeking", m_lastDrift, m_clipId);
            auto sought = seekTo(expectedMediaTime);
            if (!sought) {
                return fail(sought.error());
            }
        }
    }

    if (!m_current.bitmap) {
        // Land exactly on the target after a (re)seek
        if (m_seekCount == 0) {
            auto sought = seekTo(expectedMediaTime);
            if (!sought) {
                return fail(sought.error());
            }
        }
        auto frame = m_decoder->frameAt(expectedMediaTime, maxSize);
        if (!frame) {
            return fail(frame.error());
        }
        m_current = std::move(frame).value();
        m_consecutiveErrors = 0;
        return m_current;
    }

    // Continuous decode: advance while the following frame is already due
    Duration frameDuration = m_decoder->frameDuration();
    for (int i = 0; i < kMaxDecodeLoopIterations; ++i) {
        if (expectedMediaTime < m_current.pts + frameDuration) {
            break;
        }
        auto next = m_decoder->nextFrame(maxSize);
        if (!next) {
            if (next.error().code() == ErrorCode::EndOfFile) {
                break;   // hold the last frame
            }
            return fail(next.error());
        }
        m_current = std::move(next).value();
    }

    m_consecutiveErrors = 0;
    return m_current;
}

} // namespace lumen::media
