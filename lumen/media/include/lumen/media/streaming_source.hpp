/**
 * @file streaming_source.hpp
 * @brief Continuous decoder for the single-track fast path
 *
 * Decodes one clip sequentially and hands out whatever frame is current for
 * the time the clock expects. When the decoder falls behind or runs ahead
 * of that time by more than the drift threshold, it seeks instead of
 * catching up frame by frame.
 */

#pragma once

#include <lumen/core/result.hpp>
#include <lumen/core/types.hpp>
#include <lumen/media/decoder.hpp>

#include <memory>
#include <string>

namespace lumen::media {

class StreamingSource {
public:
    StreamingSource(std::string clipId, std::unique_ptr<VideoDecoder> decoder,
                    Duration driftThreshold = kStreamingDriftThreshold);

    /// Open a streaming source for a clip's media
    static Result<std::unique_ptr<StreamingSource>> open(DecoderFactory& factory,
                                                         const std::string& clipId,
                                                         const model::MediaItem& item,
                                                         Duration driftThreshold = kStreamingDriftThreshold);

    /**
     * @brief Frame presented for the expected media time
     *
     * Decodes forward while the next frame is due, seeks on drift beyond
     * the threshold. After kMaxConsecutiveDecoderErrors failures in a row
     * the source reports failed() and the caller should abandon it.
     */
    Result<DecodedFrame> sample(Timestamp expectedMediaTime, Size maxSize);

    [[nodiscard]] const std::string& clipId() const { return m_clipId; }

    [[nodiscard]] bool failed() const { return m_consecutiveErrors >= kMaxConsecutiveDecoderErrors; }

    /// Corrective seeks performed so far (including the initial one)
    [[nodiscard]] int seekCount() const { return m_seekCount; }

    /// expected - presented, measured before the last correction
    [[nodiscard]] Duration lastDrift() const { return m_lastDrift; }

private:
    Result<void> seekTo(Timestamp mediaTime);

    std::string m_clipId;
    std::unique_ptr<VideoDecoder> m_decoder;
    Duration m_driftThreshold;

    DecodedFrame m_current;
    int m_seekCount = 0;
    int m_consecutiveErrors = 0;
    Duration m_lastDrift = 0;
};

} // namespace lumen::media
