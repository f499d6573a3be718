/**
 * @file ff_input.hpp
 * @brief Demuxer with a bounded-wait interrupt deadline
 *
 * Every blocking libavformat call made through an InputFile returns
 * AVERROR_EXIT once the armed deadline passes, so a stalled file cannot
 * hang the frame loop.
 */

#pragma once

#include "ff_common.hpp"

#include <atomic>
#include <string>

namespace lumen::media::ff {

class InputFile {
public:
    InputFile() = default;

    InputFile(const InputFile&) = delete;
    InputFile& operator=(const InputFile&) = delete;

    /// Open a file and read its stream info within timeout
    static Result<std::unique_ptr<InputFile>> open(const std::string& path, Duration timeout);

    [[nodiscard]] AVFormatContext* ctx() const { return m_format.get(); }
    [[nodiscard]] const std::string& path() const { return m_path; }

    /// Arm the interrupt deadline timeout from now
    void armDeadline(Duration timeout);
    void disarm() { m_deadline.store(0, std::memory_order_release); }

    /**
     * @brief Open a decoder for the best stream of a type
     *
     * @param[out] streamIndex Index of the chosen stream
     */
    Result<CodecContextPtr> openDecoder(AVMediaType type, int& streamIndex);

private:
    static int interruptCallback(void* opaque);
    static int64_t nowUs();

    FormatContextPtr m_format;
    std::string m_path;
    std::atomic<int64_t> m_deadline{0};
};

/// Receive the next frame of one stream, feeding packets as needed
Result<void> receiveFrame(InputFile& input, AVCodecContext* codec, int streamIndex,
                          AVPacket* packet, AVFrame* frame, bool& eof);

} // namespace lumen::media::ff
