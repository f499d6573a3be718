/**
 * @file audio_buffer_cache.hpp
 * @brief Decode-once cache of audio buffers per media item
 */

#pragma once

#include <lumen/core/result.hpp>
#include <lumen/media/audio_buffer.hpp>
#include <lumen/media/decoder.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace lumen::media {

/**
 * @brief Audio buffer cache
 *
 * Buffers survive playback sessions; they are only dropped by clear() or
 * forget(). A media item that failed to decode is remembered so the
 * scheduler does not retry it on every poll.
 */
class AudioBufferCache {
public:
    AudioBufferCache(std::shared_ptr<DecoderFactory> factory, int sampleRate, int channels);

    /// Decoded buffer for a media item (decoding it on first use)
    Result<AudioBufferPtr> get(const model::MediaItem& item);

    [[nodiscard]] bool contains(const std::string& mediaId) const;

    void forget(const std::string& mediaId);
    void clear();

    /// Allow previously failed items to be decoded again
    void resetFailures();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t decodeCount() const { return m_decodeCount; }

    [[nodiscard]] int sampleRate() const { return m_sampleRate; }
    [[nodiscard]] int channels() const { return m_channels; }

private:
    std::shared_ptr<DecoderFactory> m_factory;
    int m_sampleRate;
    int m_channels;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, AudioBufferPtr> m_buffers;
    std::unordered_map<std::string, Error> m_failed;
    size_t m_decodeCount = 0;
};

} // namespace lumen::media
