/**
 * @file audio_buffer_cache.cpp
 * @brief AudioBufferCache implementation
 */

#include <lumen/media/audio_buffer_cache.hpp>

#include <lumen/core/logger.hpp>

namespace lumen::media {

AudioBufferCache::AudioBufferCache(std::shared_ptr<DecoderFactory> factory, int sampleRate, int channels)
    : m_factory(std::move(factory))
    , m_sampleRate(sampleRate)
    , m_channels(channels)
{}

Result<AudioBufferPtr> AudioBufferCache::get(const model::MediaItem& item) {
    std::lock_guard lock(m_mutex);

    if (auto it = m_buffers.find(item.id); it != m_buffers.end()) {
        return it->second;
    }
    if (auto it = m_failed.find(item.id); it != m_failed.end()) {
        return Err<AudioBufferPtr>(it->second);
    }

    ++m_decodeCount;
    auto decoded = m_factory->decodeAudio(item, m_sampleRate, m_channels);
    if (!decoded) {
        LUMEN_LOG_WARN("Audio decode failed for {}: {}", item.id, decoded.error().what());
        m_failed.emplace(item.id, decoded.error());
        return decoded;
    }

    AudioBufferPtr buffer = decoded.value();
    m_buffers.emplace(item.id, buffer);
    LUMEN_LOG_DEBUG("Cached audio for {} ({:.2f}s)", item.id, usToSeconds(buffer->duration()));
    return buffer;
}

bool AudioBufferCache::contains(const std::string& mediaId) const {
    std::lock_guard lock(m_mutex);
    return m_buffers.count(mediaId) > 0;
}

void AudioBufferCache::forget(const std::string& mediaId) {
    std::lock_guard lock(m_mutex);
    m_buffers.erase(mediaId);
    m_failed.erase(mediaId);
}

void AudioBufferCache::clear() {
    std::lock_guard lock(m_mutex);
    m_buffers.clear();
    m_failed.clear();
}

void AudioBufferCache::resetFailures() {
    std::lock_guard lock(m_mutex);
    m_failed.clear();
}

size_t AudioBufferCache::size() const {
    std::lock_guard lock(m_mutex);
    return m_buffers.size();
}

} // namespace lumen::media
