/**
 * @file frame_source_cache.cpp
 * @brief FrameSourceCache implementation
 */

#include <lumen/media/frame_source_cache.hpp>

#include <lumen/core/logger.hpp>

#include <chrono>

namespace lumen::media {

namespace {

int64_t nowUs() {
    return std::chrono::duration_cast<Microseconds>(Clock::now().time_since_epoch()).count();
}

} // namespace

FrameSourceCache::FrameSourceCache(std::shared_ptr<DecoderFactory> factory,
                                   const model::ProjectStore& store,
                                   size_t videoCapacity,
                                   size_t imageCapacity)
    : m_factory(std::move(factory))
    , m_store(store)
    , m_video(videoCapacity, [this](const std::string&, HandlePtr& handle) { releaseHandle(*handle); })
    , m_images(imageCapacity)
{
    m_video.setEvictionFilter([](const std::string&, const HandlePtr& handle) {
        return handle->inFlight.load() == 0;
    });
}

FrameSourceCache::~FrameSourceCache() {
    clear();
}

// ============================================================================
// Frame Access
// ============================================================================

BitmapPtr FrameSourceCache::getFrame(const model::MediaClip& clip, Timestamp mediaTime, Size outSize) {
    auto item = m_store.getMediaItem(clip.mediaId);
    if (!item) {
        reportFailure(clip.mediaId, Error(ErrorCode::NotFound, "Media item missing"));
        return nullptr;
    }

    switch (clip.kind) {
        case model::ClipKind::Video:
            return videoFrame(clip, *item, mediaTime, outSize);
        case model::ClipKind::Image:
            return imageFrame(*item);
        default:
            return nullptr;
    }
}

BitmapPtr FrameSourceCache::videoFrame(const model::MediaClip& clip, const model::MediaItem& item,
                                       Timestamp mediaTime, Size outSize) {
    HandlePtr handle = acquireHandle(item);
    if (!handle) {
        return nullptr;
    }

    Result<DecodedFrame> frame = Err<DecodedFrame>(ErrorCode::Cancelled);
    {
        std::lock_guard lock(handle->mutex);
        if (handle->decoder) {
            frame = handle->decoder->frameAt(mediaTime, outSize);
        } else {
            frame = Err<DecodedFrame>(ErrorCode::Cancelled, "Decoder released");
        }
    }
    handle->lastUsed.store(nowUs());
    handle->inFlight.fetch_sub(1);

    if (!frame) {
        // Never touch the cache while holding the handle lock; eviction takes it.
        // A sibling fetch may still be using this handle or may have replaced it.
        m_video.removeIf(item.id, [&handle](const HandlePtr& cached) {
            return cached == handle && cached->inFlight.load() == 0;
        });
        reportFailure(item.id, frame.error());
        LUMEN_LOG_TRACE("Clip {} has no frame at {}us", clip.id, mediaTime);
        return nullptr;
    }

    m_video.trim();
    clearFailure(item.id);
    return frame.value().bitmap;
}

BitmapPtr FrameSourceCache::imageFrame(const model::MediaItem& item) {
    if (auto cached = m_images.get(item.id)) {
        return cached;
    }

    auto decoded = m_factory->decodeImage(item);
    if (!decoded) {
        reportFailure(item.id, decoded.error());
        return nullptr;
    }

    BitmapPtr bitmap = std::move(decoded).value();
    m_images.put(item.id, bitmap);
    clearFailure(item.id);
    LUMEN_LOG_DEBUG("Cached image {} ({} images)", item.id, m_images.size());
    return bitmap;
}

// ============================================================================
// Handles
// ============================================================================

FrameSourceCache::HandlePtr FrameSourceCache::acquireHandle(const model::MediaItem& item) {
    auto pinHandle = [](HandlePtr& handle) { handle->inFlight.fetch_add(1); };

    if (auto cached = m_video.getAndPin(item.id, pinHandle)) {
        return std::move(*cached);
    }

    std::lock_guard openLock(m_openMutex);

    // Another fetch may have opened it while we waited
    if (auto cached = m_video.getAndPin(item.id, pinHandle)) {
        return std::move(*cached);
    }

    auto opened = m_factory->openVideo(item);
    if (!opened) {
        reportFailure(item.id, opened.error());
        return nullptr;
    }

    auto handle = std::make_shared<VideoHandle>();
    handle->mediaId = item.id;
    handle->decoder = std::move(opened).value();
    handle->lastUsed.store(nowUs());
    handle->inFlight.fetch_add(1);
    m_liveDecoders.fetch_add(1);

    m_video.put(item.id, handle);
    LUMEN_LOG_DEBUG("Opened decoder for {} ({}/{} cached)", item.id,
                    m_video.size(), m_video.capacity());
    return handle;
}

void FrameSourceCache::releaseHandle(VideoHandle& handle) {
    std::unique_ptr<VideoDecoder> decoder;
    {
        std::lock_guard lock(handle.mutex);
        decoder = std::move(handle.decoder);
    }
    if (decoder) {
        decoder.reset();
        m_liveDecoders.fetch_sub(1);
        LUMEN_LOG_TRACE("Released decoder for {}", handle.mediaId);
    }
}

// ============================================================================
// Lifetime
// ============================================================================

void FrameSourceCache::releaseVideoDecoders() {
    m_video.clear();
}

void FrameSourceCache::forget(const std::string& mediaId) {
    m_video.remove(mediaId);
    m_images.remove(mediaId);
    clearFailure(mediaId);
}

void FrameSourceCache::clear() {
    m_video.clear();
    m_images.clear();
    std::lock_guard lock(m_failureMutex);
    m_failing.clear();
}

// ============================================================================
// Failure Reporting
// ============================================================================

void FrameSourceCache::reportFailure(const std::string& mediaId, const Error& error) {
    m_failures.fetch_add(1);

    std::lock_guard lock(m_failureMutex);
    if (m_failing.insert(mediaId).second) {
        LUMEN_LOG_WARN("No frame from media {}: {}", mediaId, error.what());
    }
}

void FrameSourceCache::clearFailure(const std::string& mediaId) {
    std::lock_guard lock(m_failureMutex);
    m_failing.erase(mediaId);
}

} // namespace lumen::media
