/**
 * @file frame_source_cache.hpp
 * @brief Seek-and-snapshot frame source for scrubbing and multi-track compositing
 *
 * Holds one open decoder per video media item (bounded, LRU) and one decoded
 * bitmap per image media item. getFrame() never fails loudly: a decode error
 * or timeout evicts the offending entry and yields null, which the caller
 * paints as an empty layer.
 */

#pragma once

#include <lumen/core/lru_cache.hpp>
#include <lumen/core/types.hpp>
#include <lumen/media/bitmap.hpp>
#include <lumen/media/decoder.hpp>
#include <lumen/model/clip.hpp>
#include <lumen/model/project_store.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace lumen::media {

/**
 * @brief One open video decoder and its usage bookkeeping
 */
struct VideoHandle {
    std::string mediaId;
    std::unique_ptr<VideoDecoder> decoder;
    std::mutex mutex;                  // guards decoder
    std::atomic<int> inFlight{0};      // fetches currently using the handle
    std::atomic<int64_t> lastUsed{0};  // steady-clock microseconds
};

/**
 * @brief Frame source cache
 *
 * Thread safety: getFrame() may be called concurrently for different clips
 * (the compositing path fetches all layers of a frame in parallel). Two
 * clips that share a media item serialize on that item's decoder.
 *
 * An entry in use by an in-flight fetch is never evicted; the cache runs over
 * capacity for the duration of that fetch and trims itself afterwards.
 */
class FrameSourceCache {
public:
    static constexpr size_t kDefaultImageCapacity = 64;

    FrameSourceCache(std::shared_ptr<DecoderFactory> factory,
                     const model::ProjectStore& store,
                     size_t videoCapacity = kDefaultVideoDecoderCapacity,
                     size_t imageCapacity = kDefaultImageCapacity);
    ~FrameSourceCache();

    FrameSourceCache(const FrameSourceCache&) = delete;
    FrameSourceCache& operator=(const FrameSourceCache&) = delete;

    /**
     * @brief Frame of a visual clip
     *
     * @param clip      Video or image clip
     * @param mediaTime Time inside the media (already speed-mapped)
     * @param outSize   Bound for the returned raster; video frames are scaled
     *                  to fit inside it, images are returned at native size
     * @return Bitmap, or null when nothing can be shown this frame
     */
    [[nodiscard]] BitmapPtr getFrame(const model::MediaClip& clip, Timestamp mediaTime, Size outSize);

    // ========== Lifetime ==========

    /// Close every video decoder; decoded images stay cached
    void releaseVideoDecoders();

    /// Drop everything cached for one media item
    void forget(const std::string& mediaId);

    void clear();

    // ========== Statistics ==========

    /// Video decoders currently held by the cache
    [[nodiscard]] size_t videoEntryCount() const { return m_video.size(); }

    [[nodiscard]] size_t imageEntryCount() const { return m_images.size(); }

    [[nodiscard]] size_t videoCapacity() const { return m_video.capacity(); }

    /// Decoders opened and not yet released (cached or detached in flight)
    [[nodiscard]] size_t liveDecoderCount() const { return m_liveDecoders.load(); }

    [[nodiscard]] uint64_t failureCount() const { return m_failures.load(); }

    [[nodiscard]] LRUCache<std::string, std::shared_ptr<VideoHandle>>::Stats videoStats() const {
        return m_video.stats();
    }

private:
    using HandlePtr = std::shared_ptr<VideoHandle>;

    BitmapPtr videoFrame(const model::MediaClip& clip, const model::MediaItem& item,
                         Timestamp mediaTime, Size outSize);
    BitmapPtr imageFrame(const model::MediaItem& item);

    /// Cached handle for a media item, opening a decoder on miss
    HandlePtr acquireHandle(const model::MediaItem& item);

    void releaseHandle(VideoHandle& handle);

    /// Log a failure once per media item until it recovers
    void reportFailure(const std::string& mediaId, const Error& error);
    void clearFailure(const std::string& mediaId);

    std::shared_ptr<DecoderFactory> m_factory;
    const model::ProjectStore& m_store;

    LRUCache<std::string, HandlePtr> m_video;
    SharedLRUCache<std::string, Bitmap> m_images;

    std::mutex m_openMutex;   // serializes decoder creation per cache

    mutable std::mutex m_failureMutex;
    std::unordered_set<std::string> m_failing;

    std::atomic<size_t> m_liveDecoders{0};
    std::atomic<uint64_t> m_failures{0};
};

} // namespace lumen::media
