/**
 * @file project_store.hpp
 * @brief Project data source consumed by the preview
 *
 * The compositor reads timeline snapshots and media items from the store
 * and writes back only through the narrow live-interaction setters.
 */

#pragma once

#include <lumen/core/result.hpp>
#include <lumen/core/signals.hpp>
#include <lumen/model/keyframe.hpp>
#include <lumen/model/media_item.hpp>
#include <lumen/model/timeline.hpp>
#include <lumen/model/transform.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lumen::model {

using TimelinePtr = std::shared_ptr<const Timeline>;

class ProjectStore {
public:
    virtual ~ProjectStore() = default;

    /// Current timeline snapshot (never null)
    [[nodiscard]] virtual TimelinePtr getProjectTimeline() const = 0;

    [[nodiscard]] virtual std::optional<MediaItem> getMediaItem(const std::string& mediaId) const = 0;

    virtual Result<void> updateClipTransform(const std::string& clipId, const TransformPatch& patch) = 0;
    virtual Result<void> updateTextTransform(const std::string& textId, const TransformPatch& patch) = 0;
    virtual Result<void> updateShapeTransform(const std::string& shapeId, const TransformPatch& patch) = 0;
    virtual Result<void> updateClipKeyframes(const std::string& clipId,
                                             const std::vector<Keyframe>& keyframes) = 0;

    /// Fired after every accepted write
    VoidSignal changed;
};

/**
 * @brief Store backed by an in-memory timeline
 *
 * Writes replace the snapshot (copy-on-write), so a snapshot already handed
 * to a render pass is never mutated under it.
 */
class InMemoryProjectStore : public ProjectStore {
public:
    InMemoryProjectStore();
    explicit InMemoryProjectStore(Timeline timeline);

    [[nodiscard]] TimelinePtr getProjectTimeline() const override;
    [[nodiscard]] std::optional<MediaItem> getMediaItem(const std::string& mediaId) const override;

    Result<void> updateClipTransform(const std::string& clipId, const TransformPatch& patch) override;
    Result<void> updateTextTransform(const std::string& textId, const TransformPatch& patch) override;
    Result<void> updateShapeTransform(const std::string& shapeId, const TransformPatch& patch) override;
    Result<void> updateClipKeyframes(const std::string& clipId,
                                     const std::vector<Keyframe>& keyframes) override;

    // ========== Setup ==========

    void setTimeline(Timeline timeline);
    void addMediaItem(MediaItem item);

    /// Incremented on every accepted write
    [[nodiscard]] uint64_t revision() const;

private:
    Result<void> updateOverlayTransform(const std::string& id, ClipKind expected,
                                        const TransformPatch& patch);
    void publish(std::shared_ptr<Timeline> next);

    mutable std::mutex m_mutex;
    TimelinePtr m_timeline;
    std::unordered_map<std::string, MediaItem> m_media;
    uint64_t m_revision = 0;
};

} // namespace lumen::model
