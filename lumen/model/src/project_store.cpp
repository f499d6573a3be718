/**
 * @file project_store.cpp
 * @brief In-memory project store
 */

#include <lumen/model/project_store.hpp>

#include <lumen/core/logger.hpp>

namespace lumen::model {

MediaType parseMediaType(const std::string& name) {
    if (name == "video") return MediaType::Video;
    if (name == "audio") return MediaType::Audio;
    if (name == "image") return MediaType::Image;
    return MediaType::Unknown;
}

InMemoryProjectStore::InMemoryProjectStore()
    : m_timeline(std::make_shared<Timeline>())
{}

InMemoryProjectStore::InMemoryProjectStore(Timeline timeline)
    : m_timeline(std::make_shared<Timeline>(std::move(timeline)))
{}

TimelinePtr InMemoryProjectStore::getProjectTimeline() const {
    std::lock_guard lock(m_mutex);
    return m_timeline;
}

std::optional<MediaItem> InMemoryProjectStore::getMediaItem(const std::string& mediaId) const {
    std::lock_guard lock(m_mutex);
    auto it = m_media.find(mediaId);
    if (it == m_media.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<void> InMemoryProjectStore::updateClipTransform(const std::string& clipId,
                                                       const TransformPatch& patch) {
    std::shared_ptr<Timeline> next;
    {
        std::lock_guard lock(m_mutex);
        next = std::make_shared<Timeline>(*m_timeline);
    }

    for (auto& track : next->tracks) {
        for (auto& clip : track.clips) {
            if (clip.id == clipId) {
                patch.applyTo(clip.transform);
                publish(std::move(next));
                return Ok();
            }
        }
    }
    return Err(ErrorCode::NotFound, "No clip " + clipId);
}

Result<void> InMemoryProjectStore::updateTextTransform(const std::string& textId,
                                                       const TransformPatch& patch) {
    return updateOverlayTransform(textId, ClipKind::Text, patch);
}

Result<void> InMemoryProjectStore::updateShapeTransform(const std::string& shapeId,
                                                        const TransformPatch& patch) {
    return updateOverlayTransform(shapeId, ClipKind::Shape, patch);
}

Result<void> InMemoryProjectStore::updateClipKeyframes(const std::string& clipId,
                                                       const std::vector<Keyframe>& keyframes) {
    std::shared_ptr<Timeline> next;
    {
        std::lock_guard lock(m_mutex);
        next = std::make_shared<Timeline>(*m_timeline);
    }

    for (auto& track : next->tracks) {
        for (auto& clip : track.clips) {
            if (clip.id == clipId) {
                clip.keyframes = keyframes;
                publish(std::move(next));
                return Ok();
            }
        }
    }
    return Err(ErrorCode::NotFound, "No clip " + clipId);
}

void InMemoryProjectStore::setTimeline(Timeline timeline) {
    publish(std::make_shared<Timeline>(std::move(timeline)));
}

void InMemoryProjectStore::addMediaItem(MediaItem item) {
    std::lock_guard lock(m_mutex);
    auto id = item.id;
    m_media[id] = std::move(item);
}

uint64_t InMemoryProjectStore::revision() const {
    std::lock_guard lock(m_mutex);
    return m_revision;
}

Result<void> InMemoryProjectStore::updateOverlayTransform(const std::string& id, ClipKind expected,
                                                          const TransformPatch& patch) {
    std::shared_ptr<Timeline> next;
    {
        std::lock_guard lock(m_mutex);
        next = std::make_shared<Timeline>(*m_timeline);
    }

    for (auto& item : next->overlays) {
        auto& base = overlayBase(item);
        if (base.id != id) {
            continue;
        }
        // Shape setter also covers the other graphic kinds
        ClipKind kind = overlayKind(item);
        bool matches = expected == ClipKind::Text ? kind == ClipKind::Text : kind != ClipKind::Text;
        if (!matches) {
            return Err(ErrorCode::InvalidArgument,
                       std::string("Overlay ") + id + " is a " + clipKindToString(kind));
        }
        patch.applyTo(base.transform);
        publish(std::move(next));
        return Ok();
    }
    return Err(ErrorCode::NotFound, "No overlay " + id);
}

void InMemoryProjectStore::publish(std::shared_ptr<Timeline> next) {
    uint64_t revision = 0;
    {
        std::lock_guard lock(m_mutex);
        m_timeline = std::move(next);
        revision = ++m_revision;
    }
    LUMEN_LOG_TRACE("Project store revision {}", revision);
    changed.fire();
}

} // namespace lumen::model
