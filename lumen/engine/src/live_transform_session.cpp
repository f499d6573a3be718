/**
 * @file live_transform_session.cpp
 * @brief LiveTransformSession implementation
 */

#include <lumen/engine/live_transform_session.hpp>

#include <lumen/core/logger.hpp>

#include <algorithm>

namespace lumen::engine {

const char* liveTargetToString(LiveTarget target) {
    switch (target) {
        case LiveTarget::Clip: return "clip";
        case LiveTarget::Text: return "text";
        case LiveTarget::Shape: return "shape";
        default: return "unknown";
    }
}

std::optional<LiveTarget> liveTargetForKind(model::ClipKind kind) {
    switch (kind) {
        case model::ClipKind::Video:
        case model::ClipKind::Image:
            return LiveTarget::Clip;
        case model::ClipKind::Text:
            return LiveTarget::Text;
        // Svg and sticker entities live in the shape collection of the store
        case model::ClipKind::Shape:
        case model::ClipKind::Svg:
        case model::ClipKind::Sticker:
            return LiveTarget::Shape;
        default:
            return std::nullopt;
    }
}

model::TransformPatch interactionPatch(const model::Transform& transform) {
    model::TransformPatch patch;
    patch.position = transform.position;
    patch.scale = transform.scale;
    patch.rotation = transform.rotation;
    patch.anchor = transform.anchor;
    patch.opacity = transform.opacity;
    patch.borderRadius = transform.borderRadius;
    patch.crop = transform.crop;
    return patch;
}

LiveTransformSession::LiveTransformSession(model::ProjectStore& store, FrameScheduler& scheduler,
                                           Duration commitInterval)
    : m_store(store)
    , m_scheduler(scheduler)
    , m_interval(commitInterval) {}

LiveTransformSession::~LiveTransformSession() {
    cancelTrailing();
}

Result<void> LiveTransformSession::begin(const std::string& id, LiveTarget target,
                                         const model::Transform& initial) {
    if (m_current) {
        return Err(ErrorCode::InvalidArgument,
                   "interaction with " + m_current->id + " still active");
    }
    m_current = TransformOverride{id, initial};
    m_target = target;
    m_dirty = false;
    m_lastCommit = kNoTimestamp;
    LUMEN_LOG_DEBUG("Live {} interaction started on {}", liveTargetToString(target), id);
    return Ok();
}

void LiveTransformSession::update(const model::Transform& transform) {
    if (!m_current) {
        return;
    }
    m_current->transform = transform;
    m_dirty = true;
    liveChanged.fire(transform);

    const int64_t now = m_scheduler.now();
    if (m_lastCommit == kNoTimestamp || now - m_lastCommit >= m_interval) {
        cancelTrailing();
        if (auto result = commit(); !result) {
            LUMEN_LOG_WARN("Live commit for {} failed: {}", m_current->id, result.error().what());
        }
        return;
    }
    armTrailing();
}

Result<void> LiveTransformSession::end() {
    if (!m_current) {
        return Ok();
    }
    cancelTrailing();
    auto result = commit();
    LUMEN_LOG_DEBUG("Live interaction on {} ended after {} commits", m_current->id, m_commits);
    m_current.reset();
    m_dirty = false;
    return result;
}

void LiveTransformSession::cancel() {
    cancelTrailing();
    m_current.reset();
    m_dirty = false;
}

Result<void> LiveTransformSession::commit() {
    m_lastCommit = m_scheduler.now();
    m_dirty = false;
    ++m_commits;

    const model::TransformPatch patch = interactionPatch(m_current->transform);
    switch (m_target) {
        case LiveTarget::Text:
            return m_store.updateTextTransform(m_current->id, patch);
        case LiveTarget::Shape:
            return m_store.updateShapeTransform(m_current->id, patch);
        case LiveTarget::Clip:
        default:
            return m_store.updateClipTransform(m_current->id, patch);
    }
}

void LiveTransformSession::armTrailing() {
    if (m_trailing != kInvalidTask) {
        return;
    }
    const Duration wait = std::max<Duration>(0, m_lastCommit + m_interval - m_scheduler.now());
    m_trailing = m_scheduler.schedule(wait, [this] {
        m_trailing = kInvalidTask;
        if (!m_current || !m_dirty) {
            return;
        }
        if (auto result = commit(); !result) {
            LUMEN_LOG_WARN("Live commit for {} failed: {}", m_current->id, result.error().what());
        }
    });
}

void LiveTransformSession::cancelTrailing() {
    if (m_trailing != kInvalidTask) {
        m_scheduler.cancel(m_trailing);
        m_trailing = kInvalidTask;
    }
}

} // namespace lumen::engine
