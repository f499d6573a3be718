/**
 * @file live_transform_session.hpp
 * @brief Throttled write-back of an interactive drag, resize or crop
 *
 * While the user drags a handle the preview paints the locally held
 * transform every mouse move, but writes it to the project store at most
 * once per commit interval. A trailing timer makes sure the last move of a
 * burst is committed, and end() performs one final commit with the last
 * transform.
 */

#pragma once

#include <lumen/core/frame_scheduler.hpp>
#include <lumen/core/result.hpp>
#include <lumen/core/signals.hpp>
#include <lumen/engine/overlay_compositor.hpp>
#include <lumen/model/project_store.hpp>

#include <optional>
#include <string>

namespace lumen::engine {

/// Which store setter an interaction writes through
enum class LiveTarget {
    Clip,
    Text,
    Shape,
};

const char* liveTargetToString(LiveTarget target);

/// Write target for an entity of the given kind; nullopt if it cannot be edited live
std::optional<LiveTarget> liveTargetForKind(model::ClipKind kind);

/// Patch carrying every field the preview handles can change
model::TransformPatch interactionPatch(const model::Transform& transform);

class LiveTransformSession {
public:
    LiveTransformSession(model::ProjectStore& store, FrameScheduler& scheduler,
                         Duration commitInterval = msToUs(32));
    ~LiveTransformSession();

    LiveTransformSession(const LiveTransformSession&) = delete;
    LiveTransformSession& operator=(const LiveTransformSession&) = delete;

    /**
     * @brief Start interacting with an entity
     *
     * @param initial Transform the entity has in the store right now
     * @return Error if another interaction is still active
     */
    Result<void> begin(const std::string& id, LiveTarget target, const model::Transform& initial);

    /// New local transform; committed now or by the trailing timer
    void update(const model::Transform& transform);

    /// Commit the last transform and finish
    Result<void> end();

    /// Finish without the final commit (the store keeps what was committed)
    void cancel();

    [[nodiscard]] bool active() const { return m_current.has_value(); }

    /// Locally held transform, null when idle
    [[nodiscard]] const TransformOverride* current() const {
        return m_current ? &*m_current : nullptr;
    }

    [[nodiscard]] LiveTarget target() const { return m_target; }
    [[nodiscard]] uint64_t commitCount() const { return m_commits; }
    [[nodiscard]] Duration commitInterval() const { return m_interval; }

    /// Fired for every update() with the transform now shown
    Signal<model::Transform> liveChanged;

private:
    Result<void> commit();
    void armTrailing();
    void cancelTrailing();

    model::ProjectStore& m_store;
    FrameScheduler& m_scheduler;
    Duration m_interval;

    std::optional<TransformOverride> m_current;
    LiveTarget m_target = LiveTarget::Clip;
    bool m_dirty = false;
    int64_t m_lastCommit = kNoTimestamp;
    TaskId m_trailing = kInvalidTask;
    uint64_t m_commits = 0;
};

} // namespace lumen::engine
