/**
 * @file frame_compositor.hpp
 * @brief Multi-track compositing of one timeline instant
 *
 * Builds a frame as:
 *   background -> overlays below video -> visual lanes (highest index
 *   first, so index 0 ends on top) -> overlays above video -> subtitles
 *
 * Frames for all visual layers are fetched concurrently and joined before
 * the first draw; drawing itself is strictly in paint order. A layer whose
 * frame is missing is skipped, never fatal.
 */

#pragma once

#include <lumen/core/result.hpp>
#include <lumen/core/types.hpp>
#include <lumen/engine/effects_engine.hpp>
#include <lumen/engine/overlay_compositor.hpp>
#include <lumen/engine/render_backend.hpp>
#include <lumen/engine/software_backend.hpp>
#include <lumen/engine/speed_engine.hpp>
#include <lumen/engine/transition_evaluator.hpp>
#include <lumen/media/frame_source_cache.hpp>
#include <lumen/model/timeline.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace lumen::engine {

/// One visual clip to fetch for a frame
struct LayerRequest {
    int trackIndex = -1;
    const model::MediaClip* clip = nullptr;
    Timestamp mediaTime = 0;
};

/// The layers one visual lane contributes at an instant
struct LaneLayers {
    int trackIndex = -1;
    std::vector<LayerRequest> layers;          // paint order inside the lane
    std::optional<ActiveTransition> transition;
};

/// Supplies the bitmap of a layer; may run on a worker thread
using FrameProvider = std::function<media::BitmapPtr(const LayerRequest& request, Size canvas)>;

struct ComposeOptions {
    Size canvas{1280, 720};
    Color background = Color::black();
    const TransformOverride* live = nullptr;
    FrameProvider provider;      // empty = the frame source cache
    bool concurrentFetch = true;
};

struct CompositeStats {
    int videoLayers = 0;
    int overlayLayers = 0;
    int subtitleLayers = 0;
    int missingLayers = 0;
    int layerErrors = 0;   // layers skipped because an effect, blend or rasterizer threw
    bool transitionActive = false;
};

class FrameCompositor {
public:
    FrameCompositor(media::FrameSourceCache& frames, const SpeedEngine& speed,
                    std::shared_ptr<EffectsEngine> effects, OverlayCompositor& overlays);

    /// Visible visual lanes with content at time, highest index first
    [[nodiscard]] std::vector<LaneLayers> collectLanes(const model::Timeline& timeline,
                                                       Timestamp time) const;

    /// Media time shown by a visual clip at a timeline time
    [[nodiscard]] Timestamp mediaTimeFor(const model::MediaClip& clip, Timestamp time) const;

    /**
     * @brief Fetch every request, joined in request order
     *
     * Concurrent fetches each run on their own task; a fetch that throws
     * yields null for its slot.
     */
    [[nodiscard]] std::vector<media::BitmapPtr> fetchLayers(const std::vector<LayerRequest>& requests,
                                                            Size canvas, const FrameProvider& provider,
                                                            bool concurrent);

    /**
     * @brief Composite the timeline at time into the backend
     *
     * @return The finished canvas, or the backend error that prevented the
     *         frame from starting or finishing
     */
    Result<media::BitmapPtr> compose(RenderBackend& backend, const model::Timeline& timeline,
                                     Timestamp time, const ComposeOptions& options);

    /**
     * @brief Draw one visual clip with its resolved transform
     *
     * Applies crop, effects, fit and the visual fade ramp. Returns false
     * (after logging once per clip) if the layer could not be drawn.
     */
    bool drawClipLayer(RenderBackend& backend, const model::MediaClip& clip,
                       media::BitmapPtr bitmap, Timestamp time, Size canvas,
                       const TransformOverride* live = nullptr);

    [[nodiscard]] const CompositeStats& lastStats() const { return m_stats; }

private:
    media::BitmapPtr fetchFromCache(const LayerRequest& request, Size canvas);

    /// Render one clip alone onto a transparent canvas-sized bitmap
    media::BitmapPtr isolateClip(const model::MediaClip& clip, const media::BitmapPtr& bitmap,
                                 Timestamp time, Size canvas, const TransformOverride* live);

    void drawTransition(RenderBackend& backend, const LaneLayers& lane,
                        const media::BitmapPtr& outgoing, const media::BitmapPtr& incoming,
                        Timestamp time, Size canvas, const TransformOverride* live);

    void warnOnce(const std::string& clipId, const std::string& message);
    void clearWarning(const std::string& clipId);

    media::FrameSourceCache& m_frames;
    const SpeedEngine& m_speed;
    std::shared_ptr<EffectsEngine> m_effects;
    OverlayCompositor& m_overlays;

    TransitionEvaluator m_transitions;
    SoftwareBackend m_isolation{Size{1, 1}};
    std::unordered_set<std::string> m_warned;
    CompositeStats m_stats;
};

} // namespace lumen::engine
