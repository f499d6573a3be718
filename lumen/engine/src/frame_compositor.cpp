/**
 * @file frame_compositor.cpp
 * @brief Layer collection, concurrent fetch and ordered painting
 */

#include <lumen/engine/frame_compositor.hpp>

#include <lumen/core/logger.hpp>
#include <lumen/engine/layer_geometry.hpp>
#include <lumen/engine/transform_resolver.hpp>
#include <lumen/model/keyframe.hpp>

#include <algorithm>
#include <exception>
#include <future>
#include <string>

namespace lumen::engine {

FrameCompositor::FrameCompositor(media::FrameSourceCache& frames, const SpeedEngine& speed,
                                 std::shared_ptr<EffectsEngine> effects,
                                 OverlayCompositor& overlays)
    : m_frames(frames)
    , m_speed(speed)
    , m_effects(std::move(effects))
    , m_overlays(overlays) {}

// ============================================================================
// Layer collection
// ============================================================================

Timestamp FrameCompositor::mediaTimeFor(const model::MediaClip& clip, Timestamp time) const {
    if (clip.kind == model::ClipKind::Image) {
        return 0;
    }
    return m_speed.sourceTimeAtPlaybackTime(clip, time - clip.startTime);
}

std::vector<LaneLayers> FrameCompositor::collectLanes(const model::Timeline& timeline,
                                                      Timestamp time) const {
    std::vector<LaneLayers> lanes;

    for (int i = static_cast<int>(timeline.tracks.size()) - 1; i >= 0; --i) {
        const model::Track& track = timeline.tracks[static_cast<size_t>(i)];
        if (track.hidden || !track.isVisualMedia()) {
            continue;
        }

        LaneLayers lane;
        lane.trackIndex = i;
        lane.transition = TransitionEvaluator::detect(time, track, i);

        if (lane.transition) {
            for (const model::MediaClip* clip : {lane.transition->clipA, lane.transition->clipB}) {
                lane.layers.push_back({i, clip, mediaTimeFor(*clip, time)});
            }
        } else {
            std::vector<const model::MediaClip*> active;
            for (const auto& clip : track.clips) {
                if (clip.isVisual() && clip.containsTime(time)) {
                    active.push_back(&clip);
                }
            }
            // Overlapping clips without a transition: the later start paints on top
            std::stable_sort(active.begin(), active.end(),
                             [](const auto* a, const auto* b) { return a->startTime < b->startTime; });
            for (const model::MediaClip* clip : active) {
                lane.layers.push_back({i, clip, mediaTimeFor(*clip, time)});
            }
        }

        if (!lane.layers.empty()) {
            lanes.push_back(std::move(lane));
        }
    }
    return lanes;
}

// ============================================================================
// Fetch
// ============================================================================

media::BitmapPtr FrameCompositor::fetchFromCache(const LayerRequest& request, Size canvas) {
    return m_frames.getFrame(*request.clip, request.mediaTime, canvas);
}

std::vector<media::BitmapPtr> FrameCompositor::fetchLayers(const std::vector<LayerRequest>& requests,
                                                           Size canvas,
                                                           const FrameProvider& provider,
                                                           bool concurrent) {
    auto fetchOne = [this, &provider, canvas](const LayerRequest& request) {
        return provider ? provider(request, canvas) : fetchFromCache(request, canvas);
    };

    std::vector<media::BitmapPtr> out(requests.size());

    if (!concurrent || requests.size() <= 1) {
        for (size_t i = 0; i < requests.size(); ++i) {
            try {
                out[i] = fetchOne(requests[i]);
            } catch (const std::exception& e) {
                ++m_stats.layerErrors;
                LUMEN_LOG_WARN("Frame fetch for clip {} threw: {}", requests[i].clip->id, e.what());
            }
        }
        return out;
    }

    std::vector<std::future<media::BitmapPtr>> pending;
    pending.reserve(requests.size());
    for (const auto& request : requests) {
        pending.push_back(std::async(std::launch::async, fetchOne, std::cref(request)));
    }

    // Join in request order; paint order never depends on completion order
    for (size_t i = 0; i < pending.size(); ++i) {
        try {
            out[i] = pending[i].get();
        } catch (const std::exception& e) {
            ++m_stats.layerErrors;
            LUMEN_LOG_WARN("Frame fetch for clip {} threw: {}", requests[i].clip->id, e.what());
        }
    }
    return out;
}

// ============================================================================
// Drawing
// ============================================================================

void FrameCompositor::warnOnce(const std::string& clipId, const std::string& message) {
    if (m_warned.insert(clipId).second) {
        LUMEN_LOG_WARN("Clip {}: {}", clipId, message);
    }
}

void FrameCompositor::clearWarning(const std::string& clipId) {
    m_warned.erase(clipId);
}

bool FrameCompositor::drawClipLayer(RenderBackend& backend, const model::MediaClip& clip,
                                    media::BitmapPtr bitmap, Timestamp time, Size canvas,
                                    const TransformOverride* live) {
    if (!bitmap || bitmap->isEmpty()) {
        return false;
    }

    const model::Transform& authored = live && live->id == clip.id ? live->transform : clip.transform;
    if (authored.crop) {
        bitmap = bitmap->cropped(*authored.crop);
        if (!bitmap || bitmap->isEmpty()) {
            return false;
        }
    }

    if (m_effects && !clip.effects.empty()) {
        try {
            bitmap = m_effects->applyEffectsToFrame(clip, bitmap);
        } catch (const std::exception& e) {
            ++m_stats.layerErrors;
            warnOnce(clip.id, std::string("effects threw: ") + e.what());
            return false;
        }
        if (!bitmap) {
            warnOnce(clip.id, "effects produced no frame");
            return false;
        }
    }

    const Timestamp local = time - clip.startTime;
    model::ResolvedTransform resolved = resolveTransform(
        authored, model::KeyframeTrack(clip.keyframes), local, clip.emphasis, clip.duration, canvas);

    const Vec2 drawSize = fitSize(bitmap->size(), canvas, authored.fitMode);
    const double opacity = clip.blendOpacity * model::fadeFactor(clip.fade, local, clip.duration);

    auto drawn = drawBitmap(backend, *bitmap, drawSize, resolved, opacity);
    if (!drawn) {
        warnOnce(clip.id, drawn.error().what());
        return false;
    }
    clearWarning(clip.id);
    return true;
}

media::BitmapPtr FrameCompositor::isolateClip(const model::MediaClip& clip,
                                              const media::BitmapPtr& bitmap, Timestamp time,
                                              Size canvas, const TransformOverride* live) {
    if (!bitmap) {
        return nullptr;
    }
    if (m_isolation.size() != canvas) {
        if (auto resized = m_isolation.resize(canvas); !resized) {
            warnOnce(clip.id, resized.error().what());
            return nullptr;
        }
    }
    if (!m_isolation.beginFrame(Color::transparent())) {
        return nullptr;
    }
    drawClipLayer(m_isolation, clip, bitmap, time, canvas, live);
    auto frame = m_isolation.endFrame();
    return frame ? std::move(frame).value() : nullptr;
}

void FrameCompositor::drawTransition(RenderBackend& backend, const LaneLayers& lane,
                                     const media::BitmapPtr& outgoing,
                                     const media::BitmapPtr& incoming, Timestamp time, Size canvas,
                                     const TransformOverride* live) {
    const ActiveTransition& active = *lane.transition;

    media::BitmapPtr a = isolateClip(*active.clipA, outgoing, time, canvas, live);
    media::BitmapPtr b = isolateClip(*active.clipB, incoming, time, canvas, live);
    const double progress = active.progressAt(time);
    media::BitmapPtr blended;
    try {
        blended = m_transitions.blend(*active.transition, progress, a, b, canvas);
    } catch (const std::exception& e) {
        // Degrade to a cut at the midpoint
        ++m_stats.layerErrors;
        warnOnce(active.transition->id, std::string("blend threw: ") + e.what());
        blended = progress < 0.5 ? (a ? a : b) : (b ? b : a);
    }
    if (!blended) {
        m_stats.missingLayers += 2;
        return;
    }

    // Blended output is already canvas-sized with transforms applied
    auto drawn = drawBitmap(backend, *blended,
                            {static_cast<double>(canvas.width), static_cast<double>(canvas.height)},
                            model::ResolvedTransform{});
    if (!drawn) {
        warnOnce(active.transition->id, drawn.error().what());
        return;
    }
    m_stats.videoLayers += (a ? 1 : 0) + (b ? 1 : 0);
    m_stats.missingLayers += (a ? 0 : 1) + (b ? 0 : 1);
}

Result<media::BitmapPtr> FrameCompositor::compose(RenderBackend& backend,
                                                  const model::Timeline& timeline, Timestamp time,
                                                  const ComposeOptions& options) {
    m_stats = {};
    const Size canvas = options.canvas;

    // Fetch before the frame starts so a slow decode never holds the device
    std::vector<LaneLayers> lanes = collectLanes(timeline, time);
    std::vector<LayerRequest> requests;
    for (const auto& lane : lanes) {
        requests.insert(requests.end(), lane.layers.begin(), lane.layers.end());
    }
    std::vector<media::BitmapPtr> bitmaps =
        fetchLayers(requests, canvas, options.provider, options.concurrentFetch);

    if (auto begun = backend.beginFrame(options.background); !begun) {
        return Err<media::BitmapPtr>(begun.error());
    }

    const uint64_t rasterizeErrorsBefore = m_overlays.rasterizeErrors();
    const bool hasVideo = !videoIndexRange(timeline.tracks).empty();
    if (hasVideo) {
        m_stats.overlayLayers += m_overlays.paintOverlays(backend, timeline, time, canvas,
                                                          OverlayPass::Below, options.live);
    }

    size_t slot = 0;
    for (const auto& lane : lanes) {
        if (lane.transition) {
            m_stats.transitionActive = true;
            drawTransition(backend, lane, bitmaps[slot], bitmaps[slot + 1], time, canvas, options.live);
            slot += 2;
            continue;
        }
        for (const auto& layer : lane.layers) {
            if (drawClipLayer(backend, *layer.clip, bitmaps[slot], time, canvas, options.live)) {
                ++m_stats.videoLayers;
            } else {
                ++m_stats.missingLayers;
            }
            ++slot;
        }
    }

    m_stats.overlayLayers += m_overlays.paintOverlays(backend, timeline, time, canvas,
                                                      hasVideo ? OverlayPass::Above : OverlayPass::All,
                                                      options.live);
    m_stats.subtitleLayers = m_overlays.paintSubtitles(backend, timeline, time, canvas);
    m_stats.layerErrors += static_cast<int>(m_overlays.rasterizeErrors() - rasterizeErrorsBefore);

    return backend.endFrame();
}

} // namespace lumen::engine
