/**
 * @file overlay_compositor.cpp
 * @brief Overlay pass ordering and placement
 */

#include <lumen/engine/overlay_compositor.hpp>

#include <lumen/core/logger.hpp>
#include <lumen/engine/transform_resolver.hpp>

#include <algorithm>
#include <exception>
#include <functional>
#include <type_traits>
#include <variant>

namespace lumen::engine {

const char* overlayPassToString(OverlayPass pass) {
    switch (pass) {
        case OverlayPass::Below: return "below-video";
        case OverlayPass::Above: return "above-video";
        case OverlayPass::All: return "all";
        default: return "unknown";
    }
}

VideoIndexRange videoIndexRange(const std::vector<model::Track>& tracks) {
    VideoIndexRange range;
    bool any = false;
    for (int i = 0; i < static_cast<int>(tracks.size()); ++i) {
        const auto& track = tracks[static_cast<size_t>(i)];
        if (!track.isVisualMedia() || track.hidden) {
            continue;
        }
        if (!any) {
            range.lowest = i;
            range.highest = i;
            any = true;
        } else {
            range.lowest = std::min(range.lowest, i);
            range.highest = std::max(range.highest, i);
        }
    }
    return range;
}

std::vector<int> overlayTracksForPass(const std::vector<model::Track>& tracks, OverlayPass pass) {
    const VideoIndexRange video = videoIndexRange(tracks);
    std::vector<int> result;

    for (int i = 0; i < static_cast<int>(tracks.size()); ++i) {
        const auto& track = tracks[static_cast<size_t>(i)];
        if (!track.isOverlay() || track.hidden) {
            continue;
        }
        bool include = true;
        if (!video.empty()) {
            if (pass == OverlayPass::Below) {
                include = i > video.highest;
            } else if (pass == OverlayPass::Above) {
                // Everything not painted below, including lanes between video lanes
                include = i <= video.highest;
            }
        }
        if (include) {
            result.push_back(i);
        }
    }

    std::sort(result.begin(), result.end(), std::greater<int>());
    return result;
}

OverlayCompositor::OverlayCompositor(std::shared_ptr<OverlayRasterizer> rasterizer)
    : m_rasterizer(std::move(rasterizer))
{
}

void OverlayCompositor::reportThrow(const std::string& id, const char* what) {
    ++m_rasterizeErrors;
    if (m_failing.insert(id).second) {
        LUMEN_LOG_WARN("Rasterizing {} threw, layer skipped: {}", id, what);
    }
}

media::BitmapPtr OverlayCompositor::rasterizeSubtitle(const model::Subtitle& subtitle, Size canvas) {
    try {
        return m_rasterizer->renderSubtitle(subtitle, canvas);
    } catch (const std::exception& e) {
        reportThrow(subtitle.id, e.what());
        return nullptr;
    }
}

media::BitmapPtr OverlayCompositor::rasterize(const model::OverlayItem& item, Size canvas) {
    try {
        media::BitmapPtr bitmap = std::visit([&](const auto& entity) -> media::BitmapPtr {
            using T = std::decay_t<decltype(entity)>;
            if constexpr (std::is_same_v<T, model::TextClip>) {
                return m_rasterizer->renderText(entity, canvas);
            } else if constexpr (std::is_same_v<T, model::ShapeClip>) {
                return m_rasterizer->renderShape(entity, canvas);
            } else if constexpr (std::is_same_v<T, model::SvgClip>) {
                return m_rasterizer->renderSvg(entity, canvas);
            } else {
                static_assert(std::is_same_v<T, model::StickerClip>, "unhandled overlay kind");
                return m_rasterizer->renderSticker(entity, canvas);
            }
        }, item);
        m_failing.erase(model::overlayBase(item).id);
        return bitmap;
    } catch (const std::exception& e) {
        reportThrow(model::overlayBase(item).id, e.what());
        return nullptr;
    }
}

bool OverlayCompositor::paintEntity(RenderBackend& backend, const model::OverlayItem& item,
                                    Timestamp time, Size canvas,
                                    const model::Transform* transformOverride) {
    const model::OverlayBase& base = model::overlayBase(item);

    media::BitmapPtr bitmap = rasterize(item, canvas);
    if (!bitmap || bitmap->isEmpty()) {
        return false;
    }

    const model::Transform& authored = transformOverride ? *transformOverride : base.transform;
    if (authored.crop) {
        bitmap = bitmap->cropped(*authored.crop);
        if (!bitmap || bitmap->isEmpty()) {
            return false;
        }
    }

    model::KeyframeTrack keyframes(base.keyframes);
    model::ResolvedTransform resolved = resolveTransform(
        authored, keyframes, time - base.startTime, base.emphasis, base.duration, canvas);

    Vec2 drawSize{static_cast<double>(bitmap->width()), static_cast<double>(bitmap->height())};
    auto drawn = drawBitmap(backend, *bitmap, drawSize, resolved, base.blendOpacity);
    if (!drawn) {
        LUMEN_LOG_WARN("Overlay {} ({}) not drawn: {}", base.id,
                       model::clipKindToString(model::overlayKind(item)), drawn.error().what());
        return false;
    }
    return true;
}

int OverlayCompositor::paintOverlays(RenderBackend& backend, const model::Timeline& timeline,
                                     Timestamp time, Size canvas, OverlayPass pass,
                                     const TransformOverride* live) {
    const std::vector<int> lanes = overlayTracksForPass(timeline.tracks, pass);
    if (lanes.empty()) {
        return 0;
    }
    const auto active = model::activeOverlays(timeline.overlays, time);
    if (active.empty()) {
        return 0;
    }

    int painted = 0;
    for (int index : lanes) {
        const model::Track& track = timeline.tracks[static_cast<size_t>(index)];
        for (const model::OverlayItem* item : active) {
            const auto kind = model::overlayKind(*item);
            const bool laneMatches = track.type == model::TrackType::Text
                ? kind == model::ClipKind::Text
                : kind != model::ClipKind::Text;
            if (!laneMatches || model::overlayBase(*item).trackId != track.id) {
                continue;
            }
            const model::OverlayBase& base = model::overlayBase(*item);
            const model::Transform* liveTransform = live && live->id == base.id ? &live->transform : nullptr;
            if (paintEntity(backend, *item, time, canvas, liveTransform)) {
                ++painted;
            }
        }
    }
    return painted;
}

int OverlayCompositor::paintSubtitles(RenderBackend& backend, const model::Timeline& timeline,
                                      Timestamp time, Size canvas) {
    int painted = 0;
    for (const model::Subtitle* subtitle : model::activeSubtitles(timeline.subtitles, time)) {
        media::BitmapPtr bitmap = rasterizeSubtitle(*subtitle, canvas);
        if (!bitmap || bitmap->isEmpty()) {
            continue;
        }
        model::ResolvedTransform full;   // centred, unscaled: covers the canvas
        auto drawn = drawBitmap(backend, *bitmap,
                                {static_cast<double>(bitmap->width()), static_cast<double>(bitmap->height())},
                                full);
        if (!drawn) {
            LUMEN_LOG_WARN("Subtitle {} not drawn: {}", subtitle->id, drawn.error().what());
            continue;
        }
        ++painted;
    }
    return painted;
}

} // namespace lumen::engine
