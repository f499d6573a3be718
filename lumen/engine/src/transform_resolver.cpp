/**
 * @file transform_resolver.cpp
 * @brief Keyframe + emphasis transform resolution
 */

#include <lumen/engine/transform_resolver.hpp>

#include <lumen/engine/emphasis_evaluator.hpp>
#include <lumen/engine/keyframe_evaluator.hpp>

#include <algorithm>

namespace lumen::engine {

namespace prop = model::property;

model::ResolvedTransform resolveTransform(const model::Transform& base,
                                          const model::KeyframeTrack& keyframes,
                                          Timestamp localTime,
                                          const std::optional<model::EmphasisAnimation>& emphasis,
                                          Duration clipDuration, Size canvas) {
    model::ResolvedTransform out;
    out.position = base.position;
    out.scale = base.scale;
    out.rotation = base.rotation;
    out.anchor = base.anchor;
    out.opacity = base.opacity;
    out.borderRadius = base.borderRadius;

    if (!keyframes.empty()) {
        out.position.x = evaluateProperty(keyframes, prop::kPositionX, localTime, out.position.x);
        out.position.y = evaluateProperty(keyframes, prop::kPositionY, localTime, out.position.y);
        out.scale.x = evaluateProperty(keyframes, prop::kScaleX, localTime, out.scale.x);
        out.scale.y = evaluateProperty(keyframes, prop::kScaleY, localTime, out.scale.y);
        out.rotation = evaluateProperty(keyframes, prop::kRotation, localTime, out.rotation);
        out.anchor.x = evaluateProperty(keyframes, prop::kAnchorX, localTime, out.anchor.x);
        out.anchor.y = evaluateProperty(keyframes, prop::kAnchorY, localTime, out.anchor.y);
        out.opacity = evaluateProperty(keyframes, prop::kOpacity, localTime, out.opacity);
        out.borderRadius = evaluateProperty(keyframes, prop::kBorderRadius, localTime, out.borderRadius);
    }

    if (base.rotate3d) {
        out.rotation += base.rotate3d->z;
    }

    if (emphasis && emphasis->active()) {
        EmphasisState e = evaluateEmphasis(*emphasis, localTime, clipDuration);
        out.opacity *= e.opacity;
        out.scale.x *= e.scale * e.scaleX;
        out.scale.y *= e.scale * e.scaleY;
        out.position.x += e.offsetX * canvas.width;
        out.position.y += e.offsetY * canvas.height;
        out.rotation += e.rotation;
    }

    out.opacity = std::clamp(out.opacity, 0.0, 1.0);
    out.borderRadius = std::max(out.borderRadius, 0.0);
    return out;
}

model::ResolvedTransform resolveClipTransform(const model::MediaClip& clip, Timestamp timelineTime,
                                              Size canvas) {
    model::KeyframeTrack track(clip.keyframes);
    return resolveTransform(clip.transform, track, timelineTime - clip.startTime, clip.emphasis,
                            clip.duration, canvas);
}

model::ResolvedTransform resolveOverlayTransform(const model::OverlayBase& overlay,
                                                 Timestamp timelineTime, Size canvas) {
    model::KeyframeTrack track(overlay.keyframes);
    return resolveTransform(overlay.transform, track, timelineTime - overlay.startTime,
                            overlay.emphasis, overlay.duration, canvas);
}

} // namespace lumen::engine
