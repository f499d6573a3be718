/**
 * @file transform_resolver.hpp
 * @brief Fold keyframes and emphasis into a per-frame transform
 */

#pragma once

#include <lumen/core/types.hpp>
#include <lumen/model/clip.hpp>
#include <lumen/model/keyframe.hpp>
#include <lumen/model/transform.hpp>

#include <optional>

namespace lumen::engine {

/**
 * @brief Resolve the transform of a clip at a clip-local time
 *
 * Keyframed properties replace the static value. Emphasis is applied
 * afterwards: opacity and scale multiply, offsets (canvas fractions) are
 * converted to pixels and added to position, rotation adds. The z
 * component of a 3D rotation is added to the 2D rotation.
 */
[[nodiscard]] model::ResolvedTransform resolveTransform(
    const model::Transform& base, const model::KeyframeTrack& keyframes, Timestamp localTime,
    const std::optional<model::EmphasisAnimation>& emphasis, Duration clipDuration, Size canvas);

/// Convenience overloads that build the keyframe track from the entity
[[nodiscard]] model::ResolvedTransform resolveClipTransform(const model::MediaClip& clip,
                                                            Timestamp timelineTime, Size canvas);
[[nodiscard]] model::ResolvedTransform resolveOverlayTransform(const model::OverlayBase& overlay,
                                                               Timestamp timelineTime, Size canvas);

} // namespace lumen::engine
