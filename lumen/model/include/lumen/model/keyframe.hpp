/**
 * @file keyframe.hpp
 * @brief Keyframes and per-property keyframe tracks
 */

#pragma once

#include <lumen/core/types.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lumen::model {

enum class Easing {
    Linear,
    EaseIn,
    EaseOut,
    EaseInOut,
    Bezier,
    // Presets
    Bounce,
    Elastic,
    Spring,
    // Penner family
    EaseInQuad, EaseOutQuad, EaseInOutQuad,
    EaseInCubic, EaseOutCubic, EaseInOutCubic,
    EaseInQuart, EaseOutQuart, EaseInOutQuart,
    EaseInQuint, EaseOutQuint, EaseInOutQuint,
    EaseInSine, EaseOutSine, EaseInOutSine,
    EaseInExpo, EaseOutExpo, EaseInOutExpo,
    EaseInCirc, EaseOutCirc, EaseInOutCirc,
    EaseInBack, EaseOutBack, EaseInOutBack,
    EaseInElastic, EaseOutElastic, EaseInOutElastic,
    EaseInBounce, EaseOutBounce, EaseInOutBounce,
};

/// Unknown names map to Linear
Easing parseEasing(const std::string& name);
const char* easingToString(Easing easing);

/// Cubic-bezier control points (P1, P2); P0 = (0,0), P3 = (1,1)
struct BezierHandles {
    double x1 = 0.25;
    double y1 = 0.1;
    double x2 = 0.25;
    double y2 = 1.0;
};

/// Names of the numeric properties the resolver animates
namespace property {
constexpr const char* kOpacity = "opacity";
constexpr const char* kPositionX = "position.x";
constexpr const char* kPositionY = "position.y";
constexpr const char* kScaleX = "scale.x";
constexpr const char* kScaleY = "scale.y";
constexpr const char* kRotation = "rotation";
constexpr const char* kAnchorX = "anchor.x";
constexpr const char* kAnchorY = "anchor.y";
constexpr const char* kBorderRadius = "borderRadius";
} // namespace property

/**
 * @brief A (time, value, easing) sample for one property
 *
 * Time is clip-local. The easing shapes the segment that starts at this
 * keyframe.
 */
struct Keyframe {
    std::string id;
    Timestamp time = 0;
    std::string property;
    double value = 0.0;
    Easing easing = Easing::Linear;
    std::optional<BezierHandles> bezier;
};

/**
 * @brief Keyframes grouped by property, each list time-sorted
 *
 * Built once per clip snapshot. Sorting is stable, so keyframes sharing a
 * timestamp keep authoring order and the later one wins at that instant.
 */
class KeyframeTrack {
public:
    KeyframeTrack() = default;
    explicit KeyframeTrack(const std::vector<Keyframe>& keyframes);

    [[nodiscard]] bool empty() const { return m_byProperty.empty(); }
    [[nodiscard]] bool has(const std::string& property) const;

    /// Sorted keyframes of one property (empty if none)
    [[nodiscard]] const std::vector<Keyframe>& forProperty(const std::string& property) const;

    [[nodiscard]] std::vector<std::string> properties() const;

private:
    std::map<std::string, std::vector<Keyframe>> m_byProperty;
};

} // namespace lumen::model
