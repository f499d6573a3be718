/**
 * @file emphasis.hpp
 * @brief Emphasis (looping attention) animation descriptor
 */

#pragma once

#include <lumen/core/types.hpp>

#include <optional>
#include <string>

namespace lumen::model {

enum class EmphasisType {
    None,
    Pulse,
    Shake,
    Bounce,
    Float,
    Spin,
    Flash,
    Heartbeat,
    Swing,
    Wobble,
    Jello,
    RubberBand,
    Tada,
    Vibrate,
    Flicker,
    Glow,
    Breathe,
    Wave,
    Tilt,
    ZoomPulse,
    FocusZoom,
    PanLeft,
    PanRight,
    PanUp,
    PanDown,
    KenBurns,
};

/// Unknown names map to None
EmphasisType parseEmphasisType(const std::string& name);
const char* emphasisTypeToString(EmphasisType type);

/**
 * @brief Emphasis animation attached to a clip
 *
 * startTime and animationDuration are clip-local; an unset duration runs
 * the animation to the end of the clip.
 */
struct EmphasisAnimation {
    EmphasisType type = EmphasisType::None;
    double speed = 1.0;         // cycles per second
    double intensity = 1.0;
    bool loop = true;

    // focus-zoom
    Vec2 focusPoint{0.5, 0.5};
    double zoomScale = 1.5;
    double holdDuration = 0.3;  // fraction of the cycle held at full zoom

    Timestamp startTime = 0;
    std::optional<Duration> animationDuration;

    [[nodiscard]] bool active() const { return type != EmphasisType::None; }
};

} // namespace lumen::model
