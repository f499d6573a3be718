/**
 * @file emphasis_evaluator.hpp
 * @brief Per-type emphasis animation curves
 */

#pragma once

#include <lumen/core/types.hpp>
#include <lumen/model/emphasis.hpp>

namespace lumen::engine {

/**
 * @brief Multipliers and offsets an emphasis animation contributes
 *
 * Composed onto a keyframe-resolved transform: scale and opacity multiply,
 * offsets (fractions of the canvas) and rotation (degrees) add.
 */
struct EmphasisState {
    double opacity = 1.0;
    double scale = 1.0;
    double scaleX = 1.0;
    double scaleY = 1.0;
    double offsetX = 0.0;
    double offsetY = 0.0;
    double rotation = 0.0;

    [[nodiscard]] bool isIdentity() const {
        return opacity == 1.0 && scale == 1.0 && scaleX == 1.0 && scaleY == 1.0
            && offsetX == 0.0 && offsetY == 0.0 && rotation == 0.0;
    }
};

/**
 * @brief Evaluate an emphasis animation at a clip-local time
 *
 * Identity outside [startTime, startTime + animationDuration]; the window
 * runs to clipDuration when no duration is set. Deterministic: the jitter
 * types hash the cycle position instead of drawing random numbers.
 */
[[nodiscard]] EmphasisState evaluateEmphasis(const model::EmphasisAnimation& animation,
                                             Timestamp localTime, Duration clipDuration);

} // namespace lumen::engine
