/**
 * @file easing.hpp
 * @brief Easing curves for keyframes and transitions
 */

#pragma once

#include <lumen/model/keyframe.hpp>

#include <optional>
#include <string>

namespace lumen::engine {

/**
 * @brief Ease a normalized progress value
 *
 * @param t      Progress, clamped to [0,1]
 * @param bezier Handles for Easing::Bezier (defaults when absent)
 */
[[nodiscard]] double applyEasing(model::Easing easing, double t,
                                 const std::optional<model::BezierHandles>& bezier = std::nullopt);

/**
 * @brief CSS-style cubic-bezier timing function
 *
 * Solves x(s) = t for the curve parameter s (Newton-Raphson, bisection when
 * the slope is too flat) and returns y(s).
 */
[[nodiscard]] double cubicBezier(double t, const model::BezierHandles& handles);

/// Transition progress curve: linear, ease (smoothstep), ease-in, ease-out, ease-in-out
[[nodiscard]] double transitionCurve(const std::string& curve, double t);

} // namespace lumen::engine
