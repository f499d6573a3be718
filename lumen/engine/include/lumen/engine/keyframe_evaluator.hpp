/**
 * @file keyframe_evaluator.hpp
 * @brief Value of a keyframed property at a clip-local time
 */

#pragma once

#include <lumen/core/types.hpp>
#include <lumen/model/keyframe.hpp>

#include <optional>
#include <string>
#include <vector>

namespace lumen::engine {

/**
 * @brief Interpolate a time-sorted keyframe list
 *
 * - Before the first keyframe: first value. After the last: last value.
 * - Exactly at a keyframe time: that keyframe's value. When several share
 *   the time, the last one in list order wins.
 * - Between A and B: A.value + (B.value - A.value) * ease_A(progress).
 *
 * @return nullopt for an empty list
 */
[[nodiscard]] std::optional<double> evaluateKeyframes(const std::vector<model::Keyframe>& sorted,
                                                      Timestamp localTime);

/// Property value from the track, or the fallback when it is not animated
[[nodiscard]] double evaluateProperty(const model::KeyframeTrack& track, const std::string& property,
                                      Timestamp localTime, double fallback);

} // namespace lumen::engine
