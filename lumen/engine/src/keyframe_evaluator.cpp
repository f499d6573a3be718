/**
 * @file keyframe_evaluator.cpp
 * @brief Keyframe interpolation
 */

#include <lumen/engine/keyframe_evaluator.hpp>

#include <lumen/engine/easing.hpp>

#include <algorithm>

namespace lumen::engine {

std::optional<double> evaluateKeyframes(const std::vector<model::Keyframe>& sorted, Timestamp localTime) {
    if (sorted.empty()) {
        return std::nullopt;
    }
    if (localTime < sorted.front().time) {
        return sorted.front().value;
    }
    if (localTime >= sorted.back().time) {
        return sorted.back().value;
    }

    // First keyframe strictly after localTime; the one before it is the
    // segment start (the last of any keyframes sharing that time)
    auto next = std::upper_bound(sorted.begin(), sorted.end(), localTime,
        [](Timestamp t, const model::Keyframe& kf) { return t < kf.time; });
    const model::Keyframe& b = *next;
    const model::Keyframe& a = *std::prev(next);

    if (localTime == a.time) {
        return a.value;
    }

    double span = static_cast<double>(b.time - a.time);
    double progress = span > 0.0 ? static_cast<double>(localTime - a.time) / span : 0.0;
    double eased = applyEasing(a.easing, progress, a.bezier);
    return a.value + (b.value - a.value) * eased;
}

double evaluateProperty(const model::KeyframeTrack& track, const std::string& property,
                        Timestamp localTime, double fallback) {
    return evaluateKeyframes(track.forProperty(property), localTime).value_or(fallback);
}

} // namespace lumen::engine
