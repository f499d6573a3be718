/**
 * @file emphasis.cpp
 * @brief Emphasis type names
 */

#include <lumen/model/emphasis.hpp>

#include <array>
#include <utility>

namespace lumen::model {

namespace {

constexpr std::array<std::pair<const char*, EmphasisType>, 26> kNames{{
    {"none", EmphasisType::None},
    {"pulse", EmphasisType::Pulse},
    {"shake", EmphasisType::Shake},
    {"bounce", EmphasisType::Bounce},
    {"float", EmphasisType::Float},
    {"spin", EmphasisType::Spin},
    {"flash", EmphasisType::Flash},
    {"heartbeat", EmphasisType::Heartbeat},
    {"swing", EmphasisType::Swing},
    {"wobble", EmphasisType::Wobble},
    {"jello", EmphasisType::Jello},
    {"rubber-band", EmphasisType::RubberBand},
    {"tada", EmphasisType::Tada},
    {"vibrate", EmphasisType::Vibrate},
    {"flicker", EmphasisType::Flicker},
    {"glow", EmphasisType::Glow},
    {"breathe", EmphasisType::Breathe},
    {"wave", EmphasisType::Wave},
    {"tilt", EmphasisType::Tilt},
    {"zoom-pulse", EmphasisType::ZoomPulse},
    {"focus-zoom", EmphasisType::FocusZoom},
    {"pan-left", EmphasisType::PanLeft},
    {"pan-right", EmphasisType::PanRight},
    {"pan-up", EmphasisType::PanUp},
    {"pan-down", EmphasisType::PanDown},
    {"ken-burns", EmphasisType::KenBurns},
}};

} // namespace

EmphasisType parseEmphasisType(const std::string& name) {
    for (const auto& [text, type] : kNames) {
        if (name == text) {
            return type;
        }
    }
    return EmphasisType::None;
}

const char* emphasisTypeToString(EmphasisType type) {
    for (const auto& [text, value] : kNames) {
        if (value == type) {
            return text;
        }
    }
    return "none";
}

} // namespace lumen::model
