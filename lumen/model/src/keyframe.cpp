/**
 * @file keyframe.cpp
 * @brief Easing names and keyframe track construction
 */

#include <lumen/model/keyframe.hpp>

#include <algorithm>
#include <array>
#include <utility>

namespace lumen::model {

namespace {

constexpr std::array<std::pair<const char*, Easing>, 38> kEasingNames{{
    {"linear", Easing::Linear},
    {"ease-in", Easing::EaseIn},
    {"ease-out", Easing::EaseOut},
    {"ease-in-out", Easing::EaseInOut},
    {"bezier", Easing::Bezier},
    {"bounce", Easing::Bounce},
    {"elastic", Easing::Elastic},
    {"spring", Easing::Spring},
    {"easeInQuad", Easing::EaseInQuad},
    {"easeOutQuad", Easing::EaseOutQuad},
    {"easeInOutQuad", Easing::EaseInOutQuad},
    {"easeInCubic", Easing::EaseInCubic},
    {"easeOutCubic", Easing::EaseOutCubic},
    {"easeInOutCubic", Easing::EaseInOutCubic},
    {"easeInQuart", Easing::EaseInQuart},
    {"easeOutQuart", Easing::EaseOutQuart},
    {"easeInOutQuart", Easing::EaseInOutQuart},
    {"easeInQuint", Easing::EaseInQuint},
    {"easeOutQuint", Easing::EaseOutQuint},
    {"easeInOutQuint", Easing::EaseInOutQuint},
    {"easeInSine", Easing::EaseInSine},
    {"easeOutSine", Easing::EaseOutSine},
    {"easeInOutSine", Easing::EaseInOutSine},
    {"easeInExpo", Easing::EaseInExpo},
    {"easeOutExpo", Easing::EaseOutExpo},
    {"easeInOutExpo", Easing::EaseInOutExpo},
    {"easeInCirc", Easing::EaseInCirc},
    {"easeOutCirc", Easing::EaseOutCirc},
    {"easeInOutCirc", Easing::EaseInOutCirc},
    {"easeInBack", Easing::EaseInBack},
    {"easeOutBack", Easing::EaseOutBack},
    {"easeInOutBack", Easing::EaseInOutBack},
    {"easeInElastic", Easing::EaseInElastic},
    {"easeOutElastic", Easing::EaseOutElastic},
    {"easeInOutElastic", Easing::EaseInOutElastic},
    {"easeInBounce", Easing::EaseInBounce},
    {"easeOutBounce", Easing::EaseOutBounce},
    {"easeInOutBounce", Easing::EaseInOutBounce},
}};

const std::vector<Keyframe> kNoKeyframes;

} // namespace

Easing parseEasing(const std::string& name) {
    for (const auto& [text, easing] : kEasingNames) {
        if (name == text) {
            return easing;
        }
    }
    return Easing::Linear;
}

const char* easingToString(Easing easing) {
    for (const auto& [text, value] : kEasingNames) {
        if (value == easing) {
            return text;
        }
    }
    return "linear";
}

KeyframeTrack::KeyframeTrack(const std::vector<Keyframe>& keyframes) {
    for (const auto& kf : keyframes) {
        m_byProperty[kf.property].push_back(kf);
    }
    for (auto& [property, list] : m_byProperty) {
        std::stable_sort(list.begin(), list.end(),
                         [](const Keyframe& a, const Keyframe& b) { return a.time < b.time; });
    }
}

bool KeyframeTrack::has(const std::string& property) const {
    return m_byProperty.find(property) != m_byProperty.end();
}

const std::vector<Keyframe>& KeyframeTrack::forProperty(const std::string& property) const {
    auto it = m_byProperty.find(property);
    return it != m_byProperty.end() ? it->second : kNoKeyframes;
}

std::vector<std::string> KeyframeTrack::properties() const {
    std::vector<std::string> names;
    names.reserve(m_byProperty.size());
    for (const auto& [property, list] : m_byProperty) {
        names.push_back(property);
    }
    return names;
}

} // namespace lumen::model
