/**
 * @file speed_engine.cpp
 * @brief Clip time mapping
 */

#include <lumen/engine/speed_engine.hpp>

#include <algorithm>
#include <cmath>

namespace lumen::engine {

namespace {
constexpr double kMinSpeed = 0.01;
constexpr double kMaxSpeed = 100.0;
}

double ClipSpeedEngine::getClipSpeed(const model::MediaClip& clip) const {
    std::lock_guard lock(m_mutex);
    auto it = m_speed.find(clip.id);
    double speed = it != m_speed.end() ? it->second : clip.speed;
    if (!(speed > 0.0)) {
        return 1.0;
    }
    return std::clamp(speed, kMinSpeed, kMaxSpeed);
}

bool ClipSpeedEngine::isReverse(const model::MediaClip& clip) const {
    std::lock_guard lock(m_mutex);
    auto it = m_reverse.find(clip.id);
    return it != m_reverse.end() ? it->second : clip.reversed;
}

Timestamp ClipSpeedEngine::sourceTimeAtPlaybackTime(const model::MediaClip& clip,
                                                     Duration localTime) const {
    const double speed = getClipSpeed(clip);
    const bool reversed = isReverse(clip);

    Timestamp in = clip.inPoint;
    Timestamp out = clip.outPoint > clip.inPoint
        ? clip.outPoint
        : clip.inPoint + static_cast<Duration>(std::llround(static_cast<double>(clip.duration) * speed));

    auto advanced = static_cast<Duration>(std::llround(static_cast<double>(std::max<Duration>(0, localTime)) * speed));
    Timestamp last = std::max(in, out - 1);

    if (reversed) {
        return std::clamp(out - 1 - advanced, in, last);
    }
    return std::clamp(in + advanced, in, last);
}

void ClipSpeedEngine::setSpeedOverride(const std::string& clipId, double speed) {
    std::lock_guard lock(m_mutex);
    m_speed[clipId] = speed;
}

void ClipSpeedEngine::setReverseOverride(const std::string& clipId, bool reversed) {
    std::lock_guard lock(m_mutex);
    m_reverse[clipId] = reversed;
}

void ClipSpeedEngine::clearOverrides() {
    std::lock_guard lock(m_mutex);
    m_speed.clear();
    m_reverse.clear();
}

bool isIdentityTimeMapping(const SpeedEngine& engine, const model::MediaClip& clip) {
    return std::abs(engine.getClipSpeed(clip) - 1.0) < 1e-6 && !engine.isReverse(clip);
}

} // namespace lumen::engine
