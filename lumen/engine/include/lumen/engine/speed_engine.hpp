/**
 * @file speed_engine.hpp
 * @brief Clip speed / reverse time mapping
 *
 * Video frame lookup and audio scheduling both go through the same mapping,
 * so picture and sound stay aligned under non-1x or reversed playback.
 */

#pragma once

#include <lumen/core/types.hpp>
#include <lumen/model/clip.hpp>

#include <mutex>
#include <string>
#include <unordered_map>

namespace lumen::engine {

class SpeedEngine {
public:
    virtual ~SpeedEngine() = default;

    [[nodiscard]] virtual double getClipSpeed(const model::MediaClip& clip) const = 0;
    [[nodiscard]] virtual bool isReverse(const model::MediaClip& clip) const = 0;

    /**
     * @brief Source media time shown at a clip-local playback time
     *
     * @param localTime Time since clip.startTime on the timeline
     * @return Absolute time in the media file (inPoint included)
     */
    [[nodiscard]] virtual Timestamp sourceTimeAtPlaybackTime(const model::MediaClip& clip,
                                                             Duration localTime) const = 0;
};

/**
 * @brief Speed engine reading the clip's own speed fields
 *
 * Per-clip overrides let an editor preview a speed change before it is
 * written to the project.
 */
class ClipSpeedEngine : public SpeedEngine {
public:
    [[nodiscard]] double getClipSpeed(const model::MediaClip& clip) const override;
    [[nodiscard]] bool isReverse(const model::MediaClip& clip) const override;
    [[nodiscard]] Timestamp sourceTimeAtPlaybackTime(const model::MediaClip& clip,
                                                     Duration localTime) const override;

    void setSpeedOverride(const std::string& clipId, double speed);
    void setReverseOverride(const std::string& clipId, bool reversed);
    void clearOverrides();

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, double> m_speed;
    std::unordered_map<std::string, bool> m_reverse;
};

/// True if the clip plays at normal speed, forwards
[[nodiscard]] bool isIdentityTimeMapping(const SpeedEngine& engine, const model::MediaClip& clip);

} // namespace lumen::engine
