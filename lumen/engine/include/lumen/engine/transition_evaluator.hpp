/**
 * @file transition_evaluator.hpp
 * @brief Transition detection on a lane and two-frame blending
 */

#pragma once

#include <lumen/core/types.hpp>
#include <lumen/engine/software_backend.hpp>
#include <lumen/media/bitmap.hpp>
#include <lumen/model/track.hpp>

#include <optional>
#include <vector>

namespace lumen::engine {

/// A transition whose overlap window contains the queried time
struct ActiveTransition {
    int trackIndex = -1;
    const model::Track* track = nullptr;
    const model::MediaClip* clipA = nullptr;     // outgoing
    const model::MediaClip* clipB = nullptr;     // incoming
    const model::Transition* transition = nullptr;
    Timestamp windowStart = 0;
    Timestamp windowEnd = 0;

    /// Linear progress through the window, [0,1]
    [[nodiscard]] double progressAt(Timestamp time) const;
};

/**
 * @brief Blends outgoing and incoming frames
 *
 * Inputs are canvas-sized layers with their clip transforms already
 * applied; the result is one canvas-sized layer. Progress is clamped and
 * shaped by the "curve" parameter before the type-specific blend.
 */
class TransitionEvaluator {
public:
    /// Transition active at time on one lane (the overlap of its two clips)
    [[nodiscard]] static std::optional<ActiveTransition> detect(Timestamp time, const model::Track& track,
                                                                int trackIndex = -1);

    /// First transition active at time on any visible video/image lane
    [[nodiscard]] static std::optional<ActiveTransition> detect(Timestamp time,
                                                                const std::vector<model::Track>& tracks);

    /**
     * @brief Blend two frames
     *
     * With only one frame available, that frame is returned unchanged;
     * with none, null.
     */
    [[nodiscard]] media::BitmapPtr blend(const model::Transition& transition, double progress,
                                         const media::BitmapPtr& outgoing,
                                         const media::BitmapPtr& incoming, Size canvas);

private:
    void drawFull(const media::Bitmap& frame, double opacity, Vec2 offset = {0.0, 0.0},
                  double scale = 1.0, Vec2 center = {0.5, 0.5});
    void dip(const media::Bitmap& out, const media::Bitmap& in, double p, Color color, double hold);
    void wipe(const media::Bitmap& out, const media::Bitmap& in, double p, const std::string& direction,
              double softness);
    void slide(const media::Bitmap& out, const media::Bitmap& in, double p, const std::string& direction,
               bool pushOut);
    void zoom(const media::Bitmap& out, const media::Bitmap& in, double p, double scale, Vec2 center);

    SoftwareBackend m_scratch{Size{1, 1}};
    Size m_canvas;
};

} // namespace lumen::engine
