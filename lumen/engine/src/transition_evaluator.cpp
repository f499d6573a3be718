/**
 * @file transition_evaluator.cpp
 * @brief Transition windows and blends
 */

#include <lumen/engine/transition_evaluator.hpp>

#include <lumen/core/logger.hpp>
#include <lumen/engine/easing.hpp>
#include <lumen/model/effect.hpp>

#include <algorithm>
#include <cmath>

namespace lumen::engine {

double ActiveTransition::progressAt(Timestamp time) const {
    Duration span = windowEnd - windowStart;
    if (span <= 0) {
        return 1.0;
    }
    return std::clamp(static_cast<double>(time - windowStart) / static_cast<double>(span), 0.0, 1.0);
}

// ============================================================================
// Detection
// ============================================================================

std::optional<ActiveTransition> TransitionEvaluator::detect(Timestamp time, const model::Track& track,
                                                            int trackIndex) {
    for (const auto& transition : track.transitions) {
        const model::MediaClip* a = track.findClip(transition.clipAId);
        const model::MediaClip* b = track.findClip(transition.clipBId);
        if (!a || !b) {
            continue;
        }
        Timestamp start = std::max(a->startTime, b->startTime);
        Timestamp end = std::min(a->endTime(), b->endTime());
        if (end <= start || time < start || time >= end) {
            continue;
        }

        ActiveTransition active;
        active.trackIndex = trackIndex;
        active.track = &track;
        // Outgoing is whichever clip started first
        active.clipA = a->startTime <= b->startTime ? a : b;
        active.clipB = active.clipA == a ? b : a;
        active.transition = &transition;
        active.windowStart = start;
        active.windowEnd = end;
        return active;
    }
    return std::nullopt;
}

std::optional<ActiveTransition> TransitionEvaluator::detect(Timestamp time,
                                                            const std::vector<model::Track>& tracks) {
    for (size_t i = 0; i < tracks.size(); ++i) {
        const auto& track = tracks[i];
        if (!track.isVisualMedia() || track.hidden) {
            continue;
        }
        if (auto active = detect(time, track, static_cast<int>(i))) {
            return active;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Blending
// ============================================================================

void TransitionEvaluator::drawFull(const media::Bitmap& frame, double opacity, Vec2 offset,
                                   double scale, Vec2 center) {
    if (opacity <= 0.0) {
        return;
    }
    // Scale about the normalized centre, then shift by offset pixels
    model::ResolvedTransform t;
    t.anchor = center;
    t.position = {(center.x - 0.5) * m_canvas.width + offset.x,
                  (center.y - 0.5) * m_canvas.height + offset.y};
    t.scale = {scale, scale};
    auto drawn = drawBitmap(m_scratch, frame,
                            {static_cast<double>(m_canvas.width), static_cast<double>(m_canvas.height)},
                            t, opacity);
    if (!drawn) {
        LUMEN_LOG_WARN("Transition layer not drawn: {}", drawn.error().what());
    }
}

void TransitionEvaluator::dip(const media::Bitmap& out, const media::Bitmap& in, double p,
                              Color color, double hold) {
    const double phases = 2.0 + hold;
    const double fadeOutEnd = 1.0 / phases;
    const double holdEnd = (1.0 + hold) / phases;
    media::Bitmap solid(m_canvas.width, m_canvas.height, color);

    if (p < fadeOutEnd) {
        drawFull(out, 1.0);
        drawFull(solid, p / fadeOutEnd);
    } else if (p < holdEnd) {
        drawFull(solid, 1.0);
    } else {
        drawFull(solid, 1.0);
        drawFull(in, (p - holdEnd) / (1.0 - holdEnd));
    }
}

void TransitionEvaluator::wipe(const media::Bitmap& out, const media::Bitmap& in, double p,
                               const std::string& direction, double softness) {
    const double w = m_canvas.width;
    const double h = m_canvas.height;
    const double feather = std::max(softness, 0.0) * std::max(w, h) * 0.1;

    // Signed distance into the revealed region, pixels
    auto inside = [&](double x, double y) -> double {
        if (direction == "right") {
            return x - w * (1.0 - p);
        }
        if (direction == "up") {
            return y - p * h;
        }
        if (direction == "down") {
            return y - h * (1.0 - p);
        }
        if (direction == "diagonal") {
            return (x + y - (w + h) * p) / std::sqrt(2.0);
        }
        return x - p * w;   // left
    };

    media::Bitmap masked = in;
    for (int y = 0; y < masked.height(); ++y) {
        uint8_t* row = masked.row(y);
        for (int x = 0; x < masked.width(); ++x) {
            double d = inside(x + 0.5, y + 0.5);
            double coverage = feather > 0.0 ? std::clamp(d / feather + 0.5, 0.0, 1.0) : (d >= 0.0 ? 1.0 : 0.0);
            row[x * 4 + 3] = static_cast<uint8_t>(std::lround(row[x * 4 + 3] * coverage));
        }
    }

    drawFull(out, 1.0);
    drawFull(masked, 1.0);
}

void TransitionEvaluator::slide(const media::Bitmap& out, const media::Bitmap& in, double p,
                                const std::string& direction, bool pushOut) {
    const double w = m_canvas.width;
    const double h = m_canvas.height;
    Vec2 outOffset;
    Vec2 inOffset;

    if (direction == "right") {
        inOffset.x = -w * (1.0 - p);
        if (pushOut) outOffset.x = w * p;
    } else if (direction == "up") {
        inOffset.y = h * (1.0 - p);
        if (pushOut) outOffset.y = -h * p;
    } else if (direction == "down") {
        inOffset.y = -h * (1.0 - p);
        if (pushOut) outOffset.y = h * p;
    } else {
        inOffset.x = w * (1.0 - p);
        if (pushOut) outOffset.x = -w * p;
    }

    if (pushOut || p < 1.0) {
        drawFull(out, 1.0, outOffset);
    }
    drawFull(in, 1.0, inOffset);
}

void TransitionEvaluator::zoom(const media::Bitmap& out, const media::Bitmap& in, double p,
                               double scale, Vec2 center) {
    if (scale <= 0.0) {
        scale = 2.0;
    }
    drawFull(out, 1.0 - p, {0.0, 0.0}, 1.0 + (scale - 1.0) * p, center);
    drawFull(in, p, {0.0, 0.0}, 1.0 / scale + (1.0 - 1.0 / scale) * p, center);
}

media::BitmapPtr TransitionEvaluator::blend(const model::Transition& transition, double progress,
                                            const media::BitmapPtr& outgoing,
                                            const media::BitmapPtr& incoming, Size canvas) {
    if (!outgoing || !incoming) {
        return outgoing ? outgoing : incoming;
    }
    if (canvas.isEmpty()) {
        return incoming;
    }

    m_canvas = canvas;
    if (m_scratch.size() != canvas) {
        auto resized = m_scratch.resize(canvas);
        if (!resized) {
            LUMEN_LOG_WARN("Transition canvas resize failed: {}", resized.error().what());
            return incoming;
        }
    }
    auto begun = m_scratch.beginFrame(Color::transparent());
    if (!begun) {
        LUMEN_LOG_WARN("Transition frame failed: {}", begun.error().what());
        return incoming;
    }

    using model::numberParam;
    using model::stringParam;

    const nlohmann::json& params = transition.params;
    const double p = transitionCurve(stringParam(params, "curve", "linear"),
                                     std::clamp(progress, 0.0, 1.0));

    switch (transition.type) {
        case model::TransitionType::Crossfade:
            drawFull(*outgoing, 1.0 - p);
            drawFull(*incoming, p);
            break;
        case model::TransitionType::DipToBlack:
            dip(*outgoing, *incoming, p, Color::black(), numberParam(params, "holdDuration", 0.0));
            break;
        case model::TransitionType::DipToWhite:
            dip(*outgoing, *incoming, p, Color::white(), numberParam(params, "holdDuration", 0.0));
            break;
        case model::TransitionType::Wipe:
            wipe(*outgoing, *incoming, p, stringParam(params, "direction", "left"),
                 numberParam(params, "softness", 0.0));
            break;
        case model::TransitionType::Slide:
            slide(*outgoing, *incoming, p, stringParam(params, "direction", "left"),
                  model::boolParam(params, "pushOut", false));
            break;
        case model::TransitionType::Push:
            slide(*outgoing, *incoming, p, stringParam(params, "direction", "left"), true);
            break;
        case model::TransitionType::Zoom: {
            Vec2 center{0.5, 0.5};
            if (params.is_object()) {
                if (auto it = params.find("center"); it != params.end()) {
                    center.x = numberParam(*it, "x", 0.5);
                    center.y = numberParam(*it, "y", 0.5);
                }
            }
            zoom(*outgoing, *incoming, p, numberParam(params, "scale", 2.0), center);
            break;
        }
    }

    auto frame = m_scratch.endFrame();
    if (!frame) {
        LUMEN_LOG_WARN("Transition readback failed: {}", frame.error().what());
        return incoming;
    }
    return std::move(frame).value();
}

} // namespace lumen::engine
