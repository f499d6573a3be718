/**
 * @file emphasis_evaluator.cpp
 * @brief Emphasis curves
 */

#include <lumen/engine/emphasis_evaluator.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numbers>

namespace lumen::engine {

using model::EmphasisType;

namespace {

constexpr double kTwoPi = 2.0 * std::numbers::pi;

/// Deterministic value in [0,1) for a cycle position and channel
double hashNoise(double cycle, uint32_t channel) {
    // Quantize so nearby samples inside one 1/64 cycle step agree; the step
    // index wraps at 2^32 so the cast stays in range
    constexpr double kWrap = 4294967296.0;
    double step = std::fmod(std::floor(cycle * 64.0), kWrap);
    if (step < 0.0) {
        step += kWrap;
    }
    auto q = static_cast<uint32_t>(step);
    uint32_t h = q * 0x9E3779B1u ^ (channel * 0x85EBCA77u);
    h ^= h >> 15;
    h *= 0x2C1B3C6Du;
    h ^= h >> 12;
    h *= 0x297A2D39u;
    h ^= h >> 15;
    return static_cast<double>(h) / 4294967296.0;
}

} // namespace

EmphasisState evaluateEmphasis(const model::EmphasisAnimation& anim, Timestamp localTime,
                               Duration clipDuration) {
    EmphasisState s;
    if (!anim.active() || localTime < anim.startTime) {
        return s;
    }

    Duration window = anim.animationDuration.value_or(clipDuration - anim.startTime);
    if (window > 0 && localTime > anim.startTime + window) {
        return s;
    }

    const double elapsed = usToSeconds(localTime - anim.startTime);
    const double progress = elapsed * anim.speed;
    const double cycle = anim.loop ? progress - std::floor(progress) : std::min(progress, 1.0);
    const double t = cycle * kTwoPi;
    const double k = anim.intensity;

    switch (anim.type) {
        case EmphasisType::None:
            break;
        case EmphasisType::Pulse:
            s.scale = 1.0 + std::sin(t) * 0.1 * k;
            break;
        case EmphasisType::Shake:
            s.offsetX = std::sin(t * 5.0) * 0.02 * k;
            s.offsetY = std::cos(t * 5.0) * 0.02 * k;
            break;
        case EmphasisType::Bounce:
            s.offsetY = std::abs(std::sin(t)) * -0.05 * k;
            break;
        case EmphasisType::Float:
            s.offsetY = std::sin(t) * 0.03 * k;
            break;
        case EmphasisType::Spin:
            s.rotation = cycle * 360.0 * k;
            break;
        case EmphasisType::Flash:
            s.opacity = 0.5 + std::abs(std::sin(t)) * 0.5;
            break;
        case EmphasisType::Heartbeat: {
            double phase = cycle * 4.0;
            if (phase < 1.0) {
                s.scale = 1.0 + 0.15 * k * std::sin(phase * std::numbers::pi);
            } else if (phase < 2.0) {
                s.scale = 1.0 + 0.1 * k * std::sin((phase - 1.0) * std::numbers::pi);
            }
            break;
        }
        case EmphasisType::Swing:
            s.rotation = std::sin(t) * 15.0 * k;
            break;
        case EmphasisType::Wobble:
            s.rotation = std::sin(t * 3.0) * 5.0 * k;
            s.offsetX = std::sin(t) * 0.02 * k;
            break;
        case EmphasisType::Jello:
            s.scaleX = 1.0 + std::sin(t * 2.0) * 0.1 * k;
            s.scaleY = 1.0 - std::sin(t * 2.0) * 0.1 * k;
            break;
        case EmphasisType::RubberBand:
            s.scaleX = 1.0 + std::sin(t) * 0.2 * k;
            s.scaleY = 1.0 - std::sin(t) * 0.1 * k;
            break;
        case EmphasisType::Tada:
            s.rotation = std::sin(t * 4.0) * 10.0 * k;
            s.scale = 1.0 + std::sin(t * 2.0) * 0.1 * k;
            break;
        case EmphasisType::Vibrate:
            s.offsetX = (hashNoise(progress, 1) - 0.5) * 0.02 * k;
            s.offsetY = (hashNoise(progress, 2) - 0.5) * 0.02 * k;
            break;
        case EmphasisType::Flicker:
            s.opacity = hashNoise(progress, 3) > 0.1 ? 1.0 : 0.3;
            break;
        case EmphasisType::Glow:
            s.scale = 1.0 + std::sin(t) * 0.05 * k;
            s.opacity = 0.8 + std::sin(t) * 0.2;
            break;
        case EmphasisType::Breathe:
            s.scale = 1.0 + std::sin(t * 0.5) * 0.08 * k;
            break;
        case EmphasisType::Wave:
            s.offsetY = std::sin(t + usToSeconds(localTime) * 2.0) * 0.03 * k;
            s.rotation = std::sin(t) * 5.0 * k;
            break;
        case EmphasisType::Tilt:
            s.rotation = std::sin(t * 0.5) * 10.0 * k;
            break;
        case EmphasisType::ZoomPulse:
            s.scale = 1.0 + std::sin(t) * 0.15 * k;
            break;
        case EmphasisType::FocusZoom: {
            constexpr double zoomIn = 0.3;
            const double zoom = anim.zoomScale > 0.0 ? anim.zoomScale : 1.5;
            const double hold = anim.holdDuration;
            const double zoomOut = std::max(1.0 - hold - zoomIn, 1e-6);

            if (cycle < zoomIn) {
                double eased = 1.0 - std::pow(1.0 - cycle / zoomIn, 3.0);
                s.scale = 1.0 + (zoom - 1.0) * eased * k;
            } else if (cycle < zoomIn + hold) {
                s.scale = zoom * k;
            } else {
                double eased = std::pow((cycle - zoomIn - hold) / zoomOut, 3.0);
                s.scale = zoom - (zoom - 1.0) * eased * k;
            }
            s.offsetX = (0.5 - anim.focusPoint.x) * (s.scale - 1.0);
            s.offsetY = (0.5 - anim.focusPoint.y) * (s.scale - 1.0);
            break;
        }
        case EmphasisType::PanLeft:
            s.offsetX = -cycle * 0.2 * k;
            break;
        case EmphasisType::PanRight:
            s.offsetX = cycle * 0.2 * k;
            break;
        case EmphasisType::PanUp:
            s.offsetY = -cycle * 0.2 * k;
            break;
        case EmphasisType::PanDown:
            s.offsetY = cycle * 0.2 * k;
            break;
        case EmphasisType::KenBurns:
            s.scale = 1.0 + cycle * 0.3 * k;
            s.offsetX = cycle * 0.1 * k;
            s.offsetY = cycle * 0.05 * k;
            break;
    }
    return s;
}

} // namespace lumen::engine
