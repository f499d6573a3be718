/**
 * @file easing.cpp
 * @brief Easing curve implementations
 */

#include <lumen/engine/easing.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace lumen::engine {

using model::Easing;

namespace {

constexpr double kPi = std::numbers::pi;

// Penner constants
constexpr double kBackC1 = 1.70158;
constexpr double kBackC2 = kBackC1 * 1.525;
constexpr double kBackC3 = kBackC1 + 1.0;
constexpr double kElasticC4 = (2.0 * kPi) / 3.0;
constexpr double kElasticC5 = (2.0 * kPi) / 4.5;

double bounceOut(double t) {
    constexpr double n1 = 7.5625;
    constexpr double d1 = 2.75;

    if (t < 1.0 / d1) {
        return n1 * t * t;
    }
    if (t < 2.0 / d1) {
        t -= 1.5 / d1;
        return n1 * t * t + 0.75;
    }
    if (t < 2.5 / d1) {
        t -= 2.25 / d1;
        return n1 * t * t + 0.9375;
    }
    t -= 2.625 / d1;
    return n1 * t * t + 0.984375;
}

double elasticPreset(double t) {
    if (t == 0.0 || t == 1.0) {
        return t;
    }
    constexpr double p = 0.3;
    constexpr double s = p / 4.0;
    return std::pow(2.0, -10.0 * t) * std::sin(((t - s) * (2.0 * kPi)) / p) + 1.0;
}

double springPreset(double t) {
    if (t == 0.0 || t == 1.0) {
        return t;
    }
    constexpr double factor = 0.4;
    return 1.0 - std::pow(std::cos(t * kPi * 4.5), 3.0) * std::pow(1.0 - t, 2.2) * factor - (1.0 - t);
}

} // namespace

double cubicBezier(double t, const model::BezierHandles& h) {
    if (t <= 0.0) {
        return 0.0;
    }
    if (t >= 1.0) {
        return 1.0;
    }

    // Polynomial coefficients, P0 = (0,0), P3 = (1,1)
    const double cx = 3.0 * h.x1;
    const double bx = 3.0 * (h.x2 - h.x1) - cx;
    const double ax = 1.0 - cx - bx;
    const double cy = 3.0 * h.y1;
    const double by = 3.0 * (h.y2 - h.y1) - cy;
    const double ay = 1.0 - cy - by;

    auto sampleX = [&](double s) { return ((ax * s + bx) * s + cx) * s; };
    auto sampleY = [&](double s) { return ((ay * s + by) * s + cy) * s; };
    auto slopeX = [&](double s) { return (3.0 * ax * s + 2.0 * bx) * s + cx; };

    double s = t;
    for (int i = 0; i < 8; ++i) {
        double err = sampleX(s) - t;
        if (std::abs(err) < 1e-7) {
            return sampleY(s);
        }
        double d = slopeX(s);
        if (std::abs(d) < 1e-6) {
            break;
        }
        s -= err / d;
    }

    double lo = 0.0;
    double hi = 1.0;
    s = t;
    for (int i = 0; i < 32; ++i) {
        double x = sampleX(s);
        if (std::abs(x - t) < 1e-7) {
            break;
        }
        if (x > t) {
            hi = s;
        } else {
            lo = s;
        }
        s = (lo + hi) / 2.0;
    }
    return sampleY(s);
}

double applyEasing(Easing easing, double t, const std::optional<model::BezierHandles>& bezier) {
    t = std::clamp(t, 0.0, 1.0);

    switch (easing) {
        case Easing::Linear:
            return t;
        case Easing::EaseIn:
        case Easing::EaseInQuad:
            return t * t;
        case Easing::EaseOut:
            return t * (2.0 - t);
        case Easing::EaseInOut:
            return t < 0.5 ? 2.0 * t * t : -1.0 + (4.0 - 2.0 * t) * t;
        case Easing::Bezier:
            return cubicBezier(t, bezier.value_or(model::BezierHandles{}));

        case Easing::Bounce:
            return bounceOut(t);
        case Easing::Elastic:
            return elasticPreset(t);
        case Easing::Spring:
            return springPreset(t);

        case Easing::EaseOutQuad:
            return 1.0 - (1.0 - t) * (1.0 - t);
        case Easing::EaseInOutQuad:
            return t < 0.5 ? 2.0 * t * t : 1.0 - std::pow(-2.0 * t + 2.0, 2.0) / 2.0;

        case Easing::EaseInCubic:
            return t * t * t;
        case Easing::EaseOutCubic:
            return 1.0 - std::pow(1.0 - t, 3.0);
        case Easing::EaseInOutCubic:
            return t < 0.5 ? 4.0 * t * t * t : 1.0 - std::pow(-2.0 * t + 2.0, 3.0) / 2.0;

        case Easing::EaseInQuart:
            return t * t * t * t;
        case Easing::EaseOutQuart:
            return 1.0 - std::pow(1.0 - t, 4.0);
        case Easing::EaseInOutQuart:
            return t < 0.5 ? 8.0 * std::pow(t, 4.0) : 1.0 - std::pow(-2.0 * t + 2.0, 4.0) / 2.0;

        case Easing::EaseInQuint:
            return std::pow(t, 5.0);
        case Easing::EaseOutQuint:
            return 1.0 - std::pow(1.0 - t, 5.0);
        case Easing::EaseInOutQuint:
            return t < 0.5 ? 16.0 * std::pow(t, 5.0) : 1.0 - std::pow(-2.0 * t + 2.0, 5.0) / 2.0;

        case Easing::EaseInSine:
            return 1.0 - std::cos((t * kPi) / 2.0);
        case Easing::EaseOutSine:
            return std::sin((t * kPi) / 2.0);
        case Easing::EaseInOutSine:
            return -(std::cos(kPi * t) - 1.0) / 2.0;

        case Easing::EaseInExpo:
            return t == 0.0 ? 0.0 : std::pow(2.0, 10.0 * t - 10.0);
        case Easing::EaseOutExpo:
            return t == 1.0 ? 1.0 : 1.0 - std::pow(2.0, -10.0 * t);
        case Easing::EaseInOutExpo:
            if (t == 0.0 || t == 1.0) {
                return t;
            }
            return t < 0.5 ? std::pow(2.0, 20.0 * t - 10.0) / 2.0
                           : (2.0 - std::pow(2.0, -20.0 * t + 10.0)) / 2.0;

        case Easing::EaseInCirc:
            return 1.0 - std::sqrt(1.0 - t * t);
        case Easing::EaseOutCirc:
            return std::sqrt(1.0 - (t - 1.0) * (t - 1.0));
        case Easing::EaseInOutCirc:
            return t < 0.5 ? (1.0 - std::sqrt(1.0 - std::pow(2.0 * t, 2.0))) / 2.0
                           : (std::sqrt(1.0 - std::pow(-2.0 * t + 2.0, 2.0)) + 1.0) / 2.0;

        case Easing::EaseInBack:
            return kBackC3 * t * t * t - kBackC1 * t * t;
        case Easing::EaseOutBack:
            return 1.0 + kBackC3 * std::pow(t - 1.0, 3.0) + kBackC1 * std::pow(t - 1.0, 2.0);
        case Easing::EaseInOutBack:
            return t < 0.5
                ? (std::pow(2.0 * t, 2.0) * ((kBackC2 + 1.0) * 2.0 * t - kBackC2)) / 2.0
                : (std::pow(2.0 * t - 2.0, 2.0) * ((kBackC2 + 1.0) * (t * 2.0 - 2.0) + kBackC2) + 2.0) / 2.0;

        case Easing::EaseInElastic:
            if (t == 0.0 || t == 1.0) {
                return t;
            }
            return -std::pow(2.0, 10.0 * t - 10.0) * std::sin((t * 10.0 - 10.75) * kElasticC4);
        case Easing::EaseOutElastic:
            if (t == 0.0 || t == 1.0) {
                return t;
            }
            return std::pow(2.0, -10.0 * t) * std::sin((t * 10.0 - 0.75) * kElasticC4) + 1.0;
        case Easing::EaseInOutElastic:
            if (t == 0.0 || t == 1.0) {
                return t;
            }
            return t < 0.5
                ? -(std::pow(2.0, 20.0 * t - 10.0) * std::sin((20.0 * t - 11.125) * kElasticC5)) / 2.0
                : (std::pow(2.0, -20.0 * t + 10.0) * std::sin((20.0 * t - 11.125) * kElasticC5)) / 2.0 + 1.0;

        case Easing::EaseInBounce:
            return 1.0 - bounceOut(1.0 - t);
        case Easing::EaseOutBounce:
            return bounceOut(t);
        case Easing::EaseInOutBounce:
            return t < 0.5 ? (1.0 - bounceOut(1.0 - 2.0 * t)) / 2.0
                           : (1.0 + bounceOut(2.0 * t - 1.0)) / 2.0;
    }
    return t;
}

double transitionCurve(const std::string& curve, double t) {
    t = std::clamp(t, 0.0, 1.0);

    if (curve == "ease") {
        return t * t * (3.0 - 2.0 * t);
    }
    if (curve == "ease-in") {
        return t * t;
    }
    if (curve == "ease-out") {
        return t * (2.0 - t);
    }
    if (curve == "ease-in-out") {
        return t < 0.5 ? 2.0 * t * t : -1.0 + (4.0 - 2.0 * t) * t;
    }
    return t;
}

} // namespace lumen::engine
