/**
 * @file effects_engine.cpp
 * @brief CPU colour adjustments
 */

#include <lumen/engine/effects_engine.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <vector>

namespace lumen::engine {

namespace {

using Pixel = std::array<double, 3>;

double luma(const Pixel& p) {
    return 0.2126 * p[0] + 0.7152 * p[1] + 0.0722 * p[2];
}

void applyOne(const model::Effect& effect, Pixel& p) {
    const std::string& type = effect.type;

    if (type == "brightness") {
        double v = std::clamp(effect.param("value", 0.0), -1.0, 1.0) * 255.0;
        for (double& c : p) {
            c += v;
        }
    } else if (type == "contrast") {
        double v = std::clamp(effect.param("value", 0.0), -1.0, 1.0);
        double factor = v >= 0.0 ? 1.0 + v * 3.0 : 1.0 + v;
        for (double& c : p) {
            c = (c - 127.5) * factor + 127.5;
        }
    } else if (type == "saturation") {
        double v = std::clamp(effect.param("value", 0.0), -1.0, 1.0);
        double y = luma(p);
        for (double& c : p) {
            c = y + (c - y) * (1.0 + v);
        }
    } else if (type == "grayscale") {
        double amount = std::clamp(effect.param("amount", 1.0), 0.0, 1.0);
        double y = luma(p);
        for (double& c : p) {
            c += (y - c) * amount;
        }
    } else if (type == "invert") {
        double amount = std::clamp(effect.param("amount", 1.0), 0.0, 1.0);
        for (double& c : p) {
            c += (255.0 - 2.0 * c) * amount;
        }
    } else if (type == "sepia") {
        double amount = std::clamp(effect.param("amount", 1.0), 0.0, 1.0);
        Pixel s{
            0.393 * p[0] + 0.769 * p[1] + 0.189 * p[2],
            0.349 * p[0] + 0.686 * p[1] + 0.168 * p[2],
            0.272 * p[0] + 0.534 * p[1] + 0.131 * p[2],
        };
        for (int i = 0; i < 3; ++i) {
            p[i] += (s[i] - p[i]) * amount;
        }
    }

    for (double& c : p) {
        c = std::clamp(c, 0.0, 255.0);
    }
}

} // namespace

bool BasicEffectsEngine::supports(const std::string& type) {
    return type == "brightness" || type == "contrast" || type == "saturation"
        || type == "grayscale" || type == "invert" || type == "sepia";
}

media::BitmapPtr BasicEffectsEngine::applyEffectsToFrame(const model::MediaClip& clip,
                                                         const media::BitmapPtr& frame) {
    if (!frame || frame->isEmpty()) {
        return frame;
    }

    std::vector<const model::Effect*> active;
    for (const auto& effect : clip.effects) {
        if (effect.enabled && supports(effect.type)) {
            active.push_back(&effect);
        }
    }
    if (active.empty()) {
        return frame;
    }

    auto out = std::make_shared<media::Bitmap>(*frame);
    const size_t pixels = static_cast<size_t>(out->width()) * static_cast<size_t>(out->height());
    uint8_t* data = out->data();
    for (size_t i = 0; i < pixels; ++i) {
        uint8_t* px = data + i * 4;
        Pixel p{static_cast<double>(px[0]), static_cast<double>(px[1]), static_cast<double>(px[2])};
        for (const model::Effect* effect : active) {
            applyOne(*effect, p);
        }
        for (int c = 0; c < 3; ++c) {
            px[c] = static_cast<uint8_t>(std::lround(p[c]));
        }
    }
    return out;
}

} // namespace lumen::engine
