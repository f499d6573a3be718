/**
 * @file effects_engine.hpp
 * @brief Per-clip video effect application
 */

#pragma once

#include <lumen/media/bitmap.hpp>
#include <lumen/model/clip.hpp>

#include <string>

namespace lumen::engine {

/**
 * @brief Applies a clip's effect list to one decoded frame
 *
 * The input bitmap may be shared with a cache and must not be modified;
 * implementations return either the input itself (nothing to do) or a new
 * bitmap.
 */
class EffectsEngine {
public:
    virtual ~EffectsEngine() = default;

    [[nodiscard]] virtual media::BitmapPtr applyEffectsToFrame(const model::MediaClip& clip,
                                                               const media::BitmapPtr& frame) = 0;
};

/**
 * @brief Colour adjustments done per pixel on the CPU
 *
 * Handles brightness, contrast, saturation (-1..1 each, 0 = neutral),
 * grayscale, invert and sepia (amount 0..1). Disabled and unknown effects
 * pass through.
 */
class BasicEffectsEngine : public EffectsEngine {
public:
    [[nodiscard]] media::BitmapPtr applyEffectsToFrame(const model::MediaClip& clip,
                                                       const media::BitmapPtr& frame) override;

    /// True if the type is one this engine changes pixels for
    [[nodiscard]] static bool supports(const std::string& type);
};

} // namespace lumen::engine
