/**
 * @file transform.hpp
 * @brief Static clip transform and its per-frame resolved form
 */

#pragma once

#include <lumen/core/types.hpp>

#include <optional>
#include <string>

namespace lumen::model {

/// How a source is sized into the canvas before the transform applies
enum class FitMode {
    Contain,    // Letterbox, whole source visible (default)
    Cover,      // Fill canvas, crop overflow
    Fill,       // Stretch to canvas
    None,       // Native pixel size
};

FitMode parseFitMode(const std::string& name);
const char* fitModeToString(FitMode mode);

/**
 * @brief Clip transform as authored
 *
 * Position is a pixel offset of the anchor from the canvas centre. Scale is
 * relative to the fitted size. Rotation is in degrees, clockwise. Anchor is
 * normalized within the source (0.5, 0.5 = centre).
 */
struct Transform {
    Vec2 position{0.0, 0.0};
    Vec2 scale{1.0, 1.0};
    double rotation = 0.0;
    Vec2 anchor{0.5, 0.5};
    double opacity = 1.0;
    double borderRadius = 0.0;
    FitMode fitMode = FitMode::Contain;

    /// Normalized crop rectangle in source space; nullopt = uncropped
    std::optional<Rect> crop;

    /// Carried for the inspector; only the z component reaches the 2D preview
    struct Rotate3d {
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;
    };
    std::optional<Rotate3d> rotate3d;
    std::optional<double> perspective;
};

/**
 * @brief Partial transform used by live-interaction commits
 *
 * Only engaged fields are written to the store.
 */
struct TransformPatch {
    std::optional<Vec2> position;
    std::optional<Vec2> scale;
    std::optional<double> rotation;
    std::optional<Vec2> anchor;
    std::optional<double> opacity;
    std::optional<double> borderRadius;
    std::optional<Rect> crop;

    [[nodiscard]] bool empty() const {
        return !position && !scale && !rotation && !anchor && !opacity && !borderRadius && !crop;
    }

    /// Apply engaged fields onto a transform
    void applyTo(Transform& t) const;
};

/**
 * @brief Transform resolved for one instant
 *
 * The output of the animation resolver: keyframes and emphasis already
 * folded in. Both render backends interpret these fields identically.
 */
struct ResolvedTransform {
    Vec2 position{0.0, 0.0};
    Vec2 scale{1.0, 1.0};
    double rotation = 0.0;
    Vec2 anchor{0.5, 0.5};
    double opacity = 1.0;
    double borderRadius = 0.0;

    bool operator==(const ResolvedTransform&) const = default;
};

} // namespace lumen::model
