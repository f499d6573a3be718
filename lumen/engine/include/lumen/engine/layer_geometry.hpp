/**
 * @file layer_geometry.hpp
 * @brief Shared layer placement math for both render backends
 *
 * A layer is a drawSize rectangle in local coordinates [0,w] x [0,h]. Its
 * anchor point lands at canvas centre + position; the rectangle is scaled
 * and rotated (degrees, clockwise in screen space) about that anchor.
 */

#pragma once

#include <lumen/core/types.hpp>
#include <lumen/model/transform.hpp>

#include <array>

namespace lumen::engine {

/// 2x3 affine matrix: [a c tx; b d ty]
struct Affine {
    double a = 1.0;
    double b = 0.0;
    double c = 0.0;
    double d = 1.0;
    double tx = 0.0;
    double ty = 0.0;

    [[nodiscard]] Vec2 apply(Vec2 p) const {
        return {a * p.x + c * p.y + tx, b * p.x + d * p.y + ty};
    }

    [[nodiscard]] double determinant() const { return a * d - b * c; }

    /// Inverse; identity when singular (callers check determinant first)
    [[nodiscard]] Affine inverted() const;
};

/// Local-to-canvas matrix of a layer
[[nodiscard]] Affine layerMatrix(const model::ResolvedTransform& transform, Vec2 drawSize,
                                 Size canvas);

/// Canvas-space corners of a layer: top-left, top-right, bottom-right, bottom-left
[[nodiscard]] std::array<Vec2, 4> layerCorners(const model::ResolvedTransform& transform,
                                               Vec2 drawSize, Size canvas);

/**
 * @brief Base draw size of a source placed in the canvas
 *
 * contain letterboxes, cover fills and overflows, fill stretches, none keeps
 * native pixels.
 */
[[nodiscard]] Vec2 fitSize(Size source, Size canvas, model::FitMode mode);

/**
 * @brief Rounded-rectangle membership in local coordinates
 *
 * The radius is clamped to half of the shorter side.
 */
[[nodiscard]] bool insideRoundedRect(double u, double v, Vec2 size, double radius);

} // namespace lumen::engine
