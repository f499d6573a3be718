/**
 * @file layer_geometry.cpp
 * @brief Layer placement math
 */

#include <lumen/engine/layer_geometry.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace lumen::engine {

Affine Affine::inverted() const {
    double det = determinant();
    if (std::abs(det) < 1e-12) {
        return {};
    }
    Affine inv;
    inv.a = d / det;
    inv.b = -b / det;
    inv.c = -c / det;
    inv.d = a / det;
    inv.tx = -(inv.a * tx + inv.c * ty);
    inv.ty = -(inv.b * tx + inv.d * ty);
    return inv;
}

Affine layerMatrix(const model::ResolvedTransform& t, Vec2 drawSize, Size canvas) {
    const double radians = t.rotation * std::numbers::pi / 180.0;
    const double cosR = std::cos(radians);
    const double sinR = std::sin(radians);

    // M = T(anchorOnCanvas) * R * S * T(-anchorInLocal)
    Affine m;
    m.a = cosR * t.scale.x;
    m.b = sinR * t.scale.x;
    m.c = -sinR * t.scale.y;
    m.d = cosR * t.scale.y;

    const double ax = drawSize.x * t.anchor.x;
    const double ay = drawSize.y * t.anchor.y;
    const double px = canvas.width / 2.0 + t.position.x;
    const double py = canvas.height / 2.0 + t.position.y;

    m.tx = px - (m.a * ax + m.c * ay);
    m.ty = py - (m.b * ax + m.d * ay);
    return m;
}

std::array<Vec2, 4> layerCorners(const model::ResolvedTransform& t, Vec2 drawSize, Size canvas) {
    Affine m = layerMatrix(t, drawSize, canvas);
    return {m.apply({0.0, 0.0}), m.apply({drawSize.x, 0.0}), m.apply({drawSize.x, drawSize.y}),
            m.apply({0.0, drawSize.y})};
}

Vec2 fitSize(Size source, Size canvas, model::FitMode mode) {
    if (source.isEmpty()) {
        return {0.0, 0.0};
    }
    const double sw = source.width;
    const double sh = source.height;
    if (canvas.isEmpty()) {
        return {sw, sh};
    }

    switch (mode) {
        case model::FitMode::Fill:
            return {static_cast<double>(canvas.width), static_cast<double>(canvas.height)};
        case model::FitMode::None:
            return {sw, sh};
        case model::FitMode::Cover: {
            double s = std::max(canvas.width / sw, canvas.height / sh);
            return {sw * s, sh * s};
        }
        case model::FitMode::Contain:
        default: {
            double s = std::min(canvas.width / sw, canvas.height / sh);
            return {sw * s, sh * s};
        }
    }
}

bool insideRoundedRect(double u, double v, Vec2 size, double radius) {
    if (u < 0.0 || v < 0.0 || u >= size.x || v >= size.y) {
        return false;
    }
    double r = std::min({radius, size.x / 2.0, size.y / 2.0});
    if (r <= 0.0) {
        return true;
    }

    // Distance from the nearest corner circle centre, only in corner zones
    double cx = u < r ? r : (u > size.x - r ? size.x - r : u);
    double cy = v < r ? r : (v > size.y - r ? size.y - r : v);
    double dx = u - cx;
    double dy = v - cy;
    return dx * dx + dy * dy <= r * r;
}

} // namespace lumen::engine
