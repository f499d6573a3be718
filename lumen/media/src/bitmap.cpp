/**
 * @file bitmap.cpp
 * @brief Bitmap implementation
 */

#include <lumen/media/bitmap.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>

namespace lumen::media {

Bitmap::Bitmap(int width, int height, Color fill)
    : m_width(std::max(width, 0))
    , m_height(std::max(height, 0))
    , m_pixels(static_cast<size_t>(m_width) * static_cast<size_t>(m_height) * 4)
{
    if (fill != Color::transparent()) {
        this->fill(fill);
    }
}

Color Bitmap::pixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= m_width || y >= m_height) {
        return Color::transparent();
    }
    const uint8_t* p = row(y) + x * 4;
    return {p[0], p[1], p[2], p[3]};
}

void Bitmap::setPixel(int x, int y, Color c) {
    if (x < 0 || y < 0 || x >= m_width || y >= m_height) {
        return;
    }
    uint8_t* p = row(y) + x * 4;
    p[0] = c.r;
    p[1] = c.g;
    p[2] = c.b;
    p[3] = c.a;
}

void Bitmap::blendPixel(int x, int y, Color c, double coverage) {
    if (x < 0 || y < 0 || x >= m_width || y >= m_height) {
        return;
    }
    const double sa = (c.a / 255.0) * std::clamp(coverage, 0.0, 1.0);
    if (sa <= 0.0) {
        return;
    }
    uint8_t* p = row(y) + x * 4;
    const double da = p[3] / 255.0;
    const double outA = sa + da * (1.0 - sa);
    const uint8_t src[3] = {c.r, c.g, c.b};
    for (int i = 0; i < 3; ++i) {
        double v = (src[i] * sa + p[i] * da * (1.0 - sa)) / outA;
        p[i] = static_cast<uint8_t>(std::lround(std::clamp(v, 0.0, 255.0)));
    }
    p[3] = static_cast<uint8_t>(std::lround(outA * 255.0));
}

void Bitmap::fill(Color c) {
    for (size_t i = 0; i + 3 < m_pixels.size(); i += 4) {
        m_pixels[i] = c.r;
        m_pixels[i + 1] = c.g;
        m_pixels[i + 2] = c.b;
        m_pixels[i + 3] = c.a;
    }
}

std::shared_ptr<Bitmap> Bitmap::cropped(const Rect& normalized) const {
    double x0 = std::clamp(normalized.x, 0.0, 1.0);
    double y0 = std::clamp(normalized.y, 0.0, 1.0);
    double x1 = std::clamp(normalized.x + normalized.width, 0.0, 1.0);
    double y1 = std::clamp(normalized.y + normalized.height, 0.0, 1.0);

    int px0 = static_cast<int>(std::floor(x0 * m_width));
    int py0 = static_cast<int>(std::floor(y0 * m_height));
    int px1 = static_cast<int>(std::ceil(x1 * m_width));
    int py1 = static_cast<int>(std::ceil(y1 * m_height));

    auto out = std::make_shared<Bitmap>(std::max(px1 - px0, 0), std::max(py1 - py0, 0));
    for (int y = 0; y < out->height(); ++y) {
        std::memcpy(out->row(y), row(py0 + y) + px0 * 4, static_cast<size_t>(out->stride()));
    }
    return out;
}

} // namespace lumen::media
