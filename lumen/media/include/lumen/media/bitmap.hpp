/**
 * @file bitmap.hpp
 * @brief CPU-side RGBA8 raster
 *
 * Every decoded frame, rasterized overlay and composited output is a
 * Bitmap. Pixels are straight (non-premultiplied) RGBA, rows tightly packed.
 * Bitmaps are shared through BitmapPtr; the last owner releases the pixels.
 */

#pragma once

#include <lumen/core/types.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace lumen::media {

class Bitmap {
public:
    Bitmap() = default;
    Bitmap(int width, int height, Color fill = Color::transparent());

    [[nodiscard]] int width() const { return m_width; }
    [[nodiscard]] int height() const { return m_height; }
    [[nodiscard]] Size size() const { return {m_width, m_height}; }
    [[nodiscard]] int stride() const { return m_width * 4; }
    [[nodiscard]] bool isEmpty() const { return m_width <= 0 || m_height <= 0; }
    [[nodiscard]] size_t byteSize() const { return m_pixels.size(); }

    [[nodiscard]] uint8_t* data() { return m_pixels.data(); }
    [[nodiscard]] const uint8_t* data() const { return m_pixels.data(); }

    [[nodiscard]] uint8_t* row(int y) { return m_pixels.data() + static_cast<size_t>(y) * stride(); }
    [[nodiscard]] const uint8_t* row(int y) const {
        return m_pixels.data() + static_cast<size_t>(y) * stride();
    }

    /// Pixel at (x, y); transparent outside the raster
    [[nodiscard]] Color pixel(int x, int y) const;
    void setPixel(int x, int y, Color c);

    /// Source-over blend of c scaled by coverage (0..1)
    void blendPixel(int x, int y, Color c, double coverage = 1.0);

    void fill(Color c);

    /**
     * @brief Copy of a sub-rectangle
     *
     * @param normalized Rectangle in [0,1] source coordinates; clamped to the
     *                   raster. An empty intersection yields an empty bitmap.
     */
    [[nodiscard]] std::shared_ptr<Bitmap> cropped(const Rect& normalized) const;

private:
    int m_width = 0;
    int m_height = 0;
    std::vector<uint8_t> m_pixels;
};

using BitmapPtr = std::shared_ptr<Bitmap>;

inline BitmapPtr makeBitmap(int width, int height, Color fill = Color::transparent()) {
    return std::make_shared<Bitmap>(width, height, fill);
}

} // namespace lumen::media
