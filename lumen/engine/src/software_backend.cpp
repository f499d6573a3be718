/**
 * @file software_backend.cpp
 * @brief CPU raster compositing
 */

#include <lumen/engine/software_backend.hpp>

#include <lumen/core/logger.hpp>
#include <lumen/engine/layer_geometry.hpp>

#include <algorithm>
#include <cmath>

namespace lumen::engine {

namespace {

struct Texel {
    double r, g, b, a;   // straight, 0..255
};

/// Bilinear sample with edge clamping; (x, y) in texel space, centres at +0.5
Texel sampleBilinear(const media::Bitmap& tex, double x, double y) {
    x -= 0.5;
    y -= 0.5;
    const int maxX = tex.width() - 1;
    const int maxY = tex.height() - 1;

    int x0 = static_cast<int>(std::floor(x));
    int y0 = static_cast<int>(std::floor(y));
    double fx = x - x0;
    double fy = y - y0;
    int x1 = std::clamp(x0 + 1, 0, maxX);
    int y1 = std::clamp(y0 + 1, 0, maxY);
    x0 = std::clamp(x0, 0, maxX);
    y0 = std::clamp(y0, 0, maxY);

    const uint8_t* p00 = tex.row(y0) + x0 * 4;
    const uint8_t* p10 = tex.row(y0) + x1 * 4;
    const uint8_t* p01 = tex.row(y1) + x0 * 4;
    const uint8_t* p11 = tex.row(y1) + x1 * 4;

    const double w00 = (1.0 - fx) * (1.0 - fy);
    const double w10 = fx * (1.0 - fy);
    const double w01 = (1.0 - fx) * fy;
    const double w11 = fx * fy;

    // Interpolate premultiplied so transparent texels do not bleed colour
    double a = p00[3] * w00 + p10[3] * w10 + p01[3] * w01 + p11[3] * w11;
    if (a <= 0.0) {
        return {0.0, 0.0, 0.0, 0.0};
    }
    Texel out{};
    double* channels[3] = {&out.r, &out.g, &out.b};
    for (int c = 0; c < 3; ++c) {
        double premul = p00[c] * p00[3] * w00 + p10[c] * p10[3] * w10
                      + p01[c] * p01[3] * w01 + p11[c] * p11[3] * w11;
        *channels[c] = premul / a;
    }
    out.a = a;
    return out;
}

void blendOver(uint8_t* dst, const Texel& src, double alpha) {
    const double sa = (src.a / 255.0) * alpha;
    if (sa <= 0.0) {
        return;
    }
    const double da = dst[3] / 255.0;
    const double outA = sa + da * (1.0 - sa);
    if (outA <= 0.0) {
        return;
    }
    const double s[3] = {src.r, src.g, src.b};
    for (int c = 0; c < 3; ++c) {
        double v = (s[c] * sa + dst[c] * da * (1.0 - sa)) / outA;
        dst[c] = static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
    }
    dst[3] = static_cast<uint8_t>(std::clamp(std::lround(outA * 255.0), 0L, 255L));
}

} // namespace

SoftwareBackend::SoftwareBackend(Size size)
    : m_size(size)
{
}

Result<void> SoftwareBackend::beginFrame(Color background) {
    if (m_size.isEmpty()) {
        return Err<void>(ErrorCode::RenderError, "Canvas size is empty");
    }
    if (!m_canvas || m_canvas->size() != m_size) {
        m_canvas = media::makeBitmap(m_size.width, m_size.height, background);
    } else {
        m_canvas->fill(background);
    }
    m_inFrame = true;
    return Ok();
}

Result<void> SoftwareBackend::renderLayer(const RenderLayer& layer) {
    if (!m_inFrame) {
        return Err<void>(ErrorCode::RenderError, "renderLayer outside beginFrame/endFrame");
    }
    auto it = m_textures.find(layer.texture);
    if (it == m_textures.end()) {
        return Err<void>(ErrorCode::NotFound, "Unknown texture");
    }
    const media::Bitmap& tex = *it->second;
    const Vec2 size = layer.drawSize;
    const double alpha = std::clamp(layer.transform.opacity * layer.opacity, 0.0, 1.0);
    if (tex.isEmpty() || size.x <= 0.0 || size.y <= 0.0 || alpha <= 0.0) {
        return Ok();
    }

    Affine m = layerMatrix(layer.transform, size, m_size);
    if (std::abs(m.determinant()) < 1e-9) {
        return Ok();
    }
    Affine inv = m.inverted();

    auto corners = layerCorners(layer.transform, size, m_size);
    double minX = corners[0].x, maxX = corners[0].x;
    double minY = corners[0].y, maxY = corners[0].y;
    for (const auto& c : corners) {
        minX = std::min(minX, c.x);
        maxX = std::max(maxX, c.x);
        minY = std::min(minY, c.y);
        maxY = std::max(maxY, c.y);
    }
    const int x0 = std::max(0, static_cast<int>(std::floor(minX)));
    const int y0 = std::max(0, static_cast<int>(std::floor(minY)));
    const int x1 = std::min(m_size.width, static_cast<int>(std::ceil(maxX)));
    const int y1 = std::min(m_size.height, static_cast<int>(std::ceil(maxY)));

    const double texScaleX = tex.width() / size.x;
    const double texScaleY = tex.height() / size.y;
    const double radius = layer.transform.borderRadius;

    for (int y = y0; y < y1; ++y) {
        uint8_t* row = m_canvas->row(y);
        for (int x = x0; x < x1; ++x) {
            Vec2 local = inv.apply({x + 0.5, y + 0.5});
            if (!insideRoundedRect(local.x, local.y, size, radius)) {
                continue;
            }
            Texel t = sampleBilinear(tex, local.x * texScaleX, local.y * texScaleY);
            blendOver(row + x * 4, t, alpha);
        }
    }
    return Ok();
}

Result<media::BitmapPtr> SoftwareBackend::endFrame() {
    if (!m_inFrame) {
        return Err<media::BitmapPtr>(ErrorCode::RenderError, "endFrame without beginFrame");
    }
    m_inFrame = false;
    // Hand out the canvas and start the next frame on a fresh one
    media::BitmapPtr out = std::move(m_canvas);
    m_canvas.reset();
    return Ok(std::move(out));
}

Result<TextureId> SoftwareBackend::createTextureFromImage(const media::Bitmap& image) {
    if (image.isEmpty()) {
        return Err<TextureId>(ErrorCode::TextureCreationFailed, "Empty image");
    }
    TextureId id = m_nextTexture++;
    auto copy = std::make_shared<media::Bitmap>(image);
    m_textureBytes += copy->byteSize();
    m_textures.emplace(id, std::move(copy));
    return Ok(id);
}

void SoftwareBackend::releaseTexture(TextureId texture) {
    auto it = m_textures.find(texture);
    if (it == m_textures.end()) {
        return;
    }
    m_textureBytes -= it->second->byteSize();
    m_textures.erase(it);
}

Result<void> SoftwareBackend::resize(Size size) {
    if (size.isEmpty()) {
        return Err<void>(ErrorCode::InvalidArgument, "Canvas size must be positive");
    }
    m_size = size;
    m_canvas.reset();
    LUMEN_LOG_DEBUG("Software backend resized to {}x{}", size.width, size.height);
    return Ok();
}

} // namespace lumen::engine
