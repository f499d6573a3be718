/**
 * @file software_backend.hpp
 * @brief CPU raster compositing backend
 */

#pragma once

#include <lumen/engine/render_backend.hpp>

#include <unordered_map>

namespace lumen::engine {

/**
 * @brief Affine rasterizer with bilinear sampling and source-over blending
 *
 * Always available; selected when no accelerated renderer exists and as the
 * permanent fallback after an unrecoverable device loss.
 */
class SoftwareBackend : public RenderBackend {
public:
    explicit SoftwareBackend(Size size);

    [[nodiscard]] const char* name() const override { return "software"; }
    [[nodiscard]] bool isHardwareAccelerated() const override { return false; }

    Result<void> beginFrame(Color background) override;
    Result<void> renderLayer(const RenderLayer& layer) override;
    Result<media::BitmapPtr> endFrame() override;

    Result<TextureId> createTextureFromImage(const media::Bitmap& image) override;
    void releaseTexture(TextureId texture) override;
    [[nodiscard]] size_t getMemoryUsage() const override { return m_textureBytes; }
    [[nodiscard]] size_t textureCount() const override { return m_textures.size(); }

    Result<void> resize(Size size) override;
    [[nodiscard]] Size size() const override { return m_size; }

    /// Nothing to rebuild on the CPU
    bool recreateDevice() override { return true; }
    [[nodiscard]] bool isDeviceLost() const override { return false; }

private:
    Size m_size;
    media::BitmapPtr m_canvas;
    bool m_inFrame = false;

    std::unordered_map<TextureId, media::BitmapPtr> m_textures;
    TextureId m_nextTexture = 1;
    size_t m_textureBytes = 0;
};

} // namespace lumen::engine
