/**
 * @file sdl_gpu_backend.hpp
 * @brief SDL2 accelerated-renderer compositing backend
 *
 * Draws into a render-target texture owned by a hidden window, so the
 * composited canvas can be read back and presented anywhere. Device loss is
 * reported by SDL as SDL_RENDER_DEVICE_RESET / SDL_RENDER_TARGETS_RESET;
 * the host forwards its events through handleEvent().
 */

#pragma once

#include <lumen/engine/render_backend.hpp>

#include <SDL2/SDL.h>

#include <memory>
#include <unordered_map>
#include <vector>

namespace lumen::engine {

class SdlGpuBackend : public RenderBackend {
public:
    /// True if an accelerated renderer with render-target support exists
    [[nodiscard]] static bool isAvailable();

    static Result<std::unique_ptr<SdlGpuBackend>> create(Size size);

    ~SdlGpuBackend() override;

    SdlGpuBackend(const SdlGpuBackend&) = delete;
    SdlGpuBackend& operator=(const SdlGpuBackend&) = delete;

    [[nodiscard]] const char* name() const override { return "gpu"; }
    [[nodiscard]] bool isHardwareAccelerated() const override { return true; }

    Result<void> beginFrame(Color background) override;
    Result<void> renderLayer(const RenderLayer& layer) override;
    Result<media::BitmapPtr> endFrame() override;

    Result<TextureId> createTextureFromImage(const media::Bitmap& image) override;
    void releaseTexture(TextureId texture) override;
    [[nodiscard]] size_t getMemoryUsage() const override { return m_textureBytes; }
    [[nodiscard]] size_t textureCount() const override { return m_textures.size(); }

    Result<void> resize(Size size) override;
    [[nodiscard]] Size size() const override { return m_size; }

    bool recreateDevice() override;
    [[nodiscard]] bool isDeviceLost() const override { return m_lost; }

    /// Inspect a host event for device resets
    void handleEvent(const SDL_Event& event);

private:
    explicit SdlGpuBackend(Size size);

    struct TextureEntry {
        SDL_Texture* texture = nullptr;
        media::BitmapPtr source;     // kept for rounded-corner masking and re-upload
        size_t bytes = 0;
    };

    Result<void> createDevice();
    void destroyDevice();
    void markLost(const char* reason);
    Result<SDL_Texture*> uploadTexture(const media::Bitmap& image);

    Size m_size;
    SDL_Window* m_window = nullptr;
    SDL_Renderer* m_renderer = nullptr;
    SDL_Texture* m_target = nullptr;
    bool m_lost = false;
    bool m_inFrame = false;

    std::unordered_map<TextureId, TextureEntry> m_textures;
    std::vector<SDL_Texture*> m_frameTemporaries;
    TextureId m_nextTexture = 1;
    size_t m_textureBytes = 0;
};

} // namespace lumen::engine
