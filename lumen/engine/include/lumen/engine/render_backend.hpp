/**
 * @file render_backend.hpp
 * @brief Compositing backend interface
 *
 * A frame is built by beginFrame(), any number of renderLayer() calls (call
 * order = paint order, first call at the bottom) and endFrame(), which
 * returns the composited canvas. The GPU and software implementations
 * interpret every field of RenderLayer identically.
 */

#pragma once

#include <lumen/core/result.hpp>
#include <lumen/core/signals.hpp>
#include <lumen/core/types.hpp>
#include <lumen/media/bitmap.hpp>
#include <lumen/model/transform.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace lumen::engine {

using TextureId = uint64_t;
constexpr TextureId kInvalidTexture = 0;

/// One layer of the current frame
struct RenderLayer {
    TextureId texture = kInvalidTexture;
    Vec2 drawSize{0.0, 0.0};                 // local size before the transform scale
    model::ResolvedTransform transform;
    double opacity = 1.0;                    // multiplied with transform.opacity
};

class RenderBackend {
public:
    virtual ~RenderBackend() = default;

    [[nodiscard]] virtual const char* name() const = 0;
    [[nodiscard]] virtual bool isHardwareAccelerated() const = 0;

    // ========== Frame ==========

    /// Start a frame cleared to background; fails with DeviceLost while the device is lost
    virtual Result<void> beginFrame(Color background) = 0;

    virtual Result<void> renderLayer(const RenderLayer& layer) = 0;

    /// Finish the frame and read back the composited canvas
    virtual Result<media::BitmapPtr> endFrame() = 0;

    // ========== Textures ==========

    virtual Result<TextureId> createTextureFromImage(const media::Bitmap& image) = 0;

    /// Unknown ids are ignored
    virtual void releaseTexture(TextureId texture) = 0;

    /// Bytes held by live textures
    [[nodiscard]] virtual size_t getMemoryUsage() const = 0;

    [[nodiscard]] virtual size_t textureCount() const = 0;

    // ========== Device ==========

    virtual Result<void> resize(Size size) = 0;
    [[nodiscard]] virtual Size size() const = 0;

    /**
     * @brief Rebuild the device after a loss
     *
     * Every texture id handed out before the loss becomes invalid.
     * @return true if the backend is usable again
     */
    virtual bool recreateDevice() = 0;

    [[nodiscard]] virtual bool isDeviceLost() const = 0;

    /// Fired once per device loss
    VoidSignal deviceLost;
};

/**
 * @brief Texture released when the frame scope that created it ends
 */
class ScopedTexture {
public:
    ScopedTexture() = default;
    ScopedTexture(RenderBackend& backend, TextureId id) : m_backend(&backend), m_id(id) {}

    ~ScopedTexture() { reset(); }

    ScopedTexture(ScopedTexture&& other) noexcept
        : m_backend(other.m_backend), m_id(other.m_id) {
        other.m_id = kInvalidTexture;
    }

    ScopedTexture& operator=(ScopedTexture&& other) noexcept {
        if (this != &other) {
            reset();
            m_backend = other.m_backend;
            m_id = other.m_id;
            other.m_id = kInvalidTexture;
        }
        return *this;
    }

    ScopedTexture(const ScopedTexture&) = delete;
    ScopedTexture& operator=(const ScopedTexture&) = delete;

    [[nodiscard]] TextureId id() const { return m_id; }
    [[nodiscard]] bool valid() const { return m_id != kInvalidTexture; }

    void reset() {
        if (m_backend && m_id != kInvalidTexture) {
            m_backend->releaseTexture(m_id);
        }
        m_id = kInvalidTexture;
    }

private:
    RenderBackend* m_backend = nullptr;
    TextureId m_id = kInvalidTexture;
};

/**
 * @brief Upload a bitmap and draw it as one layer
 *
 * The texture lives until the end of this call; backends copy what they
 * need into the frame's draw list.
 */
Result<void> drawBitmap(RenderBackend& backend, const media::Bitmap& bitmap, Vec2 drawSize,
                        const model::ResolvedTransform& transform, double opacity = 1.0);

// ========== Selection ==========

enum class BackendPreference {
    Auto,       // GPU if the capability check succeeds, else software
    Gpu,        // GPU, software only if creation fails
    Software,
};

/// "gpu" | "software"; anything else is Auto
BackendPreference parseBackendPreference(const std::string& name);

/// Never null: falls back to the software backend
[[nodiscard]] std::unique_ptr<RenderBackend> createRenderBackend(BackendPreference preference, Size size);

} // namespace lumen::engine
