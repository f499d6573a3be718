/**
 * @file sdl_gpu_backend.cpp
 * @brief SDL2 accelerated compositing
 */

#include <lumen/engine/sdl_gpu_backend.hpp>

#include <lumen/core/logger.hpp>
#include <lumen/engine/layer_geometry.hpp>

#include <algorithm>
#include <cmath>

namespace lumen::engine {

namespace {

constexpr Uint32 kRendererFlags = SDL_RENDERER_ACCELERATED | SDL_RENDERER_TARGETTEXTURE;

/// Copy of the image with pixels outside the rounded rectangle cleared
media::Bitmap maskRoundedCorners(const media::Bitmap& image, Vec2 drawSize, double radius) {
    media::Bitmap masked = image;
    const double sx = drawSize.x / image.width();
    const double sy = drawSize.y / image.height();
    for (int y = 0; y < image.height(); ++y) {
        uint8_t* row = masked.row(y);
        for (int x = 0; x < image.width(); ++x) {
            if (!insideRoundedRect((x + 0.5) * sx, (y + 0.5) * sy, drawSize, radius)) {
                row[x * 4 + 3] = 0;
            }
        }
    }
    return masked;
}

} // namespace

bool SdlGpuBackend::isAvailable() {
    if (SDL_InitSubSystem(SDL_INIT_VIDEO) != 0) {
        LUMEN_LOG_DEBUG("GPU check: SDL video unavailable: {}", SDL_GetError());
        return false;
    }
    bool supported = false;
    int drivers = SDL_GetNumRenderDrivers();
    for (int i = 0; i < drivers && !supported; ++i) {
        SDL_RendererInfo info{};
        if (SDL_GetRenderDriverInfo(i, &info) == 0) {
            supported = (info.flags & kRendererFlags) == kRendererFlags;
        }
    }
    SDL_QuitSubSystem(SDL_INIT_VIDEO);
    return supported;
}

Result<std::unique_ptr<SdlGpuBackend>> SdlGpuBackend::create(Size size) {
    if (size.isEmpty()) {
        return Err<std::unique_ptr<SdlGpuBackend>>(ErrorCode::InvalidArgument, "Canvas size must be positive");
    }
    if (SDL_InitSubSystem(SDL_INIT_VIDEO) != 0) {
        return Err<std::unique_ptr<SdlGpuBackend>>(ErrorCode::DeviceError, SDL_GetError());
    }
    std::unique_ptr<SdlGpuBackend> backend(new SdlGpuBackend(size));
    auto result = backend->createDevice();
    if (!result) {
        // The destructor balances SDL_InitSubSystem
        return Err<std::unique_ptr<SdlGpuBackend>>(result.error());
    }
    return Ok(std::move(backend));
}

SdlGpuBackend::SdlGpuBackend(Size size)
    : m_size(size)
{
}

SdlGpuBackend::~SdlGpuBackend() {
    destroyDevice();
    SDL_QuitSubSystem(SDL_INIT_VIDEO);
}

// ============================================================================
// Device
// ============================================================================

Result<void> SdlGpuBackend::createDevice() {
    m_window = SDL_CreateWindow("lumen-compositor", SDL_WINDOWPOS_UNDEFINED, SDL_WINDOWPOS_UNDEFINED,
                                m_size.width, m_size.height, SDL_WINDOW_HIDDEN);
    if (!m_window) {
        return Err<void>(ErrorCode::WindowCreationFailed, SDL_GetError());
    }

    m_renderer = SDL_CreateRenderer(m_window, -1, kRendererFlags);
    if (!m_renderer) {
        std::string error = SDL_GetError();
        destroyDevice();
        return Err<void>(ErrorCode::RenderError, error);
    }

    m_target = SDL_CreateTexture(m_renderer, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_TARGET,
                                 m_size.width, m_size.height);
    if (!m_target) {
        std::string error = SDL_GetError();
        destroyDevice();
        return Err<void>(ErrorCode::TextureCreationFailed, error);
    }
    SDL_SetTextureBlendMode(m_target, SDL_BLENDMODE_BLEND);

    SDL_RendererInfo info{};
    if (SDL_GetRendererInfo(m_renderer, &info) == 0) {
        LUMEN_LOG_INFO("GPU backend ready: {} {}x{}", info.name, m_size.width, m_size.height);
    }
    m_lost = false;
    return Ok();
}

void SdlGpuBackend::destroyDevice() {
    for (SDL_Texture* tmp : m_frameTemporaries) {
        SDL_DestroyTexture(tmp);
    }
    m_frameTemporaries.clear();

    for (auto& [id, entry] : m_textures) {
        if (entry.texture) {
            SDL_DestroyTexture(entry.texture);
            entry.texture = nullptr;
        }
    }

    if (m_target) {
        SDL_DestroyTexture(m_target);
        m_target = nullptr;
    }
    if (m_renderer) {
        SDL_DestroyRenderer(m_renderer);
        m_renderer = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }
    m_inFrame = false;
}

void SdlGpuBackend::markLost(const char* reason) {
    if (m_lost) {
        return;
    }
    m_lost = true;
    m_inFrame = false;
    LUMEN_LOG_WARN("GPU device lost: {}", reason);
    deviceLost.fire();
}

void SdlGpuBackend::handleEvent(const SDL_Event& event) {
    if (event.type == SDL_RENDER_DEVICE_RESET) {
        markLost("render device reset");
    } else if (event.type == SDL_RENDER_TARGETS_RESET) {
        markLost("render targets reset");
    }
}

bool SdlGpuBackend::recreateDevice() {
    destroyDevice();

    // Old ids are invalid after a loss
    m_textures.clear();
    m_textureBytes = 0;

    auto result = createDevice();
    if (!result) {
        LUMEN_LOG_WARN("GPU device recreation failed: {}", result.error().what());
        m_lost = true;
        return false;
    }
    LUMEN_LOG_INFO("GPU device recreated");
    return true;
}

Result<void> SdlGpuBackend::resize(Size size) {
    if (size.isEmpty()) {
        return Err<void>(ErrorCode::InvalidArgument, "Canvas size must be positive");
    }
    if (size == m_size) {
        return Ok();
    }
    m_size = size;
    if (!m_renderer) {
        return Ok();
    }

    if (m_target) {
        SDL_DestroyTexture(m_target);
    }
    m_target = SDL_CreateTexture(m_renderer, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_TARGET,
                                 size.width, size.height);
    if (!m_target) {
        return Err<void>(ErrorCode::TextureCreationFailed, SDL_GetError());
    }
    SDL_SetWindowSize(m_window, size.width, size.height);
    return Ok();
}

// ============================================================================
// Textures
// ============================================================================

Result<SDL_Texture*> SdlGpuBackend::uploadTexture(const media::Bitmap& image) {
    SDL_Texture* texture = SDL_CreateTexture(m_renderer, SDL_PIXELFORMAT_RGBA32,
                                             SDL_TEXTUREACCESS_STATIC, image.width(), image.height());
    if (!texture) {
        return Err<SDL_Texture*>(ErrorCode::TextureCreationFailed, SDL_GetError());
    }
    if (SDL_UpdateTexture(texture, nullptr, image.data(), image.stride()) != 0) {
        std::string error = SDL_GetError();
        SDL_DestroyTexture(texture);
        return Err<SDL_Texture*>(ErrorCode::TextureCreationFailed, error);
    }
    SDL_SetTextureBlendMode(texture, SDL_BLENDMODE_BLEND);
    SDL_SetTextureScaleMode(texture, SDL_ScaleModeLinear);
    return Ok(texture);
}

Result<TextureId> SdlGpuBackend::createTextureFromImage(const media::Bitmap& image) {
    if (m_lost || !m_renderer) {
        return Err<TextureId>(ErrorCode::DeviceLost, "GPU device unavailable");
    }
    if (image.isEmpty()) {
        return Err<TextureId>(ErrorCode::TextureCreationFailed, "Empty image");
    }

    auto uploaded = uploadTexture(image);
    if (!uploaded) {
        return Err<TextureId>(uploaded.error());
    }

    TextureEntry entry;
    entry.texture = uploaded.value();
    entry.source = std::make_shared<media::Bitmap>(image);
    entry.bytes = image.byteSize();

    TextureId id = m_nextTexture++;
    m_textureBytes += entry.bytes;
    m_textures.emplace(id, std::move(entry));
    return Ok(id);
}

void SdlGpuBackend::releaseTexture(TextureId texture) {
    auto it = m_textures.find(texture);
    if (it == m_textures.end()) {
        return;
    }
    if (it->second.texture) {
        SDL_DestroyTexture(it->second.texture);
    }
    m_textureBytes -= it->second.bytes;
    m_textures.erase(it);
}

// ============================================================================
// Frame
// ============================================================================

Result<void> SdlGpuBackend::beginFrame(Color background) {
    if (m_lost || !m_renderer) {
        return Err<void>(ErrorCode::DeviceLost, "GPU device lost");
    }
    if (SDL_SetRenderTarget(m_renderer, m_target) != 0) {
        return Err<void>(ErrorCode::RenderError, SDL_GetError());
    }
    SDL_SetRenderDrawBlendMode(m_renderer, SDL_BLENDMODE_NONE);
    SDL_SetRenderDrawColor(m_renderer, background.r, background.g, background.b, background.a);
    if (SDL_RenderClear(m_renderer) != 0) {
        return Err<void>(ErrorCode::RenderError, SDL_GetError());
    }
    m_inFrame = true;
    return Ok();
}

Result<void> SdlGpuBackend::renderLayer(const RenderLayer& layer) {
    if (m_lost) {
        return Err<void>(ErrorCode::DeviceLost, "GPU device lost");
    }
    if (!m_inFrame) {
        return Err<void>(ErrorCode::RenderError, "renderLayer outside beginFrame/endFrame");
    }
    auto it = m_textures.find(layer.texture);
    if (it == m_textures.end()) {
        return Err<void>(ErrorCode::NotFound, "Unknown texture");
    }

    const model::ResolvedTransform& t = layer.transform;
    const double alpha = std::clamp(t.opacity * layer.opacity, 0.0, 1.0);
    if (alpha <= 0.0 || layer.drawSize.x <= 0.0 || layer.drawSize.y <= 0.0) {
        return Ok();
    }

    SDL_Texture* texture = it->second.texture;
    if (t.borderRadius > 0.0) {
        auto masked = uploadTexture(maskRoundedCorners(*it->second.source, layer.drawSize, t.borderRadius));
        if (!masked) {
            return Err<void>(masked.error());
        }
        texture = masked.value();
        m_frameTemporaries.push_back(texture);
    }

    // Same placement as layerMatrix(): anchor at canvas centre + position,
    // scaled and rotated about the anchor
    const double w = layer.drawSize.x * std::abs(t.scale.x);
    const double h = layer.drawSize.y * std::abs(t.scale.y);
    const double anchorX = w * (t.scale.x < 0.0 ? 1.0 - t.anchor.x : t.anchor.x);
    const double anchorY = h * (t.scale.y < 0.0 ? 1.0 - t.anchor.y : t.anchor.y);

    SDL_FRect dst;
    dst.x = static_cast<float>(m_size.width / 2.0 + t.position.x - anchorX);
    dst.y = static_cast<float>(m_size.height / 2.0 + t.position.y - anchorY);
    dst.w = static_cast<float>(w);
    dst.h = static_cast<float>(h);
    SDL_FPoint center{static_cast<float>(anchorX), static_cast<float>(anchorY)};

    int flip = SDL_FLIP_NONE;
    if (t.scale.x < 0.0) {
        flip |= SDL_FLIP_HORIZONTAL;
    }
    if (t.scale.y < 0.0) {
        flip |= SDL_FLIP_VERTICAL;
    }

    SDL_SetTextureAlphaMod(texture, static_cast<Uint8>(std::lround(alpha * 255.0)));
    if (SDL_RenderCopyExF(m_renderer, texture, nullptr, &dst, t.rotation, &center,
                          static_cast<SDL_RendererFlip>(flip)) != 0) {
        return Err<void>(ErrorCode::RenderError, SDL_GetError());
    }
    return Ok();
}

Result<media::BitmapPtr> SdlGpuBackend::endFrame() {
    if (m_lost) {
        return Err<media::BitmapPtr>(ErrorCode::DeviceLost, "GPU device lost");
    }
    if (!m_inFrame) {
        return Err<media::BitmapPtr>(ErrorCode::RenderError, "endFrame without beginFrame");
    }
    m_inFrame = false;

    auto canvas = media::makeBitmap(m_size.width, m_size.height);
    int rc = SDL_RenderReadPixels(m_renderer, nullptr, SDL_PIXELFORMAT_RGBA32, canvas->data(),
                                  canvas->stride());

    for (SDL_Texture* tmp : m_frameTemporaries) {
        SDL_DestroyTexture(tmp);
    }
    m_frameTemporaries.clear();
    SDL_SetRenderTarget(m_renderer, nullptr);

    if (rc != 0) {
        return Err<media::BitmapPtr>(ErrorCode::RenderError, SDL_GetError());
    }
    return Ok(std::move(canvas));
}

} // namespace lumen::engine
