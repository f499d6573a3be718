/**
 * @file render_backend.cpp
 * @brief Backend helpers and capability-based selection
 */

#include <lumen/engine/render_backend.hpp>

#include <lumen/core/logger.hpp>
#include <lumen/engine/sdl_gpu_backend.hpp>
#include <lumen/engine/software_backend.hpp>

namespace lumen::engine {

Result<void> drawBitmap(RenderBackend& backend, const media::Bitmap& bitmap, Vec2 drawSize,
                        const model::ResolvedTransform& transform, double opacity) {
    auto texture = backend.createTextureFromImage(bitmap);
    if (!texture) {
        return Err<void>(texture.error());
    }
    ScopedTexture scoped(backend, texture.value());

    RenderLayer layer;
    layer.texture = scoped.id();
    layer.drawSize = drawSize;
    layer.transform = transform;
    layer.opacity = opacity;
    return backend.renderLayer(layer);
}

BackendPreference parseBackendPreference(const std::string& name) {
    if (name == "gpu") {
        return BackendPreference::Gpu;
    }
    if (name == "software") {
        return BackendPreference::Software;
    }
    return BackendPreference::Auto;
}

std::unique_ptr<RenderBackend> createRenderBackend(BackendPreference preference, Size size) {
    if (preference != BackendPreference::Software) {
        if (preference == BackendPreference::Gpu || SdlGpuBackend::isAvailable()) {
            auto gpu = SdlGpuBackend::create(size);
            if (gpu) {
                return std::move(gpu).value();
            }
            LUMEN_LOG_WARN("GPU backend unavailable ({}), using software rendering",
                           gpu.error().what());
        } else {
            LUMEN_LOG_INFO("No accelerated renderer, using software rendering");
        }
    }
    return std::make_unique<SoftwareBackend>(size);
}

} // namespace lumen::engine
