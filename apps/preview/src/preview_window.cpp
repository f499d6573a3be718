/**
 * @file preview_window.cpp
 * @brief PreviewWindow implementation
 */

#include "preview_window.hpp"

#include <lumen/core/logger.hpp>

#include <algorithm>

namespace lumen::preview {

PreviewWindow::~PreviewWindow() {
    shutdown();
}

Result<void> PreviewWindow::init(Size canvas, const char* title) {
    if (m_window) {
        return Err(ErrorCode::InvalidArgument, "Already initialized");
    }

    m_window = SDL_CreateWindow(title, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                canvas.width, canvas.height + kScrubBarHeight,
                                SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    if (!m_window) {
        return Err(ErrorCode::WindowCreationFailed, SDL_GetError());
    }

    m_renderer = SDL_CreateRenderer(m_window, -1, SDL_RENDERER_PRESENTVSYNC);
    if (!m_renderer) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
        return Err(ErrorCode::RenderError, SDL_GetError());
    }

    // RGBA32 is byte order R, G, B, A on every platform, matching Bitmap
    m_texture = SDL_CreateTexture(m_renderer, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STREAMING,
                                  canvas.width, canvas.height);
    if (!m_texture) {
        std::string message = SDL_GetError();
        shutdown();
        return Err(ErrorCode::TextureCreationFailed, message);
    }

    m_canvas = canvas;
    SDL_GetWindowSize(m_window, &m_windowWidth, &m_windowHeight);
    LUMEN_LOG_INFO("Preview window {}x{}", m_windowWidth, m_windowHeight);
    return Ok();
}

void PreviewWindow::shutdown() {
    if (m_texture) {
        SDL_DestroyTexture(m_texture);
        m_texture = nullptr;
    }
    if (m_renderer) {
        SDL_DestroyRenderer(m_renderer);
        m_renderer = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }
}

Result<void> PreviewWindow::setFrame(const media::Bitmap& frame) {
    if (!m_texture) {
        return Err(ErrorCode::RenderError, "Window not initialized");
    }
    if (frame.width() != m_canvas.width || frame.height() != m_canvas.height) {
        return Err(ErrorCode::InvalidArgument, "Frame does not match the canvas size");
    }
    if (SDL_UpdateTexture(m_texture, nullptr, frame.data(), frame.stride()) != 0) {
        return Err(ErrorCode::TextureCreationFailed, SDL_GetError());
    }
    return Ok();
}

void PreviewWindow::present(double progress, const std::optional<Rect>& crop) {
    if (!m_renderer) {
        return;
    }

    SDL_SetRenderDrawColor(m_renderer, 0, 0, 0, 255);
    SDL_RenderClear(m_renderer);

    const SDL_Rect dst = displayRect();
    SDL_RenderCopy(m_renderer, m_texture, nullptr, &dst);

    if (crop) {
        SDL_Rect outline{dst.x + static_cast<int>(crop->x * dst.w),
                         dst.y + static_cast<int>(crop->y * dst.h),
                         static_cast<int>(crop->width * dst.w),
                         static_cast<int>(crop->height * dst.h)};
        SDL_SetRenderDrawColor(m_renderer, 255, 200, 0, 255);
        SDL_RenderDrawRect(m_renderer, &outline);
    }

    SDL_Rect bar{0, m_windowHeight - kScrubBarHeight, m_windowWidth, kScrubBarHeight};
    SDL_SetRenderDrawColor(m_renderer, 40, 40, 40, 255);
    SDL_RenderFillRect(m_renderer, &bar);

    bar.w = static_cast<int>(std::clamp(progress, 0.0, 1.0) * m_windowWidth);
    SDL_SetRenderDrawColor(m_renderer, 80, 140, 255, 255);
    SDL_RenderFillRect(m_renderer, &bar);

    SDL_RenderPresent(m_renderer);
}

// ============================================================================
// Window Management
// ============================================================================

void PreviewWindow::onResized(int width, int height) {
    m_windowWidth = width;
    m_windowHeight = height;
}

void PreviewWindow::toggleFullscreen() {
    m_fullscreen = !m_fullscreen;
    if (SDL_SetWindowFullscreen(m_window, m_fullscreen ? SDL_WINDOW_FULLSCREEN_DESKTOP : 0) != 0) {
        LUMEN_LOG_WARN("Fullscreen toggle failed: {}", SDL_GetError());
        m_fullscreen = !m_fullscreen;
    }
}

void PreviewWindow::toggleMaximize() {
    if (SDL_GetWindowFlags(m_window) & SDL_WINDOW_MAXIMIZED) {
        SDL_RestoreWindow(m_window);
    } else {
        SDL_MaximizeWindow(m_window);
    }
}

void PreviewWindow::setTitle(const char* title) {
    if (m_window) {
        SDL_SetWindowTitle(m_window, title);
    }
}

// ============================================================================
// Coordinates
// ============================================================================

SDL_Rect PreviewWindow::displayRect() const {
    const int areaHeight = std::max(m_windowHeight - kScrubBarHeight, 1);
    const double canvasAspect = static_cast<double>(m_canvas.width) / m_canvas.height;
    const double areaAspect = static_cast<double>(m_windowWidth) / areaHeight;

    SDL_Rect rect;
    if (canvasAspect > areaAspect) {
        rect.w = m_windowWidth;
        rect.h = static_cast<int>(m_windowWidth / canvasAspect);
        rect.x = 0;
        rect.y = (areaHeight - rect.h) / 2;
    } else {
        rect.h = areaHeight;
        rect.w = static_cast<int>(areaHeight * canvasAspect);
        rect.x = (m_windowWidth - rect.w) / 2;
        rect.y = 0;
    }
    return rect;
}

Vec2 PreviewWindow::toCanvas(int x, int y) const {
    const SDL_Rect dst = displayRect();
    if (dst.w <= 0 || dst.h <= 0) {
        return {0.0, 0.0};
    }
    return {static_cast<double>(x - dst.x) * m_canvas.width / dst.w,
            static_cast<double>(y - dst.y) * m_canvas.height / dst.h};
}

std::optional<double> PreviewWindow::scrubFraction(int x, int y) const {
    if (y < m_windowHeight - kScrubBarHeight || m_windowWidth <= 0) {
        return std::nullopt;
    }
    return std::clamp(static_cast<double>(x) / m_windowWidth, 0.0, 1.0);
}

} // namespace lumen::preview
