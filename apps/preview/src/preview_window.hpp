/**
 * @file preview_window.hpp
 * @brief SDL window showing the composited preview canvas
 *
 * The canvas is letterboxed into the window; a thin scrub bar along the
 * bottom edge shows the playhead and takes seek clicks.
 */

#pragma once

#include <lumen/core/result.hpp>
#include <lumen/core/types.hpp>
#include <lumen/media/bitmap.hpp>

#include <SDL2/SDL.h>

#include <optional>

namespace lumen::preview {

class PreviewWindow {
public:
    static constexpr int kScrubBarHeight = 16;

    PreviewWindow() = default;
    ~PreviewWindow();

    PreviewWindow(const PreviewWindow&) = delete;
    PreviewWindow& operator=(const PreviewWindow&) = delete;

    Result<void> init(Size canvas, const char* title);
    void shutdown();

    /// Upload a composited canvas; it stays on screen until the next one
    Result<void> setFrame(const media::Bitmap& frame);

    /**
     * @brief Draw the last frame, the scrub bar and an optional crop outline
     *
     * @param progress Playhead position in [0, 1]
     * @param crop     Normalized rectangle in canvas space
     */
    void present(double progress, const std::optional<Rect>& crop);

    // ========== Window Management ==========

    void onResized(int width, int height);
    void toggleFullscreen();
    void toggleMaximize();
    void setTitle(const char* title);

    // ========== Coordinates ==========

    /// Window pixel to canvas pixel (may lie outside the canvas)
    [[nodiscard]] Vec2 toCanvas(int x, int y) const;

    /// Scrub bar hit test; the fraction along the bar when inside
    [[nodiscard]] std::optional<double> scrubFraction(int x, int y) const;

    [[nodiscard]] SDL_Window* window() { return m_window; }

private:
    [[nodiscard]] SDL_Rect displayRect() const;

    SDL_Window* m_window = nullptr;
    SDL_Renderer* m_renderer = nullptr;
    SDL_Texture* m_texture = nullptr;

    Size m_canvas;
    int m_windowWidth = 0;
    int m_windowHeight = 0;
    bool m_fullscreen = false;
};

} // namespace lumen::preview
