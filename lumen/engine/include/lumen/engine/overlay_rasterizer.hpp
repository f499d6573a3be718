/**
 * @file overlay_rasterizer.hpp
 * @brief Rasterization of text, graphic and subtitle entities
 *
 * Every render* call returns a bitmap at the entity's natural size in canvas
 * pixels (before the entity transform); the overlay compositor places it.
 * Subtitles are the exception: they come back as a full-canvas layer.
 * A null result means "nothing to draw", never an error.
 */

#pragma once

#include <lumen/core/lru_cache.hpp>
#include <lumen/media/bitmap.hpp>
#include <lumen/media/decoder.hpp>
#include <lumen/model/clip.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace lumen::engine {

class OverlayRasterizer {
public:
    virtual ~OverlayRasterizer() = default;

    virtual media::BitmapPtr renderText(const model::TextClip& text, Size canvas) = 0;
    virtual media::BitmapPtr renderShape(const model::ShapeClip& shape, Size canvas) = 0;
    virtual media::BitmapPtr renderSvg(const model::SvgClip& svg, Size canvas) = 0;
    virtual media::BitmapPtr renderSticker(const model::StickerClip& sticker, Size canvas) = 0;
    virtual media::BitmapPtr renderSubtitle(const model::Subtitle& subtitle, Size canvas) = 0;
};

/**
 * @brief Rasterizer built on FreeType and the media decoder
 *
 * - text / subtitles: FreeType glyph coverage, one face for all families
 * - shapes: supersampled coverage of the shape outline, base size 15% of
 *   the shorter canvas side
 * - svg: the view box filled with the tint colour (no vector parsing)
 * - stickers: the image file decoded once and cached by path
 *
 * Text is skipped (with one warning) when the font file cannot be loaded.
 */
class BasicOverlayRasterizer : public OverlayRasterizer {
public:
    static constexpr size_t kStickerCacheCapacity = 50;

    BasicOverlayRasterizer(std::shared_ptr<media::DecoderFactory> factory, const std::string& fontFile);
    ~BasicOverlayRasterizer() override;

    media::BitmapPtr renderText(const model::TextClip& text, Size canvas) override;
    media::BitmapPtr renderShape(const model::ShapeClip& shape, Size canvas) override;
    media::BitmapPtr renderSvg(const model::SvgClip& svg, Size canvas) override;
    media::BitmapPtr renderSticker(const model::StickerClip& sticker, Size canvas) override;
    media::BitmapPtr renderSubtitle(const model::Subtitle& subtitle, Size canvas) override;

    [[nodiscard]] bool hasFont() const { return m_font != nullptr; }

private:
    class FontFace;

    std::shared_ptr<media::DecoderFactory> m_factory;
    std::unique_ptr<FontFace> m_font;
    std::mutex m_fontMutex;

    SharedLRUCache<std::string, media::Bitmap> m_stickers{kStickerCacheCapacity};
    std::unordered_set<std::string> m_failedStickers;
};

} // namespace lumen::engine
