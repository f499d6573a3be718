/**
 * @file overlay_rasterizer.cpp
 * @brief FreeType text, supersampled shapes, decoded stickers
 */

#include <lumen/engine/overlay_rasterizer.hpp>

#include <lumen/core/logger.hpp>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <algorithm>
#include <cmath>
#include <numbers>
#include <optional>
#include <sstream>
#include <vector>

namespace lumen::engine {

namespace {

constexpr int kSupersample = 4;

std::u32string decodeUtf8(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        char32_t cp = 0;
        size_t extra = 0;
        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            extra = 3;
        } else {
            ++i;
            out.push_back(U'\uFFFD');
            continue;
        }
        if (i + extra >= text.size()) {
            out.push_back(U'\uFFFD');
            break;
        }
        for (size_t k = 1; k <= extra; ++k) {
            cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line, '\n')) {
        lines.push_back(line);
    }
    if (lines.empty()) {
        lines.emplace_back();
    }
    return lines;
}

Color withOpacity(Color c, double opacity) {
    c.a = static_cast<uint8_t>(std::lround(c.a * std::clamp(opacity, 0.0, 1.0)));
    return c;
}

void fillRect(media::Bitmap& bmp, double x, double y, double w, double h, Color c) {
    const int x0 = std::max(0, static_cast<int>(std::floor(x)));
    const int y0 = std::max(0, static_cast<int>(std::floor(y)));
    const int x1 = std::min(bmp.width(), static_cast<int>(std::ceil(x + w)));
    const int y1 = std::min(bmp.height(), static_cast<int>(std::ceil(y + h)));
    for (int py = y0; py < y1; ++py) {
        for (int px = x0; px < x1; ++px) {
            bmp.blendPixel(px, py, c);
        }
    }
}

// ========== Shape outlines ==========

bool insidePolygon(const std::vector<Vec2>& poly, double x, double y) {
    bool inside = false;
    for (size_t i = 0, j = poly.size() - 1; i < poly.size(); j = i++) {
        const Vec2& a = poly[i];
        const Vec2& b = poly[j];
        if ((a.y > y) != (b.y > y) && x < (b.x - a.x) * (y - a.y) / (b.y - a.y) + a.x) {
            inside = !inside;
        }
    }
    return inside;
}

struct ShapeOutline {
    model::ShapeType type = model::ShapeType::Rectangle;
    double size = 0.0;
    double cornerRadius = 0.0;
    double lineThickness = 0.0;
    std::vector<Vec2> polygon;

    [[nodiscard]] bool contains(double x, double y) const {
        if (x < 0.0 || y < 0.0 || x > size || y > size) {
            return false;
        }
        const double h = size / 2.0;
        switch (type) {
            case model::ShapeType::Rectangle: {
                double r = std::min(cornerRadius, h);
                double cx = std::clamp(x, r, size - r);
                double cy = std::clamp(y, r, size - r);
                return (x - cx) * (x - cx) + (y - cy) * (y - cy) <= r * r;
            }
            case model::ShapeType::Circle:
            case model::ShapeType::Ellipse: {
                double dx = (x - h) / h;
                double dy = (y - h) / h;
                return dx * dx + dy * dy <= 1.0;
            }
            case model::ShapeType::Line:
                return std::abs(y - h) <= lineThickness / 2.0;
            case model::ShapeType::Triangle:
            case model::ShapeType::Arrow:
            case model::ShapeType::Polygon:
            case model::ShapeType::Star:
                return polygon.size() >= 3 && insidePolygon(polygon, x, y);
        }
        return false;
    }
};

std::vector<Vec2> starPolygon(double size, int points, double innerRatio) {
    std::vector<Vec2> poly;
    const double outer = size / 2.0;
    const double inner = outer * std::clamp(innerRatio, 0.05, 1.0);
    const int n = std::max(points, 3);
    for (int i = 0; i < n * 2; ++i) {
        double r = (i % 2 == 0) ? outer : inner;
        double angle = -std::numbers::pi / 2.0 + i * std::numbers::pi / n;
        poly.push_back({outer + r * std::cos(angle), outer + r * std::sin(angle)});
    }
    return poly;
}

ShapeOutline buildOutline(const model::ShapeClip& shape, double size, double strokeScale) {
    ShapeOutline o;
    o.type = shape.shapeType;
    o.size = size;
    o.cornerRadius = shape.style.cornerRadius * strokeScale;
    o.lineThickness = std::max(shape.style.strokeWidth, 2.0) * strokeScale * 2.0;

    const double s = size;
    switch (shape.shapeType) {
        case model::ShapeType::Triangle:
            o.polygon = {{s / 2.0, 0.0}, {s, s}, {0.0, s}};
            break;
        case model::ShapeType::Arrow:
            o.polygon = {{0.0, s * 0.35}, {s * 0.6, s * 0.35}, {s * 0.6, s * 0.15}, {s, s * 0.5},
                         {s * 0.6, s * 0.85}, {s * 0.6, s * 0.65}, {0.0, s * 0.65}};
            break;
        case model::ShapeType::Polygon:
            if (shape.points.size() >= 3) {
                for (const Vec2& p : shape.points) {
                    o.polygon.push_back({p.x * s, p.y * s});
                }
            } else {
                o.polygon = starPolygon(s, 3, 1.0);   // inner == outer: regular hexagon
            }
            break;
        case model::ShapeType::Star:
            o.polygon = starPolygon(s, shape.style.points, shape.style.innerRadius);
            break;
        default:
            break;
    }
    return o;
}

} // namespace

// ============================================================================
// FontFace
// ============================================================================

class BasicOverlayRasterizer::FontFace {
public:
    static Result<std::unique_ptr<FontFace>> open(const std::string& path) {
        std::unique_ptr<FontFace> font(new FontFace());
        if (FT_Init_FreeType(&font->m_library) != 0) {
            font->m_library = nullptr;
            return Err<std::unique_ptr<FontFace>>(ErrorCode::Unknown, "FT_Init_FreeType failed");
        }
        if (FT_New_Face(font->m_library, path.c_str(), 0, &font->m_face) != 0) {
            font->m_face = nullptr;
            return Err<std::unique_ptr<FontFace>>(ErrorCode::FileOpenFailed, "Cannot load font " + path);
        }
        return Ok(std::move(font));
    }

    ~FontFace() {
        if (m_face) {
            FT_Done_Face(m_face);
        }
        if (m_library) {
            FT_Done_FreeType(m_library);
        }
    }

    FontFace(const FontFace&) = delete;
    FontFace& operator=(const FontFace&) = delete;

    void setPixelSize(int px) {
        if (px != m_pixelSize) {
            FT_Set_Pixel_Sizes(m_face, 0, static_cast<FT_UInt>(std::max(px, 1)));
            m_pixelSize = px;
        }
    }

    /// Ascender above the baseline, pixels
    [[nodiscard]] double ascender() const { return m_face->size->metrics.ascender / 64.0; }

    /// Descender below the baseline, pixels (positive)
    [[nodiscard]] double descender() const { return -m_face->size->metrics.descender / 64.0; }

    double measure(const std::u32string& text, double letterSpacing) {
        double width = 0.0;
        for (char32_t cp : text) {
            if (FT_Load_Char(m_face, cp, FT_LOAD_DEFAULT) != 0) {
                continue;
            }
            width += m_face->glyph->advance.x / 64.0 + letterSpacing;
        }
        return std::max(0.0, width - (text.empty() ? 0.0 : letterSpacing));
    }

    void draw(media::Bitmap& target, const std::u32string& text, double x, double baseline,
              Color color, double letterSpacing) {
        double pen = x;
        for (char32_t cp : text) {
            if (FT_Load_Char(m_face, cp, FT_LOAD_RENDER) != 0) {
                continue;
            }
            FT_GlyphSlot slot = m_face->glyph;
            const FT_Bitmap& glyph = slot->bitmap;
            const int ox = static_cast<int>(std::lround(pen)) + slot->bitmap_left;
            const int oy = static_cast<int>(std::lround(baseline)) - slot->bitmap_top;

            for (unsigned int gy = 0; gy < glyph.rows; ++gy) {
                const unsigned char* src = glyph.buffer + static_cast<ptrdiff_t>(gy) * glyph.pitch;
                for (unsigned int gx = 0; gx < glyph.width; ++gx) {
                    if (src[gx] == 0) {
                        continue;
                    }
                    target.blendPixel(ox + static_cast<int>(gx), oy + static_cast<int>(gy), color,
                                      src[gx] / 255.0);
                }
            }
            pen += slot->advance.x / 64.0 + letterSpacing;
        }
    }

private:
    FontFace() = default;

    FT_Library m_library = nullptr;
    FT_Face m_face = nullptr;
    int m_pixelSize = 0;
};

// ============================================================================
// BasicOverlayRasterizer
// ============================================================================

BasicOverlayRasterizer::BasicOverlayRasterizer(std::shared_ptr<media::DecoderFactory> factory,
                                               const std::string& fontFile)
    : m_factory(std::move(factory))
{
    if (fontFile.empty()) {
        LUMEN_LOG_WARN("No overlay font configured, text layers disabled");
        return;
    }
    auto font = FontFace::open(fontFile);
    if (!font) {
        LUMEN_LOG_WARN("{}, text layers disabled", font.error().message());
        return;
    }
    m_font = std::move(font).value();
    LUMEN_LOG_DEBUG("Overlay font loaded: {}", fontFile);
}

BasicOverlayRasterizer::~BasicOverlayRasterizer() = default;

media::BitmapPtr BasicOverlayRasterizer::renderText(const model::TextClip& text, Size canvas) {
    (void)canvas;
    if (!m_font || text.text.empty()) {
        return nullptr;
    }
    std::lock_guard lock(m_fontMutex);

    const auto& style = text.style;
    const int px = std::max(1, static_cast<int>(std::lround(style.fontSize)));
    m_font->setPixelSize(px);

    std::vector<std::u32string> lines;
    std::vector<double> widths;
    double maxWidth = 0.0;
    for (const auto& line : splitLines(text.text)) {
        lines.push_back(decodeUtf8(line));
        widths.push_back(m_font->measure(lines.back(), style.letterSpacing));
        maxWidth = std::max(maxWidth, widths.back());
    }

    const double lineHeight = px * style.lineHeight;
    const double stroke = style.strokeColor ? style.strokeWidth : 0.0;
    const double pad = px * 0.2 + stroke;
    const int width = static_cast<int>(std::ceil(maxWidth + pad * 2.0));
    const int height = static_cast<int>(std::ceil(lines.size() * lineHeight + pad * 2.0));
    if (width <= 0 || height <= 0) {
        return nullptr;
    }

    auto bmp = media::makeBitmap(width, height);
    if (style.backgroundColor) {
        bmp->fill(*style.backgroundColor);
    }

    const bool bold = style.fontWeight == "bold" || style.fontWeight == "700"
        || style.fontWeight == "800" || style.fontWeight == "900";
    const double glyphBox = m_font->ascender() + m_font->descender();

    for (size_t i = 0; i < lines.size(); ++i) {
        double x = pad;
        if (style.textAlign == "center") {
            x = (width - widths[i]) / 2.0;
        } else if (style.textAlign == "right") {
            x = width - pad - widths[i];
        }
        double baseline = pad + i * lineHeight + (lineHeight - glyphBox) / 2.0 + m_font->ascender();

        if (stroke > 0.0) {
            // Outline by stamping the glyphs around a circle
            const int steps = 12;
            for (int k = 0; k < steps; ++k) {
                double a = k * 2.0 * std::numbers::pi / steps;
                m_font->draw(*bmp, lines[i], x + std::cos(a) * stroke, baseline + std::sin(a) * stroke,
                             *style.strokeColor, style.letterSpacing);
            }
        }
        m_font->draw(*bmp, lines[i], x, baseline, style.color, style.letterSpacing);
        if (bold) {
            m_font->draw(*bmp, lines[i], x + 1.0, baseline, style.color, style.letterSpacing);
        }
    }
    return bmp;
}

media::BitmapPtr BasicOverlayRasterizer::renderShape(const model::ShapeClip& shape, Size canvas) {
    if (canvas.isEmpty()) {
        return nullptr;
    }
    const double base = std::min(canvas.width, canvas.height);
    const double size = base * 0.15;
    const double strokeScale = base / 1080.0;
    const int dim = std::max(1, static_cast<int>(std::ceil(size)));

    ShapeOutline outline = buildOutline(shape, size, strokeScale);
    const auto& style = shape.style;
    const double strokeWidth = shape.shapeType == model::ShapeType::Line ? 0.0 : style.strokeWidth * strokeScale;
    std::optional<Color> fill;
    if (style.fill) {
        fill = withOpacity(*style.fill, style.fillOpacity);
    } else if (shape.shapeType == model::ShapeType::Line) {
        fill = withOpacity(style.strokeColor, style.strokeOpacity);
    }
    const Color strokeColor = withOpacity(style.strokeColor, style.strokeOpacity);

    auto bmp = media::makeBitmap(dim, dim);
    const double step = 1.0 / kSupersample;
    const double offsets[8][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1},
                                {0.7071, 0.7071}, {-0.7071, 0.7071}, {0.7071, -0.7071}, {-0.7071, -0.7071}};

    for (int y = 0; y < dim; ++y) {
        for (int x = 0; x < dim; ++x) {
            int inside = 0;
            int edge = 0;
            for (int sy = 0; sy < kSupersample; ++sy) {
                for (int sx = 0; sx < kSupersample; ++sx) {
                    double u = x + (sx + 0.5) * step;
                    double v = y + (sy + 0.5) * step;
                    if (!outline.contains(u, v)) {
                        continue;
                    }
                    ++inside;
                    if (strokeWidth > 0.0) {
                        for (const auto& d : offsets) {
                            if (!outline.contains(u + d[0] * strokeWidth, v + d[1] * strokeWidth)) {
                                ++edge;
                                break;
                            }
                        }
                    }
                }
            }
            if (inside == 0) {
                continue;
            }
            const double total = kSupersample * kSupersample;
            if (fill) {
                bmp->blendPixel(x, y, *fill, (inside - edge) / total);
            }
            if (edge > 0) {
                bmp->blendPixel(x, y, strokeColor, edge / total);
            }
        }
    }
    return bmp;
}

media::BitmapPtr BasicOverlayRasterizer::renderSvg(const model::SvgClip& svg, Size canvas) {
    (void)canvas;
    const int width = static_cast<int>(std::lround(svg.viewBox.width > 0.0 ? svg.viewBox.width : 200.0));
    const int height = static_cast<int>(std::lround(svg.viewBox.height > 0.0 ? svg.viewBox.height : 200.0));
    if (width <= 0 || height <= 0) {
        return nullptr;
    }
    Color tint = svg.tintColor.value_or(Color{255, 255, 255, 255});
    return media::makeBitmap(width, height, withOpacity(tint, svg.tintOpacity));
}

media::BitmapPtr BasicOverlayRasterizer::renderSticker(const model::StickerClip& sticker, Size canvas) {
    (void)canvas;
    if (sticker.imageUrl.empty() || !m_factory) {
        return nullptr;
    }
    if (auto cached = m_stickers.get(sticker.imageUrl)) {
        return cached;
    }
    if (m_failedStickers.count(sticker.imageUrl)) {
        return nullptr;
    }

    model::MediaItem item;
    item.id = sticker.id;
    item.name = sticker.name;
    item.type = MediaType::Image;
    item.path = sticker.imageUrl;

    auto decoded = m_factory->decodeImage(item);
    if (!decoded) {
        LUMEN_LOG_WARN("Sticker {} failed to decode: {}", sticker.id, decoded.error().what());
        m_failedStickers.insert(sticker.imageUrl);
        return nullptr;
    }
    media::BitmapPtr bitmap = std::move(decoded).value();
    m_stickers.put(sticker.imageUrl, bitmap);
    return bitmap;
}

media::BitmapPtr BasicOverlayRasterizer::renderSubtitle(const model::Subtitle& subtitle, Size canvas) {
    if (!m_font || subtitle.text.empty() || canvas.isEmpty()) {
        return nullptr;
    }
    std::lock_guard lock(m_fontMutex);

    const auto& style = subtitle.style;
    const int px = std::max(1, static_cast<int>(std::lround(style.fontSize)));
    m_font->setPixelSize(px);

    const auto lines = splitLines(subtitle.text);
    const double lineHeight = px * 1.3;
    const double totalHeight = lines.size() * lineHeight;

    double top = 0.0;
    switch (style.position) {
        case model::SubtitlePosition::Top:
            top = px * 2.0;
            break;
        case model::SubtitlePosition::Center:
            top = (canvas.height - totalHeight) / 2.0;
            break;
        case model::SubtitlePosition::Bottom:
            top = canvas.height - px * 2.0 - totalHeight;
            break;
    }

    auto bmp = media::makeBitmap(canvas.width, canvas.height);
    const double pad = px * 0.4;
    const double glyphBox = m_font->ascender() + m_font->descender();

    for (size_t i = 0; i < lines.size(); ++i) {
        auto line = decodeUtf8(lines[i]);
        double w = m_font->measure(line, 0.0);
        double x = (canvas.width - w) / 2.0;
        double y = top + i * lineHeight;
        fillRect(*bmp, x - pad, y, w + pad * 2.0, lineHeight, style.backgroundColor);
        double baseline = y + (lineHeight - glyphBox) / 2.0 + m_font->ascender();
        m_font->draw(*bmp, line, x, baseline, style.color, 0.0);
    }
    return bmp;
}

} // namespace lumen::engine
