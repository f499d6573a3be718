/**
 * @file clip.cpp
 * @brief Clip kind helpers
 */

#include <lumen/model/clip.hpp>

#include <algorithm>

namespace lumen::model {

const char* clipKindToString(ClipKind kind) {
    switch (kind) {
        case ClipKind::Video: return "video";
        case ClipKind::Image: return "image";
        case ClipKind::Audio: return "audio";
        case ClipKind::Text: return "text";
        case ClipKind::Shape: return "shape";
        case ClipKind::Svg: return "svg";
        case ClipKind::Sticker: return "sticker";
        default: return "unknown";
    }
}

double fadeFactor(const FadeSettings& fade, Duration localTime, Duration clipDuration) {
    double gain = 1.0;
    if (fade.fadeIn > 0 && localTime < fade.fadeIn) {
        gain *= static_cast<double>(localTime) / static_cast<double>(fade.fadeIn);
    }
    if (fade.fadeOut > 0 && localTime > clipDuration - fade.fadeOut) {
        gain *= static_cast<double>(clipDuration - localTime) / static_cast<double>(fade.fadeOut);
    }
    return std::clamp(gain, 0.0, 1.0);
}

ShapeType parseShapeType(const std::string& name) {
    if (name == "circle") return ShapeType::Circle;
    if (name == "ellipse") return ShapeType::Ellipse;
    if (name == "triangle") return ShapeType::Triangle;
    if (name == "arrow") return ShapeType::Arrow;
    if (name == "line") return ShapeType::Line;
    if (name == "polygon") return ShapeType::Polygon;
    if (name == "star") return ShapeType::Star;
    return ShapeType::Rectangle;
}

namespace {

template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

ClipKind overlayKind(const OverlayItem& item) {
    return std::visit(Overloaded{
        [](const TextClip&) { return ClipKind::Text; },
        [](const ShapeClip&) { return ClipKind::Shape; },
        [](const SvgClip&) { return ClipKind::Svg; },
        [](const StickerClip&) { return ClipKind::Sticker; },
    }, item);
}

const OverlayBase& overlayBase(const OverlayItem& item) {
    return std::visit([](const auto& clip) -> const OverlayBase& { return clip; }, item);
}

OverlayBase& overlayBase(OverlayItem& item) {
    return std::visit([](auto& clip) -> OverlayBase& { return clip; }, item);
}

} // namespace lumen::model
