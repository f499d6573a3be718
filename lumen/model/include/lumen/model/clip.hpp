/**
 * @file clip.hpp
 * @brief Timeline clips and overlay entities
 *
 * Media clips (video, image, audio) live inside their track. Overlay
 * entities (text, shape, svg, sticker) are kept in one timeline-wide list
 * and point at their lane by trackId; they are co-scheduled by time the same
 * way as media clips.
 *
 * Timeline coordinates: [startTime, startTime + duration) in microseconds.
 * Source coordinates: [inPoint, outPoint) in the media item.
 */

#pragma once

#include <lumen/core/types.hpp>
#include <lumen/model/effect.hpp>
#include <lumen/model/emphasis.hpp>
#include <lumen/model/keyframe.hpp>
#include <lumen/model/transform.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lumen::model {

/// Closed set of clip kinds, matched exhaustively by the compositor
enum class ClipKind {
    Video,
    Image,
    Audio,
    Text,
    Shape,
    Svg,
    Sticker,
};

const char* clipKindToString(ClipKind kind);

struct FadeSettings {
    Duration fadeIn = 0;
    Duration fadeOut = 0;
};

/**
 * @brief Fade ramp gain at a clip-local time
 *
 * Linear 0 -> 1 over fadeIn from the clip start and 1 -> 0 over fadeOut
 * before its end; 1 elsewhere.
 */
[[nodiscard]] double fadeFactor(const FadeSettings& fade, Duration localTime, Duration clipDuration);

/// (clip-local time, value) sample of an audio automation lane
struct AutomationPoint {
    Timestamp time = 0;
    double value = 0.0;
};

// ============================================================================
// Media Clip
// ============================================================================

/**
 * @brief A video, image or audio clip on a media track
 */
struct MediaClip {
    std::string id;
    std::string mediaId;
    std::string trackId;
    ClipKind kind = ClipKind::Video;

    // Placement
    Timestamp startTime = 0;
    Duration duration = 0;
    Timestamp inPoint = 0;
    Timestamp outPoint = 0;

    // Visual
    Transform transform;
    std::vector<Keyframe> keyframes;
    std::optional<EmphasisAnimation> emphasis;
    std::vector<Effect> effects;
    double blendOpacity = 1.0;

    // Audio
    std::vector<Effect> audioEffects;
    double volume = 1.0;
    FadeSettings fade;
    std::vector<AutomationPoint> volumeAutomation;
    std::vector<AutomationPoint> panAutomation;

    // Time mapping (owned by the speed engine, mirrored here)
    double speed = 1.0;
    bool reversed = false;

    [[nodiscard]] Timestamp endTime() const { return startTime + duration; }

    [[nodiscard]] bool containsTime(Timestamp t) const {
        return t >= startTime && t < endTime();
    }

    [[nodiscard]] bool isVisual() const {
        return kind == ClipKind::Video || kind == ClipKind::Image;
    }
};

// ============================================================================
// Overlay Entities
// ============================================================================

/// Fields every overlay entity shares
struct OverlayBase {
    std::string id;
    std::string trackId;
    Timestamp startTime = 0;
    Duration duration = 0;
    Transform transform;
    std::vector<Keyframe> keyframes;
    std::optional<EmphasisAnimation> emphasis;
    double blendOpacity = 1.0;

    [[nodiscard]] Timestamp endTime() const { return startTime + duration; }

    [[nodiscard]] bool containsTime(Timestamp t) const {
        return t >= startTime && t < endTime();
    }
};

struct TextStyle {
    std::string fontFamily = "Inter";
    double fontSize = 48.0;
    std::string fontWeight = "normal";
    bool italic = false;
    Color color = Color::white();
    std::optional<Color> backgroundColor;
    std::optional<Color> strokeColor;
    double strokeWidth = 0.0;
    std::string textAlign = "center";
    std::string verticalAlign = "middle";
    double lineHeight = 1.2;
    double letterSpacing = 0.0;
};

struct TextClip : OverlayBase {
    std::string text;
    TextStyle style;
};

enum class ShapeType {
    Rectangle,
    Circle,
    Ellipse,
    Triangle,
    Arrow,
    Line,
    Polygon,
    Star,
};

ShapeType parseShapeType(const std::string& name);

struct ShapeStyle {
    std::optional<Color> fill = Color::white();   // nullopt = no fill
    double fillOpacity = 1.0;
    Color strokeColor = Color::black();
    double strokeWidth = 0.0;
    double strokeOpacity = 1.0;
    double cornerRadius = 0.0;
    int points = 5;            // star
    double innerRadius = 0.5;  // star
};

struct ShapeClip : OverlayBase {
    ShapeType shapeType = ShapeType::Rectangle;
    ShapeStyle style;
    std::vector<Vec2> points;  // polygon, normalized to the shape box
};

struct SvgClip : OverlayBase {
    std::string svgContent;
    Rect viewBox{0.0, 0.0, 100.0, 100.0};
    std::optional<Color> tintColor;
    double tintOpacity = 1.0;
};

struct StickerClip : OverlayBase {
    std::string imageUrl;
    std::string name;
};

/// Tagged union of overlay entities
using OverlayItem = std::variant<TextClip, ShapeClip, SvgClip, StickerClip>;

[[nodiscard]] ClipKind overlayKind(const OverlayItem& item);
[[nodiscard]] const OverlayBase& overlayBase(const OverlayItem& item);
[[nodiscard]] OverlayBase& overlayBase(OverlayItem& item);

// ============================================================================
// Subtitles
// ============================================================================

enum class SubtitlePosition {
    Top,
    Center,
    Bottom,
};

struct SubtitleStyle {
    std::string fontFamily = "Inter";
    double fontSize = 36.0;
    Color color = Color::white();
    Color backgroundColor{0, 0, 0, 160};
    SubtitlePosition position = SubtitlePosition::Bottom;
};

struct Subtitle {
    std::string id;
    std::string text;
    Timestamp startTime = 0;
    Timestamp endTime = 0;
    SubtitleStyle style;

    [[nodiscard]] bool containsTime(Timestamp t) const {
        return t >= startTime && t < endTime;
    }
};

} // namespace lumen::model
