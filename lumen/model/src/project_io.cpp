/**
 * @file project_io.cpp
 * @brief Project JSON parsing
 */

#include <lumen/model/io/project_io.hpp>

#include <lumen/core/logger.hpp>

#include <fstream>
#include <sstream>
#include <unordered_map>

using json = nlohmann::json;

namespace lumen::model {

// ============================================================================
// JSON Parsing Helpers
// ============================================================================

namespace {

Timestamp timeFromJson(const json& j, const char* key, double fallbackSeconds = 0.0) {
    return secondsToUs(j.value(key, fallbackSeconds));
}

Vec2 vec2FromJson(const json& j, Vec2 fallback) {
    if (!j.is_object()) {
        return fallback;
    }
    return {j.value("x", fallback.x), j.value("y", fallback.y)};
}

Color colorFromJson(const json& j, const char* key, Color fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return fallback;
    }
    return Color::fromHex(it->get<std::string>());
}

std::optional<Color> optionalColorFromJson(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return Color::fromHex(it->get<std::string>());
}

// Transform
Transform transformFromJson(const json& j) {
    Transform t;
    if (!j.is_object()) {
        return t;
    }
    if (j.contains("position")) t.position = vec2FromJson(j["position"], t.position);
    if (j.contains("scale")) t.scale = vec2FromJson(j["scale"], t.scale);
    if (j.contains("anchor")) t.anchor = vec2FromJson(j["anchor"], t.anchor);
    t.rotation = j.value("rotation", 0.0);
    t.opacity = j.value("opacity", 1.0);
    t.borderRadius = j.value("borderRadius", 0.0);
    t.fitMode = parseFitMode(j.value("fitMode", std::string("contain")));

    if (auto it = j.find("crop"); it != j.end() && it->is_object()) {
        t.crop = Rect{it->value("x", 0.0), it->value("y", 0.0),
                      it->value("width", 1.0), it->value("height", 1.0)};
    }
    if (auto it = j.find("rotate3d"); it != j.end() && it->is_object()) {
        t.rotate3d = Transform::Rotate3d{it->value("x", 0.0), it->value("y", 0.0), it->value("z", 0.0)};
    }
    if (auto it = j.find("perspective"); it != j.end() && it->is_number()) {
        t.perspective = it->get<double>();
    }
    return t;
}

// Keyframes
std::vector<Keyframe> keyframesFromJson(const json& j) {
    std::vector<Keyframe> keyframes;
    if (!j.is_array()) {
        return keyframes;
    }
    for (const auto& k : j) {
        // Only numeric properties animate in the preview
        auto value = k.find("value");
        if (value == k.end() || !value->is_number()) {
            continue;
        }
        Keyframe kf;
        kf.id = k.value("id", "");
        kf.time = timeFromJson(k, "time");
        kf.property = k.value("property", "");
        kf.value = value->get<double>();
        kf.easing = parseEasing(k.value("easing", std::string("linear")));
        if (auto it = k.find("bezier"); it != k.end() && it->is_object()) {
            kf.bezier = BezierHandles{it->value("x1", 0.25), it->value("y1", 0.1),
                                      it->value("x2", 0.25), it->value("y2", 1.0)};
        }
        keyframes.push_back(std::move(kf));
    }
    return keyframes;
}

std::optional<EmphasisAnimation> emphasisFromJson(const json& j) {
    auto it = j.find("emphasisAnimation");
    if (it == j.end() || !it->is_object()) {
        return std::nullopt;
    }
    EmphasisAnimation e;
    e.type = parseEmphasisType(it->value("type", std::string("none")));
    e.speed = it->value("speed", 1.0);
    e.intensity = it->value("intensity", 1.0);
    e.loop = it->value("loop", true);
    if (it->contains("focusPoint")) e.focusPoint = vec2FromJson((*it)["focusPoint"], e.focusPoint);
    e.zoomScale = it->value("zoomScale", 1.5);
    e.holdDuration = it->value("holdDuration", 0.3);
    e.startTime = timeFromJson(*it, "startTime");
    if (auto d = it->find("animationDuration"); d != it->end() && d->is_number()) {
        e.animationDuration = secondsToUs(d->get<double>());
    }
    if (!e.active()) {
        return std::nullopt;
    }
    return e;
}

std::vector<Effect> effectsFromJson(const json& j) {
    std::vector<Effect> effects;
    if (!j.is_array()) {
        return effects;
    }
    for (const auto& e : j) {
        Effect effect;
        effect.id = e.value("id", "");
        effect.type = e.value("type", "");
        effect.enabled = e.value("enabled", true);
        if (auto it = e.find("params"); it != e.end() && it->is_object()) {
            effect.params = *it;
        }
        effects.push_back(std::move(effect));
    }
    return effects;
}

std::vector<AutomationPoint> automationFromJson(const json& j) {
    std::vector<AutomationPoint> points;
    if (!j.is_array()) {
        return points;
    }
    for (const auto& p : j) {
        points.push_back({timeFromJson(p, "time"), p.value("value", 0.0)});
    }
    return points;
}

// Clip
MediaClip clipFromJson(const json& j, TrackType trackType,
                       const std::unordered_map<std::string, MediaType>& mediaTypes) {
    MediaClip clip;
    clip.id = j.value("id", "");
    clip.mediaId = j.value("mediaId", "");
    clip.trackId = j.value("trackId", "");
    clip.startTime = timeFromJson(j, "startTime");
    clip.duration = timeFromJson(j, "duration");
    clip.inPoint = timeFromJson(j, "inPoint");
    clip.outPoint = j.contains("outPoint") ? timeFromJson(j, "outPoint") : clip.inPoint + clip.duration;

    switch (trackType) {
        case TrackType::Audio: clip.kind = ClipKind::Audio; break;
        case TrackType::Image: clip.kind = ClipKind::Image; break;
        default: {
            auto it = mediaTypes.find(clip.mediaId);
            clip.kind = (it != mediaTypes.end() && it->second == MediaType::Image)
                ? ClipKind::Image : ClipKind::Video;
            break;
        }
    }

    clip.transform = transformFromJson(j.value("transform", json::object()));
    clip.keyframes = keyframesFromJson(j.value("keyframes", json::array()));
    clip.emphasis = emphasisFromJson(j);
    clip.effects = effectsFromJson(j.value("effects", json::array()));
    clip.audioEffects = effectsFromJson(j.value("audioEffects", json::array()));
    clip.blendOpacity = j.value("blendOpacity", 1.0);
    clip.volume = j.value("volume", 1.0);
    clip.speed = j.value("speed", 1.0);
    clip.reversed = j.value("reversed", false);

    if (auto it = j.find("fade"); it != j.end() && it->is_object()) {
        clip.fade.fadeIn = timeFromJson(*it, "fadeIn");
        clip.fade.fadeOut = timeFromJson(*it, "fadeOut");
    }
    if (auto it = j.find("automation"); it != j.end() && it->is_object()) {
        clip.volumeAutomation = automationFromJson(it->value("volume", json::array()));
        clip.panAutomation = automationFromJson(it->value("pan", json::array()));
    }
    return clip;
}

Transition transitionFromJson(const json& j) {
    Transition t;
    t.id = j.value("id", "");
    t.clipAId = j.value("clipAId", "");
    t.clipBId = j.value("clipBId", "");
    t.type = parseTransitionType(j.value("type", std::string("crossfade")));
    t.duration = timeFromJson(j, "duration");
    if (auto it = j.find("params"); it != j.end() && it->is_object()) {
        t.params = *it;
    }
    return t;
}

// Track
Track trackFromJson(const json& j, const std::unordered_map<std::string, MediaType>& mediaTypes) {
    Track track;
    track.id = j.value("id", "");
    track.name = j.value("name", "");
    track.type = parseTrackType(j.value("type", std::string("video")));
    track.hidden = j.value("hidden", false);
    track.muted = j.value("muted", false);
    track.solo = j.value("solo", false);
    track.locked = j.value("locked", false);
    track.volume = j.value("volume", 1.0);
    track.pan = j.value("pan", 0.0);

    for (const auto& c : j.value("clips", json::array())) {
        auto clip = clipFromJson(c, track.type, mediaTypes);
        if (clip.trackId.empty()) {
            clip.trackId = track.id;
        }
        track.clips.push_back(std::move(clip));
    }
    for (const auto& t : j.value("transitions", json::array())) {
        track.transitions.push_back(transitionFromJson(t));
    }
    return track;
}

void overlayBaseFromJson(const json& j, OverlayBase& base) {
    base.id = j.value("id", "");
    base.trackId = j.value("trackId", "");
    base.startTime = timeFromJson(j, "startTime");
    base.duration = timeFromJson(j, "duration");
    base.transform = transformFromJson(j.value("transform", json::object()));
    base.keyframes = keyframesFromJson(j.value("keyframes", json::array()));
    base.emphasis = emphasisFromJson(j);
    base.blendOpacity = j.value("blendOpacity", 1.0);
}

std::optional<OverlayItem> overlayFromJson(const json& j) {
    std::string kind = j.value("kind", j.value("type", std::string()));

    if (kind == "text") {
        TextClip text;
        overlayBaseFromJson(j, text);
        text.text = j.value("text", "");
        const json style = j.value("style", json::object());
        text.style.fontFamily = style.value("fontFamily", text.style.fontFamily);
        text.style.fontSize = style.value("fontSize", text.style.fontSize);
        if (auto w = style.find("fontWeight"); w != style.end()) {
            text.style.fontWeight = w->is_string() ? w->get<std::string>() : std::to_string(w->get<int>());
        }
        text.style.italic = style.value("fontStyle", std::string("normal")) == "italic";
        text.style.color = colorFromJson(style, "color", text.style.color);
        text.style.backgroundColor = optionalColorFromJson(style, "backgroundColor");
        text.style.strokeColor = optionalColorFromJson(style, "strokeColor");
        text.style.strokeWidth = style.value("strokeWidth", 0.0);
        text.style.textAlign = style.value("textAlign", text.style.textAlign);
        text.style.verticalAlign = style.value("verticalAlign", text.style.verticalAlign);
        text.style.lineHeight = style.value("lineHeight", text.style.lineHeight);
        text.style.letterSpacing = style.value("letterSpacing", text.style.letterSpacing);
        return text;
    }
    if (kind == "shape") {
        ShapeClip shape;
        overlayBaseFromJson(j, shape);
        shape.shapeType = parseShapeType(j.value("shapeType", std::string("rectangle")));
        const json style = j.value("style", json::object());
        const json fill = style.value("fill", json::object());
        if (fill.value("type", std::string("solid")) == "none") {
            shape.style.fill.reset();
        } else {
            shape.style.fill = colorFromJson(fill, "color", Color::white());
        }
        shape.style.fillOpacity = fill.value("opacity", 1.0);
        const json stroke = style.value("stroke", json::object());
        shape.style.strokeColor = colorFromJson(stroke, "color", Color::black());
        shape.style.strokeWidth = stroke.value("width", 0.0);
        shape.style.strokeOpacity = stroke.value("opacity", 1.0);
        shape.style.cornerRadius = style.value("cornerRadius", 0.0);
        shape.style.points = style.value("points", 5);
        shape.style.innerRadius = style.value("innerRadius", 0.5);
        for (const auto& p : j.value("points", json::array())) {
            shape.points.push_back(vec2FromJson(p, {}));
        }
        return shape;
    }
    if (kind == "svg") {
        SvgClip svg;
        overlayBaseFromJson(j, svg);
        svg.svgContent = j.value("svgContent", "");
        if (auto vb = j.find("viewBox"); vb != j.end() && vb->is_object()) {
            svg.viewBox = Rect{vb->value("minX", 0.0), vb->value("minY", 0.0),
                               vb->value("width", 100.0), vb->value("height", 100.0)};
        }
        if (auto cs = j.find("colorStyle"); cs != j.end() && cs->is_object()
            && cs->value("colorMode", std::string("none")) != "none") {
            svg.tintColor = colorFromJson(*cs, "tintColor", Color::white());
            svg.tintOpacity = cs->value("tintOpacity", 1.0);
        }
        return svg;
    }
    if (kind == "sticker" || kind == "emoji") {
        StickerClip sticker;
        overlayBaseFromJson(j, sticker);
        sticker.imageUrl = j.value("imageUrl", "");
        sticker.name = j.value("name", "");
        return sticker;
    }

    LUMEN_LOG_WARN("Skipping overlay '{}' of unknown kind '{}'", j.value("id", ""), kind);
    return std::nullopt;
}

Subtitle subtitleFromJson(const json& j) {
    Subtitle sub;
    sub.id = j.value("id", "");
    sub.text = j.value("text", "");
    sub.startTime = timeFromJson(j, "startTime");
    sub.endTime = timeFromJson(j, "endTime");
    if (auto it = j.find("style"); it != j.end() && it->is_object()) {
        sub.style.fontFamily = it->value("fontFamily", sub.style.fontFamily);
        sub.style.fontSize = it->value("fontSize", sub.style.fontSize);
        sub.style.color = colorFromJson(*it, "color", sub.style.color);
        sub.style.backgroundColor = colorFromJson(*it, "backgroundColor", sub.style.backgroundColor);
        std::string position = it->value("position", std::string("bottom"));
        sub.style.position = position == "top" ? SubtitlePosition::Top
            : position == "center" ? SubtitlePosition::Center : SubtitlePosition::Bottom;
    }
    return sub;
}

MediaItem mediaItemFromJson(const json& j) {
    MediaItem item;
    item.id = j.value("id", "");
    item.name = j.value("name", "");
    item.type = parseMediaType(j.value("type", std::string()));
    item.path = j.value("path", "");
    if (auto it = j.find("metadata"); it != j.end() && it->is_object()) {
        item.metadata.duration = timeFromJson(*it, "duration");
        item.metadata.width = it->value("width", 0);
        item.metadata.height = it->value("height", 0);
        item.metadata.frameRate = it->value("frameRate", 0.0);
        item.metadata.sampleRate = it->value("sampleRate", 0);
        item.metadata.channels = it->value("channels", 0);
    }
    return item;
}

} // anonymous namespace

// ============================================================================
// ProjectIO Implementation
// ============================================================================

Result<Timeline> ProjectIO::parseTimeline(const json& j, const json& media) {
    if (!j.is_object()) {
        return Err<Timeline>(ErrorCode::InvalidData, "Timeline must be a JSON object");
    }

    try {
        std::unordered_map<std::string, MediaType> mediaTypes;
        if (media.is_array()) {
            for (const auto& m : media) {
                mediaTypes[m.value("id", "")] = parseMediaType(m.value("type", std::string()));
            }
        }

        Timeline timeline;
        for (const auto& t : j.value("tracks", json::array())) {
            timeline.tracks.push_back(trackFromJson(t, mediaTypes));
        }
        for (const auto& o : j.value("overlays", json::array())) {
            if (auto item = overlayFromJson(o)) {
                timeline.overlays.push_back(std::move(*item));
            }
        }
        for (const auto& s : j.value("subtitles", json::array())) {
            timeline.subtitles.push_back(subtitleFromJson(s));
        }
        for (const auto& m : j.value("markers", json::array())) {
            timeline.markers.push_back({m.value("id", ""), timeFromJson(m, "time"),
                                        m.value("label", ""), colorFromJson(m, "color", Color::white())});
        }
        timeline.duration = timeFromJson(j, "duration");
        return timeline;
    }
    catch (const json::exception& e) {
        return Err<Timeline>(ErrorCode::InvalidData, e.what());
    }
}

Result<std::unique_ptr<InMemoryProjectStore>> ProjectIO::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<std::unique_ptr<InMemoryProjectStore>>(
            ErrorCode::FileNotFound, "Cannot open project file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Err<std::unique_ptr<InMemoryProjectStore>>(
            ErrorCode::ReadError, "Failed to read project file: " + path.string());
    }
    return fromJson(buffer.str());
}

Result<std::unique_ptr<InMemoryProjectStore>> ProjectIO::fromJson(const std::string& text) {
    using StorePtr = std::unique_ptr<InMemoryProjectStore>;

    json root;
    try {
        root = json::parse(text);
    }
    catch (const json::parse_error& e) {
        return Err<StorePtr>(ErrorCode::InvalidData, e.what());
    }

    const json media = root.value("media", json::array());
    auto timeline = parseTimeline(root.value("timeline", json::object()), media);
    if (!timeline) {
        return Err<StorePtr>(timeline.error());
    }

    auto store = std::make_unique<InMemoryProjectStore>(std::move(timeline).value());
    try {
        for (const auto& m : media) {
            store->addMediaItem(mediaItemFromJson(m));
        }
    }
    catch (const json::exception& e) {
        return Err<StorePtr>(ErrorCode::InvalidData, e.what());
    }

    auto snapshot = store->getProjectTimeline();
    LUMEN_LOG_INFO("Loaded project: {} tracks, {} overlays, {} subtitles, duration {:.2f}s",
                   snapshot->tracks.size(), snapshot->overlays.size(),
                   snapshot->subtitles.size(), usToSeconds(snapshot->duration));
    return Ok(std::move(store));
}

} // namespace lumen::model
