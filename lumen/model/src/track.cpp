/**
 * @file track.cpp
 * @brief Track helpers
 */

#include <lumen/model/track.hpp>

namespace lumen::model {

TrackType parseTrackType(const std::string& name) {
    if (name == "audio") return TrackType::Audio;
    if (name == "image") return TrackType::Image;
    if (name == "text") return TrackType::Text;
    if (name == "graphics") return TrackType::Graphics;
    return TrackType::Video;
}

const char* trackTypeToString(TrackType type) {
    switch (type) {
        case TrackType::Video: return "video";
        case TrackType::Audio: return "audio";
        case TrackType::Image: return "image";
        case TrackType::Text: return "text";
        case TrackType::Graphics: return "graphics";
        default: return "video";
    }
}

TransitionType parseTransitionType(const std::string& name) {
    if (name == "dipToBlack") return TransitionType::DipToBlack;
    if (name == "dipToWhite") return TransitionType::DipToWhite;
    if (name == "wipe") return TransitionType::Wipe;
    if (name == "slide") return TransitionType::Slide;
    if (name == "zoom") return TransitionType::Zoom;
    if (name == "push") return TransitionType::Push;
    return TransitionType::Crossfade;
}

const char* transitionTypeToString(TransitionType type) {
    switch (type) {
        case TransitionType::Crossfade: return "crossfade";
        case TransitionType::DipToBlack: return "dipToBlack";
        case TransitionType::DipToWhite: return "dipToWhite";
        case TransitionType::Wipe: return "wipe";
        case TransitionType::Slide: return "slide";
        case TransitionType::Zoom: return "zoom";
        case TransitionType::Push: return "push";
        default: return "crossfade";
    }
}

const MediaClip* Track::findClip(const std::string& clipId) const {
    for (const auto& clip : clips) {
        if (clip.id == clipId) {
            return &clip;
        }
    }
    return nullptr;
}

} // namespace lumen::model
