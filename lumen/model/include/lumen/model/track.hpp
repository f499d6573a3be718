/**
 * @file track.hpp
 * @brief Typed timeline lane and its transitions
 *
 * Track index order matters: for video/image lanes a lower index paints
 * later (on top). Overlay lanes (text, graphics) are placed above or below
 * the video stack by where their index falls relative to it.
 */

#pragma once

#include <lumen/core/types.hpp>
#include <lumen/model/clip.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace lumen::model {

enum class TrackType {
    Video,
    Audio,
    Image,
    Text,
    Graphics,
};

TrackType parseTrackType(const std::string& name);
const char* trackTypeToString(TrackType type);

enum class TransitionType {
    Crossfade,
    DipToBlack,
    DipToWhite,
    Wipe,
    Slide,
    Zoom,
    Push,
};

/// Unknown names map to Crossfade
TransitionType parseTransitionType(const std::string& name);
const char* transitionTypeToString(TransitionType type);

/**
 * @brief Transition attached to the overlap of two clips on one lane
 *
 * Parameters (direction, softness, curve, ...) are type specific and kept
 * as JSON; the transition evaluator reads them.
 */
struct Transition {
    std::string id;
    std::string clipAId;
    std::string clipBId;
    TransitionType type = TransitionType::Crossfade;
    Duration duration = 0;
    nlohmann::json params = nlohmann::json::object();
};

struct Track {
    std::string id;
    std::string name;
    TrackType type = TrackType::Video;

    bool hidden = false;
    bool muted = false;
    bool solo = false;
    bool locked = false;

    // Mixer settings for audio lanes
    double volume = 1.0;
    double pan = 0.0;

    std::vector<MediaClip> clips;
    std::vector<Transition> transitions;

    /// Video or image lane
    [[nodiscard]] bool isVisualMedia() const {
        return type == TrackType::Video || type == TrackType::Image;
    }

    /// Text or graphics lane
    [[nodiscard]] bool isOverlay() const {
        return type == TrackType::Text || type == TrackType::Graphics;
    }

    [[nodiscard]] const MediaClip* findClip(const std::string& clipId) const;
};

} // namespace lumen::model
