/**
 * @file timeline.hpp
 * @brief Timeline snapshot and time-based queries
 *
 * A Timeline is an immutable snapshot handed out by the project store. The
 * compositor borrows it for one render pass; anything it keeps across
 * frames is keyed by clip or media id, never by pointer into the snapshot.
 */

#pragma once

#include <lumen/core/types.hpp>
#include <lumen/model/clip.hpp>
#include <lumen/model/track.hpp>

#include <optional>
#include <string>
#include <vector>

namespace lumen::model {

struct Marker {
    std::string id;
    Timestamp time = 0;
    std::string label;
    Color color = Color::white();
};

/// A media clip active at some instant, with the lane it sits on
struct ActiveClip {
    int trackIndex = -1;
    const Track* track = nullptr;
    const MediaClip* clip = nullptr;
};

struct Timeline {
    std::vector<Track> tracks;
    std::vector<OverlayItem> overlays;   // insertion order
    std::vector<Subtitle> subtitles;
    std::vector<Marker> markers;
    Duration duration = 0;

    // ========== Lookup ==========

    /// Index of a track, -1 if absent
    [[nodiscard]] int trackIndex(const std::string& trackId) const;
    [[nodiscard]] const Track* findTrack(const std::string& trackId) const;
    [[nodiscard]] const MediaClip* findClip(const std::string& clipId) const;
    [[nodiscard]] const OverlayItem* findOverlay(const std::string& overlayId) const;

    // ========== Time Queries ==========

    /**
     * @brief Visual media clips active at t on visible lanes
     *
     * Returned in track index order (index 0 first = topmost). A lane in a
     * transition overlap contributes both clips.
     */
    [[nodiscard]] std::vector<ActiveClip> activeVisualClips(Timestamp t) const;

    /// Audio-bearing clips (audio lanes, plus video clips) active at t
    [[nodiscard]] std::vector<ActiveClip> activeAudioClips(Timestamp t) const;

    /// True if any clip, overlay or subtitle is active at t
    [[nodiscard]] bool hasContentAt(Timestamp t) const;

    /// Earliest content start strictly after t, nullopt if nothing follows
    [[nodiscard]] std::optional<Timestamp> nextContentStart(Timestamp t) const;

    /// False for an overlay whose lane is hidden
    [[nodiscard]] bool overlayShown(const OverlayItem& item) const;

    /// Number of visible video/image lanes
    [[nodiscard]] int visualTrackCount() const;
};

// ========== Active-entity filters ==========

[[nodiscard]] std::vector<const TextClip*> activeTextClips(const std::vector<OverlayItem>& all,
                                                           Timestamp t);

/// Shape, svg and sticker entities active at t
[[nodiscard]] std::vector<const OverlayItem*> activeGraphicClips(
    const std::vector<OverlayItem>& all, Timestamp t);

/// All overlay entities active at t, insertion order
[[nodiscard]] std::vector<const OverlayItem*> activeOverlays(const std::vector<OverlayItem>& all,
                                                             Timestamp t);

[[nodiscard]] std::vector<const Subtitle*> activeSubtitles(const std::vector<Subtitle>& all,
                                                           Timestamp t);

} // namespace lumen::model
