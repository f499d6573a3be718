/**
 * @file timeline.cpp
 * @brief Timeline queries
 */

#include <lumen/model/timeline.hpp>

#include <algorithm>

namespace lumen::model {

int Timeline::trackIndex(const std::string& trackId) const {
    for (size_t i = 0; i < tracks.size(); ++i) {
        if (tracks[i].id == trackId) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

const Track* Timeline::findTrack(const std::string& trackId) const {
    int index = trackIndex(trackId);
    return index >= 0 ? &tracks[static_cast<size_t>(index)] : nullptr;
}

const MediaClip* Timeline::findClip(const std::string& clipId) const {
    for (const auto& track : tracks) {
        if (const auto* clip = track.findClip(clipId)) {
            return clip;
        }
    }
    return nullptr;
}

const OverlayItem* Timeline::findOverlay(const std::string& overlayId) const {
    for (const auto& item : overlays) {
        if (overlayBase(item).id == overlayId) {
            return &item;
        }
    }
    return nullptr;
}

std::vector<ActiveClip> Timeline::activeVisualClips(Timestamp t) const {
    std::vector<ActiveClip> result;
    for (size_t i = 0; i < tracks.size(); ++i) {
        const auto& track = tracks[i];
        if (track.hidden || !track.isVisualMedia()) {
            continue;
        }
        for (const auto& clip : track.clips) {
            if (clip.isVisual() && clip.containsTime(t)) {
                result.push_back({static_cast<int>(i), &track, &clip});
            }
        }
    }
    return result;
}

std::vector<ActiveClip> Timeline::activeAudioClips(Timestamp t) const {
    std::vector<ActiveClip> result;
    for (size_t i = 0; i < tracks.size(); ++i) {
        const auto& track = tracks[i];
        if (track.type != TrackType::Audio && track.type != TrackType::Video) {
            continue;
        }
        for (const auto& clip : track.clips) {
            bool audible = clip.kind == ClipKind::Audio || clip.kind == ClipKind::Video;
            if (audible && clip.containsTime(t)) {
                result.push_back({static_cast<int>(i), &track, &clip});
            }
        }
    }
    return result;
}

bool Timeline::overlayShown(const OverlayItem& item) const {
    const Track* lane = findTrack(overlayBase(item).trackId);
    return !lane || !lane->hidden;
}

bool Timeline::hasContentAt(Timestamp t) const {
    for (const auto& track : tracks) {
        if (track.hidden && track.isVisualMedia()) {
            continue;
        }
        for (const auto& clip : track.clips) {
            if (clip.containsTime(t)) {
                return true;
            }
        }
    }
    for (const auto& item : overlays) {
        if (overlayShown(item) && overlayBase(item).containsTime(t)) {
            return true;
        }
    }
    return std::any_of(subtitles.begin(), subtitles.end(),
                       [t](const Subtitle& s) { return s.containsTime(t); });
}

std::optional<Timestamp> Timeline::nextContentStart(Timestamp t) const {
    std::optional<Timestamp> next;
    auto consider = [&](Timestamp start) {
        if (start > t && (!next || start < *next)) {
            next = start;
        }
    };

    for (const auto& track : tracks) {
        if (track.hidden && track.isVisualMedia()) {
            continue;
        }
        for (const auto& clip : track.clips) {
            consider(clip.startTime);
        }
    }
    for (const auto& item : overlays) {
        if (overlayShown(item)) {
            consider(overlayBase(item).startTime);
        }
    }
    for (const auto& sub : subtitles) {
        consider(sub.startTime);
    }
    return next;
}

int Timeline::visualTrackCount() const {
    return static_cast<int>(std::count_if(tracks.begin(), tracks.end(), [](const Track& track) {
        return !track.hidden && track.isVisualMedia();
    }));
}

std::vector<const TextClip*> activeTextClips(const std::vector<OverlayItem>& all, Timestamp t) {
    std::vector<const TextClip*> result;
    for (const auto& item : all) {
        if (const auto* text = std::get_if<TextClip>(&item); text && text->containsTime(t)) {
            result.push_back(text);
        }
    }
    return result;
}

std::vector<const OverlayItem*> activeGraphicClips(const std::vector<OverlayItem>& all,
                                                   Timestamp t) {
    std::vector<const OverlayItem*> result;
    for (const auto& item : all) {
        if (overlayKind(item) != ClipKind::Text && overlayBase(item).containsTime(t)) {
            result.push_back(&item);
        }
    }
    return result;
}

std::vector<const OverlayItem*> activeOverlays(const std::vector<OverlayItem>& all, Timestamp t) {
    std::vector<const OverlayItem*> result;
    for (const auto& item : all) {
        if (overlayBase(item).containsTime(t)) {
            result.push_back(&item);
        }
    }
    return result;
}

std::vector<const Subtitle*> activeSubtitles(const std::vector<Subtitle>& all, Timestamp t) {
    std::vector<const Subtitle*> result;
    for (const auto& sub : all) {
        if (sub.containsTime(t)) {
            result.push_back(&sub);
        }
    }
    return result;
}

} // namespace lumen::model
