/**
 * @file audio_scheduler.cpp
 * @brief Audio schedule derivation and the look-ahead poll
 */

#include <lumen/engine/audio_scheduler.hpp>

#include <lumen/core/logger.hpp>

#include <algorithm>
#include <cstdlib>
#include <unordered_set>

namespace lumen::engine {

// ============================================================================
// Effect resolution
// ============================================================================

std::vector<model::Effect> resolveClipAudioEffects(const model::Timeline& timeline,
                                                   const model::MediaClip& clip,
                                                   Duration tolerance) {
    if (!clip.audioEffects.empty()) {
        return clip.audioEffects;
    }

    for (const auto& track : timeline.tracks) {
        if (!track.isVisualMedia()) {
            continue;
        }
        for (const auto& candidate : track.clips) {
            if (candidate.id == clip.id || candidate.kind != model::ClipKind::Video) {
                continue;
            }
            if (candidate.mediaId == clip.mediaId
                && std::llabs(candidate.startTime - clip.startTime) <= tolerance
                && !candidate.audioEffects.empty()) {
                return candidate.audioEffects;
            }
        }
    }
    return {};
}

// ============================================================================
// AudioScheduleBuilder
// ============================================================================

AudioScheduleBuilder::AudioScheduleBuilder(const model::ProjectStore& store,
                                           media::AudioBufferCache& cache,
                                           const SpeedEngine& speed,
                                           Duration linkedClipTolerance)
    : m_store(store)
    , m_cache(cache)
    , m_speed(speed)
    , m_tolerance(linkedClipTolerance) {}

void AudioScheduleBuilder::reportSkip(const std::string& clipId, const std::string& reason) {
    ++m_skipped;
    if (m_reported.insert(clipId).second) {
        LUMEN_LOG_WARN("Audio clip {} not scheduled: {}", clipId, reason);
    }
}

std::vector<AudioClipSchedule> AudioScheduleBuilder::build(const model::Timeline& timeline,
                                                           Timestamp from, Timestamp to) {
    std::vector<AudioClipSchedule> schedules;

    for (const auto& track : timeline.tracks) {
        if (track.type != model::TrackType::Audio) {
            continue;
        }

        for (const auto& clip : track.clips) {
            if (clip.duration <= 0 || clip.startTime >= to || clip.endTime() <= from) {
                continue;
            }

            auto item = m_store.getMediaItem(clip.mediaId);
            if (!item) {
                reportSkip(clip.id, "media " + clip.mediaId + " not found");
                continue;
            }

            auto buffer = m_cache.get(*item);
            if (!buffer.ok()) {
                reportSkip(clip.id, buffer.error().message());
                continue;
            }

            const Timestamp anchor = std::max(clip.startTime, from);
            const double speed = m_speed.getClipSpeed(clip);

            AudioClipSchedule s;
            s.clipId = clip.id;
            s.trackId = track.id;
            s.buffer = std::move(buffer).value();
            s.startTime = anchor;
            s.endTime = clip.endTime();
            s.mediaOffset = m_speed.sourceTimeAtPlaybackTime(clip, anchor - clip.startTime);
            s.rate = m_speed.isReverse(clip) ? -speed : speed;
            s.volume = clip.volume;
            s.effects = resolveClipAudioEffects(timeline, clip, m_tolerance);
            s.clipStart = clip.startTime;
            s.clipDuration = clip.duration;
            s.fade = clip.fade;
            s.volumeAutomation = clip.volumeAutomation;
            s.panAutomation = clip.panAutomation;
            schedules.push_back(std::move(s));
        }
    }
    return schedules;
}

void AudioScheduleBuilder::configureBuses(AudioGraph& graph, const model::Timeline& timeline) const {
    for (const auto& track : timeline.tracks) {
        if (track.type != model::TrackType::Audio) {
            continue;
        }
        graph.configureTrack({track.id, track.volume, track.pan, track.muted, track.solo});
    }
}

// ============================================================================
// AudioScheduler
// ============================================================================

AudioScheduler::AudioScheduler(AudioGraph& graph, FrameScheduler& scheduler,
                               const MasterClock& clock, AudioSchedulerSettings settings)
    : m_graph(graph)
    , m_scheduler(scheduler)
    , m_clock(clock)
    , m_settings(settings) {}

AudioScheduler::~AudioScheduler() {
    stopScheduler();
}

void AudioScheduler::startScheduler(ScheduleSupplier supplier) {
    stopScheduler();
    m_supplier = std::move(supplier);
    LUMEN_LOG_DEBUG("Audio scheduler started (lookahead {}ms, every {}ms)",
                    m_settings.scheduleAhead / 1000, m_settings.interval / 1000);
    poll(m_clock.currentTime());
    arm();
}

void AudioScheduler::stopScheduler() {
    if (m_task != kInvalidTask) {
        m_scheduler.cancel(m_task);
        m_task = kInvalidTask;
        LUMEN_LOG_DEBUG("Audio scheduler stopped");
    }
    m_supplier = nullptr;
}

void AudioScheduler::arm() {
    m_task = m_scheduler.schedule(m_settings.interval, [this] {
        m_task = kInvalidTask;
        if (!m_supplier) {
            return;
        }
        poll(m_clock.currentTime());
        arm();
    });
}

void AudioScheduler::poll(Timestamp from) {
    if (!m_supplier) {
        return;
    }
    ++m_polls;
    m_graph.collectFinished();
    scheduleClips(m_supplier(from, from + m_settings.scheduleAhead));
}

void AudioScheduler::scheduleClips(std::vector<AudioClipSchedule> schedules) {
    for (auto& s : schedules) {
        if (m_scheduled.count(s.clipId) > 0) {
            continue;
        }
        m_scheduled.emplace(s.clipId, s);
        m_graph.scheduleClip(std::move(s));
    }
}

void AudioScheduler::stopAllClips() {
    m_graph.stopAllClips();
    m_scheduled.clear();
}

void AudioScheduler::seekTo(Timestamp time) {
    stopAllClips();
    if (isRunning()) {
        poll(time);
    }
}

void AudioScheduler::refresh(Timestamp time) {
    if (!m_supplier) {
        return;
    }
    m_graph.collectFinished();

    std::unordered_set<std::string> present;
    size_t replaced = 0;
    for (auto& s : m_supplier(time, time + m_settings.scheduleAhead)) {
        present.insert(s.clipId);
        auto it = m_scheduled.find(s.clipId);
        if (it != m_scheduled.end() && samePlayback(it->second, s)) {
            continue;
        }
        if (it != m_scheduled.end()) {
            ++replaced;
        }
        m_scheduled.insert_or_assign(s.clipId, s);
        m_graph.scheduleClip(std::move(s));
    }

    size_t dropped = 0;
    for (auto it = m_scheduled.begin(); it != m_scheduled.end();) {
        if (present.count(it->first) > 0) {
            ++it;
            continue;
        }
        m_graph.stopClip(it->first);
        it = m_scheduled.erase(it);
        ++dropped;
    }

    if (replaced > 0 || dropped > 0) {
        LUMEN_LOG_DEBUG("Audio schedule refreshed at {}us: {} replaced, {} stopped", time, replaced, dropped);
    }
}

} // namespace lumen::engine
