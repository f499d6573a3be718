/**
 * @file audio_scheduler.hpp
 * @brief Look-ahead scheduling of audio clips against the master clock
 *
 * A periodic task on the host frame scheduler reads the clock, asks a
 * supplier for every clip audible in [now, now + lookahead] and hands the
 * ones not yet playing to the audio graph. Clips are derived from the
 * timeline by AudioScheduleBuilder, which decodes each media item once
 * (through the shared AudioBufferCache) and maps media offsets through the
 * speed engine.
 */

#pragma once

#include <lumen/core/clock.hpp>
#include <lumen/core/frame_scheduler.hpp>
#include <lumen/core/types.hpp>
#include <lumen/engine/audio_graph.hpp>
#include <lumen/engine/speed_engine.hpp>
#include <lumen/media/audio_buffer_cache.hpp>
#include <lumen/model/project_store.hpp>

#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace lumen::engine {

struct AudioSchedulerSettings {
    Duration scheduleAhead = msToUs(200);
    Duration interval = msToUs(100);
    Duration linkedClipTolerance = msToUs(10);
};

/**
 * @brief Effect list that applies to an audio clip
 *
 * The clip's own audio effects; if it has none, the audio effects of a
 * video clip with the same media starting within tolerance of it (the
 * video half of a detached pair).
 */
[[nodiscard]] std::vector<model::Effect> resolveClipAudioEffects(const model::Timeline& timeline,
                                                                 const model::MediaClip& clip,
                                                                 Duration tolerance);

/**
 * @brief Builds AudioClipSchedule records from a timeline snapshot
 */
class AudioScheduleBuilder {
public:
    AudioScheduleBuilder(const model::ProjectStore& store, media::AudioBufferCache& cache,
                         const SpeedEngine& speed, Duration linkedClipTolerance = msToUs(10));

    /**
     * @brief Schedules for every audio-lane clip overlapping [from, to)
     *
     * Playback of a clip already under way at `from` is anchored there.
     * A clip whose media is missing or fails to decode is skipped; the
     * others are still returned.
     */
    [[nodiscard]] std::vector<AudioClipSchedule> build(const model::Timeline& timeline,
                                                       Timestamp from, Timestamp to);

    /// Push every audio lane's mixer settings to the graph
    void configureBuses(AudioGraph& graph, const model::Timeline& timeline) const;

    [[nodiscard]] uint64_t skippedClips() const { return m_skipped; }

private:
    void reportSkip(const std::string& clipId, const std::string& reason);

    const model::ProjectStore& m_store;
    media::AudioBufferCache& m_cache;
    const SpeedEngine& m_speed;
    Duration m_tolerance;

    std::unordered_set<std::string> m_reported;
    uint64_t m_skipped = 0;
};

class AudioScheduler {
public:
    /// Schedules audible in [from, to]
    using ScheduleSupplier = std::function<std::vector<AudioClipSchedule>(Timestamp from, Timestamp to)>;

    AudioScheduler(AudioGraph& graph, FrameScheduler& scheduler, const MasterClock& clock,
                   AudioSchedulerSettings settings = {});
    ~AudioScheduler();

    AudioScheduler(const AudioScheduler&) = delete;
    AudioScheduler& operator=(const AudioScheduler&) = delete;

    /// Poll now, then every interval until stopScheduler()
    void startScheduler(ScheduleSupplier supplier);

    /// Cancel the periodic poll; sources already scheduled keep playing
    void stopScheduler();

    [[nodiscard]] bool isRunning() const { return m_task != kInvalidTask; }

    /// Hand schedules to the graph, skipping clips already scheduled
    void scheduleClips(std::vector<AudioClipSchedule> schedules);

    /// Stop every source and forget what was scheduled
    void stopAllClips();

    /// Restart scheduling from a new playhead position
    void seekTo(Timestamp time);

    /**
     * @brief Reconcile scheduled sources with the timeline after an edit
     *
     * Clips whose playback changed are rescheduled in place, clips that
     * left the look-ahead window are stopped and new clips are added.
     * Unchanged clips keep playing untouched.
     */
    void refresh(Timestamp time);

    [[nodiscard]] bool wasScheduled(const std::string& clipId) const {
        return m_scheduled.count(clipId) > 0;
    }

    [[nodiscard]] uint64_t pollCount() const { return m_polls; }

    [[nodiscard]] const AudioSchedulerSettings& settings() const { return m_settings; }

private:
    void poll(Timestamp from);
    void arm();

    AudioGraph& m_graph;
    FrameScheduler& m_scheduler;
    const MasterClock& m_clock;
    AudioSchedulerSettings m_settings;

    ScheduleSupplier m_supplier;
    TaskId m_task = kInvalidTask;
    std::unordered_map<std::string, AudioClipSchedule> m_scheduled;   // as handed to the graph
    uint64_t m_polls = 0;
};

} // namespace lumen::engine
