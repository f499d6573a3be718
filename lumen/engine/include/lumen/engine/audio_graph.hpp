/**
 * @file audio_graph.hpp
 * @brief Real-time audio mixing graph
 *
 * One bus per audio track (effect chain -> volume/mute/solo -> pan) summed
 * into a master bus. Scheduled clips feed their track bus. The graph is
 * pulled: the output device asks for a block of samples starting at a
 * timeline time and the graph renders whatever is scheduled there.
 *
 * Threading: control calls come from the host thread, render() from the
 * audio device thread. render() never blocks or allocates; if a control call
 * holds the graph it outputs silence for that block.
 */

#pragma once

#include <lumen/core/types.hpp>
#include <lumen/engine/audio_effects.hpp>
#include <lumen/media/audio_buffer.hpp>
#include <lumen/model/clip.hpp>
#include <lumen/model/effect.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lumen::engine {

/**
 * @brief Playback of one clip, derived from Clip + Track + effect lookup
 *
 * Not persisted; rebuilt whenever the scheduler runs. Media time at a
 * timeline time t is mediaOffset + (t - startTime) * rate.
 */
struct AudioClipSchedule {
    std::string clipId;
    std::string trackId;
    media::AudioBufferPtr buffer;

    Timestamp startTime = 0;     // timeline time playback begins
    Timestamp endTime = 0;       // timeline time playback ends
    Timestamp mediaOffset = 0;   // media time at startTime
    double rate = 1.0;           // media time per timeline time, negative when reversed

    double volume = 1.0;
    double pan = 0.0;
    std::vector<model::Effect> effects;

    // Clip-local envelopes (local time = t - clipStart)
    Timestamp clipStart = 0;
    Duration clipDuration = 0;
    model::FadeSettings fade;
    std::vector<model::AutomationPoint> volumeAutomation;
    std::vector<model::AutomationPoint> panAutomation;

    /// Clip gain (volume x fade x automation) at a timeline time
    [[nodiscard]] double gainAt(Timestamp t) const;

    /// Clip pan at a timeline time (automation overrides the static pan)
    [[nodiscard]] double panAt(Timestamp t) const;
};

/// Linear interpolation over (time, value) points, clamped at the ends
[[nodiscard]] double evaluateAutomation(const std::vector<model::AutomationPoint>& points,
                                        Timestamp localTime, double fallback);

/// Structural equality of two effect lists (id, type, enabled, params)
[[nodiscard]] bool sameEffects(const std::vector<model::Effect>& a,
                               const std::vector<model::Effect>& b);

/**
 * @brief Whether two schedules of one clip play the same audio
 *
 * Schedules built from different look-ahead windows differ in startTime and
 * mediaOffset; they match when they map timeline time to the same media
 * time (within a millisecond) and agree on every gain, pan and effect input.
 */
[[nodiscard]] bool samePlayback(const AudioClipSchedule& a, const AudioClipSchedule& b);

struct TrackBusConfig {
    std::string trackId;
    double volume = 1.0;   // [0, 4]
    double pan = 0.0;      // [-1, 1]
    bool muted = false;
    bool solo = false;
};

class AudioGraph {
public:
    static constexpr double kMaxVolume = 4.0;

    /// Largest block mixed in one pass; longer render() requests are split
    static constexpr size_t kMaxBlockFrames = 4096;

    AudioGraph(int sampleRate, int channels);
    ~AudioGraph();

    AudioGraph(const AudioGraph&) = delete;
    AudioGraph& operator=(const AudioGraph&) = delete;

    [[nodiscard]] int sampleRate() const { return m_sampleRate; }
    [[nodiscard]] int channels() const { return m_channels; }

    // ========== Track buses ==========

    /// Create the bus or update its mixer settings; the effect chain is left alone
    void configureTrack(const TrackBusConfig& config);
    void removeTrack(const std::string& trackId);

    void updateTrackVolume(const std::string& trackId, double volume);
    void updateTrackPan(const std::string& trackId, double pan);
    void setTrackMuted(const std::string& trackId, bool muted);
    void setTrackSolo(const std::string& trackId, bool solo);
    void updateTrackEffects(const std::string& trackId, const std::vector<model::Effect>& effects);

    [[nodiscard]] bool hasTrack(const std::string& trackId) const;
    [[nodiscard]] std::vector<std::string> trackEffectTypes(const std::string& trackId) const;

    /// Whether a track's bus currently passes signal (mute and solo applied)
    [[nodiscard]] bool isTrackAudible(const std::string& trackId) const;

    // ========== Master ==========

    void setMasterVolume(double volume);
    [[nodiscard]] double masterVolume() const { return m_masterVolume.load(); }

    void setMuted(bool muted) { m_muted.store(muted); }
    [[nodiscard]] bool isMuted() const { return m_muted.load(); }

    // ========== Clips ==========

    /**
     * @brief Add a clip source
     *
     * Creates the track bus on first use; a schedule whose effect list
     * differs from the bus chain replaces the chain. A schedule for a clip
     * that is already playing replaces it.
     */
    void scheduleClip(AudioClipSchedule schedule);
    void scheduleClips(std::vector<AudioClipSchedule> schedules);

    void stopClip(const std::string& clipId);
    void stopAllClips();

    /// Sources that render() has finished are not counted
    [[nodiscard]] bool isClipScheduled(const std::string& clipId) const;
    [[nodiscard]] size_t scheduledCount() const;

    /// Release sources render() marked finished; host thread
    void collectFinished();

    /// Copy of a live clip source, used to inspect the active schedule
    [[nodiscard]] std::optional<AudioClipSchedule> scheduledClip(const std::string& clipId) const;

    // ========== Rendering ==========

    /**
     * @brief Render one block
     *
     * @param out           frames * channels interleaved floats (overwritten)
     * @param timelineStart Timeline time of the first frame
     * @param timelineRate  Timeline time advanced per output second
     *                      (the clock's playback rate)
     *
     * Sources that ended before the end of the block are marked finished
     * and released by the next host-thread call.
     */
    void render(float* out, size_t frames, Timestamp timelineStart, double timelineRate = 1.0);

    /// Blocks rendered as silence because a control call held the graph
    [[nodiscard]] uint64_t contendedBlocks() const { return m_contended.load(); }

private:
    struct Source {
        std::shared_ptr<AudioClipSchedule> schedule;
        bool finished = false;   // set by render(), erased on the host thread
    };

    struct Bus {
        TrackBusConfig config;
        std::vector<model::Effect> effects;
        EffectChain chain;
        std::vector<Source> sources;
    };

    Bus& ensureBus(const std::string& trackId);
    static void eraseFinished(Bus& bus);
    void renderBlock(float* out, size_t frames, Timestamp timelineStart, double timePerFrame);
    [[nodiscard]] bool audible(const Bus& bus) const;
    void updateSoloState();
    void mixSource(const AudioClipSchedule& source, float* bus, size_t frames,
                   Timestamp timelineStart, double timePerFrame) const;

    int m_sampleRate;
    int m_channels;

    mutable std::mutex m_mutex;
    std::map<std::string, Bus> m_buses;
    bool m_hasSolo = false;

    std::atomic<double> m_masterVolume{1.0};
    std::atomic<bool> m_muted{false};
    std::atomic<uint64_t> m_contended{0};

    std::vector<float> m_busScratch;   // kMaxBlockFrames * channels, sized once
};

/**
 * @brief Equal-power stereo pan of one interleaved frame
 *
 * Centre (0) leaves both channels untouched; hard left/right folds the
 * opposite channel in at equal power.
 */
void panStereoFrame(float& left, float& right, double pan);

} // namespace lumen::engine
