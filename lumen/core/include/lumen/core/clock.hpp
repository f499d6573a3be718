/**
 * @file clock.hpp
 * @brief Master timeline clock shared by the video frame loop and audio graph
 *
 * The clock is the single authority for "now" during a playback session.
 * Control calls (play/pause/seek/stop) come from the host thread; the audio
 * device callback reads currentTime() from its own thread. The playing-state
 * anchor (timeline time, wall time, rate) is published with a SeqLock so
 * those reads never block.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>

#include "signals.hpp"
#include "types.hpp"

namespace lumen {

enum class ClockState {
    Stopped,
    Playing,
    Paused,
};

inline const char* clockStateToString(ClockState state) {
    switch (state) {
        case ClockState::Stopped: return "stopped";
        case ClockState::Playing: return "playing";
        case ClockState::Paused: return "paused";
        default: return "unknown";
    }
}

/// Monotonic wall time in microseconds
using TimeSource = std::function<int64_t()>;

/// Steady-clock based time source
TimeSource steadyTimeSource();

/**
 * @brief Master clock
 *
 * Thread safety:
 * - Control calls and signals: host thread only
 * - currentTime(), state queries: any thread, lock-free
 */
class MasterClock {
public:
    static constexpr double kMinRate = 0.1;
    static constexpr double kMaxRate = 16.0;

    explicit MasterClock(TimeSource timeSource = steadyTimeSource());

    MasterClock(const MasterClock&) = delete;
    MasterClock& operator=(const MasterClock&) = delete;

    // ========== Configuration ==========

    void setDuration(Duration duration);
    [[nodiscard]] Duration duration() const { return m_duration.load(std::memory_order_acquire); }

    /**
     * @brief Enable looping between start and end
     *
     * An end of 0 (or <= start) loops over the whole duration.
     */
    void setLoop(bool enabled, Timestamp start = 0, Timestamp end = 0);
    [[nodiscard]] bool isLooping() const { return m_loop.load(std::memory_order_acquire); }

    /// Frame duration used by the skip/repeat decisions
    void setFrameRate(double fps);
    [[nodiscard]] Duration frameDuration() const { return m_frameDuration; }

    /// Clamped to [kMinRate, kMaxRate]; re-anchors when playing
    void setPlaybackRate(double rate);
    [[nodiscard]] double playbackRate() const;

    // ========== Transport ==========

    void play();
    void pause();

    /// Stop and park the playhead at 0
    void stop();

    /// Move the playhead, clamped to [0, duration]
    void seek(Timestamp time);
    void seekRelative(Duration delta);

    // ========== Queries ==========

    /**
     * @brief Current timeline time
     *
     * Parked position when stopped or paused; anchor + elapsed * rate when
     * playing, wrapped inside the loop window or clamped to [0, duration].
     */
    [[nodiscard]] Timestamp currentTime() const;

    [[nodiscard]] ClockState state() const { return m_state.load(std::memory_order_acquire); }

    /// True while playing and not yet past the end (loop never ends)
    [[nodiscard]] bool isPlaying() const;
    [[nodiscard]] bool isPaused() const { return state() == ClockState::Paused; }
    [[nodiscard]] bool isStopped() const { return state() == ClockState::Stopped; }

    /// True once a non-looping playing clock has reached its duration
    [[nodiscard]] bool reachedEnd() const;

    // ========== Video Reconciliation ==========

    /**
     * @brief Report the timeline time of the frame the video path presented
     *
     * Records drift = clock time - video time. Positive drift means video
     * lags the clock.
     */
    void reportVideoTime(Timestamp videoTime);

    [[nodiscard]] Duration drift() const { return m_drift; }
    [[nodiscard]] Timestamp lastVideoTime() const { return m_lastVideoTime; }

    /// Video is more than one frame behind the clock
    [[nodiscard]] bool shouldSkipFrame() const { return m_drift > m_frameDuration; }

    /// Video is more than one frame ahead of the clock
    [[nodiscard]] bool shouldRepeatFrame() const { return m_drift < -m_frameDuration; }

    // ========== Signals ==========

    Signal<ClockState> stateChanged;
    Signal<Timestamp> timeChanged;

private:
    struct Anchor {
        Timestamp media;
        int64_t wall;
        double rate;
    };

    void publishAnchor(Timestamp media, double rate);
    [[nodiscard]] Anchor readAnchor() const;
    [[nodiscard]] Timestamp rawPlayingTime() const;
    [[nodiscard]] Timestamp wrapOrClamp(Timestamp t) const;
    [[nodiscard]] Timestamp clampToDuration(Timestamp t) const;
    void setState(ClockState state);

    TimeSource m_timeSource;

    // SeqLock data
    std::atomic<uint64_t> m_sequence{0};
    std::atomic<Timestamp> m_anchorMedia{0};
    std::atomic<int64_t> m_anchorWall{0};
    std::atomic<double> m_anchorRate{1.0};

    std::atomic<ClockState> m_state{ClockState::Stopped};
    std::atomic<Timestamp> m_parked{0};
    std::atomic<Duration> m_duration{0};

    std::atomic<bool> m_loop{false};
    std::atomic<Timestamp> m_loopStart{0};
    std::atomic<Timestamp> m_loopEnd{0};

    double m_rate = 1.0;
    Duration m_frameDuration = kTimeBaseUs / 30;
    Duration m_drift = 0;
    Timestamp m_lastVideoTime = 0;
};

} // namespace lumen
