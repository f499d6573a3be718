/**
 * @file clock.cpp
 * @brief MasterClock implementation
 */

#include <lumen/core/clock.hpp>

#include <lumen/core/logger.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>

namespace lumen {

TimeSource steadyTimeSource() {
    return [] {
        return std::chrono::duration_cast<Microseconds>(Clock::now().time_since_epoch()).count();
    };
}

MasterClock::MasterClock(TimeSource timeSource)
    : m_timeSource(timeSource ? std::move(timeSource) : steadyTimeSource())
{
    publishAnchor(0, 1.0);
}

// ============================================================================
// SeqLock
// ============================================================================

void MasterClock::publishAnchor(Timestamp media, double rate) {
    // Begin write: odd sequence
    uint64_t seq = m_sequence.load(std::memory_order_relaxed);
    m_sequence.store(seq + 1, std::memory_order_relaxed);
    std::atomic_thread_fence(std::memory_order_release);

    m_anchorMedia.store(media, std::memory_order_relaxed);
    m_anchorWall.store(m_timeSource(), std::memory_order_relaxed);
    m_anchorRate.store(rate, std::memory_order_relaxed);

    // End write: even sequence
    m_sequence.store(seq + 2, std::memory_order_release);
}

MasterClock::Anchor MasterClock::readAnchor() const {
    Anchor anchor{};
    uint64_t seq1 = 0;
    uint64_t seq2 = 0;
    do {
        seq1 = m_sequence.load(std::memory_order_acquire);
        anchor.media = m_anchorMedia.load(std::memory_order_relaxed);
        anchor.wall = m_anchorWall.load(std::memory_order_relaxed);
        anchor.rate = m_anchorRate.load(std::memory_order_relaxed);
        std::atomic_thread_fence(std::memory_order_acquire);
        seq2 = m_sequence.load(std::memory_order_relaxed);
    } while (seq1 != seq2 || (seq1 & 1));
    return anchor;
}

// ============================================================================
// Configuration
// ============================================================================

void MasterClock::setDuration(Duration duration) {
    m_duration.store(std::max<Duration>(0, duration), std::memory_order_release);
}

void MasterClock::setLoop(bool enabled, Timestamp start, Timestamp end) {
    m_loopStart.store(std::max<Timestamp>(0, start), std::memory_order_release);
    m_loopEnd.store(end, std::memory_order_release);
    m_loop.store(enabled, std::memory_order_release);
}

void MasterClock::setFrameRate(double fps) {
    if (fps > 0.0) {
        m_frameDuration = static_cast<Duration>(std::llround(static_cast<double>(kTimeBaseUs) / fps));
    }
}

void MasterClock::setPlaybackRate(double rate) {
    double clamped = std::clamp(rate, kMinRate, kMaxRate);
    if (state() == ClockState::Playing) {
        // Re-anchor so the rate change does not jump the playhead
        publishAnchor(currentTime(), clamped);
    } else {
        publishAnchor(m_parked.load(std::memory_order_acquire), clamped);
    }
    m_rate = clamped;
}

double MasterClock::playbackRate() const {
    // Read from the anchor so the audio thread sees a consistent value
    return m_anchorRate.load(std::memory_order_acquire);
}

// ============================================================================
// Transport
// ============================================================================

void MasterClock::play() {
    if (state() == ClockState::Playing) {
        return;
    }
    publishAnchor(m_parked.load(std::memory_order_acquire), m_rate);
    setState(ClockState::Playing);
}

void MasterClock::pause() {
    if (state() != ClockState::Playing) {
        return;
    }
    m_parked.store(currentTime(), std::memory_order_release);
    setState(ClockState::Paused);
}

void MasterClock::stop() {
    m_parked.store(0, std::memory_order_release);
    publishAnchor(0, m_rate);
    m_drift = 0;
    m_lastVideoTime = 0;
    setState(ClockState::Stopped);
    timeChanged.fire(0);
}

void MasterClock::seek(Timestamp time) {
    Timestamp target = clampToDuration(time);
    if (state() == ClockState::Playing) {
        publishAnchor(target, m_rate);
    } else {
        m_parked.store(target, std::memory_order_release);
    }
    timeChanged.fire(target);
}

void MasterClock::seekRelative(Duration delta) {
    seek(currentTime() + delta);
}

// ============================================================================
// Queries
// ============================================================================

Timestamp MasterClock::rawPlayingTime() const {
    Anchor anchor = readAnchor();
    double elapsed = static_cast<double>(m_timeSource() - anchor.wall) * anchor.rate;
    return anchor.media + static_cast<Timestamp>(std::llround(elapsed));
}

Timestamp MasterClock::clampToDuration(Timestamp t) const {
    Duration d = duration();
    if (t < 0) {
        return 0;
    }
    if (d > 0 && t > d) {
        return d;
    }
    return t;
}

Timestamp MasterClock::wrapOrClamp(Timestamp t) const {
    if (isLooping()) {
        Timestamp start = m_loopStart.load(std::memory_order_acquire);
        Timestamp end = m_loopEnd.load(std::memory_order_acquire);
        if (end <= start) {
            start = 0;
            end = duration();
        }
        if (end > start && t >= end) {
            Duration span = end - start;
            t = start + (t - start) % span;
        }
    }
    return clampToDuration(t);
}

Timestamp MasterClock::currentTime() const {
    switch (state()) {
        case ClockState::Playing:
            return wrapOrClamp(rawPlayingTime());
        case ClockState::Paused:
        case ClockState::Stopped:
        default:
            return m_parked.load(std::memory_order_acquire);
    }
}

bool MasterClock::reachedEnd() const {
    if (state() != ClockState::Playing || isLooping()) {
        return false;
    }
    Duration d = duration();
    return d > 0 && rawPlayingTime() >= d;
}

bool MasterClock::isPlaying() const {
    return state() == ClockState::Playing && !reachedEnd();
}

void MasterClock::reportVideoTime(Timestamp videoTime) {
    m_lastVideoTime = videoTime;
    m_drift = currentTime() - videoTime;
}

void MasterClock::setState(ClockState state) {
    ClockState previous = m_state.exchange(state, std::memory_order_acq_rel);
    if (previous != state) {
        LUMEN_LOG_DEBUG("Clock {} -> {}", clockStateToString(previous), clockStateToString(state));
        stateChanged.fire(state);
    }
}

} // namespace lumen
