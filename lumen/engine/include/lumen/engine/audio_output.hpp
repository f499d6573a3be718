/**
 * @file audio_output.hpp
 * @brief SDL audio device pulling blocks from the audio graph
 *
 * The device callback runs on SDL's audio thread. It keeps its own render
 * cursor on the timeline so consecutive blocks are contiguous, and snaps
 * the cursor back to the master clock when the two drift apart (seek,
 * rate change, a stall).
 *
 * CRITICAL RULES:
 * - The callback never blocks: the graph skips a contended block
 * - Outputs silence unless the clock is playing
 */

#pragma once

#include <lumen/core/clock.hpp>
#include <lumen/core/result.hpp>
#include <lumen/engine/audio_graph.hpp>

#include <atomic>
#include <cstdint>
#include <memory>

namespace lumen::engine {

class AudioOutput {
public:
    /// Cursor snaps to the clock beyond this distance
    static constexpr Duration kResyncThreshold = msToUs(50);

    AudioOutput(AudioGraph& graph, const MasterClock& clock);
    ~AudioOutput();

    AudioOutput(const AudioOutput&) = delete;
    AudioOutput& operator=(const AudioOutput&) = delete;

    /// Open the default SDL output device (float32, graph rate and channels), paused
    Result<void> open();
    void close();

    [[nodiscard]] bool isOpen() const { return m_deviceId != 0; }

    void resume();
    void pause();

    /**
     * @brief Produce one block for the device
     *
     * Called by the SDL callback; usable directly without a device.
     */
    void fill(float* out, size_t frames);

    /// Timeline time of the next block (kNoTimestamp when idle)
    [[nodiscard]] Timestamp cursor() const { return m_cursor.load(); }
    [[nodiscard]] uint64_t resyncCount() const { return m_resyncs.load(); }

private:
    static void sdlCallback(void* userdata, uint8_t* stream, int len);

    AudioGraph& m_graph;
    const MasterClock& m_clock;

    uint32_t m_deviceId = 0;
    bool m_ownsSubsystem = false;

    std::atomic<Timestamp> m_cursor{kNoTimestamp};
    std::atomic<uint64_t> m_resyncs{0};
};

} // namespace lumen::engine
