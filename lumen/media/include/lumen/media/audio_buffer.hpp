/**
 * @file audio_buffer.hpp
 * @brief Fully decoded PCM for one media item
 */

#pragma once

#include <lumen/core/types.hpp>

#include <memory>
#include <vector>

namespace lumen::media {

/**
 * @brief Interleaved float PCM at the graph's sample rate
 *
 * Immutable once decoded; shared between every clip that references the
 * same media.
 */
struct AudioBuffer {
    int sampleRate = 48000;
    int channels = 2;
    std::vector<float> samples;   // interleaved

    [[nodiscard]] size_t frameCount() const {
        return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
    }

    [[nodiscard]] Duration duration() const {
        return sampleRate > 0
            ? static_cast<Duration>(frameCount()) * kTimeBaseUs / sampleRate
            : 0;
    }

    /// Sample of one channel at a frame index; 0 outside the buffer
    [[nodiscard]] float sample(int64_t frame, int channel) const {
        if (frame < 0 || static_cast<size_t>(frame) >= frameCount() || channel >= channels) {
            return 0.0f;
        }
        return samples[static_cast<size_t>(frame) * static_cast<size_t>(channels)
                       + static_cast<size_t>(channel)];
    }
};

using AudioBufferPtr = std::shared_ptr<const AudioBuffer>;

} // namespace lumen::media
