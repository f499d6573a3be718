/**
 * @file decoder.cpp
 * @brief Seek decision shared by every video decoder
 */

#include <lumen/media/decoder.hpp>

namespace lumen::media {

SeekAction decideSeek(Timestamp position, Timestamp target, Duration frameDuration,
                      const DecodeLimits& limits) {
    if (position == kNoTimestamp) {
        return SeekAction::Seek;
    }

    Duration delta = target - position;

    // Within the frame currently shown, or a small step backwards
    if ((delta >= 0 && delta < frameDuration) || (delta < 0 && -delta <= limits.seekEpsilon)) {
        return SeekAction::Reuse;
    }
    if (delta < 0 || delta > limits.maxForwardDecode) {
        return SeekAction::Seek;
    }
    return SeekAction::DecodeForward;
}

} // namespace lumen::media
