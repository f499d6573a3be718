/**
 * @file types.hpp
 * @brief Core type definitions for Lumen
 *
 * All internal timestamps use int64_t microseconds so that long timelines
 * scrub to the same frame every time. Project data arrives in seconds and
 * is converted once at the model boundary.
 */

#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <string>

namespace lumen {

// ============================================================================
// Time Types - ALL timestamps are microseconds (int64_t)
// ============================================================================

/// Timestamp in microseconds since timeline (or media) start
using Timestamp = int64_t;

/// Duration in microseconds
using Duration = int64_t;

/// Time base constant: 1 second = 1,000,000 microseconds
constexpr Timestamp kTimeBaseUs = 1'000'000;

/// Invalid timestamp sentinel
constexpr Timestamp kNoTimestamp = INT64_MIN;

using Microseconds = std::chrono::microseconds;
using Milliseconds = std::chrono::milliseconds;

/// High-resolution clock
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

inline Timestamp secondsToUs(double seconds) {
    return static_cast<Timestamp>(std::llround(seconds * static_cast<double>(kTimeBaseUs)));
}

inline double usToSeconds(Timestamp us) {
    return static_cast<double>(us) / static_cast<double>(kTimeBaseUs);
}

constexpr Duration msToUs(int64_t ms) { return ms * 1000; }

// ============================================================================
// Geometry
// ============================================================================

struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Vec2&) const = default;
};

struct Size {
    int width = 0;
    int height = 0;

    [[nodiscard]] bool isEmpty() const { return width <= 0 || height <= 0; }
    bool operator==(const Size&) const = default;
};

/// Normalized or pixel rectangle depending on context
struct Rect {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    bool operator==(const Rect&) const = default;
};

/// Straight (non-premultiplied) 8-bit RGBA colour
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    static constexpr Color black() { return {0, 0, 0, 255}; }
    static constexpr Color white() { return {255, 255, 255, 255}; }
    static constexpr Color transparent() { return {0, 0, 0, 0}; }

    /// Parse "#rrggbb" / "#rrggbbaa"; returns black on malformed input
    static Color fromHex(const std::string& hex);

    bool operator==(const Color&) const = default;
};

// ============================================================================
// Media Types
// ============================================================================

enum class MediaType {
    Unknown = 0,
    Video,
    Audio,
    Image,
};

/// Sample format for decoded audio
enum class SampleFormat {
    Unknown = 0,
    S16,
    Float,      // 32-bit float interleaved (graph format)
    FloatP,
};

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    Ok = 0,

    // General errors
    Unknown,
    InvalidArgument,
    NotFound,
    NotSupported,
    OutOfMemory,
    Cancelled,

    // I/O errors
    FileNotFound,
    FileOpenFailed,
    ReadError,
    EndOfFile,

    // Codec errors
    CodecNotFound,
    CodecOpenFailed,
    DecoderError,
    InvalidData,

    // Pipeline errors
    Timeout,
    Terminated,

    // Render errors
    RenderError,
    WindowCreationFailed,
    TextureCreationFailed,

    // Device errors
    DeviceError,
    DeviceLost,
    AudioDeviceError,
};

/// Convert ErrorCode to string
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::OutOfMemory: return "Out of memory";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileOpenFailed: return "File open failed";
        case ErrorCode::ReadError: return "Read error";
        case ErrorCode::EndOfFile: return "End of file";
        case ErrorCode::CodecNotFound: return "Codec not found";
        case ErrorCode::CodecOpenFailed: return "Codec open failed";
        case ErrorCode::DecoderError: return "Decoder error";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Terminated: return "Terminated";
        case ErrorCode::RenderError: return "Render error";
        case ErrorCode::WindowCreationFailed: return "Window creation failed";
        case ErrorCode::TextureCreationFailed: return "Texture creation failed";
        case ErrorCode::DeviceError: return "Device error";
        case ErrorCode::DeviceLost: return "Device lost";
        case ErrorCode::AudioDeviceError: return "Audio device error";
        default: return "Unknown error code";
    }
}

// ============================================================================
// Playback State
// ============================================================================

enum class PlaybackState {
    Stopped,              // No session, playhead parked
    Paused,               // One frame per external time change
    Playing,              // Frame loop running
    TransitioningToStop,  // Teardown in progress
};

inline const char* playbackStateToString(PlaybackState state) {
    switch (state) {
        case PlaybackState::Stopped: return "Stopped";
        case PlaybackState::Paused: return "Paused";
        case PlaybackState::Playing: return "Playing";
        case PlaybackState::TransitioningToStop: return "TransitioningToStop";
        default: return "Unknown";
    }
}

/// Which per-frame pipeline a playing session uses
enum class PlaybackPath {
    None,
    FastPath,     // Single continuous decode, no per-frame compositing
    Composite,    // General multi-track compositing
};

inline const char* playbackPathToString(PlaybackPath path) {
    switch (path) {
        case PlaybackPath::None: return "None";
        case PlaybackPath::FastPath: return "FastPath";
        case PlaybackPath::Composite: return "Composite";
        default: return "Unknown";
    }
}

// ============================================================================
// Utility Constants
// ============================================================================

/// Default number of open video decode handles
constexpr size_t kDefaultVideoDecoderCapacity = 8;

/// Drift that forces a corrective seek on the streaming decoder
constexpr Duration kStreamingDriftThreshold = 100'000;   // 100ms

/// Maximum consecutive decode errors before a source is evicted
constexpr int kMaxConsecutiveDecoderErrors = 3;

/// Maximum decode loop iterations (safety limit)
constexpr int kMaxDecodeLoopIterations = 600;

} // namespace lumen
