/**
 * @file playback_orchestrator.hpp
 * @brief Playback state machine driving the preview
 *
 * Owns everything a preview session needs (clock, caches, render backend,
 * audio graph) and runs the frame loop on the host FrameScheduler:
 *
 *   clock time -> gap skip / end check -> decode -> resolve -> effects
 *   -> composite -> present -> pace -> next tick
 *
 * Each play() picks one of two pipelines for the whole session:
 * - FastPath: one continuous StreamingSource per active video clip; used
 *   when the visible video is a single run of non-overlapping clips at
 *   normal speed (image lanes and overlays are still composited on top)
 * - Composite: every visual layer fetched from the seek-and-snapshot cache
 *   concurrently, then painted in track order
 *
 * A timeline edit that changes which pipeline applies restarts the session;
 * the pipeline is never switched in place.
 *
 * Threading: every public call and every tick runs on the host thread. The
 * only other thread is the SDL audio callback, which reads the clock and the
 * audio graph.
 */

#pragma once

#include <lumen/core/clock.hpp>
#include <lumen/core/frame_scheduler.hpp>
#include <lumen/core/signals.hpp>
#include <lumen/core/types.hpp>
#include <lumen/engine/audio_graph.hpp>
#include <lumen/engine/audio_output.hpp>
#include <lumen/engine/audio_scheduler.hpp>
#include <lumen/engine/effects_engine.hpp>
#include <lumen/engine/frame_compositor.hpp>
#include <lumen/engine/live_transform_session.hpp>
#include <lumen/engine/overlay_compositor.hpp>
#include <lumen/engine/overlay_rasterizer.hpp>
#include <lumen/engine/preview_settings.hpp>
#include <lumen/engine/render_backend.hpp>
#include <lumen/engine/speed_engine.hpp>
#include <lumen/media/audio_buffer_cache.hpp>
#include <lumen/media/decoder.hpp>
#include <lumen/media/frame_source_cache.hpp>
#include <lumen/media/streaming_source.hpp>
#include <lumen/model/project_store.hpp>

#include <functional>
#include <memory>
#include <string>

namespace lumen::engine {

/// Creates the render backend of a session
using BackendFactory = std::function<std::unique_ptr<RenderBackend>(BackendPreference, Size)>;

/**
 * @brief Collaborators handed to the orchestrator
 *
 * Empty members are filled with the built-in implementations (FFmpeg
 * decoders, clip speed fields, basic effects, FreeType rasterizer,
 * createRenderBackend).
 */
struct PreviewServices {
    std::shared_ptr<media::DecoderFactory> decoders;
    std::shared_ptr<SpeedEngine> speed;
    std::shared_ptr<EffectsEngine> effects;
    std::shared_ptr<OverlayRasterizer> rasterizer;
    BackendFactory backendFactory;
};

struct FastPathDecision {
    bool eligible = false;
    std::string reason;     // why not, when ineligible
};

/**
 * @brief Decide whether playback from start can use the fast path
 *
 * Considers video clips on visible video lanes that end after start. The
 * fast path needs at least one, every one of them at normal speed and
 * forwards, and no two of them overlapping in time (on any lane, which also
 * rules out transitions between them). Image lanes and overlays do not
 * disqualify it.
 */
[[nodiscard]] FastPathDecision evaluateFastPath(const model::Timeline& timeline, Timestamp start,
                                                const SpeedEngine& speed);

class PlaybackOrchestrator {
public:
    PlaybackOrchestrator(model::ProjectStore& store, FrameScheduler& scheduler,
                         PreviewServices services, PreviewSettings settings,
                         TimeSource timeSource = steadyTimeSource());
    ~PlaybackOrchestrator();

    PlaybackOrchestrator(const PlaybackOrchestrator&) = delete;
    PlaybackOrchestrator& operator=(const PlaybackOrchestrator&) = delete;

    /**
     * @brief Create the render backend
     *
     * Called lazily by the first render if the host does not call it.
     * @return Error when no backend, not even the software one, can be made
     */
    Result<void> initialize();

    /// Open the SDL audio device; playback works silently without it
    Result<void> openAudioDevice();

    // ========== Transport ==========

    void play();
    void pause();

    /// Stop and park the playhead at 0
    void stop();

    void togglePlayPause();
    void seek(Timestamp time);
    void seekRelative(Duration delta);

    /// Move by whole frames of the preview frame rate
    void stepFrames(int frames);

    void setPlaybackRate(double rate);
    void setMuted(bool muted);
    [[nodiscard]] bool isMuted() const;

    // ========== Rendering ==========

    /**
     * @brief Composite the timeline at a time and present it
     *
     * The frame is produced on the composite path regardless of state.
     * Errors are logged and returned; nothing is thrown.
     */
    Result<media::BitmapPtr> renderAt(Timestamp time);

    /// Resize the preview canvas
    Result<void> resize(Size canvas);

    // ========== Live Interaction ==========

    /**
     * @brief Start dragging, resizing or cropping an entity
     *
     * Render-on-change from store writes is suspended until end; every
     * update paints the local transform immediately.
     */
    Result<void> beginInteraction(const std::string& id);
    void updateInteraction(const model::Transform& transform);

    /// Final commit and one authoritative render from the store
    Result<void> endInteraction();
    void cancelInteraction();

    [[nodiscard]] bool isInteracting() const { return m_live.active(); }
    [[nodiscard]] LiveTransformSession& liveSession() { return m_live; }

    // ========== Queries ==========

    [[nodiscard]] PlaybackState state() const { return m_state; }
    [[nodiscard]] PlaybackPath path() const { return m_ctx.path; }
    [[nodiscard]] Timestamp currentTime() const { return m_clock.currentTime(); }
    [[nodiscard]] Duration duration() const { return m_clock.duration(); }

    /// Identifies the current playing session; changes on every (re)start
    [[nodiscard]] uint64_t sessionId() const { return m_ctx.session; }

    [[nodiscard]] const PreviewSettings& settings() const { return m_settings; }
    [[nodiscard]] MasterClock& clock() { return m_clock; }
    [[nodiscard]] AudioGraph& audioGraph() { return m_graph; }
    [[nodiscard]] AudioScheduler& audioScheduler() { return m_audioScheduler; }
    [[nodiscard]] AudioOutput& audioOutput() { return m_output; }
    [[nodiscard]] media::FrameSourceCache& frameCache() { return m_frames; }
    [[nodiscard]] media::AudioBufferCache& audioBuffers() { return m_audioBuffers; }
    [[nodiscard]] RenderBackend* backend() { return m_backend.get(); }
    [[nodiscard]] const CompositeStats& lastStats() const { return m_compositor.lastStats(); }

    [[nodiscard]] bool usingSoftwareFallback() const { return m_softwareFallback; }
    [[nodiscard]] uint64_t framesPresented() const { return m_framesPresented; }
    [[nodiscard]] uint64_t frameErrors() const { return m_frameErrors; }
    [[nodiscard]] uint64_t gapSkips() const { return m_gapSkips; }
    [[nodiscard]] uint64_t deviceRecoveries() const { return m_deviceRecoveries; }

    // ========== Signals ==========

    Signal<Timestamp> playheadChanged;
    Signal<PlaybackState> stateChanged;
    Signal<media::BitmapPtr, Timestamp> framePresented;

private:
    /**
     * @brief Mutable state of one playing session
     *
     * Reset by teardown; the tick reads and writes nothing else that lives
     * only for a session.
     */
    struct FrameContext {
        uint64_t session = 0;
        PlaybackPath path = PlaybackPath::None;
        bool fastPathAllowed = true;
        TaskId tickTask = kInvalidTask;
        std::unique_ptr<media::StreamingSource> streaming;
        Timestamp lastPresented = kNoTimestamp;
    };

    static PreviewServices withDefaults(PreviewServices services, const PreviewSettings& settings);

    /// False if nothing could be started
    bool startSession(bool allowFastPath);
    void restartSession(bool allowFastPath);
    void teardownSession();
    void finishPlayback(const char* reason);
    void setState(PlaybackState state);

    void scheduleTick(Duration delay);
    void tick(uint64_t session);

    /// Frame of the fast path; false if the session must fall back to compositing
    bool fastPathFrame(const model::Timeline& timeline, Timestamp time, media::BitmapPtr& streamed,
                       const model::MediaClip*& streamedClip);

    /// Compose and present one frame; per-frame failures never escape
    Result<media::BitmapPtr> composeAndPresent(const model::Timeline& timeline, Timestamp time,
                                               const ComposeOptions& options);
    Result<media::BitmapPtr> composeWithRecovery(const model::Timeline& timeline, Timestamp time,
                                                 const ComposeOptions& options);
    void recoverDevice();
    void attachBackend(std::unique_ptr<RenderBackend> backend);

    ComposeOptions baseOptions() const;

    /// Coalesced one-shot render of the parked playhead
    void requestRender();
    void syncDuration(const model::Timeline& timeline);
    void onStoreChanged();

    model::ProjectStore& m_store;
    FrameScheduler& m_scheduler;
    PreviewServices m_services;
    PreviewSettings m_settings;

    MasterClock m_clock;
    media::FrameSourceCache m_frames;
    OverlayCompositor m_overlays;
    FrameCompositor m_compositor;
    std::unique_ptr<RenderBackend> m_backend;
    bool m_softwareFallback = false;
    bool m_deviceLostPending = false;

    media::AudioBufferCache m_audioBuffers;
    AudioGraph m_graph;
    AudioScheduleBuilder m_audioBuilder;
    AudioScheduler m_audioScheduler;
    AudioOutput m_output;

    LiveTransformSession m_live;

    PlaybackState m_state = PlaybackState::Stopped;
    FrameContext m_ctx;
    uint64_t m_nextSession = 1;
    TaskId m_renderTask = kInvalidTask;

    uint64_t m_framesPresented = 0;
    uint64_t m_frameErrors = 0;
    uint64_t m_gapSkips = 0;
    uint64_t m_deviceRecoveries = 0;

    ScopedConnection m_storeConnection;
    ScopedConnection m_clockConnection;
    ScopedConnection m_deviceConnection;
};

} // namespace lumen::engine
