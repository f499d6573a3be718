/**
 * @file playback_orchestrator.cpp
 * @brief Playback state machine and frame loop
 */

#include <lumen/engine/playback_orchestrator.hpp>

#include <lumen/core/logger.hpp>
#include <lumen/engine/software_backend.hpp>
#include <lumen/media/ffmpeg_decoder_factory.hpp>

#include <algorithm>
#include <cmath>
#include <exception>

namespace lumen::engine {

// ============================================================================
// Fast path eligibility
// ============================================================================

FastPathDecision evaluateFastPath(const model::Timeline& timeline, Timestamp start,
                                  const SpeedEngine& speed) {
    std::vector<const model::MediaClip*> videos;

    for (const auto& track : timeline.tracks) {
        if (track.hidden || track.type != model::TrackType::Video) {
            continue;
        }
        for (const auto& clip : track.clips) {
            if (clip.kind != model::ClipKind::Video || clip.endTime() <= start) {
                continue;
            }
            if (!isIdentityTimeMapping(speed, clip)) {
                return {false, "clip " + clip.id + " is speed-adjusted or reversed"};
            }
            videos.push_back(&clip);
        }
    }

    if (videos.empty()) {
        return {false, "no video ahead of the playhead"};
    }

    std::sort(videos.begin(), videos.end(),
              [](const auto* a, const auto* b) { return a->startTime < b->startTime; });

    const model::MediaClip* latest = videos.front();
    for (size_t i = 1; i < videos.size(); ++i) {
        if (videos[i]->startTime < latest->endTime()) {
            return {false, "clips " + latest->id + " and " + videos[i]->id + " overlap"};
        }
        if (videos[i]->endTime() > latest->endTime()) {
            latest = videos[i];
        }
    }
    return {true, {}};
}

// ============================================================================
// Construction
// ============================================================================

PreviewServices PlaybackOrchestrator::withDefaults(PreviewServices services,
                                                   const PreviewSettings& settings) {
    if (!services.decoders) {
        services.decoders = std::make_shared<media::FFmpegDecoderFactory>(settings.decodeLimits);
    }
    if (!services.speed) {
        services.speed = std::make_shared<ClipSpeedEngine>();
    }
    if (!services.effects) {
        services.effects = std::make_shared<BasicEffectsEngine>();
    }
    if (!services.rasterizer) {
        services.rasterizer = std::make_shared<BasicOverlayRasterizer>(services.decoders, settings.fontFile);
    }
    if (!services.backendFactory) {
        services.backendFactory = [](BackendPreference preference, Size size) {
            return createRenderBackend(preference, size);
        };
    }
    return services;
}

PlaybackOrchestrator::PlaybackOrchestrator(model::ProjectStore& store, FrameScheduler& scheduler,
                                           PreviewServices services, PreviewSettings settings,
                                           TimeSource timeSource)
    : m_store(store)
    , m_scheduler(scheduler)
    , m_services(withDefaults(std::move(services), settings))
    , m_settings(std::move(settings))
    , m_clock(std::move(timeSource))
    , m_frames(m_services.decoders, store, m_settings.videoDecoders)
    , m_overlays(m_services.rasterizer)
    , m_compositor(m_frames, *m_services.speed, m_services.effects, m_overlays)
    , m_audioBuffers(m_services.decoders, m_settings.sampleRate, m_settings.channels)
    , m_graph(m_settings.sampleRate, m_settings.channels)
    , m_audioBuilder(store, m_audioBuffers, *m_services.speed, m_settings.audio.linkedClipTolerance)
    , m_audioScheduler(m_graph, scheduler, m_clock, m_settings.audio)
    , m_output(m_graph, m_clock)
    , m_live(store, scheduler, m_settings.commitInterval) {
    m_clock.setFrameRate(m_settings.frameRate);
    m_graph.setMasterVolume(m_settings.masterVolume);
    syncDuration(*m_store.getProjectTimeline());

    m_storeConnection = m_store.changed.connectScoped([this] { onStoreChanged(); });
    m_clockConnection = m_clock.timeChanged.connectScoped([this](Timestamp) {
        if (m_state != PlaybackState::Playing) {
            requestRender();
        }
    });
}

PlaybackOrchestrator::~PlaybackOrchestrator() {
    if (m_renderTask != kInvalidTask) {
        m_scheduler.cancel(m_renderTask);
        m_renderTask = kInvalidTask;
    }
    m_live.cancel();
    teardownSession();
    m_output.close();
}

Result<void> PlaybackOrchestrator::initialize() {
    if (m_backend) {
        return Ok();
    }
    auto backend = m_services.backendFactory(m_settings.backend, m_settings.canvas);
    if (!backend) {
        return Err(ErrorCode::RenderError, "no render backend could be created");
    }
    LUMEN_LOG_INFO("Preview {}x{} on the {} backend", m_settings.canvas.width,
                   m_settings.canvas.height, backend->name());
    m_softwareFallback = false;
    attachBackend(std::move(backend));
    return Ok();
}

Result<void> PlaybackOrchestrator::openAudioDevice() {
    auto opened = m_output.open();
    if (!opened) {
        LUMEN_LOG_WARN("Audio output unavailable, playing silently: {}", opened.error().what());
        return opened;
    }
    if (m_state == PlaybackState::Playing) {
        m_output.resume();
    }
    return Ok();
}

void PlaybackOrchestrator::attachBackend(std::unique_ptr<RenderBackend> backend) {
    m_deviceConnection = backend->deviceLost.connectScoped([this] { m_deviceLostPending = true; });
    m_backend = std::move(backend);
    m_deviceLostPending = false;
}

// ============================================================================
// Transport
// ============================================================================

void PlaybackOrchestrator::play() {
    if (m_state == PlaybackState::Playing) {
        return;
    }
    if (!startSession(true)) {
        LUMEN_LOG_DEBUG("Play request ignored");
    }
}

void PlaybackOrchestrator::pause() {
    if (m_state != PlaybackState::Playing) {
        return;
    }
    teardownSession();
    m_clock.pause();
    setState(PlaybackState::Paused);
    playheadChanged.fire(m_clock.currentTime());
    requestRender();
}

void PlaybackOrchestrator::stop() {
    if (m_state == PlaybackState::Playing) {
        setState(PlaybackState::TransitioningToStop);
    }
    teardownSession();
    m_clock.stop();
    setState(PlaybackState::Stopped);
    playheadChanged.fire(0);
    requestRender();
}

void PlaybackOrchestrator::togglePlayPause() {
    if (m_state == PlaybackState::Playing) {
        pause();
    } else {
        play();
    }
}

void PlaybackOrchestrator::seek(Timestamp time) {
    syncDuration(*m_store.getProjectTimeline());
    m_clock.seek(time);

    const Timestamp target = m_clock.currentTime();
    if (m_state == PlaybackState::Playing) {
        m_audioScheduler.seekTo(target);
    }
    playheadChanged.fire(target);
}

void PlaybackOrchestrator::seekRelative(Duration delta) {
    seek(m_clock.currentTime() + delta);
}

void PlaybackOrchestrator::stepFrames(int frames) {
    pause();
    seekRelative(static_cast<Duration>(frames) * m_settings.frameDuration());
}

void PlaybackOrchestrator::setPlaybackRate(double rate) {
    m_clock.setPlaybackRate(rate);
    LUMEN_LOG_DEBUG("Playback rate {:.2f}", m_clock.playbackRate());
}

void PlaybackOrchestrator::setMuted(bool muted) {
    m_graph.setMuted(muted);
    LUMEN_LOG_DEBUG("Preview audio {}", muted ? "muted" : "unmuted");
}

bool PlaybackOrchestrator::isMuted() const {
    return m_graph.isMuted();
}

// ============================================================================
// Session
// ============================================================================

void PlaybackOrchestrator::setState(PlaybackState state) {
    if (m_state == state) {
        return;
    }
    LUMEN_LOG_DEBUG("Playback {} -> {}", playbackStateToString(m_state), playbackStateToString(state));
    m_state = state;
    stateChanged.fire(state);
}

bool PlaybackOrchestrator::startSession(bool allowFastPath) {
    model::TimelinePtr timeline = m_store.getProjectTimeline();
    syncDuration(*timeline);

    if (timeline->duration <= 0) {
        LUMEN_LOG_INFO("Nothing to play: the timeline is empty");
        return false;
    }
    if (auto ready = initialize(); !ready) {
        LUMEN_LOG_ERROR("Cannot start playback: {}", ready.error().what());
        return false;
    }

    Timestamp start = m_clock.currentTime();
    if (start >= timeline->duration) {
        m_clock.seek(0);
        start = 0;
    }

    const FastPathDecision decision = evaluateFastPath(*timeline, start, *m_services.speed);

    m_ctx.session = m_nextSession++;
    m_ctx.fastPathAllowed = allowFastPath;
    m_ctx.path = allowFastPath && decision.eligible ? PlaybackPath::FastPath : PlaybackPath::Composite;
    m_ctx.lastPresented = kNoTimestamp;

    if (m_ctx.path == PlaybackPath::FastPath) {
        LUMEN_LOG_INFO("Playback session {} from {:.3f}s on the fast path", m_ctx.session,
                       usToSeconds(start));
    } else {
        LUMEN_LOG_INFO("Playback session {} from {:.3f}s on the composite path ({})", m_ctx.session,
                       usToSeconds(start),
                       allowFastPath ? decision.reason : std::string("fast path disabled"));
    }

    m_audioBuilder.configureBuses(m_graph, *timeline);
    m_clock.play();
    m_audioScheduler.startScheduler([this](Timestamp from, Timestamp to) {
        model::TimelinePtr current = m_store.getProjectTimeline();
        return m_audioBuilder.build(*current, from, to);
    });
    m_output.resume();

    setState(PlaybackState::Playing);
    scheduleTick(0);
    return true;
}

void PlaybackOrchestrator::restartSession(bool allowFastPath) {
    LUMEN_LOG_INFO("Restarting playback session {}", m_ctx.session);
    teardownSession();
    m_clock.pause();
    if (!startSession(allowFastPath)) {
        stop();
    }
}

void PlaybackOrchestrator::teardownSession() {
    if (m_ctx.tickTask != kInvalidTask) {
        m_scheduler.cancel(m_ctx.tickTask);
        m_ctx.tickTask = kInvalidTask;
    }

    m_audioScheduler.stopScheduler();
    m_audioScheduler.stopAllClips();
    m_output.pause();

    m_ctx.streaming.reset();
    m_ctx.path = PlaybackPath::None;
    m_ctx.lastPresented = kNoTimestamp;

    // Images and decoded audio stay cached for the next session
    m_frames.releaseVideoDecoders();
}

void PlaybackOrchestrator::finishPlayback(const char* reason) {
    LUMEN_LOG_INFO("Playback finished: {}", reason);
    stop();
}

// ============================================================================
// Frame Loop
// ============================================================================

void PlaybackOrchestrator::scheduleTick(Duration delay) {
    const uint64_t session = m_ctx.session;
    m_ctx.tickTask = m_scheduler.schedule(delay, [this, session] { tick(session); });
}

void PlaybackOrchestrator::tick(uint64_t session) {
    if (session != m_ctx.session || m_state != PlaybackState::Playing) {
        return;
    }
    m_ctx.tickTask = kInvalidTask;

    const int64_t tickStart = m_scheduler.now();
    model::TimelinePtr timeline = m_store.getProjectTimeline();
    syncDuration(*timeline);

    Timestamp time = m_clock.currentTime();
    if (time >= timeline->duration || !m_clock.isPlaying()) {
        finishPlayback("reached the end of the timeline");
        return;
    }

    if (!timeline->hasContentAt(time)) {
        auto next = timeline->nextContentStart(time);
        if (!next || *next >= timeline->duration) {
            finishPlayback("no content after the playhead");
            return;
        }
        LUMEN_LOG_DEBUG("Skipping gap {:.3f}s -> {:.3f}s", usToSeconds(time), usToSeconds(*next));
        ++m_gapSkips;
        m_clock.seek(*next);
        m_audioScheduler.seekTo(*next);
        time = *next;
    }

    ComposeOptions options = baseOptions();
    media::BitmapPtr streamed;
    const model::MediaClip* streamedClip = nullptr;

    if (m_ctx.path == PlaybackPath::FastPath) {
        if (!fastPathFrame(*timeline, time, streamed, streamedClip)) {
            LUMEN_LOG_WARN("Fast path failed; continuing on the composite path");
            restartSession(false);
            return;
        }
        options.concurrentFetch = false;
        options.provider = [this, &streamed, streamedClip](const LayerRequest& request, Size canvas) {
            if (streamedClip && request.clip->id == streamedClip->id) {
                return streamed;
            }
            return m_frames.getFrame(*request.clip, request.mediaTime, canvas);
        };
    }

    auto frame = composeAndPresent(*timeline, time, options);
    if (!frame && frame.error().code() != ErrorCode::Unknown) {
        LUMEN_LOG_ERROR("Render pipeline failed, pausing playback: {}", frame.error().what());
        pause();
        return;
    }
    if (frame) {
        m_clock.reportVideoTime(time);
        m_ctx.lastPresented = time;
    }
    playheadChanged.fire(time);

    // A slot may have paused or restarted playback
    if (session != m_ctx.session || m_state != PlaybackState::Playing) {
        return;
    }

    const auto tickInterval = static_cast<Duration>(std::llround(
        static_cast<double>(m_clock.frameDuration()) / m_clock.playbackRate()));
    const Duration spent = m_scheduler.now() - tickStart;
    scheduleTick(std::max<Duration>(0, tickInterval - spent));
}

bool PlaybackOrchestrator::fastPathFrame(const model::Timeline& timeline, Timestamp time,
                                         media::BitmapPtr& streamed,
                                         const model::MediaClip*& streamedClip) {
    const model::MediaClip* active = nullptr;
    for (const auto& track : timeline.tracks) {
        if (track.hidden || track.type != model::TrackType::Video) {
            continue;
        }
        for (const auto& clip : track.clips) {
            if (clip.kind == model::ClipKind::Video && clip.containsTime(time)) {
                active = &clip;
                break;
            }
        }
        if (active) {
            break;
        }
    }

    if (!active) {
        if (m_ctx.streaming) {
            LUMEN_LOG_DEBUG("Streaming source for {} released", m_ctx.streaming->clipId());
            m_ctx.streaming.reset();
        }
        return true;
    }

    if (!m_ctx.streaming || m_ctx.streaming->clipId() != active->id) {
        m_ctx.streaming.reset();

        auto item = m_store.getMediaItem(active->mediaId);
        if (!item) {
            LUMEN_LOG_WARN("Fast path: media {} of clip {} not found", active->mediaId, active->id);
            return false;
        }
        auto opened = media::StreamingSource::open(*m_services.decoders, active->id, *item,
                                                   m_settings.streamingDrift);
        if (!opened) {
            LUMEN_LOG_WARN("Fast path: cannot stream clip {}: {}", active->id, opened.error().what());
            return false;
        }
        m_ctx.streaming = std::move(opened).value();
        LUMEN_LOG_DEBUG("Streaming clip {}", active->id);
    }

    auto sampled = m_ctx.streaming->sample(m_compositor.mediaTimeFor(*active, time), m_settings.canvas);
    if (!sampled) {
        if (m_ctx.streaming->failed()) {
            LUMEN_LOG_WARN("Fast path: streaming clip {} keeps failing: {}", active->id,
                           sampled.error().what());
            return false;
        }
        LUMEN_LOG_DEBUG("Fast path: no frame for {} this tick: {}", active->id, sampled.error().what());
        return true;
    }

    streamed = std::move(sampled).value().bitmap;
    streamedClip = active;
    return true;
}

// ============================================================================
// Rendering
// ============================================================================

ComposeOptions PlaybackOrchestrator::baseOptions() const {
    ComposeOptions options;
    options.canvas = m_settings.canvas;
    options.background = m_settings.background;
    options.live = m_live.current();
    return options;
}

Result<media::BitmapPtr> PlaybackOrchestrator::renderAt(Timestamp time) {
    if (auto ready = initialize(); !ready) {
        return Err<media::BitmapPtr>(ready.error());
    }
    model::TimelinePtr timeline = m_store.getProjectTimeline();
    syncDuration(*timeline);

    const Timestamp clamped = std::clamp<Timestamp>(time, 0, std::max<Duration>(0, timeline->duration));
    auto frame = composeAndPresent(*timeline, clamped, baseOptions());
    if (!frame) {
        LUMEN_LOG_WARN("Preview frame at {:.3f}s not rendered: {}", usToSeconds(clamped),
                       frame.error().what());
    }
    return frame;
}

Result<media::BitmapPtr> PlaybackOrchestrator::composeAndPresent(const model::Timeline& timeline,
                                                                 Timestamp time,
                                                                 const ComposeOptions& options) {
    Result<media::BitmapPtr> frame = Err<media::BitmapPtr>(ErrorCode::Unknown, "no frame");
    try {
        frame = composeWithRecovery(timeline, time, options);
    } catch (const std::exception& e) {
        // Unknown marks a per-frame failure: no frame this tick, the loop goes on
        ++m_frameErrors;
        LUMEN_LOG_WARN("Frame at {:.3f}s failed: {}", usToSeconds(time), e.what());
        return Err<media::BitmapPtr>(ErrorCode::Unknown, e.what());
    }

    if (!frame) {
        ++m_frameErrors;
        return frame;
    }

    media::BitmapPtr bitmap = frame.value();
    ++m_framesPresented;
    framePresented.fire(bitmap, time);
    return Ok(std::move(bitmap));
}

Result<media::BitmapPtr> PlaybackOrchestrator::composeWithRecovery(const model::Timeline& timeline,
                                                                   Timestamp time,
                                                                   const ComposeOptions& options) {
    if (m_deviceLostPending || m_backend->isDeviceLost()) {
        recoverDevice();
    }

    auto frame = m_compositor.compose(*m_backend, timeline, time, options);
    if (!frame && frame.error().code() == ErrorCode::DeviceLost) {
        recoverDevice();
        frame = m_compositor.compose(*m_backend, timeline, time, options);
    }
    return frame;
}

void PlaybackOrchestrator::recoverDevice() {
    m_deviceLostPending = false;
    if (!m_backend->isDeviceLost()) {
        return;
    }

    LUMEN_LOG_WARN("Render device lost on the {} backend, recreating it", m_backend->name());
    if (m_backend->recreateDevice()) {
        ++m_deviceRecoveries;
        LUMEN_LOG_WARN("Render device recovered");
        return;
    }

    LUMEN_LOG_WARN("Render device recovery failed; using the software backend from now on");
    attachBackend(std::make_unique<SoftwareBackend>(m_settings.canvas));
    m_softwareFallback = true;
}

Result<void> PlaybackOrchestrator::resize(Size canvas) {
    if (canvas.isEmpty()) {
        return Err(ErrorCode::InvalidArgument, "empty preview size");
    }
    m_settings.canvas = canvas;
    if (m_backend) {
        if (auto resized = m_backend->resize(canvas); !resized) {
            return resized;
        }
    }
    requestRender();
    return Ok();
}

void PlaybackOrchestrator::requestRender() {
    if (m_renderTask != kInvalidTask) {
        return;
    }
    m_renderTask = m_scheduler.schedule(0, [this] {
        m_renderTask = kInvalidTask;
        // Playing sessions present from the tick; interactions paint directly
        if (m_state == PlaybackState::Playing || m_live.active()) {
            return;
        }
        if (auto frame = renderAt(m_clock.currentTime()); frame) {
            m_clock.reportVideoTime(m_clock.currentTime());
        }
    });
}

void PlaybackOrchestrator::syncDuration(const model::Timeline& timeline) {
    if (m_clock.duration() != timeline.duration) {
        m_clock.setDuration(timeline.duration);
    }
}

void PlaybackOrchestrator::onStoreChanged() {
    if (m_live.active()) {
        return;
    }

    if (m_state != PlaybackState::Playing) {
        requestRender();
        return;
    }

    model::TimelinePtr timeline = m_store.getProjectTimeline();
    m_audioBuilder.configureBuses(m_graph, *timeline);

    const FastPathDecision decision = evaluateFastPath(*timeline, m_clock.currentTime(), *m_services.speed);
    const bool wantFastPath = decision.eligible && m_ctx.fastPathAllowed;
    if (wantFastPath != (m_ctx.path == PlaybackPath::FastPath)) {
        LUMEN_LOG_INFO("Timeline edit changes the playback path{}{}",
                       decision.reason.empty() ? "" : ": ", decision.reason);
        restartSession(m_ctx.fastPathAllowed);
        return;
    }
    m_audioScheduler.refresh(m_clock.currentTime());
}

// ============================================================================
// Live Interaction
// ============================================================================

Result<void> PlaybackOrchestrator::beginInteraction(const std::string& id) {
    model::TimelinePtr timeline = m_store.getProjectTimeline();

    if (const model::MediaClip* clip = timeline->findClip(id)) {
        auto target = liveTargetForKind(clip->kind);
        if (!target) {
            return Err(ErrorCode::InvalidArgument,
                       "clip " + id + " has no transform to edit");
        }
        return m_live.begin(id, *target, clip->transform);
    }

    if (const model::OverlayItem* item = timeline->findOverlay(id)) {
        auto target = liveTargetForKind(model::overlayKind(*item));
        if (!target) {
            return Err(ErrorCode::InvalidArgument, "overlay " + id + " cannot be edited live");
        }
        return m_live.begin(id, *target, model::overlayBase(*item).transform);
    }

    return Err(ErrorCode::NotFound, "no clip or overlay " + id);
}

void PlaybackOrchestrator::updateInteraction(const model::Transform& transform) {
    if (!m_live.active()) {
        return;
    }
    m_live.update(transform);

    // While playing, the next tick picks up the live transform
    if (m_state != PlaybackState::Playing) {
        if (auto frame = renderAt(m_clock.currentTime()); !frame) {
            LUMEN_LOG_DEBUG("Live preview frame skipped");
        }
    }
}

Result<void> PlaybackOrchestrator::endInteraction() {
    if (!m_live.active()) {
        return Ok();
    }
    auto committed = m_live.end();
    if (!committed) {
        LUMEN_LOG_WARN("Final transform commit failed: {}", committed.error().what());
    }

    if (m_state != PlaybackState::Playing) {
        if (auto frame = renderAt(m_clock.currentTime()); !frame) {
            LUMEN_LOG_DEBUG("Final interaction frame skipped");
        }
    }
    return committed;
}

void PlaybackOrchestrator::cancelInteraction() {
    if (!m_live.active()) {
        return;
    }
    m_live.cancel();
    requestRender();
}

} // namespace lumen::engine
