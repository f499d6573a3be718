/**
 * @file orchestrator_test.cpp
 * @brief Playback sessions end to end on fake decoders and a manual clock
 */

#include "test_support.hpp"

#include <lumen/engine/effects_engine.hpp>
#include <lumen/engine/playback_orchestrator.hpp>
#include <lumen/engine/software_backend.hpp>

#include <gtest/gtest.h>

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lumen::engine {
namespace {

using model::ClipKind;
using model::TrackType;
using test::kTestCanvas;

/// Software canvas whose device can be lost on demand
class FlakyBackend : public SoftwareBackend {
public:
    FlakyBackend(Size size, bool recoverable) : SoftwareBackend(size), m_recoverable(recoverable) {}

    [[nodiscard]] const char* name() const override { return "flaky"; }

    Result<void> beginFrame(Color background) override {
        if (m_lost) {
            return Err(ErrorCode::DeviceLost, "device lost");
        }
        return SoftwareBackend::beginFrame(background);
    }

    bool recreateDevice() override {
        ++recreateAttempts;
        if (m_recoverable) {
            m_lost = false;
        }
        return !m_lost;
    }

    [[nodiscard]] bool isDeviceLost() const override { return m_lost; }

    void loseDevice() {
        m_lost = true;
        deviceLost.fire();
    }

    int recreateAttempts = 0;

private:
    bool m_recoverable;
    bool m_lost = false;
};

/// Software canvas whose first frames throw before anything is drawn
class ThrowingBackend : public SoftwareBackend {
public:
    ThrowingBackend(Size size, int throws) : SoftwareBackend(size), m_throws(throws) {}

    Result<void> beginFrame(Color background) override {
        if (m_throws > 0) {
            --m_throws;
            throw std::runtime_error("frame setup exploded");
        }
        return SoftwareBackend::beginFrame(background);
    }

private:
    int m_throws;
};

/// Opens "cursed" media by throwing instead of reporting an error
class ThrowingDecoderFactory : public test::FakeDecoderFactory {
public:
    Result<std::unique_ptr<media::VideoDecoder>> openVideo(const model::MediaItem& item) override {
        if (item.id == "cursed") {
            throw std::runtime_error("demuxer exploded");
        }
        return FakeDecoderFactory::openVideo(item);
    }
};

/// Throws for the text "boom"
class ThrowingRasterizer : public test::FakeRasterizer {
public:
    media::BitmapPtr renderText(const model::TextClip& text, Size canvas) override {
        if (text.text == "boom") {
            throw std::runtime_error("glyph cache exploded");
        }
        return FakeRasterizer::renderText(text, canvas);
    }
};

/// Throws for every clip that carries effects
class ThrowingEffects : public EffectsEngine {
public:
    media::BitmapPtr applyEffectsToFrame(const model::MediaClip&, const media::BitmapPtr&) override {
        throw std::runtime_error("shader exploded");
    }
};

class PlaybackOrchestratorTest : public ::testing::Test {
protected:
    PlaybackOrchestratorTest() : queue(time.source()) {
        store.addMediaItem(test::mediaItem("red", MediaType::Video));
        store.addMediaItem(test::mediaItem("blue", MediaType::Video));
        store.addMediaItem(test::mediaItem("still", MediaType::Image));
        factory->setColor("red", Color{255, 0, 0});
        factory->setColor("blue", Color{0, 0, 255});
        factory->setColor("still", Color{0, 255, 0});

        settings.canvas = kTestCanvas;
        settings.frameRate = 25.0;
        settings.backend = BackendPreference::Software;
    }

    void setTimeline(std::vector<model::Track> tracks, Duration duration) {
        model::Timeline timeline;
        timeline.tracks = std::move(tracks);
        timeline.duration = duration;
        store.setTimeline(std::move(timeline));
    }

    PreviewServices services() {
        PreviewServices s;
        s.decoders = factory;
        s.rasterizer = rasterizer;
        s.effects = effects;
        s.backendFactory = [this](BackendPreference, Size size) -> std::unique_ptr<RenderBackend> {
            if (customBackend) {
                return customBackend(size);
            }
            if (flakyMode) {
                auto flaky = std::make_unique<FlakyBackend>(size, *flakyMode);
                flakyBackend = flaky.get();
                return flaky;
            }
            return std::make_unique<SoftwareBackend>(size);
        };
        return s;
    }

    PlaybackOrchestrator& orchestrator() {
        if (!m_orchestrator) {
            m_orchestrator = std::make_unique<PlaybackOrchestrator>(store, queue, services(), settings,
                                                                    time.source());
            m_presented = m_orchestrator->framePresented.connectScoped(
                [this](media::BitmapPtr frame, Timestamp) { lastFrame = std::move(frame); });
        }
        return *m_orchestrator;
    }

    void run(Duration total) { test::pump(time, queue, total); }

    model::InMemoryProjectStore store;
    test::ManualTime time;
    TimerQueue queue;
    std::shared_ptr<test::FakeDecoderFactory> factory = std::make_shared<test::FakeDecoderFactory>();
    std::shared_ptr<test::FakeRasterizer> rasterizer = std::make_shared<test::FakeRasterizer>();
    PreviewSettings settings;

    std::shared_ptr<EffectsEngine> effects;   // null: the built-in engine
    std::function<std::unique_ptr<RenderBackend>(Size)> customBackend;
    std::optional<bool> flakyMode;           // recoverable?
    FlakyBackend* flakyBackend = nullptr;    // owned by the orchestrator
    media::BitmapPtr lastFrame;

private:
    std::unique_ptr<PlaybackOrchestrator> m_orchestrator;
    ScopedConnection m_presented;
};

// ========== Transport ==========

TEST_F(PlaybackOrchestratorTest, ImageAfterVideoKeepsTheFastPathSession) {
    setTimeline({test::makeTrack("v", TrackType::Video,
                                 {test::makeClip("clip", "red", ClipKind::Video, 0, secondsToUs(10)),
                                  test::makeClip("pic", "still", ClipKind::Image, secondsToUs(10),
                                                 secondsToUs(5))})},
                secondsToUs(15));

    auto& preview = orchestrator();
    preview.play();
    ASSERT_EQ(preview.state(), PlaybackState::Playing);
    EXPECT_EQ(preview.path(), PlaybackPath::FastPath);
    const uint64_t session = preview.sessionId();

    run(secondsToUs(2));
    ASSERT_TRUE(lastFrame);
    EXPECT_EQ(test::centre(*lastFrame), (Color{255, 0, 0, 255}));
    EXPECT_EQ(factory->counters->live.load(), 1);

    run(secondsToUs(10));
    EXPECT_EQ(preview.state(), PlaybackState::Playing);
    EXPECT_EQ(preview.sessionId(), session);
    EXPECT_EQ(preview.path(), PlaybackPath::FastPath);
    EXPECT_EQ(factory->counters->live.load(), 0);
    EXPECT_EQ(test::centre(*lastFrame), (Color{0, 255, 0, 255}));

    run(secondsToUs(4));
    EXPECT_EQ(preview.state(), PlaybackState::Stopped);
    EXPECT_EQ(preview.currentTime(), 0);
}

TEST_F(PlaybackOrchestratorTest, GapsAreSkipped) {
    setTimeline({test::makeTrack("v", TrackType::Video,
                                 {test::makeClip("a", "red", ClipKind::Video, 0, secondsToUs(5)),
                                  test::makeClip("b", "blue", ClipKind::Video, secondsToUs(10),
                                                 secondsToUs(5))})},
                secondsToUs(15));

    auto& preview = orchestrator();
    preview.play();
    run(msToUs(5100));

    EXPECT_EQ(preview.gapSkips(), 1u);
    EXPECT_GE(preview.currentTime(), secondsToUs(10));
    EXPECT_EQ(preview.state(), PlaybackState::Playing);
    EXPECT_EQ(test::centre(*lastFrame), (Color{0, 0, 255, 255}));
}

TEST_F(PlaybackOrchestratorTest, GapHoldingOnlyHiddenOverlaysIsSkipped) {
    model::Timeline timeline;
    timeline.tracks = {
        test::makeTrack("titles", TrackType::Text),
        test::makeTrack("v", TrackType::Video,
                        {test::makeClip("a", "red", ClipKind::Video, 0, secondsToUs(5)),
                         test::makeClip("b", "blue", ClipKind::Video, secondsToUs(10), secondsToUs(5))}),
    };
    timeline.tracks[0].hidden = true;
    timeline.overlays.push_back(
        test::makeText("between", "titles", secondsToUs(5), secondsToUs(5), Color{255, 255, 0}));
    timeline.duration = secondsToUs(15);
    store.setTimeline(std::move(timeline));

    auto& preview = orchestrator();
    preview.play();
    run(msToUs(5100));

    EXPECT_EQ(preview.gapSkips(), 1u);
    EXPECT_GE(preview.currentTime(), secondsToUs(10));
    EXPECT_EQ(test::centre(*lastFrame), (Color{0, 0, 255, 255}));
    EXPECT_EQ(rasterizer->textCalls, 0);
}

TEST_F(PlaybackOrchestratorTest, SpeedAdjustedVideoUsesTheCompositePath) {
    auto clip = test::makeClip("a", "red", ClipKind::Video, 0, secondsToUs(5));
    clip.speed = 2.0;
    setTimeline({test::makeTrack("v", TrackType::Video, {clip})}, secondsToUs(5));

    auto& preview = orchestrator();
    preview.play();
    EXPECT_EQ(preview.path(), PlaybackPath::Composite);
    run(msToUs(200));
    EXPECT_GT(preview.framesPresented(), 0u);
}

TEST_F(PlaybackOrchestratorTest, EmptyTimelineDoesNotPlay) {
    auto& preview = orchestrator();
    preview.play();
    EXPECT_EQ(preview.state(), PlaybackState::Stopped);
}

TEST_F(PlaybackOrchestratorTest, PauseParksThePlayhead) {
    setTimeline({test::makeTrack("v", TrackType::Video,
                                 {test::makeClip("a", "red", ClipKind::Video, 0, secondsToUs(10))})},
                secondsToUs(10));
    auto& preview = orchestrator();
    preview.play();
    run(secondsToUs(1));
    preview.pause();
    const Timestamp parked = preview.currentTime();
    EXPECT_EQ(preview.state(), PlaybackState::Paused);

    run(secondsToUs(1));
    EXPECT_EQ(preview.currentTime(), parked);

    preview.stepFrames(5);
    EXPECT_EQ(preview.currentTime(), parked + 5 * msToUs(40));

    preview.togglePlayPause();
    EXPECT_EQ(preview.state(), PlaybackState::Playing);
    preview.stop();
    EXPECT_EQ(preview.state(), PlaybackState::Stopped);
    EXPECT_EQ(preview.currentTime(), 0);
}

TEST_F(PlaybackOrchestratorTest, TeardownIsIdempotent) {
    setTimeline({test::makeTrack("v", TrackType::Video,
                                 {test::makeClip("a", "red", ClipKind::Video, 0, secondsToUs(10))})},
                secondsToUs(10));
    auto& preview = orchestrator();
    preview.play();
    run(msToUs(100));

    preview.stop();
    preview.stop();
    preview.pause();
    EXPECT_EQ(preview.state(), PlaybackState::Stopped);
    EXPECT_EQ(factory->counters->live.load(), 0);
    EXPECT_FALSE(preview.audioScheduler().isRunning());
    EXPECT_EQ(preview.audioGraph().scheduledCount(), 0u);

    // No tick of the old session survives
    const uint64_t presented = preview.framesPresented();
    run(msToUs(500));
    EXPECT_LE(preview.framesPresented(), presented + 1);
}

// ========== Rendering ==========

TEST_F(PlaybackOrchestratorTest, CrossfadeBlendsInsideTheOverlap) {
    auto lane = test::makeTrack("v", TrackType::Video,
                                {test::makeClip("a", "red", ClipKind::Video, 0, secondsToUs(6)),
                                 test::makeClip("b", "blue", ClipKind::Video, secondsToUs(5),
                                                secondsToUs(5))});
    model::Transition fade;
    fade.id = "fade";
    fade.type = model::TransitionType::Crossfade;
    fade.clipAId = "a";
    fade.clipBId = "b";
    fade.duration = secondsToUs(1);
    lane.transitions.push_back(fade);
    setTimeline({lane}, secondsToUs(10));

    auto& preview = orchestrator();

    auto mid = preview.renderAt(msToUs(5500));
    ASSERT_TRUE(mid) << mid.error().what();
    EXPECT_TRUE(preview.lastStats().transitionActive);
    Color c = test::centre(*mid.value());
    EXPECT_GT(c.r, 40);
    EXPECT_LT(c.r, 100);
    EXPECT_GT(c.b, 100);
    EXPECT_LT(c.b, 160);
    EXPECT_GT(c.b, c.r);

    auto before = preview.renderAt(secondsToUs(4));
    ASSERT_TRUE(before);
    EXPECT_FALSE(preview.lastStats().transitionActive);
    EXPECT_EQ(test::centre(*before.value()), (Color{255, 0, 0, 255}));

    auto after = preview.renderAt(secondsToUs(7));
    ASSERT_TRUE(after);
    EXPECT_EQ(test::centre(*after.value()), (Color{0, 0, 255, 255}));
}

TEST_F(PlaybackOrchestratorTest, TextLaneAboveVideoIsVisible) {
    model::Timeline timeline;
    timeline.tracks = {
        test::makeTrack("titles", TrackType::Text),
        test::makeTrack("v", TrackType::Video,
                        {test::makeClip("a", "red", ClipKind::Video, 0, secondsToUs(10))}),
    };
    timeline.overlays.push_back(test::makeText("hello", "titles", 0, secondsToUs(10), Color{255, 255, 0}));
    timeline.duration = secondsToUs(10);
    store.setTimeline(std::move(timeline));

    auto frame = orchestrator().renderAt(secondsToUs(1));
    ASSERT_TRUE(frame);
    EXPECT_EQ(test::centre(*frame.value()), (Color{255, 255, 0, 255}));
    EXPECT_EQ(frame.value()->pixel(2, 2), (Color{255, 0, 0, 255}));
    EXPECT_EQ(orchestrator().lastStats().overlayLayers, 1);
}

TEST_F(PlaybackOrchestratorTest, ResizeChangesTheCanvas) {
    setTimeline({test::makeTrack("v", TrackType::Video,
                                 {test::makeClip("a", "red", ClipKind::Video, 0, secondsToUs(10))})},
                secondsToUs(10));
    auto& preview = orchestrator();
    EXPECT_EQ(preview.resize({0, 0}).error().code(), ErrorCode::InvalidArgument);
    ASSERT_TRUE(preview.resize({32, 18}));

    auto frame = preview.renderAt(secondsToUs(1));
    ASSERT_TRUE(frame);
    EXPECT_EQ(frame.value()->size(), (Size{32, 18}));
}

// ========== Edits During Playback ==========

TEST_F(PlaybackOrchestratorTest, EditingAPlayingAudioClipReschedulesIt) {
    store.addMediaItem(test::mediaItem("song", MediaType::Audio, secondsToUs(10)));
    setTimeline({test::makeTrack("v", TrackType::Video,
                                 {test::makeClip("a", "red", ClipKind::Video, 0, secondsToUs(10))}),
                 test::makeTrack("music", TrackType::Audio,
                                 {test::makeClip("s", "song", ClipKind::Audio, 0, secondsToUs(10))})},
                secondsToUs(10));

    auto& preview = orchestrator();
    preview.play();
    run(msToUs(500));
    const uint64_t session = preview.sessionId();
    auto scheduled = preview.audioGraph().scheduledClip("s");
    ASSERT_TRUE(scheduled);
    EXPECT_DOUBLE_EQ(scheduled->volume, 1.0);

    model::Timeline edited = *store.getProjectTimeline();
    edited.tracks[1].clips[0].volume = 0.4;
    store.setTimeline(edited);

    scheduled = preview.audioGraph().scheduledClip("s");
    ASSERT_TRUE(scheduled);
    EXPECT_DOUBLE_EQ(scheduled->volume, 0.4);
    EXPECT_EQ(preview.sessionId(), session);

    // Moved out of the look-ahead window: stopped now, scheduled again when it comes up
    edited.tracks[1].clips[0].startTime = secondsToUs(3);
    edited.tracks[1].clips[0].duration = secondsToUs(7);
    store.setTimeline(edited);
    EXPECT_FALSE(preview.audioGraph().isClipScheduled("s"));

    run(msToUs(2700));
    scheduled = preview.audioGraph().scheduledClip("s");
    ASSERT_TRUE(scheduled);
    EXPECT_EQ(scheduled->clipStart, secondsToUs(3));
    EXPECT_DOUBLE_EQ(scheduled->volume, 0.4);
    EXPECT_EQ(preview.state(), PlaybackState::Playing);
}

// ========== Failure Policy ==========

TEST_F(PlaybackOrchestratorTest, ThrowingLayersAreSkippedAndPlaybackGoesOn) {
    auto throwingFactory = std::make_shared<ThrowingDecoderFactory>();
    throwingFactory->setColor("red", Color{255, 0, 0});
    factory = throwingFactory;
    rasterizer = std::make_shared<ThrowingRasterizer>();
    effects = std::make_shared<ThrowingEffects>();
    store.addMediaItem(test::mediaItem("cursed", MediaType::Video));

    auto withEffect = test::makeClip("fx", "blue", ClipKind::Video, 0, secondsToUs(10));
    model::Effect effect;
    effect.id = "e";
    effect.type = "brightness";
    withEffect.effects = {effect};

    model::Timeline timeline;
    timeline.tracks = {
        test::makeTrack("titles", TrackType::Text),
        test::makeTrack("top", TrackType::Video, {withEffect}),
        test::makeTrack("middle", TrackType::Video,
                        {test::makeClip("bad", "cursed", ClipKind::Video, 0, secondsToUs(10))}),
        test::makeTrack("base", TrackType::Video,
                        {test::makeClip("ok", "red", ClipKind::Video, 0, secondsToUs(10))}),
    };
    timeline.overlays.push_back(test::makeText("boom", "titles", 0, secondsToUs(10), Color{0, 255, 255}));
    timeline.overlays.push_back(test::makeText("fine", "titles", 0, secondsToUs(10), Color{255, 255, 0}));
    timeline.duration = secondsToUs(10);
    store.setTimeline(std::move(timeline));

    auto& preview = orchestrator();
    preview.play();
    ASSERT_EQ(preview.path(), PlaybackPath::Composite);
    run(msToUs(500));

    EXPECT_EQ(preview.state(), PlaybackState::Playing);
    EXPECT_GT(preview.framesPresented(), 5u);
    EXPECT_EQ(preview.frameErrors(), 0u);

    const CompositeStats& stats = preview.lastStats();
    EXPECT_EQ(stats.layerErrors, 3);
    EXPECT_EQ(stats.videoLayers, 1);
    EXPECT_EQ(stats.overlayLayers, 1);

    ASSERT_TRUE(lastFrame);
    EXPECT_EQ(test::centre(*lastFrame), (Color{255, 255, 0, 255}));
    EXPECT_EQ(lastFrame->pixel(2, 2), (Color{255, 0, 0, 255}));
}

TEST_F(PlaybackOrchestratorTest, ThrowingFrameIsCountedAndTheLoopContinues) {
    setTimeline({test::makeTrack("v", TrackType::Video,
                                 {test::makeClip("a", "red", ClipKind::Video, 0, secondsToUs(10))})},
                secondsToUs(10));
    customBackend = [](Size size) { return std::make_unique<ThrowingBackend>(size, 3); };

    auto& preview = orchestrator();
    preview.play();
    run(secondsToUs(1));

    EXPECT_EQ(preview.state(), PlaybackState::Playing);
    EXPECT_EQ(preview.frameErrors(), 3u);
    EXPECT_GT(preview.framesPresented(), 10u);
    ASSERT_TRUE(lastFrame);
    EXPECT_EQ(test::centre(*lastFrame), (Color{255, 0, 0, 255}));
}

TEST_F(PlaybackOrchestratorTest, CompositeFetchOverMoreLanesThanDecoders) {
    settings.videoDecoders = 2;
    std::vector<model::Track> lanes;
    for (int i = 0; i < 6; ++i) {
        const std::string id = "lane" + std::to_string(i);
        store.addMediaItem(test::mediaItem(id, MediaType::Video));
        lanes.push_back(test::makeTrack(id, TrackType::Video,
                                        {test::makeClip(id, id, ClipKind::Video, 0, secondsToUs(10))}));
    }
    setTimeline(std::move(lanes), secondsToUs(10));

    auto& preview = orchestrator();
    preview.play();
    ASSERT_EQ(preview.path(), PlaybackPath::Composite);
    run(secondsToUs(1));

    EXPECT_EQ(preview.state(), PlaybackState::Playing);
    EXPECT_EQ(preview.frameErrors(), 0u);
    EXPECT_EQ(preview.lastStats().videoLayers, 6);
    EXPECT_EQ(preview.lastStats().missingLayers, 0);
    EXPECT_EQ(preview.frameCache().failureCount(), 0u);
    EXPECT_LE(preview.frameCache().videoEntryCount(), 2u);
    EXPECT_EQ(factory->counters->live.load(), static_cast<int>(preview.frameCache().liveDecoderCount()));
}

// ========== Device Loss ==========

TEST_F(PlaybackOrchestratorTest, RecoverableDeviceLossRecreatesTheDevice) {
    setTimeline({test::makeTrack("v", TrackType::Video,
                                 {test::makeClip("a", "red", ClipKind::Video, 0, secondsToUs(10))})},
                secondsToUs(10));
    flakyMode = true;
    auto& preview = orchestrator();
    ASSERT_TRUE(preview.initialize());
    ASSERT_NE(flakyBackend, nullptr);

    flakyBackend->loseDevice();
    auto frame = preview.renderAt(secondsToUs(1));
    ASSERT_TRUE(frame) << frame.error().what();
    EXPECT_EQ(test::centre(*frame.value()), (Color{255, 0, 0, 255}));
    EXPECT_EQ(preview.deviceRecoveries(), 1u);
    EXPECT_EQ(flakyBackend->recreateAttempts, 1);
    EXPECT_FALSE(preview.usingSoftwareFallback());
    EXPECT_STREQ(preview.backend()->name(), "flaky");
}

TEST_F(PlaybackOrchestratorTest, UnrecoverableDeviceLossFallsBackToSoftware) {
    setTimeline({test::makeTrack("v", TrackType::Video,
                                 {test::makeClip("a", "red", ClipKind::Video, 0, secondsToUs(10))})},
                secondsToUs(10));
    flakyMode = false;
    auto& preview = orchestrator();
    ASSERT_TRUE(preview.initialize());
    ASSERT_NE(flakyBackend, nullptr);

    flakyBackend->loseDevice();
    flakyBackend = nullptr;   // destroyed by the fallback

    auto frame = preview.renderAt(secondsToUs(1));
    ASSERT_TRUE(frame) << frame.error().what();
    EXPECT_EQ(test::centre(*frame.value()), (Color{255, 0, 0, 255}));
    EXPECT_TRUE(preview.usingSoftwareFallback());
    EXPECT_EQ(preview.deviceRecoveries(), 0u);
    EXPECT_STREQ(preview.backend()->name(), "software");
}

// ========== Live Interaction ==========

TEST_F(PlaybackOrchestratorTest, InteractionPaintsLocallyAndCommitsOnEnd) {
    setTimeline({test::makeTrack("v", TrackType::Video,
                                 {test::makeClip("a", "red", ClipKind::Video, 0, secondsToUs(10))})},
                secondsToUs(10));
    auto& preview = orchestrator();

    EXPECT_EQ(preview.beginInteraction("nobody").error().code(), ErrorCode::NotFound);

    ASSERT_TRUE(preview.beginInteraction("a"));
    EXPECT_TRUE(preview.isInteracting());

    model::Transform moved;
    moved.position = {20.0, 0.0};
    preview.updateInteraction(moved);
    ASSERT_TRUE(lastFrame);
    // The clip now starts 20px right of the left edge
    EXPECT_EQ(lastFrame->pixel(5, 18), Color::black());
    EXPECT_EQ(lastFrame->pixel(40, 18), (Color{255, 0, 0, 255}));

    ASSERT_TRUE(preview.endInteraction());
    EXPECT_FALSE(preview.isInteracting());
    EXPECT_DOUBLE_EQ(store.getProjectTimeline()->findClip("a")->transform.position.x, 20.0);
}

} // namespace
} // namespace lumen::engine
