/**
 * @file compositor_test.cpp
 * @brief Speed mapping, colour effects, overlay passes and frame composition
 */

#include "test_support.hpp"

#include <lumen/engine/effects_engine.hpp>
#include <lumen/engine/frame_compositor.hpp>
#include <lumen/engine/overlay_compositor.hpp>
#include <lumen/engine/speed_engine.hpp>

#include <gtest/gtest.h>

namespace lumen::engine {
namespace {

using model::ClipKind;
using model::TrackType;
using test::kTestCanvas;

// ========== Speed ==========

class ClipSpeedEngineTest : public ::testing::Test {
protected:
    ClipSpeedEngineTest() {
        clip = test::makeClip("c", "m", ClipKind::Video, secondsToUs(10), secondsToUs(4), secondsToUs(1));
    }

    ClipSpeedEngine speed;
    model::MediaClip clip;
};

TEST_F(ClipSpeedEngineTest, ForwardMappingAddsTheInPoint) {
    EXPECT_EQ(speed.sourceTimeAtPlaybackTime(clip, secondsToUs(2)), secondsToUs(3));
    EXPECT_EQ(speed.sourceTimeAtPlaybackTime(clip, -5), secondsToUs(1));
    EXPECT_EQ(speed.sourceTimeAtPlaybackTime(clip, secondsToUs(9)), secondsToUs(5) - 1);
    EXPECT_TRUE(isIdentityTimeMapping(speed, clip));
}

TEST_F(ClipSpeedEngineTest, ReverseMirrorsInsideTheTrim) {
    speed.setReverseOverride("c", true);
    EXPECT_EQ(speed.sourceTimeAtPlaybackTime(clip, 0), secondsToUs(5) - 1);
    EXPECT_EQ(speed.sourceTimeAtPlaybackTime(clip, secondsToUs(2)), secondsToUs(3) - 1);
    EXPECT_FALSE(isIdentityTimeMapping(speed, clip));
}

TEST_F(ClipSpeedEngineTest, SpeedScalesAndIsClamped) {
    speed.setSpeedOverride("c", 2.0);
    EXPECT_EQ(speed.sourceTimeAtPlaybackTime(clip, secondsToUs(1)), secondsToUs(3));
    EXPECT_FALSE(isIdentityTimeMapping(speed, clip));

    speed.setSpeedOverride("c", 500.0);
    EXPECT_DOUBLE_EQ(speed.getClipSpeed(clip), 100.0);
    speed.setSpeedOverride("c", 0.0);
    EXPECT_DOUBLE_EQ(speed.getClipSpeed(clip), 1.0);

    speed.clearOverrides();
    clip.speed = 0.5;
    EXPECT_DOUBLE_EQ(speed.getClipSpeed(clip), 0.5);
}

// ========== Effects ==========

model::Effect effect(const char* type, const char* param, double value) {
    model::Effect e;
    e.id = type;
    e.type = type;
    e.params = {{param, value}};
    return e;
}

TEST(BasicEffectsEngine, ColourAdjustments) {
    BasicEffectsEngine engine;
    auto red = media::makeBitmap(4, 4, Color{255, 0, 0});

    model::MediaClip clip;
    clip.effects = {effect("grayscale", "amount", 1.0)};
    EXPECT_EQ(engine.applyEffectsToFrame(clip, red)->pixel(1, 1), (Color{54, 54, 54, 255}));

    clip.effects = {effect("invert", "amount", 1.0)};
    EXPECT_EQ(engine.applyEffectsToFrame(clip, red)->pixel(1, 1), (Color{0, 255, 255, 255}));

    auto grey = media::makeBitmap(4, 4, Color{100, 100, 100});
    clip.effects = {effect("brightness", "value", 0.5)};
    EXPECT_EQ(engine.applyEffectsToFrame(clip, grey)->pixel(0, 0), (Color{228, 228, 228, 255}));

    // Source frames are never modified in place
    EXPECT_EQ(red->pixel(1, 1), (Color{255, 0, 0, 255}));
}

TEST(BasicEffectsEngine, PassesThroughWhenNothingApplies) {
    BasicEffectsEngine engine;
    auto frame = media::makeBitmap(4, 4, Color::white());

    model::MediaClip clip;
    clip.effects = {effect("vignette", "amount", 1.0)};
    EXPECT_EQ(engine.applyEffectsToFrame(clip, frame), frame);

    clip.effects = {effect("invert", "amount", 1.0)};
    clip.effects[0].enabled = false;
    EXPECT_EQ(engine.applyEffectsToFrame(clip, frame), frame);
    EXPECT_EQ(engine.applyEffectsToFrame(clip, nullptr), nullptr);

    EXPECT_TRUE(BasicEffectsEngine::supports("sepia"));
    EXPECT_FALSE(BasicEffectsEngine::supports("blur"));
}

// ========== Overlay Passes ==========

std::vector<model::Track> stackedLanes() {
    return {test::makeTrack("titles", TrackType::Text), test::makeTrack("v1", TrackType::Video),
            test::makeTrack("between", TrackType::Graphics), test::makeTrack("v2", TrackType::Image),
            test::makeTrack("under", TrackType::Text), test::makeTrack("music", TrackType::Audio)};
}

TEST(OverlayPasses, LanesSplitAroundTheLowestVideoLane) {
    auto lanes = stackedLanes();
    auto range = videoIndexRange(lanes);
    EXPECT_EQ(range.lowest, 1);
    EXPECT_EQ(range.highest, 3);

    EXPECT_EQ(overlayTracksForPass(lanes, OverlayPass::Below), std::vector<int>{4});
    EXPECT_EQ(overlayTracksForPass(lanes, OverlayPass::Above), (std::vector<int>{2, 0}));
}

TEST(OverlayPasses, WithoutVideoEveryLaneIsPaintedOnce) {
    auto lanes = stackedLanes();
    lanes[1].hidden = true;
    lanes[3].hidden = true;
    lanes[2].hidden = true;

    EXPECT_TRUE(videoIndexRange(lanes).empty());
    EXPECT_EQ(overlayTracksForPass(lanes, OverlayPass::All), (std::vector<int>{4, 0}));
    EXPECT_EQ(overlayTracksForPass(lanes, OverlayPass::Below), (std::vector<int>{4, 0}));
}

// ========== Frame Composition ==========

class FrameCompositorTest : public ::testing::Test {
protected:
    FrameCompositorTest()
        : frames(factory, store, 4)
        , overlays(rasterizer)
        , compositor(frames, speed, std::make_shared<BasicEffectsEngine>(), overlays) {
        store.addMediaItem(test::mediaItem("red", MediaType::Video));
        store.addMediaItem(test::mediaItem("blue", MediaType::Video));
        factory->setColor("red", Color{255, 0, 0});
        factory->setColor("blue", Color{0, 0, 255});

        timeline.tracks = {
            test::makeTrack("titles", TrackType::Text),
            test::makeTrack("v", TrackType::Video,
                            {test::makeClip("a", "red", ClipKind::Video, 0, secondsToUs(10))}),
            test::makeTrack("shapes", TrackType::Graphics),
        };
        timeline.duration = secondsToUs(10);
    }

    media::BitmapPtr compose(Timestamp time, bool concurrent = false) {
        ComposeOptions options;
        options.canvas = kTestCanvas;
        options.concurrentFetch = concurrent;
        auto frame = compositor.compose(backend, timeline, time, options);
        EXPECT_TRUE(frame) << frame.error().what();
        return frame ? frame.value() : nullptr;
    }

    model::InMemoryProjectStore store;
    std::shared_ptr<test::FakeDecoderFactory> factory = std::make_shared<test::FakeDecoderFactory>();
    std::shared_ptr<test::FakeRasterizer> rasterizer = std::make_shared<test::FakeRasterizer>();
    media::FrameSourceCache frames;
    ClipSpeedEngine speed;
    OverlayCompositor overlays;
    FrameCompositor compositor;
    SoftwareBackend backend{kTestCanvas};
    model::Timeline timeline;
};

TEST_F(FrameCompositorTest, TextAboveVideo) {
    timeline.overlays.push_back(test::makeText("hello", "titles", 0, secondsToUs(5), Color{0, 255, 0}));

    auto frame = compose(secondsToUs(1));
    ASSERT_TRUE(frame);
    EXPECT_EQ(test::centre(*frame), (Color{0, 255, 0, 255}));
    EXPECT_EQ(frame->pixel(2, 2), (Color{255, 0, 0, 255}));
    EXPECT_EQ(compositor.lastStats().videoLayers, 1);
    EXPECT_EQ(compositor.lastStats().overlayLayers, 1);

    auto later = compose(secondsToUs(6));
    EXPECT_EQ(test::centre(*later), (Color{255, 0, 0, 255}));
}

TEST_F(FrameCompositorTest, LowerOverlayLaneIsCoveredByVideo) {
    timeline.overlays.push_back(test::makeShape("box", "shapes", 0, secondsToUs(5), Color{0, 0, 255}));

    auto frame = compose(secondsToUs(1));
    EXPECT_EQ(test::centre(*frame), (Color{255, 0, 0, 255}));
    EXPECT_EQ(rasterizer->shapeCalls, 1);

    timeline.tracks[1].hidden = true;
    auto bare = compose(secondsToUs(1));
    EXPECT_EQ(test::centre(*bare), (Color{0, 0, 255, 255}));
    EXPECT_EQ(bare->pixel(2, 2), Color::black());
}

TEST_F(FrameCompositorTest, OverlaysOnTheWrongLaneKindAreSkipped) {
    timeline.overlays.push_back(test::makeText("stray", "shapes", 0, secondsToUs(5), Color{0, 255, 0}));
    auto frame = compose(secondsToUs(1));
    EXPECT_EQ(test::centre(*frame), (Color{255, 0, 0, 255}));
    EXPECT_EQ(compositor.lastStats().overlayLayers, 0);
}

TEST_F(FrameCompositorTest, SubtitlesPaintLast) {
    model::Subtitle line;
    line.id = "s";
    line.text = "caption";
    line.startTime = 0;
    line.endTime = secondsToUs(2);
    line.style.color = Color{255, 255, 0};
    timeline.subtitles.push_back(line);

    auto frame = compose(secondsToUs(1));
    EXPECT_EQ(frame->pixel(32, kTestCanvas.height - 2), (Color{255, 255, 0, 255}));
    EXPECT_EQ(test::centre(*frame), (Color{255, 0, 0, 255}));
    EXPECT_EQ(compositor.lastStats().subtitleLayers, 1);
}

TEST_F(FrameCompositorTest, ClipEffectsAreApplied) {
    timeline.tracks[1].clips[0].effects = {effect("grayscale", "amount", 1.0)};
    auto frame = compose(secondsToUs(1));
    EXPECT_EQ(test::centre(*frame), (Color{54, 54, 54, 255}));
}

TEST_F(FrameCompositorTest, MissingMediaLeavesTheBackground) {
    timeline.tracks[1].clips[0].mediaId = "nowhere";
    auto frame = compose(secondsToUs(1));
    EXPECT_EQ(test::centre(*frame), Color::black());
    EXPECT_EQ(compositor.lastStats().missingLayers, 1);
    EXPECT_EQ(compositor.lastStats().videoLayers, 0);
}

TEST_F(FrameCompositorTest, UpperLanePaintsOverLowerLane) {
    // A half-width clip on the upper lane over the full-frame lower lane
    auto upper = test::makeClip("top", "blue", ClipKind::Video, 0, secondsToUs(10));
    upper.transform.scale = {0.5, 1.0};
    timeline.tracks.insert(timeline.tracks.begin(), test::makeTrack("upper", TrackType::Video, {upper}));

    auto lanes = compositor.collectLanes(timeline, secondsToUs(1));
    ASSERT_EQ(lanes.size(), 2u);
    EXPECT_EQ(lanes[0].trackIndex, 2);
    EXPECT_EQ(lanes[1].trackIndex, 0);

    auto frame = compose(secondsToUs(1), true);
    EXPECT_EQ(test::centre(*frame), (Color{0, 0, 255, 255}));
    EXPECT_EQ(frame->pixel(2, 18), (Color{255, 0, 0, 255}));
    EXPECT_EQ(compositor.lastStats().videoLayers, 2);
}

TEST_F(FrameCompositorTest, TransitionLaneContributesBothClips) {
    auto& lane = timeline.tracks[1];
    lane.clips[0].duration = secondsToUs(6);
    lane.clips[0].outPoint = secondsToUs(6);
    auto incoming = test::makeClip("b", "blue", ClipKind::Video, secondsToUs(5), secondsToUs(5));
    incoming.trackId = "v";
    lane.clips.push_back(incoming);
    model::Transition fade;
    fade.id = "fade";
    fade.clipAId = "a";
    fade.clipBId = "b";
    lane.transitions.push_back(fade);

    auto lanes = compositor.collectLanes(timeline, msToUs(5500));
    ASSERT_EQ(lanes.size(), 1u);
    ASSERT_TRUE(lanes[0].transition.has_value());
    ASSERT_EQ(lanes[0].layers.size(), 2u);
    EXPECT_EQ(lanes[0].layers[0].clip->id, "a");
    EXPECT_EQ(lanes[0].layers[1].mediaTime, msToUs(500));

    auto frame = compose(msToUs(5500));
    Color mid = test::centre(*frame);
    EXPECT_TRUE(compositor.lastStats().transitionActive);
    EXPECT_GT(mid.b, mid.r);
    EXPECT_GT(mid.r, 40);
}

TEST_F(FrameCompositorTest, MediaTimeFollowsTrimAndSpeed) {
    auto clip = test::makeClip("c", "red", ClipKind::Video, secondsToUs(10), secondsToUs(4), secondsToUs(2));
    EXPECT_EQ(compositor.mediaTimeFor(clip, secondsToUs(11)), secondsToUs(3));

    speed.setSpeedOverride("c", 2.0);
    EXPECT_EQ(compositor.mediaTimeFor(clip, secondsToUs(11)), secondsToUs(4));

    clip.kind = ClipKind::Image;
    EXPECT_EQ(compositor.mediaTimeFor(clip, secondsToUs(11)), 0);
}

} // namespace
} // namespace lumen::engine
