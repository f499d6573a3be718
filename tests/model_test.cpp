/**
 * @file model_test.cpp
 * @brief Project loading, timeline queries and the in-memory store
 */

#include "test_support.hpp"

#include <lumen/model/io/project_io.hpp>
#include <lumen/model/project_store.hpp>
#include <lumen/model/timeline.hpp>

#include <gtest/gtest.h>

#include <variant>

namespace lumen::model {
namespace {

constexpr const char* kProject = R"({
  "media": [
    {"id": "m1", "type": "video", "path": "/tmp/a.mp4", "metadata": {"duration": 12.5, "width": 1920, "height": 1080}},
    {"id": "img", "type": "image", "path": "/tmp/b.png"},
    {"id": "snd", "type": "audio", "path": "/tmp/c.wav", "metadata": {"sampleRate": 44100, "channels": 2}}
  ],
  "timeline": {
    "duration": 20,
    "tracks": [
      {"id": "v1", "type": "video", "clips": [
        {"id": "c1", "mediaId": "m1", "startTime": 0, "duration": 5, "inPoint": 1.5,
         "transform": {"position": {"x": 10, "y": -4}, "opacity": 0.5, "fitMode": "cover",
                       "crop": {"x": 0.1, "y": 0.2, "width": 0.5, "height": 0.5}},
         "keyframes": [{"id": "k1", "time": 0.5, "property": "opacity", "value": 0.25, "easing": "ease-in"}],
         "effects": [{"id": "e1", "type": "brightness", "params": {"value": 0.2}}],
         "speed": 2.0},
        {"id": "c2", "mediaId": "img", "startTime": 6, "duration": 2}
      ], "transitions": [
        {"id": "t1", "clipAId": "c1", "clipBId": "c2", "type": "wipe", "duration": 1, "params": {"direction": "right"}}
      ]},
      {"id": "a1", "type": "audio", "volume": 0.8, "pan": -0.5, "clips": [
        {"id": "c3", "mediaId": "snd", "startTime": 1, "duration": 3,
         "fade": {"fadeIn": 0.5}, "automation": {"volume": [{"time": 0, "value": 0.2}, {"time": 1, "value": 1}]}}
      ]},
      {"id": "txt", "type": "text"}
    ],
    "overlays": [
      {"kind": "text", "id": "o1", "trackId": "txt", "startTime": 2, "duration": 3, "text": "Hello",
       "style": {"color": "#ff0000", "fontSize": 24}},
      {"kind": "shape", "id": "o2", "trackId": "txt", "startTime": 0, "duration": 1, "shapeType": "star"},
      {"kind": "hologram", "id": "o3"}
    ],
    "subtitles": [{"id": "s1", "text": "Hi", "startTime": 15, "endTime": 16, "style": {"position": "top"}}]
  }
})";

TEST(ProjectIO, ParsesTimelineInSeconds) {
    auto loaded = ProjectIO::fromJson(kProject);
    ASSERT_TRUE(loaded) << loaded.error().what();
    auto& store = *loaded.value();
    TimelinePtr timeline = store.getProjectTimeline();

    EXPECT_EQ(timeline->duration, secondsToUs(20));
    ASSERT_EQ(timeline->tracks.size(), 3u);

    const MediaClip* c1 = timeline->findClip("c1");
    ASSERT_NE(c1, nullptr);
    EXPECT_EQ(c1->kind, ClipKind::Video);
    EXPECT_EQ(c1->trackId, "v1");
    EXPECT_EQ(c1->inPoint, secondsToUs(1.5));
    EXPECT_EQ(c1->outPoint, secondsToUs(6.5));
    EXPECT_DOUBLE_EQ(c1->speed, 2.0);
    EXPECT_EQ(c1->transform.position, (Vec2{10.0, -4.0}));
    EXPECT_EQ(c1->transform.fitMode, FitMode::Cover);
    ASSERT_TRUE(c1->transform.crop);
    EXPECT_DOUBLE_EQ(c1->transform.crop->width, 0.5);
    ASSERT_EQ(c1->keyframes.size(), 1u);
    EXPECT_EQ(c1->keyframes[0].time, msToUs(500));
    EXPECT_EQ(c1->keyframes[0].easing, Easing::EaseIn);
    ASSERT_EQ(c1->effects.size(), 1u);
    EXPECT_DOUBLE_EQ(c1->effects[0].param("value", 0.0), 0.2);

    // Kind comes from the media type on a video lane
    EXPECT_EQ(timeline->findClip("c2")->kind, ClipKind::Image);

    const auto& transition = timeline->tracks[0].transitions.at(0);
    EXPECT_EQ(transition.type, TransitionType::Wipe);
    EXPECT_EQ(transition.params.value("direction", ""), "right");
}

TEST(ProjectIO, ParsesAudioOverlaysAndSubtitles) {
    auto loaded = ProjectIO::fromJson(kProject);
    ASSERT_TRUE(loaded);
    auto& store = *loaded.value();
    TimelinePtr timeline = store.getProjectTimeline();

    const Track& audio = timeline->tracks[1];
    EXPECT_DOUBLE_EQ(audio.volume, 0.8);
    EXPECT_DOUBLE_EQ(audio.pan, -0.5);
    const MediaClip& c3 = audio.clips.at(0);
    EXPECT_EQ(c3.kind, ClipKind::Audio);
    EXPECT_EQ(c3.fade.fadeIn, msToUs(500));
    ASSERT_EQ(c3.volumeAutomation.size(), 2u);
    EXPECT_EQ(c3.volumeAutomation[1].time, secondsToUs(1));

    // The unknown overlay kind is skipped
    ASSERT_EQ(timeline->overlays.size(), 2u);
    const auto* text = std::get_if<TextClip>(&timeline->overlays[0]);
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(text->text, "Hello");
    EXPECT_EQ(text->style.color, (Color{255, 0, 0, 255}));
    EXPECT_DOUBLE_EQ(text->style.fontSize, 24.0);
    EXPECT_EQ(overlayKind(timeline->overlays[1]), ClipKind::Shape);
    EXPECT_EQ(std::get<ShapeClip>(timeline->overlays[1]).shapeType, ShapeType::Star);

    ASSERT_EQ(timeline->subtitles.size(), 1u);
    EXPECT_EQ(timeline->subtitles[0].style.position, SubtitlePosition::Top);

    auto item = store.getMediaItem("m1");
    ASSERT_TRUE(item);
    EXPECT_EQ(item->type, MediaType::Video);
    EXPECT_EQ(item->metadata.duration, secondsToUs(12.5));
    EXPECT_EQ(store.getMediaItem("snd")->metadata.sampleRate, 44100);
    EXPECT_FALSE(store.getMediaItem("nope"));
}

TEST(ProjectIO, RejectsMalformedDocuments) {
    auto garbage = ProjectIO::fromJson("{ this is not json");
    ASSERT_FALSE(garbage);
    EXPECT_EQ(garbage.error().code(), ErrorCode::InvalidData);

    auto wrongShape = ProjectIO::fromJson(R"({"timeline": []})");
    ASSERT_FALSE(wrongShape);
    EXPECT_EQ(wrongShape.error().code(), ErrorCode::InvalidData);

    auto missing = ProjectIO::load("/nonexistent/lumen/project.json");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code(), ErrorCode::FileNotFound);
}

// ========== Timeline queries ==========

Timeline queryTimeline() {
    using test::makeClip;
    using test::makeTrack;

    Timeline timeline;
    timeline.duration = secondsToUs(30);
    timeline.tracks.push_back(makeTrack("top", TrackType::Video,
        {makeClip("a", "m", ClipKind::Video, 0, secondsToUs(5))}));
    timeline.tracks.push_back(makeTrack("hidden", TrackType::Video,
        {makeClip("h", "m", ClipKind::Video, secondsToUs(6), secondsToUs(2))}));
    timeline.tracks.back().hidden = true;
    timeline.tracks.push_back(makeTrack("bottom", TrackType::Image,
        {makeClip("b", "img", ClipKind::Image, secondsToUs(2), secondsToUs(4))}));
    timeline.tracks.push_back(makeTrack("music", TrackType::Audio,
        {makeClip("s", "snd", ClipKind::Audio, secondsToUs(12), secondsToUs(2))}));
    timeline.overlays.push_back(test::makeText("t", "txt", secondsToUs(20), secondsToUs(1), Color::white()));
    timeline.subtitles.push_back({"sub", "line", secondsToUs(25), secondsToUs(26), {}});
    return timeline;
}

TEST(Timeline, ActiveVisualClipsInTrackOrder) {
    Timeline timeline = queryTimeline();

    auto active = timeline.activeVisualClips(secondsToUs(3));
    ASSERT_EQ(active.size(), 2u);
    EXPECT_EQ(active[0].clip->id, "a");
    EXPECT_EQ(active[0].trackIndex, 0);
    EXPECT_EQ(active[1].clip->id, "b");
    EXPECT_EQ(active[1].trackIndex, 2);

    // End is exclusive and hidden lanes contribute nothing
    EXPECT_EQ(timeline.activeVisualClips(secondsToUs(5)).size(), 1u);
    EXPECT_TRUE(timeline.activeVisualClips(secondsToUs(6.5)).empty());
    EXPECT_EQ(timeline.visualTrackCount(), 2);
}

TEST(Timeline, ContentQueriesSeeEveryEntityKind) {
    Timeline timeline = queryTimeline();

    EXPECT_TRUE(timeline.hasContentAt(secondsToUs(1)));
    EXPECT_FALSE(timeline.hasContentAt(secondsToUs(6.5)));   // hidden clip only
    EXPECT_TRUE(timeline.hasContentAt(secondsToUs(13)));     // audio
    EXPECT_TRUE(timeline.hasContentAt(secondsToUs(20.5)));   // overlay
    EXPECT_TRUE(timeline.hasContentAt(secondsToUs(25.5)));   // subtitle

    EXPECT_EQ(timeline.nextContentStart(secondsToUs(7)), secondsToUs(12));
    EXPECT_EQ(timeline.nextContentStart(secondsToUs(14)), secondsToUs(20));
    EXPECT_EQ(timeline.nextContentStart(secondsToUs(21)), secondsToUs(25));
    EXPECT_FALSE(timeline.nextContentStart(secondsToUs(25)));
}

TEST(Timeline, OverlaysOnHiddenLanesAreNotContent) {
    Timeline timeline = queryTimeline();
    timeline.tracks.push_back(test::makeTrack("txt", TrackType::Text));
    EXPECT_TRUE(timeline.hasContentAt(secondsToUs(20.5)));

    timeline.tracks.back().hidden = true;
    EXPECT_FALSE(timeline.overlayShown(timeline.overlays.front()));
    EXPECT_FALSE(timeline.hasContentAt(secondsToUs(20.5)));
    EXPECT_EQ(timeline.nextContentStart(secondsToUs(14)), secondsToUs(25));
}

TEST(Timeline, ActiveEntityFilters) {
    Timeline timeline = queryTimeline();
    timeline.overlays.push_back(test::makeShape("sh", "gfx", secondsToUs(20), secondsToUs(1), Color::white()));

    EXPECT_EQ(activeOverlays(timeline.overlays, secondsToUs(20.5)).size(), 2u);
    EXPECT_EQ(activeTextClips(timeline.overlays, secondsToUs(20.5)).size(), 1u);
    EXPECT_EQ(activeGraphicClips(timeline.overlays, secondsToUs(20.5)).size(), 1u);
    EXPECT_TRUE(activeOverlays(timeline.overlays, secondsToUs(21)).empty());
    EXPECT_EQ(activeSubtitles(timeline.subtitles, secondsToUs(25)).size(), 1u);
}

TEST(Clip, FadeFactorRamps) {
    FadeSettings fade{secondsToUs(1), secondsToUs(2)};
    const Duration length = secondsToUs(10);
    EXPECT_DOUBLE_EQ(fadeFactor(fade, 0, length), 0.0);
    EXPECT_DOUBLE_EQ(fadeFactor(fade, msToUs(500), length), 0.5);
    EXPECT_DOUBLE_EQ(fadeFactor(fade, secondsToUs(5), length), 1.0);
    EXPECT_DOUBLE_EQ(fadeFactor(fade, secondsToUs(9), length), 0.5);
    EXPECT_DOUBLE_EQ(fadeFactor({}, 0, length), 1.0);
}

// ========== Store ==========

TEST(InMemoryProjectStore, WritesPublishNewSnapshots) {
    InMemoryProjectStore store(queryTimeline());
    int changes = 0;
    auto conn = store.changed.connectScoped([&] { ++changes; });

    TimelinePtr before = store.getProjectTimeline();

    TransformPatch patch;
    patch.position = Vec2{5.0, 6.0};
    ASSERT_TRUE(store.updateClipTransform("a", patch));

    TimelinePtr after = store.getProjectTimeline();
    EXPECT_NE(before, after);
    EXPECT_EQ(before->findClip("a")->transform.position, (Vec2{0.0, 0.0}));
    EXPECT_EQ(after->findClip("a")->transform.position, (Vec2{5.0, 6.0}));
    EXPECT_EQ(changes, 1);
    EXPECT_EQ(store.revision(), 1u);
}

TEST(InMemoryProjectStore, OverlaySettersCheckKind) {
    Timeline timeline = queryTimeline();
    timeline.overlays.push_back(test::makeShape("sh", "gfx", 0, secondsToUs(1), Color::white()));
    InMemoryProjectStore store(std::move(timeline));

    TransformPatch patch;
    patch.opacity = 0.3;
    EXPECT_TRUE(store.updateTextTransform("t", patch));
    EXPECT_TRUE(store.updateShapeTransform("sh", patch));

    auto wrongKind = store.updateShapeTransform("t", patch);
    ASSERT_FALSE(wrongKind);
    EXPECT_EQ(wrongKind.error().code(), ErrorCode::InvalidArgument);

    auto missing = store.updateClipTransform("ghost", patch);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code(), ErrorCode::NotFound);

    EXPECT_DOUBLE_EQ(overlayBase(*store.getProjectTimeline()->findOverlay("t")).transform.opacity, 0.3);
    EXPECT_EQ(store.revision(), 2u);
}

TEST(InMemoryProjectStore, KeyframeListIsReplacedWhole) {
    InMemoryProjectStore store(queryTimeline());
    int changes = 0;
    auto conn = store.changed.connectScoped([&] { ++changes; });

    Keyframe fadeOut;
    fadeOut.id = "k";
    fadeOut.time = secondsToUs(1);
    fadeOut.property = "opacity";
    ASSERT_TRUE(store.updateClipKeyframes("a", {fadeOut}));
    ASSERT_TRUE(store.updateClipKeyframes("a", {fadeOut, fadeOut}));

    const auto& keyframes = store.getProjectTimeline()->findClip("a")->keyframes;
    ASSERT_EQ(keyframes.size(), 2u);
    EXPECT_EQ(keyframes[1].property, "opacity");
    EXPECT_EQ(changes, 2);
    EXPECT_EQ(store.revision(), 2u);

    auto missing = store.updateClipKeyframes("ghost", {});
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code(), ErrorCode::NotFound);
    EXPECT_EQ(store.revision(), 2u);
}

TEST(TransformPatch, AppliesOnlyEngagedFields) {
    Transform t;
    t.rotation = 45.0;
    TransformPatch patch;
    EXPECT_TRUE(patch.empty());

    patch.scale = Vec2{2.0, 2.0};
    patch.crop = Rect{0.0, 0.0, 0.5, 0.5};
    patch.applyTo(t);
    EXPECT_EQ(t.scale, (Vec2{2.0, 2.0}));
    EXPECT_DOUBLE_EQ(t.rotation, 45.0);
    ASSERT_TRUE(t.crop);
    EXPECT_DOUBLE_EQ(t.crop->height, 0.5);
}

} // namespace
} // namespace lumen::model
