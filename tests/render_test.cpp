/**
 * @file render_test.cpp
 * @brief Layer geometry, the software backend and transition blends
 */

#include "test_support.hpp"

#include <lumen/engine/layer_geometry.hpp>
#include <lumen/engine/software_backend.hpp>
#include <lumen/engine/transition_evaluator.hpp>

#include <gtest/gtest.h>

#include <cstdlib>

namespace lumen::engine {
namespace {

using test::kTestCanvas;

// ========== Geometry ==========

TEST(LayerGeometry, AnchorLandsOnCanvasCentrePlusPosition) {
    model::ResolvedTransform t;
    auto corners = layerCorners(t, {10.0, 10.0}, kTestCanvas);
    EXPECT_DOUBLE_EQ(corners[0].x, 27.0);
    EXPECT_DOUBLE_EQ(corners[0].y, 13.0);
    EXPECT_DOUBLE_EQ(corners[2].x, 37.0);
    EXPECT_DOUBLE_EQ(corners[2].y, 23.0);

    t.position = {5.0, -3.0};
    t.anchor = {0.0, 0.0};
    corners = layerCorners(t, {10.0, 10.0}, kTestCanvas);
    EXPECT_DOUBLE_EQ(corners[0].x, 37.0);
    EXPECT_DOUBLE_EQ(corners[0].y, 15.0);
}

TEST(LayerGeometry, RotationIsClockwiseAboutTheAnchor) {
    model::ResolvedTransform t;
    t.rotation = 90.0;
    auto corners = layerCorners(t, {10.0, 4.0}, kTestCanvas);
    EXPECT_NEAR(corners[0].x, 34.0, 1e-9);
    EXPECT_NEAR(corners[0].y, 13.0, 1e-9);
    EXPECT_NEAR(corners[2].x, 30.0, 1e-9);
    EXPECT_NEAR(corners[2].y, 23.0, 1e-9);
}

TEST(LayerGeometry, FitModes) {
    const Size canvas{64, 36};
    EXPECT_EQ(fitSize({128, 72}, canvas, model::FitMode::Contain), (Vec2{64.0, 36.0}));
    EXPECT_EQ(fitSize({32, 36}, canvas, model::FitMode::Contain), (Vec2{32.0, 36.0}));
    EXPECT_EQ(fitSize({32, 36}, canvas, model::FitMode::Cover), (Vec2{64.0, 72.0}));
    EXPECT_EQ(fitSize({32, 36}, canvas, model::FitMode::Fill), (Vec2{64.0, 36.0}));
    EXPECT_EQ(fitSize({10, 10}, canvas, model::FitMode::None), (Vec2{10.0, 10.0}));
    EXPECT_EQ(fitSize({0, 0}, canvas, model::FitMode::Contain), (Vec2{0.0, 0.0}));
}

TEST(LayerGeometry, RoundedCornersExcludeTheCornerPixels) {
    const Vec2 size{20.0, 10.0};
    EXPECT_TRUE(insideRoundedRect(10.0, 5.0, size, 4.0));
    EXPECT_FALSE(insideRoundedRect(0.2, 0.2, size, 4.0));
    EXPECT_TRUE(insideRoundedRect(0.2, 0.2, size, 0.0));
    EXPECT_FALSE(insideRoundedRect(-1.0, 5.0, size, 0.0));
}

// ========== Software Backend ==========

class SoftwareBackendTest : public ::testing::Test {
protected:
    media::BitmapPtr drawOne(const media::Bitmap& image, Vec2 drawSize,
                             const model::ResolvedTransform& transform, double opacity = 1.0) {
        EXPECT_TRUE(backend.beginFrame(Color::black()));
        auto drawn = drawBitmap(backend, image, drawSize, transform, opacity);
        EXPECT_TRUE(drawn) << drawn.error().what();
        auto frame = backend.endFrame();
        EXPECT_TRUE(frame);
        return frame.value();
    }

    SoftwareBackend backend{kTestCanvas};
};

TEST_F(SoftwareBackendTest, CentredLayerCoversOnlyItsRectangle) {
    media::Bitmap red(10, 10, Color{255, 0, 0});
    auto frame = drawOne(red, {10.0, 10.0}, {});

    ASSERT_EQ(frame->size(), kTestCanvas);
    EXPECT_EQ(test::centre(*frame), (Color{255, 0, 0, 255}));
    EXPECT_EQ(frame->pixel(2, 2), Color::black());
    EXPECT_EQ(frame->pixel(40, 18), Color::black());
    EXPECT_EQ(backend.textureCount(), 0u);   // drawBitmap releases its texture
}

TEST_F(SoftwareBackendTest, ScaleGrowsTheLayerAboutItsAnchor) {
    media::Bitmap red(10, 10, Color{255, 0, 0});
    model::ResolvedTransform t;
    t.scale = {2.0, 2.0};
    auto frame = drawOne(red, {10.0, 10.0}, t);
    EXPECT_EQ(frame->pixel(40, 18), (Color{255, 0, 0, 255}));
    EXPECT_EQ(frame->pixel(44, 18), Color::black());
}

TEST_F(SoftwareBackendTest, OpacityBlendsOverTheBackground) {
    media::Bitmap white(10, 10, Color::white());
    model::ResolvedTransform t;
    t.opacity = 0.5;
    auto frame = drawOne(white, {10.0, 10.0}, t);

    Color c = test::centre(*frame);
    EXPECT_NEAR(c.r, 128, 1);
    EXPECT_NEAR(c.g, 128, 1);
    EXPECT_EQ(c.a, 255);

    auto faint = drawOne(white, {10.0, 10.0}, t, 0.0);
    EXPECT_EQ(test::centre(*faint), Color::black());
}

TEST_F(SoftwareBackendTest, FrameProtocolErrors) {
    RenderLayer layer;
    EXPECT_EQ(backend.renderLayer(layer).error().code(), ErrorCode::RenderError);
    EXPECT_EQ(backend.endFrame().error().code(), ErrorCode::RenderError);

    ASSERT_TRUE(backend.beginFrame(Color::black()));
    layer.texture = 999;
    layer.drawSize = {4.0, 4.0};
    EXPECT_EQ(backend.renderLayer(layer).error().code(), ErrorCode::NotFound);
    EXPECT_TRUE(backend.endFrame());
}

TEST_F(SoftwareBackendTest, TexturesAreAccounted) {
    auto id = backend.createTextureFromImage(media::Bitmap(10, 10, Color::white()));
    ASSERT_TRUE(id);
    EXPECT_EQ(backend.textureCount(), 1u);
    EXPECT_EQ(backend.getMemoryUsage(), 400u);

    backend.releaseTexture(id.value());
    backend.releaseTexture(id.value());
    EXPECT_EQ(backend.getMemoryUsage(), 0u);

    EXPECT_EQ(backend.createTextureFromImage(media::Bitmap()).error().code(),
              ErrorCode::TextureCreationFailed);
}

TEST_F(SoftwareBackendTest, ResizeChangesTheCanvas) {
    EXPECT_EQ(backend.resize({0, 10}).error().code(), ErrorCode::InvalidArgument);
    ASSERT_TRUE(backend.resize({16, 8}));
    ASSERT_TRUE(backend.beginFrame(Color::white()));
    auto frame = backend.endFrame();
    ASSERT_TRUE(frame);
    EXPECT_EQ(frame.value()->size(), (Size{16, 8}));
    EXPECT_TRUE(backend.recreateDevice());
    EXPECT_FALSE(backend.isDeviceLost());
}

// ========== Transitions ==========

model::Track crossfadeLane() {
    auto lane = test::makeTrack("v", model::TrackType::Video,
                                {test::makeClip("a", "red", model::ClipKind::Video, 0, secondsToUs(6)),
                                 test::makeClip("b", "blue", model::ClipKind::Video, secondsToUs(5),
                                                secondsToUs(5))});
    model::Transition fade;
    fade.id = "x";
    fade.clipAId = "b";   // authored in reverse; detection orders by start
    fade.clipBId = "a";
    fade.duration = secondsToUs(1);
    lane.transitions.push_back(fade);
    return lane;
}

TEST(TransitionDetect, WindowIsTheClipOverlap) {
    auto lane = crossfadeLane();

    EXPECT_FALSE(TransitionEvaluator::detect(msToUs(4900), lane).has_value());
    EXPECT_FALSE(TransitionEvaluator::detect(secondsToUs(6), lane).has_value());

    auto active = TransitionEvaluator::detect(msToUs(5500), lane, 2);
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active->clipA->id, "a");
    EXPECT_EQ(active->clipB->id, "b");
    EXPECT_EQ(active->trackIndex, 2);
    EXPECT_EQ(active->windowStart, secondsToUs(5));
    EXPECT_EQ(active->windowEnd, secondsToUs(6));
    EXPECT_DOUBLE_EQ(active->progressAt(msToUs(5500)), 0.5);
    EXPECT_DOUBLE_EQ(active->progressAt(secondsToUs(9)), 1.0);
}

TEST(TransitionDetect, HiddenLanesAreIgnored) {
    std::vector<model::Track> lanes{crossfadeLane()};
    EXPECT_TRUE(TransitionEvaluator::detect(msToUs(5500), lanes).has_value());
    lanes[0].hidden = true;
    EXPECT_FALSE(TransitionEvaluator::detect(msToUs(5500), lanes).has_value());
}

class TransitionBlendTest : public ::testing::Test {
protected:
    media::BitmapPtr blend(model::TransitionType type, double progress, nlohmann::json params = {}) {
        model::Transition t;
        t.type = type;
        t.params = params.is_null() ? nlohmann::json::object() : params;
        return evaluator.blend(t, progress, red, blue, kTestCanvas);
    }

    TransitionEvaluator evaluator;
    media::BitmapPtr red = media::makeBitmap(kTestCanvas.width, kTestCanvas.height, Color{255, 0, 0});
    media::BitmapPtr blue = media::makeBitmap(kTestCanvas.width, kTestCanvas.height, Color{0, 0, 255});
};

TEST_F(TransitionBlendTest, CrossfadeMixesBothFrames) {
    auto mid = blend(model::TransitionType::Crossfade, 0.5);
    ASSERT_TRUE(mid);
    Color c = test::centre(*mid);
    EXPECT_GT(c.r, 60);
    EXPECT_LT(c.r, 110);
    EXPECT_GT(c.b, 140);
    EXPECT_GT(c.b, c.r);

    Color done = test::centre(*blend(model::TransitionType::Crossfade, 1.0));
    EXPECT_EQ(done.r, 0);
    EXPECT_EQ(done.b, 255);
}

TEST_F(TransitionBlendTest, WipeSplitsTheFrame) {
    auto frame = blend(model::TransitionType::Wipe, 0.5, {{"direction", "left"}});
    ASSERT_TRUE(frame);
    EXPECT_EQ(frame->pixel(2, 18), (Color{255, 0, 0, 255}));
    EXPECT_EQ(frame->pixel(kTestCanvas.width - 3, 18), (Color{0, 0, 255, 255}));
}

TEST_F(TransitionBlendTest, DipPassesThroughTheColour) {
    auto frame = blend(model::TransitionType::DipToBlack, 0.5);
    ASSERT_TRUE(frame);
    EXPECT_EQ(test::centre(*frame), Color::black());
}

TEST_F(TransitionBlendTest, MistypedParamsFallBackToDefaults) {
    nlohmann::json mistyped = {{"direction", 5}, {"softness", "x"}, {"curve", 3}};
    media::BitmapPtr frame;
    ASSERT_NO_THROW(frame = blend(model::TransitionType::Wipe, 0.5, mistyped));
    ASSERT_TRUE(frame);
    EXPECT_EQ(frame->pixel(2, 18), (Color{255, 0, 0, 255}));
    EXPECT_EQ(frame->pixel(kTestCanvas.width - 3, 18), (Color{0, 0, 255, 255}));

    nlohmann::json zoomParams = {{"center", "middle"}, {"scale", "big"}};
    EXPECT_NO_THROW(frame = blend(model::TransitionType::Zoom, 0.5, zoomParams));
    EXPECT_TRUE(frame);
    EXPECT_NO_THROW(frame = blend(model::TransitionType::Slide, 0.5, {{"pushOut", "yes"}}));
    EXPECT_TRUE(frame);
    EXPECT_NO_THROW(frame = blend(model::TransitionType::DipToWhite, 0.5, {{"holdDuration", nullptr}}));
    EXPECT_TRUE(frame);
}

TEST_F(TransitionBlendTest, SingleFrameIsPassedThrough) {
    model::Transition t;
    EXPECT_EQ(evaluator.blend(t, 0.5, red, nullptr, kTestCanvas), red);
    EXPECT_EQ(evaluator.blend(t, 0.5, nullptr, blue, kTestCanvas), blue);
    EXPECT_EQ(evaluator.blend(t, 0.5, nullptr, nullptr, kTestCanvas), nullptr);
}

} // namespace
} // namespace lumen::engine
