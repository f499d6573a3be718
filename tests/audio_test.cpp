/**
 * @file audio_test.cpp
 * @brief Audio processors, the mixing graph, schedule derivation and output
 */

#include "test_support.hpp"

#include <lumen/engine/audio_effects.hpp>
#include <lumen/engine/audio_graph.hpp>
#include <lumen/engine/audio_output.hpp>
#include <lumen/engine/audio_scheduler.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>
#include <vector>

namespace lumen::engine {
namespace {

constexpr int kRate = 1000;   // one frame per millisecond keeps the arithmetic readable

model::Effect audioEffect(const char* type, nlohmann::json params = nlohmann::json::object()) {
    model::Effect e;
    e.id = type;
    e.type = type;
    e.params = std::move(params);
    return e;
}

media::AudioBufferPtr constantBuffer(float level, Duration duration, int channels = 2) {
    auto buffer = std::make_shared<media::AudioBuffer>();
    buffer->sampleRate = kRate;
    buffer->channels = channels;
    buffer->samples.assign(static_cast<size_t>(duration * kRate / kTimeBaseUs) * channels, level);
    return buffer;
}

AudioClipSchedule scheduleOn(const std::string& trackId, const std::string& clipId,
                             Timestamp start, Timestamp end, float level = 0.5f) {
    AudioClipSchedule s;
    s.clipId = clipId;
    s.trackId = trackId;
    s.buffer = constantBuffer(level, secondsToUs(20));
    s.startTime = start;
    s.endTime = end;
    s.clipStart = start;
    s.clipDuration = end - start;
    return s;
}

// ========== Processors ==========

TEST(Delay, ImpulseRepeatsAfterTheDelayTime) {
    Delay delay({0.002, 0.5, 0.5}, kRate, 1);
    std::vector<float> samples{1.0f, 0.0f, 0.0f, 0.0f, 0.0f};
    delay.process(samples.data(), samples.size(), 1);

    EXPECT_FLOAT_EQ(samples[0], 0.5f);
    EXPECT_FLOAT_EQ(samples[1], 0.0f);
    EXPECT_FLOAT_EQ(samples[2], 0.5f);
    EXPECT_FLOAT_EQ(samples[3], 0.0f);
    EXPECT_FLOAT_EQ(samples[4], 0.25f);

    delay.reset();
    std::vector<float> silence(4, 0.0f);
    delay.process(silence.data(), silence.size(), 1);
    EXPECT_EQ(silence, std::vector<float>(4, 0.0f));
}

TEST(Compressor, StaticCurve) {
    CompressorParams hard;
    hard.kneeDb = 0.0;
    Compressor compressor(hard, 48000);
    EXPECT_DOUBLE_EQ(compressor.gainReductionDb(-30.0), 0.0);
    EXPECT_DOUBLE_EQ(compressor.gainReductionDb(-12.0), -9.0);

    Compressor soft(CompressorParams{}, 48000);
    EXPECT_DOUBLE_EQ(soft.gainReductionDb(-24.0), -2.8125);
    EXPECT_DOUBLE_EQ(soft.gainReductionDb(0.0), -18.0);
}

TEST(Compressor, LoudSignalSettlesToTheReducedGain) {
    Compressor compressor(CompressorParams{}, 48000);
    std::vector<float> loud(48000, 1.0f);
    compressor.process(loud.data(), loud.size(), 1);
    EXPECT_NEAR(loud.back(), std::pow(10.0, -18.0 / 20.0), 0.01);
}

TEST(Equalizer, LowPassRemovesHighFrequencies) {
    nlohmann::json band = {{"type", "lowpass"}, {"frequency", 100.0}};
    auto effect = audioEffect("eq", {{"bands", nlohmann::json::array({band})}});
    auto bands = Equalizer::bandsFromEffect(effect);
    ASSERT_EQ(bands.size(), 1u);
    EXPECT_EQ(bands[0].type, BiquadType::LowPass);

    Equalizer eq(bands, 48000);
    std::vector<float> tone(4800);
    for (size_t i = 0; i < tone.size(); ++i) {
        tone[i] = static_cast<float>(std::sin(2.0 * std::numbers::pi * 5000.0 * i / 48000.0));
    }
    eq.process(tone.data(), tone.size(), 1);

    double energy = 0.0;
    for (size_t i = tone.size() / 2; i < tone.size(); ++i) {
        energy += tone[i] * tone[i];
    }
    EXPECT_LT(std::sqrt(energy / (tone.size() / 2)), 0.05);
}

TEST(Reverb, ImpulseLeavesATail) {
    Reverb reverb(ReverbParams{}, 48000, 1);
    std::vector<float> samples(9600, 0.0f);
    samples[0] = 1.0f;
    reverb.process(samples.data(), samples.size(), 1);

    double tail = 0.0;
    for (size_t i = 2000; i < samples.size(); ++i) {
        tail += std::abs(samples[i]);
    }
    EXPECT_GT(tail, 0.0);
    EXPECT_GT(reverb.decayTime(), 0.5);
}

TEST(EffectChain, BuildsKnownProcessorsInOrder) {
    auto disabled = audioEffect("delay");
    disabled.enabled = false;
    EXPECT_EQ(createAudioProcessor(disabled, kRate, 2), nullptr);
    EXPECT_EQ(createAudioProcessor(audioEffect("chorus"), kRate, 2), nullptr);
    EXPECT_EQ(createAudioProcessor(audioEffect("eq"), kRate, 2), nullptr);

    EffectChain chain({audioEffect("compressor"), audioEffect("chorus"), audioEffect("delay"),
                       audioEffect("reverb")},
                      48000, 2);
    EXPECT_EQ(chain.types(), (std::vector<std::string>{"compressor", "delay", "reverb"}));
}

TEST(EffectParams, AreClampedToTheirRanges) {
    auto delay = DelayParams::fromEffect(audioEffect("delay", {{"time", 9.0}, {"feedback", 2.0}}));
    EXPECT_DOUBLE_EQ(delay.time, 2.0);
    EXPECT_DOUBLE_EQ(delay.feedback, 0.95);

    auto comp = CompressorParams::fromEffect(audioEffect("compressor", {{"ratio", 0.5}}));
    EXPECT_DOUBLE_EQ(comp.ratio, 1.0);
}

TEST(EffectParams, MistypedValuesReadAsAbsent) {
    auto delay = DelayParams::fromEffect(audioEffect("delay", {{"time", "long"}}));
    EXPECT_DOUBLE_EQ(delay.time, DelayParams{}.time);

    nlohmann::json band = {{"type", 7}, {"frequency", "high"}, {"gain", true}};
    auto bands = Equalizer::bandsFromEffect(audioEffect("eq", {{"bands", nlohmann::json::array({band})}}));
    ASSERT_EQ(bands.size(), 1u);
    EXPECT_EQ(bands[0].type, BiquadType::Peaking);
    EXPECT_DOUBLE_EQ(bands[0].frequency, 1000.0);
    EXPECT_DOUBLE_EQ(bands[0].gainDb, 0.0);
}

// ========== Envelopes ==========

TEST(Automation, InterpolatesAndHoldsEnds) {
    std::vector<model::AutomationPoint> points{{0, 0.0}, {secondsToUs(1), 1.0}};
    EXPECT_DOUBLE_EQ(evaluateAutomation(points, -10, 7.0), 0.0);
    EXPECT_DOUBLE_EQ(evaluateAutomation(points, msToUs(500), 7.0), 0.5);
    EXPECT_DOUBLE_EQ(evaluateAutomation(points, secondsToUs(3), 7.0), 1.0);
    EXPECT_DOUBLE_EQ(evaluateAutomation({}, 0, 7.0), 7.0);
}

TEST(Automation, ClipGainCombinesVolumeFadeAndEnvelope) {
    auto s = scheduleOn("t", "c", secondsToUs(10), secondsToUs(14));
    s.volume = 0.8;
    s.fade.fadeIn = secondsToUs(1);
    EXPECT_DOUBLE_EQ(s.gainAt(msToUs(10500)), 0.4);
    EXPECT_DOUBLE_EQ(s.gainAt(secondsToUs(12)), 0.8);

    s.panAutomation = {{0, -3.0}};
    EXPECT_DOUBLE_EQ(s.panAt(secondsToUs(11)), -1.0);
}

TEST(Pan, HardSidesFoldIntoOneChannel) {
    float l = 0.5f, r = 0.5f;
    panStereoFrame(l, r, 1.0);
    EXPECT_NEAR(l, 0.0f, 1e-6);
    EXPECT_NEAR(r, 1.0f, 1e-6);

    l = 0.5f;
    r = 0.25f;
    panStereoFrame(l, r, -1.0);
    EXPECT_NEAR(l, 0.75f, 1e-6);
    EXPECT_NEAR(r, 0.0f, 1e-6);

    l = 0.3f;
    r = 0.6f;
    panStereoFrame(l, r, 0.0);
    EXPECT_NEAR(l, 0.3f, 1e-6);
    EXPECT_NEAR(r, 0.6f, 1e-6);
}

// ========== Graph ==========

class AudioGraphTest : public ::testing::Test {
protected:
    std::vector<float> render(Timestamp start, size_t frames) {
        std::vector<float> out(frames * 2, -1.0f);
        graph.render(out.data(), frames, start);
        return out;
    }

    AudioGraph graph{kRate, 2};
};

TEST_F(AudioGraphTest, MixesScheduledClips) {
    graph.scheduleClip(scheduleOn("music", "a", 0, secondsToUs(1)));
    graph.scheduleClip(scheduleOn("voice", "b", 0, secondsToUs(1), 0.25f));
    EXPECT_EQ(graph.scheduledCount(), 2u);

    auto out = render(0, 100);
    EXPECT_NEAR(out[0], 0.75f, 1e-5);
    EXPECT_NEAR(out[199], 0.75f, 1e-5);
}

TEST_F(AudioGraphTest, ClipStartsAtItsTimelinePosition) {
    graph.scheduleClip(scheduleOn("music", "a", secondsToUs(1), secondsToUs(3)));
    auto out = render(msToUs(500), 1000);
    EXPECT_FLOAT_EQ(out[2 * 100], 0.0f);
    EXPECT_NEAR(out[2 * 600], 0.5f, 1e-5);
}

TEST_F(AudioGraphTest, MuteSoloAndVolume) {
    graph.scheduleClip(scheduleOn("music", "a", 0, secondsToUs(10)));
    graph.scheduleClip(scheduleOn("voice", "b", 0, secondsToUs(10), 0.25f));

    graph.configureTrack({"music", 2.0, 0.0, false, false});
    EXPECT_NEAR(render(0, 10)[0], 1.25f, 1e-5);

    graph.setTrackMuted("music", true);
    EXPECT_FALSE(graph.isTrackAudible("music"));
    EXPECT_NEAR(render(0, 10)[0], 0.25f, 1e-5);

    graph.setTrackMuted("music", false);
    graph.setTrackSolo("music", true);
    EXPECT_FALSE(graph.isTrackAudible("voice"));
    EXPECT_NEAR(render(0, 10)[0], 1.0f, 1e-5);

    graph.setTrackSolo("music", false);
    graph.setMasterVolume(0.5);
    EXPECT_NEAR(render(0, 10)[0], 0.625f, 1e-5);
    graph.setMuted(true);
    EXPECT_FLOAT_EQ(render(0, 10)[0], 0.0f);
}

TEST_F(AudioGraphTest, TrackPanMovesSignalAcross) {
    graph.scheduleClip(scheduleOn("music", "a", 0, secondsToUs(1)));
    graph.updateTrackPan("music", 1.0);
    auto out = render(0, 10);
    EXPECT_NEAR(out[0], 0.0f, 1e-5);
    EXPECT_NEAR(out[1], 1.0f, 1e-5);
}

TEST_F(AudioGraphTest, FinishedSourcesAreDropped) {
    graph.scheduleClip(scheduleOn("music", "a", 0, msToUs(50)));
    graph.scheduleClip(scheduleOn("voice", "b", 0, secondsToUs(1)));
    render(0, 100);
    EXPECT_EQ(graph.scheduledCount(), 1u);
    EXPECT_FALSE(graph.isClipScheduled("a"));
    EXPECT_TRUE(graph.isClipScheduled("b"));

    // The finished source stays silent until the host thread collects it
    EXPECT_NEAR(render(0, 10)[0], 0.5f, 1e-5);
    graph.collectFinished();
    EXPECT_EQ(graph.scheduledCount(), 1u);
    EXPECT_FALSE(graph.scheduledClip("a"));
}

TEST_F(AudioGraphTest, LongRequestsAreMixedInBlocks) {
    graph.scheduleClip(scheduleOn("music", "a", 0, secondsToUs(20)));
    const size_t frames = AudioGraph::kMaxBlockFrames * 2 + 17;
    auto out = render(0, frames);
    EXPECT_NEAR(out[0], 0.5f, 1e-5);
    EXPECT_NEAR(out[2 * AudioGraph::kMaxBlockFrames], 0.5f, 1e-5);
    EXPECT_NEAR(out[out.size() - 1], 0.5f, 1e-5);
    EXPECT_TRUE(graph.isClipScheduled("a"));
}

TEST_F(AudioGraphTest, ReschedulingReplacesTheSource) {
    graph.scheduleClip(scheduleOn("music", "a", 0, secondsToUs(1)));
    graph.scheduleClip(scheduleOn("music", "a", 0, secondsToUs(1), 0.1f));
    EXPECT_EQ(graph.scheduledCount(), 1u);
    EXPECT_NEAR(render(0, 10)[0], 0.1f, 1e-5);

    graph.stopClip("a");
    EXPECT_EQ(graph.scheduledCount(), 0u);
}

TEST_F(AudioGraphTest, BusEffectsFollowTheScheduledClip) {
    auto s = scheduleOn("music", "a", 0, secondsToUs(1));
    s.effects = {audioEffect("compressor"), audioEffect("delay")};
    graph.scheduleClip(s);
    EXPECT_EQ(graph.trackEffectTypes("music"), (std::vector<std::string>{"compressor", "delay"}));

    graph.updateTrackEffects("music", {});
    EXPECT_TRUE(graph.trackEffectTypes("music").empty());
}

// ========== Schedule Derivation ==========

class AudioScheduleBuilderTest : public ::testing::Test {
protected:
    AudioScheduleBuilderTest() {
        store.addMediaItem(test::mediaItem("cam", MediaType::Video));
        store.addMediaItem(test::mediaItem("song", MediaType::Audio));

        auto video = test::makeClip("v", "cam", model::ClipKind::Video, secondsToUs(2), secondsToUs(5));
        video.audioEffects = {audioEffect("delay")};
        auto linked = test::makeClip("a1", "cam", model::ClipKind::Audio, secondsToUs(2) + msToUs(5),
                                     secondsToUs(5));
        auto later = test::makeClip("a2", "song", model::ClipKind::Audio, secondsToUs(10), secondsToUs(2));

        timeline.tracks = {test::makeTrack("v", model::TrackType::Video, {video}),
                           test::makeTrack("a", model::TrackType::Audio, {linked, later})};
        timeline.duration = secondsToUs(12);
    }

    model::InMemoryProjectStore store;
    std::shared_ptr<test::FakeDecoderFactory> factory = std::make_shared<test::FakeDecoderFactory>();
    media::AudioBufferCache cache{factory, kRate, 2};
    ClipSpeedEngine speed;
    AudioScheduleBuilder builder{store, cache, speed};
    model::Timeline timeline;
};

TEST_F(AudioScheduleBuilderTest, SchedulesAudioLanesInsideTheWindow) {
    auto schedules = builder.build(timeline, secondsToUs(3), secondsToUs(3) + msToUs(200));
    ASSERT_EQ(schedules.size(), 1u);

    const auto& s = schedules[0];
    EXPECT_EQ(s.clipId, "a1");
    EXPECT_EQ(s.trackId, "a");
    EXPECT_EQ(s.startTime, secondsToUs(3));
    EXPECT_EQ(s.endTime, secondsToUs(7) + msToUs(5));
    EXPECT_EQ(s.mediaOffset, msToUs(995));
    EXPECT_DOUBLE_EQ(s.rate, 1.0);
    ASSERT_EQ(s.effects.size(), 1u);
    EXPECT_EQ(s.effects[0].type, "delay");
}

TEST_F(AudioScheduleBuilderTest, ReverseClipsPlayBackwards) {
    speed.setReverseOverride("a1", true);
    auto schedules = builder.build(timeline, secondsToUs(3), secondsToUs(3) + msToUs(200));
    ASSERT_EQ(schedules.size(), 1u);
    EXPECT_DOUBLE_EQ(schedules[0].rate, -1.0);
}

TEST_F(AudioScheduleBuilderTest, LinkedEffectsNeedMatchingMediaAndStart) {
    const auto& linked = timeline.tracks[1].clips[0];
    EXPECT_EQ(resolveClipAudioEffects(timeline, linked, msToUs(10)).size(), 1u);
    EXPECT_TRUE(resolveClipAudioEffects(timeline, linked, msToUs(1)).empty());
    EXPECT_TRUE(resolveClipAudioEffects(timeline, timeline.tracks[1].clips[1], msToUs(10)).empty());
}

TEST_F(AudioScheduleBuilderTest, MissingMediaIsSkipped) {
    timeline.tracks[1].clips[1].mediaId = "gone";
    auto schedules = builder.build(timeline, secondsToUs(9), secondsToUs(11));
    EXPECT_TRUE(schedules.empty());
    EXPECT_EQ(builder.skippedClips(), 1u);
}

TEST_F(AudioScheduleBuilderTest, BusesMirrorAudioLanes) {
    timeline.tracks[1].muted = true;
    AudioGraph graph(kRate, 2);
    builder.configureBuses(graph, timeline);
    EXPECT_TRUE(graph.hasTrack("a"));
    EXPECT_FALSE(graph.hasTrack("v"));
    EXPECT_FALSE(graph.isTrackAudible("a"));
}

// ========== Scheduler ==========

class AudioSchedulerTest : public ::testing::Test {
protected:
    AudioSchedulerTest() : queue(time.source()), clock(time.source()) {
        clock.setDuration(secondsToUs(20));
    }

    test::ManualTime time;
    TimerQueue queue;
    MasterClock clock;
    AudioGraph graph{kRate, 2};
    AudioScheduler scheduler{graph, queue, clock, {msToUs(200), msToUs(100), msToUs(10)}};
};

TEST_F(AudioSchedulerTest, PollsEveryIntervalAndSchedulesOnce) {
    std::vector<std::pair<Timestamp, Timestamp>> windows;
    scheduler.startScheduler([&](Timestamp from, Timestamp to) {
        windows.emplace_back(from, to);
        return std::vector<AudioClipSchedule>{scheduleOn("music", "x", 0, secondsToUs(10))};
    });

    EXPECT_TRUE(scheduler.isRunning());
    ASSERT_EQ(windows.size(), 1u);
    EXPECT_EQ(windows[0], std::make_pair(Timestamp{0}, msToUs(200)));

    test::pump(time, queue, msToUs(350));
    EXPECT_EQ(scheduler.pollCount(), 4u);
    EXPECT_EQ(graph.scheduledCount(), 1u);
    EXPECT_TRUE(scheduler.wasScheduled("x"));

    scheduler.stopScheduler();
    test::pump(time, queue, msToUs(300));
    EXPECT_EQ(scheduler.pollCount(), 4u);
    EXPECT_FALSE(scheduler.isRunning());
}

TEST_F(AudioSchedulerTest, RefreshReplacesOnlyEditedClips) {
    auto buffer = constantBuffer(0.5f, secondsToUs(20));
    double volume = 1.0;
    bool withVoice = true;
    auto clipFrom = [&](const std::string& id, Timestamp from) {
        auto s = scheduleOn("music", id, std::max<Timestamp>(0, from), secondsToUs(10));
        s.buffer = buffer;
        s.mediaOffset = s.startTime;
        s.clipStart = 0;
        s.clipDuration = secondsToUs(10);
        s.volume = id == "x" ? volume : 1.0;
        return s;
    };
    scheduler.startScheduler([&](Timestamp from, Timestamp) {
        std::vector<AudioClipSchedule> out{clipFrom("x", from)};
        if (withVoice) {
            out.push_back(clipFrom("y", from));
        }
        return out;
    });
    ASSERT_EQ(graph.scheduledCount(), 2u);

    // Same audio from a later window: the playing source is left alone
    scheduler.refresh(msToUs(150));
    ASSERT_TRUE(graph.scheduledClip("x"));
    EXPECT_EQ(graph.scheduledClip("x")->startTime, 0);

    volume = 0.3;
    scheduler.refresh(msToUs(150));
    auto edited = graph.scheduledClip("x");
    ASSERT_TRUE(edited);
    EXPECT_DOUBLE_EQ(edited->volume, 0.3);
    EXPECT_EQ(edited->startTime, msToUs(150));
    EXPECT_EQ(graph.scheduledClip("y")->startTime, 0);

    withVoice = false;
    scheduler.refresh(msToUs(200));
    EXPECT_FALSE(graph.isClipScheduled("y"));
    EXPECT_FALSE(scheduler.wasScheduled("y"));
    EXPECT_EQ(graph.scheduledCount(), 1u);
}

TEST(AudioClipSchedule, SamePlaybackIgnoresTheWindowAnchor) {
    auto a = scheduleOn("music", "x", 0, secondsToUs(10));
    auto b = a;
    b.startTime = secondsToUs(2);
    b.mediaOffset = secondsToUs(2);
    EXPECT_TRUE(samePlayback(a, b));

    b.mediaOffset = secondsToUs(3);
    EXPECT_FALSE(samePlayback(a, b));

    auto c = a;
    c.fade.fadeOut = msToUs(500);
    EXPECT_FALSE(samePlayback(a, c));
    c = a;
    c.effects = {audioEffect("delay")};
    EXPECT_FALSE(samePlayback(a, c));
}

TEST_F(AudioSchedulerTest, SeekDropsEverythingAndRepolls) {
    int polls = 0;
    scheduler.startScheduler([&](Timestamp from, Timestamp) {
        ++polls;
        return std::vector<AudioClipSchedule>{scheduleOn("music", "x", from, from + secondsToUs(1))};
    });
    ASSERT_EQ(polls, 1);

    scheduler.seekTo(secondsToUs(5));
    EXPECT_EQ(polls, 2);
    EXPECT_TRUE(graph.isClipScheduled("x"));

    scheduler.stopScheduler();
    scheduler.seekTo(0);
    EXPECT_EQ(polls, 2);
    EXPECT_FALSE(scheduler.wasScheduled("x"));
    EXPECT_EQ(graph.scheduledCount(), 0u);
}

// ========== Output ==========

TEST(AudioOutput, FillFollowsTheClock) {
    test::ManualTime time;
    MasterClock clock(time.source());
    clock.setDuration(secondsToUs(20));
    AudioGraph graph(kRate, 2);
    graph.scheduleClip(scheduleOn("music", "a", 0, secondsToUs(10)));
    AudioOutput output(graph, clock);

    std::vector<float> block(200, 1.0f);
    output.fill(block.data(), 100);
    EXPECT_EQ(block, std::vector<float>(200, 0.0f));
    EXPECT_EQ(output.cursor(), kNoTimestamp);

    clock.play();
    output.fill(block.data(), 100);
    EXPECT_NEAR(block[0], 0.5f, 1e-5);
    EXPECT_EQ(output.cursor(), msToUs(100));

    // Clock still at 0: the cursor is 100ms ahead and snaps back
    output.fill(block.data(), 10);
    EXPECT_EQ(output.resyncCount(), 1u);
    EXPECT_EQ(output.cursor(), msToUs(10));

    EXPECT_FALSE(output.isOpen());
}

} // namespace
} // namespace lumen::engine
