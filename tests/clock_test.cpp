/**
 * @file clock_test.cpp
 * @brief MasterClock transport, rate, looping and drift
 */

#include "test_support.hpp"

#include <lumen/core/clock.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

namespace lumen {
namespace {

class MasterClockTest : public ::testing::Test {
protected:
    MasterClockTest() : clock(time.source()) {
        clock.setDuration(secondsToUs(10));
    }

    test::ManualTime time;
    MasterClock clock;
};

TEST_F(MasterClockTest, AdvancesOnlyWhilePlaying) {
    EXPECT_TRUE(clock.isStopped());
    time.advance(msToUs(500));
    EXPECT_EQ(clock.currentTime(), 0);

    clock.play();
    time.advance(msToUs(500));
    EXPECT_EQ(clock.currentTime(), msToUs(500));

    clock.pause();
    time.advance(msToUs(500));
    EXPECT_EQ(clock.currentTime(), msToUs(500));

    clock.play();
    time.advance(msToUs(250));
    EXPECT_EQ(clock.currentTime(), msToUs(750));
}

TEST_F(MasterClockTest, StopParksAtZero) {
    clock.play();
    time.advance(secondsToUs(2));
    clock.stop();
    EXPECT_EQ(clock.currentTime(), 0);
    EXPECT_TRUE(clock.isStopped());
}

TEST_F(MasterClockTest, SeekClampsToDuration) {
    clock.seek(secondsToUs(20));
    EXPECT_EQ(clock.currentTime(), secondsToUs(10));
    clock.seek(-5);
    EXPECT_EQ(clock.currentTime(), 0);

    clock.play();
    clock.seek(secondsToUs(3));
    time.advance(msToUs(100));
    EXPECT_EQ(clock.currentTime(), secondsToUs(3) + msToUs(100));
}

TEST_F(MasterClockTest, RateScalesElapsedTimeAndIsClamped) {
    clock.setPlaybackRate(2.0);
    clock.play();
    time.advance(msToUs(100));
    EXPECT_EQ(clock.currentTime(), msToUs(200));

    // Re-anchored: the change does not jump the playhead
    clock.setPlaybackRate(0.5);
    EXPECT_EQ(clock.currentTime(), msToUs(200));
    time.advance(msToUs(100));
    EXPECT_EQ(clock.currentTime(), msToUs(250));

    clock.setPlaybackRate(100.0);
    EXPECT_DOUBLE_EQ(clock.playbackRate(), MasterClock::kMaxRate);
    clock.setPlaybackRate(0.0);
    EXPECT_DOUBLE_EQ(clock.playbackRate(), MasterClock::kMinRate);
}

TEST_F(MasterClockTest, ReachesEndWithoutLoop) {
    clock.play();
    time.advance(secondsToUs(11));
    EXPECT_EQ(clock.currentTime(), secondsToUs(10));
    EXPECT_TRUE(clock.reachedEnd());
    EXPECT_FALSE(clock.isPlaying());
}

TEST_F(MasterClockTest, LoopWrapsInsideWindow) {
    clock.setLoop(true, secondsToUs(2), secondsToUs(4));
    clock.seek(secondsToUs(3));
    clock.play();
    time.advance(secondsToUs(2));   // raw 5s -> 2 + (3 % 2)
    EXPECT_EQ(clock.currentTime(), secondsToUs(3));
    EXPECT_TRUE(clock.isPlaying());
    EXPECT_FALSE(clock.reachedEnd());
}

TEST_F(MasterClockTest, DriftDrivesSkipAndRepeat) {
    clock.setFrameRate(25.0);
    EXPECT_EQ(clock.frameDuration(), msToUs(40));

    clock.seek(secondsToUs(1));
    clock.reportVideoTime(secondsToUs(1) - msToUs(100));
    EXPECT_EQ(clock.drift(), msToUs(100));
    EXPECT_TRUE(clock.shouldSkipFrame());
    EXPECT_FALSE(clock.shouldRepeatFrame());

    clock.reportVideoTime(secondsToUs(1) + msToUs(100));
    EXPECT_TRUE(clock.shouldRepeatFrame());

    clock.reportVideoTime(secondsToUs(1) + msToUs(10));
    EXPECT_FALSE(clock.shouldSkipFrame());
    EXPECT_FALSE(clock.shouldRepeatFrame());
}

TEST_F(MasterClockTest, SignalsStateAndTimeChanges) {
    std::vector<ClockState> states;
    std::vector<Timestamp> times;
    auto a = clock.stateChanged.connectScoped([&](ClockState s) { states.push_back(s); });
    auto b = clock.timeChanged.connectScoped([&](Timestamp t) { times.push_back(t); });

    clock.play();
    clock.play();   // no duplicate
    clock.pause();
    clock.seek(secondsToUs(1));
    clock.stop();

    EXPECT_EQ(states, (std::vector<ClockState>{ClockState::Playing, ClockState::Paused,
                                                ClockState::Stopped}));
    EXPECT_EQ(times, (std::vector<Timestamp>{secondsToUs(1), 0}));
}

TEST(MasterClockThreads, ReaderSeesOnlyPublishedAnchors) {
    // Wall time is frozen, so a playing clock reads exactly its anchor
    test::ManualTime time;
    MasterClock clock(time.source());
    clock.setDuration(secondsToUs(10));
    clock.play();

    std::atomic<bool> done{false};
    std::atomic<int> inconsistent{0};
    std::thread reader([&] {
        while (!done.load()) {
            if (clock.currentTime() % msToUs(1) != 0) {
                inconsistent.fetch_add(1);
            }
            const double rate = clock.playbackRate();
            if (rate != 1.0 && rate != 2.0) {
                inconsistent.fetch_add(1);
            }
        }
    });

    for (int i = 0; i < 20000; ++i) {
        clock.setPlaybackRate(i % 2 == 0 ? 2.0 : 1.0);
        clock.seek(msToUs(i % 1000));
    }
    done.store(true);
    reader.join();

    EXPECT_EQ(inconsistent.load(), 0);
    EXPECT_EQ(clock.currentTime(), msToUs(999));
}

} // namespace
} // namespace lumen
