#include <gtest/gtest.h>

#include <chrono>

#include "flakelib/flake/clock.hpp"

using namespace flakelib::flake;
using namespace std::chrono;

TEST(ClockTest, EpochMillisTruncatesSubMillisecond) {
    system_clock::time_point tp{duration_cast<system_clock::duration>(
        milliseconds(1234567) + nanoseconds(999999))};
    EXPECT_EQ(epoch_millis(tp), 1234567u);
}

TEST(ClockTest, EpochMillisAtEpoch) {
    EXPECT_EQ(epoch_millis(system_clock::time_point{}), 0u);
}

// エポック以前はエラーにせず差の絶対値
TEST(ClockTest, EpochMillisBeforeEpochUsesMagnitude) {
    system_clock::time_point tp{duration_cast<system_clock::duration>(milliseconds(-1500))};
    EXPECT_EQ(epoch_millis(tp), 1500u);
}

TEST(ClockTest, SystemClockTracksWallClock) {
    SystemClock clock;
    uint64_t before = static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    uint64_t now = clock.now_ms();
    uint64_t after = static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    EXPECT_GE(now, before);
    EXPECT_LE(now, after);
}

TEST(ClockTest, ManualClockMoves) {
    ManualClock clock(100);
    EXPECT_EQ(clock.now_ms(), 100u);
    clock.advance(5);
    EXPECT_EQ(clock.now_ms(), 105u);
    clock.rewind(10);
    EXPECT_EQ(clock.now_ms(), 95u);
    clock.set(7);
    EXPECT_EQ(clock.now_ms(), 7u);
}

TEST(ClockTest, UsableThroughInterface) {
    ManualClock manual(42);
    Clock& clock = manual;
    EXPECT_EQ(clock.now_ms(), 42u);
}
