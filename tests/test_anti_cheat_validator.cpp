/**
 * Anti-cheat validator tests
 *
 * Each detector in isolation, the scoring rule, and the human baseline
 * that must stay clean.
 */

#include <gtest/gtest.h>

#include <algorithm>

#include "keystroke_analytics/anti_cheat_validator.hpp"
#include "session_builder.hpp"

using namespace ks::analytics;
using ks::analytics::fixtures::humanIntervals;
using ks::analytics::fixtures::logFromIntervals;
using ks::analytics::fixtures::logFromTimings;

class AntiCheatValidatorTest : public ::testing::Test {
protected:
    AntiCheatValidator validator;
};

/**
 * Test 1: Short sessions are never analysed
 */
TEST_F(AntiCheatValidatorTest, BelowMinimumIsClean) {
    const auto result = validator.validate(logFromIntervals(std::vector<Millis>(10, 5.0), 2.0), 500.0);
    EXPECT_FALSE(result.is_suspicious);
    EXPECT_TRUE(result.flags.empty());
    EXPECT_EQ(result.validation_score, 100);
    EXPECT_FALSE(result.synthetic_input_detected);
    EXPECT_FALSE(result.min_interval_ms.has_value());
    EXPECT_FALSE(result.interval_variance.has_value());
}

/**
 * Test 2: Human timing with natural jitter stays clean
 */
TEST_F(AntiCheatValidatorTest, HumanTypingIsClean) {
    const auto result = validator.validate(logFromIntervals(humanIntervals(30), 60.0), 80.0);
    EXPECT_FALSE(result.is_suspicious);
    EXPECT_TRUE(result.flags.empty());
    EXPECT_EQ(result.validation_score, 100);
    EXPECT_EQ(result.min_interval_ms, std::optional<double>(90.0));
    EXPECT_EQ(result.interval_variance, std::optional<double>(1480.0));
}

/**
 * Test 3: Metronomic input trips programmatic and rhythm checks
 */
TEST_F(AntiCheatValidatorTest, MetronomeIsSynthetic) {
    const auto result = validator.validate(logFromIntervals(std::vector<Millis>(50, 50.0), 20.0), 60.0);
    EXPECT_TRUE(result.is_suspicious);
    EXPECT_TRUE(result.hasFlag(SuspicionFlag::ProgrammaticPattern));
    EXPECT_TRUE(result.hasFlag(SuspicionFlag::PerfectRhythm));
    // Flights are uniform too, but that is already covered by programmatic_pattern.
    EXPECT_FALSE(result.hasFlag(SuspicionFlag::UniformFlightTimes));
    EXPECT_EQ(result.flags.size(), 2u);
    EXPECT_TRUE(result.synthetic_input_detected);
    EXPECT_EQ(result.validation_score, 30);
    EXPECT_EQ(result.min_interval_ms, std::optional<double>(50.0));
    EXPECT_EQ(result.interval_variance, std::optional<double>(0.0));
}

/**
 * Test 4: Alternating 100/101 ms sits exactly on the rhythm boundary
 */
TEST_F(AntiCheatValidatorTest, PerfectRhythmBoundary) {
    std::vector<Millis> intervals;
    for (int i = 0; i < 20; ++i) {
        intervals.push_back(i % 2 == 0 ? 100.0 : 101.0);
    }
    const auto result = validator.validate(logFromIntervals(intervals, 40.0), 60.0);
    // 19 steady deltas over 20 intervals is 0.95, not above it; 20 intervals is not above 20.
    EXPECT_TRUE(result.flags.empty());
    EXPECT_EQ(result.interval_variance, std::optional<double>(0.25));
}

/**
 * Test 5: One impossible gap flags inhuman speed
 */
TEST_F(AntiCheatValidatorTest, SingleInhumanInterval) {
    auto intervals = humanIntervals(30);
    intervals[12] = 5.0;
    const auto result = validator.validate(logFromIntervals(intervals, 3.0), 80.0);
    ASSERT_EQ(result.flags.size(), 1u);
    EXPECT_EQ(result.flags[0], SuspicionFlag::InhumanSpeed);
    EXPECT_TRUE(result.synthetic_input_detected);
    EXPECT_EQ(result.validation_score, 50);
    EXPECT_FALSE(result.is_suspicious);
    EXPECT_EQ(result.min_interval_ms, std::optional<double>(5.0));
}

/**
 * Test 6: Reported WPM above 200
 */
TEST_F(AntiCheatValidatorTest, ImpossibleWpm) {
    const auto result = validator.validate(logFromIntervals(humanIntervals(30), 60.0), 250.0);
    ASSERT_EQ(result.flags.size(), 1u);
    EXPECT_EQ(result.flags[0], SuspicionFlag::ImpossibleWpm);
    EXPECT_FALSE(result.synthetic_input_detected);
    EXPECT_EQ(result.validation_score, 80);
}

/**
 * Test 7: A run of sub-25 ms presses
 */
TEST_F(AntiCheatValidatorTest, BurstTyping) {
    auto intervals = humanIntervals(30);
    std::fill(intervals.begin() + 10, intervals.begin() + 20, 15.0);
    const auto result = validator.validate(logFromIntervals(intervals, 10.0), 80.0);
    ASSERT_EQ(result.flags.size(), 1u);
    EXPECT_EQ(result.flags[0], SuspicionFlag::BurstTyping);
    EXPECT_EQ(result.validation_score, 80);
    EXPECT_EQ(result.min_interval_ms, std::optional<double>(15.0));
}

/**
 * Test 8: Constant flights behind jittered presses
 */
TEST_F(AntiCheatValidatorTest, UniformFlightTimes) {
    const auto intervals = humanIntervals(30);
    std::vector<Millis> dwells;
    for (Millis interval : intervals) {
        dwells.push_back(interval - 40.0);
    }
    dwells.push_back(60.0);

    const auto result = validator.validate(logFromTimings(intervals, dwells), 80.0);
    ASSERT_EQ(result.flags.size(), 1u);
    EXPECT_EQ(result.flags[0], SuspicionFlag::UniformFlightTimes);
    EXPECT_TRUE(result.synthetic_input_detected);
    EXPECT_EQ(result.validation_score, 50);
}

/**
 * Test 9: Everything at once floors the score at zero
 */
TEST_F(AntiCheatValidatorTest, ScoreFloorsAtZero) {
    const auto result = validator.validate(logFromIntervals(std::vector<Millis>(40, 5.0), 2.0), 500.0);
    EXPECT_EQ(result.flags.size(), 5u);
    EXPECT_TRUE(result.is_suspicious);
    EXPECT_EQ(result.validation_score, 0);
}

/**
 * Test 10: Only positive press gaps count as intervals
 */
TEST(AntiCheat, PressIntervalsSkipNonPositive) {
    EventLog log{
        fixtures::makeEvent("a", 0.0, 40.0),
        fixtures::makeEvent("b", 0.0, 50.0),
        fixtures::makeEvent("c", 120.0, 160.0),
        fixtures::makeEvent("d", 110.0, 170.0),
        fixtures::makeEvent("e", 300.0, 340.0),
    };
    EXPECT_EQ(pressIntervals(log), (std::vector<Millis>{120.0, 190.0}));
}

/**
 * Test 11: Custom thresholds apply to raw series
 */
TEST(AntiCheat, EvaluateWithCustomThresholds) {
    AntiCheatThresholds thresholds;
    thresholds.min_keystrokes_for_analysis = 3;
    thresholds.max_wpm_without_flag = 100.0;
    thresholds.suspicious_flag_threshold = 1;
    AntiCheatValidator validator(thresholds);

    const auto result = validator.evaluate(4, {120.0, 90.0, 160.0}, {60.0, 40.0, 90.0}, 120.0);
    ASSERT_EQ(result.flags.size(), 1u);
    EXPECT_EQ(result.flags[0], SuspicionFlag::ImpossibleWpm);
    EXPECT_TRUE(result.is_suspicious);
    EXPECT_EQ(result.min_interval_ms, std::optional<double>(90.0));
}

/**
 * Test 12: Flag names
 */
TEST(AntiCheat, FlagNames) {
    EXPECT_STREQ(flagName(SuspicionFlag::InhumanSpeed), "inhuman_speed");
    EXPECT_STREQ(flagName(SuspicionFlag::ImpossibleWpm), "impossible_wpm");
    EXPECT_STREQ(flagName(SuspicionFlag::ProgrammaticPattern), "programmatic_pattern");
    EXPECT_STREQ(flagName(SuspicionFlag::BurstTyping), "burst_typing");
    EXPECT_STREQ(flagName(SuspicionFlag::PerfectRhythm), "perfect_rhythm");
    EXPECT_STREQ(flagName(SuspicionFlag::UniformFlightTimes), "uniform_flight_times");
}
