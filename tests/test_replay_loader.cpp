/**
 * Replay loader tests
 *
 * Capture-file parsing, evdev key name normalisation and line-level
 * error reporting.
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "keystroke_analytics/replay_loader.hpp"

using namespace ks::analytics;

namespace {

std::string replayError(const std::string& text) {
    TypingSession session("abc");
    std::istringstream in(text);
    try {
        (void)ReplayLoader{}.replay(in, session);
    } catch (const std::runtime_error& ex) {
        return ex.what();
    }
    return {};
}

}  // namespace

/**
 * Test 1: evdev names and numbers become DOM code names
 */
TEST(ReplayLoader, NormalizeKeyCode) {
    EXPECT_EQ(normalizeKeyCode("KEY_A"), "KeyA");
    EXPECT_EQ(normalizeKeyCode("key_space"), "Space");
    EXPECT_EQ(normalizeKeyCode("30"), "KeyA");
    EXPECT_EQ(normalizeKeyCode("59"), "KEY_F1");
    EXPECT_EQ(normalizeKeyCode("KeyQ"), "KeyQ");
    EXPECT_EQ(normalizeKeyCode("none"), "");
    EXPECT_EQ(normalizeKeyCode("  "), "");
    EXPECT_THROW((void)normalizeKeyCode("KEY_NOT_A_KEY"), std::runtime_error);
}

/**
 * Test 2: Glyph aliases
 */
TEST(ReplayLoader, DecodeKeyGlyph) {
    EXPECT_EQ(decodeKeyGlyph("space"), " ");
    EXPECT_EQ(decodeKeyGlyph("Comma"), ",");
    EXPECT_EQ(decodeKeyGlyph("tab"), "\t");
    EXPECT_EQ(decodeKeyGlyph("a"), "a");
    EXPECT_EQ(decodeKeyGlyph("Backspace"), "Backspace");
}

/**
 * Test 3: A short capture replays into the session
 */
TEST(ReplayLoader, ReplaysStream) {
    std::istringstream in(
        "# captured on a laptop keyboard\n"
        "down,1000,h,KEY_H\n"
        "up,1080,h,KEY_H,1\n"
        "\n"
        "cursor,1\n"
        "down,1150,i,KeyI\n"
        "up,1220,i,KeyI,true\n");

    TypingSession session("hi");
    const auto stats = ReplayLoader{}.replay(in, session);

    EXPECT_EQ(stats.lines, 5u);
    EXPECT_EQ(stats.presses, 2u);
    EXPECT_EQ(stats.releases, 2u);
    EXPECT_EQ(stats.recorded, 2u);
    EXPECT_EQ(stats.dropped, 0u);

    ASSERT_EQ(session.events().size(), 2u);
    const auto& first = session.events()[0];
    EXPECT_EQ(first.key, "h");
    EXPECT_EQ(first.code, "KeyH");
    EXPECT_DOUBLE_EQ(first.dwell_time, 80.0);
    EXPECT_EQ(first.expected_key, std::optional<std::string>("h"));

    const auto& second = session.events()[1];
    EXPECT_EQ(second.position, 1u);
    EXPECT_DOUBLE_EQ(*second.flight_time, 70.0);
}

/**
 * Test 4: Explicit expected key, position and aliases
 */
TEST(ReplayLoader, ExplicitFields) {
    std::istringstream in(
        "down,0,space,KEY_SPACE\n"
        "up,50,space,KEY_SPACE,n,comma,4\n"
        "down,100,Backspace,KEY_BACKSPACE\n"
        "up,140,Backspace,KEY_BACKSPACE,0,none\n");

    TypingSession session("a,b");
    (void)ReplayLoader{}.replay(in, session);

    ASSERT_EQ(session.events().size(), 2u);
    EXPECT_EQ(session.events()[0].key, " ");
    EXPECT_EQ(session.events()[0].code, "Space");
    EXPECT_EQ(session.events()[0].expected_key, std::optional<std::string>(","));
    EXPECT_EQ(session.events()[0].position, 4u);
    EXPECT_FALSE(session.events()[0].is_correct);
    EXPECT_EQ(session.events()[0].finger, Finger::Thumbs);
    EXPECT_FALSE(session.events()[1].expected_key.has_value());
}

/**
 * Test 5: Unmatched releases are counted as dropped, reset clears the log
 */
TEST(ReplayLoader, DroppedAndReset) {
    std::istringstream in(
        "up,10,a,KEY_A,1\n"
        "down,20,a,KEY_A\n"
        "up,60,a,KEY_A,1\n"
        "reset\n"
        "down,500,b,KEY_B\n"
        "up,540,b,KEY_B,1\n");

    TypingSession session("ab");
    const auto stats = ReplayLoader{}.replay(in, session);
    EXPECT_EQ(stats.dropped, 1u);
    EXPECT_EQ(stats.resets, 1u);
    EXPECT_EQ(stats.recorded, 1u);
    ASSERT_EQ(session.events().size(), 1u);
    EXPECT_EQ(session.events()[0].key, "b");
    EXPECT_FALSE(session.events()[0].flight_time.has_value());
}

/**
 * Test 6: Malformed lines report their line number
 */
TEST(ReplayLoader, LineErrors) {
    EXPECT_EQ(replayError("down,abc,h,KEY_H\n"), "Replay line 1: invalid timestamp 'abc'");
    EXPECT_EQ(replayError("down,nan,a,KEY_A\n"), "Replay line 1: invalid timestamp 'nan'");
    EXPECT_EQ(replayError("down,1,a,KEY_A\nup,inf,a,KEY_A\n"), "Replay line 2: invalid timestamp 'inf'");
    EXPECT_EQ(replayError("# header\njump,1\n"), "Replay line 2: unknown command 'jump'");
    EXPECT_EQ(replayError("down,1,a,KEY_A\nup,2,a,KEY_A,maybe\n"),
              "Replay line 2: invalid correctness flag 'maybe'");
    EXPECT_EQ(replayError("cursor,-3\n"), "Replay line 1: invalid position '-3'");
    EXPECT_FALSE(replayError("down,1,a\n").empty());
    EXPECT_FALSE(replayError("up,1,a,KEY_A\n").empty());
}

/**
 * Test 7: Files that cannot be opened raise
 */
TEST(ReplayLoader, MissingFile) {
    TypingSession session;
    const auto missing = std::filesystem::temp_directory_path() / "keystroke_analytics_missing.csv";
    std::filesystem::remove(missing);
    EXPECT_THROW((void)ReplayLoader{}.replayFile(missing, session), std::runtime_error);
}

/**
 * Test 8: File replay matches stream replay
 */
TEST(ReplayLoader, ReplaysFile) {
    const auto path = std::filesystem::temp_directory_path() / "keystroke_analytics_replay.csv";
    {
        std::ofstream out(path);
        out << "down,0,o,KEY_O\nup,70,o,KEY_O,1\ncursor,1\ndown,160,k,KEY_K\nup,230,k,KEY_K,1\n";
    }

    TypingSession session("ok");
    const auto stats = ReplayLoader{}.replayFile(path, session);
    std::filesystem::remove(path);

    EXPECT_EQ(stats.recorded, 2u);
    ASSERT_EQ(session.events().size(), 2u);
    EXPECT_EQ(session.events()[1].expected_key, std::optional<std::string>("k"));
}
