#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

#include "keystroke_analytics/types.hpp"

namespace ks::analytics {

// Owns the event log of one typing test. Mutated only through onKeyDown/onKeyUp
// from the capture thread; analytics read events() once the test is over.
class TypingSession {
public:
    explicit TypingSession(std::string expected_text = {});

    void onKeyDown(const std::string& key, const std::string& code, Millis timestamp);

    // Expected key is taken from the expected text at the current cursor.
    void onKeyUp(const std::string& key,
                 const std::string& code,
                 Millis timestamp,
                 bool is_correct);

    // expected_override replaces the text lookup; nullopt records "no expected key".
    void onKeyUp(const std::string& key,
                 const std::string& code,
                 Millis timestamp,
                 bool is_correct,
                 std::optional<std::string> expected_override,
                 std::optional<std::size_t> position_override = std::nullopt);

    void reset();
    void reset(std::string expected_text);

    // The cursor is owned by the caller; the session never advances it.
    void setCursor(std::size_t position) noexcept { cursor_ = position; }
    [[nodiscard]] std::size_t cursor() const noexcept { return cursor_; }

    [[nodiscard]] const std::string& expectedText() const noexcept { return expected_text_; }
    [[nodiscard]] const EventLog& events() const noexcept { return events_; }
    [[nodiscard]] std::size_t pendingKeyCount() const noexcept { return pressed_keys_.size(); }
    [[nodiscard]] std::optional<Millis> lastReleaseTime() const noexcept { return last_release_time_; }

private:
    void recordRelease(const std::string& key,
                       const std::string& code,
                       Millis timestamp,
                       bool is_correct,
                       std::optional<std::string> expected_key,
                       std::size_t position);

    [[nodiscard]] std::optional<std::string> expectedAtCursor() const;

    std::string expected_text_;
    EventLog events_;
    std::unordered_map<std::string, Millis> pressed_keys_;
    std::optional<Millis> last_release_time_;
    std::size_t cursor_{0};
};

}  // namespace ks::analytics
