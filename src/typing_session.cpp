#include "keystroke_analytics/typing_session.hpp"

#include <utility>

namespace ks::analytics {

TypingSession::TypingSession(std::string expected_text)
    : expected_text_(std::move(expected_text)) {}

void TypingSession::onKeyDown(const std::string& key, const std::string& code, Millis timestamp) {
    (void)code;
    // Auto-repeat delivers further key-downs for a held key; keep the first.
    pressed_keys_.emplace(key, timestamp);
}

void TypingSession::onKeyUp(const std::string& key,
                            const std::string& code,
                            Millis timestamp,
                            bool is_correct) {
    recordRelease(key, code, timestamp, is_correct, expectedAtCursor(), cursor_);
}

void TypingSession::onKeyUp(const std::string& key,
                            const std::string& code,
                            Millis timestamp,
                            bool is_correct,
                            std::optional<std::string> expected_override,
                            std::optional<std::size_t> position_override) {
    recordRelease(key, code, timestamp, is_correct, std::move(expected_override),
                  position_override.value_or(cursor_));
}

void TypingSession::reset() {
    events_.clear();
    pressed_keys_.clear();
    last_release_time_.reset();
    cursor_ = 0;
}

void TypingSession::reset(std::string expected_text) {
    reset();
    expected_text_ = std::move(expected_text);
}

void TypingSession::recordRelease(const std::string& key,
                                  const std::string& code,
                                  Millis timestamp,
                                  bool is_correct,
                                  std::optional<std::string> expected_key,
                                  std::size_t position) {
    auto it = pressed_keys_.find(key);
    if (it == pressed_keys_.end()) {
        return;
    }
    const Millis press_time = it->second;
    pressed_keys_.erase(it);
    if (!(timestamp >= press_time)) {
        // A release stamped before its press, or a non-finite stamp, cannot be paired.
        return;
    }

    KeystrokeEvent event;
    event.key = key;
    event.code = code;
    event.press_time = press_time;
    event.release_time = timestamp;
    event.dwell_time = timestamp - press_time;
    if (last_release_time_) {
        event.flight_time = press_time - *last_release_time_;
    }
    event.is_correct = is_correct;
    event.expected_key = std::move(expected_key);
    event.position = position;
    if (auto assignment = resolveFinger(key, code)) {
        event.finger = assignment->finger;
        event.hand = assignment->hand;
    }

    events_.push_back(std::move(event));
    last_release_time_ = timestamp;
}

std::optional<std::string> TypingSession::expectedAtCursor() const {
    if (cursor_ >= expected_text_.size()) {
        return std::nullopt;
    }
    return std::string(1, expected_text_[cursor_]);
}

}  // namespace ks::analytics
