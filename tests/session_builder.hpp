#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "keystroke_analytics/typing_session.hpp"

namespace ks::analytics::fixtures {

// Drives a TypingSession the way the capture layer would: one press/release
// pair per character, cursor moved by the caller before each release.
class SessionBuilder {
public:
    explicit SessionBuilder(std::string text, Millis start = 1000.0)
        : session_(std::move(text)), next_press_(start) {}

    // Presses `key`, releases it `dwell` ms later, and schedules the next press `interval` ms after this one.
    SessionBuilder& type(const std::string& key, Millis interval, bool correct = true, Millis dwell = 40.0) {
        const Millis press = next_press_;
        session_.setCursor(position_);
        session_.onKeyDown(key, "", press);
        session_.onKeyUp(key, "", press + dwell, correct);
        ++position_;
        next_press_ = press + interval;
        return *this;
    }

    SessionBuilder& typeText(const std::string& text, Millis interval, Millis dwell = 40.0) {
        for (char ch : text) {
            type(std::string(1, ch), interval, true, dwell);
        }
        return *this;
    }

    TypingSession& session() { return session_; }
    const EventLog& events() const { return session_.events(); }

private:
    TypingSession session_;
    Millis next_press_;
    std::size_t position_{0};
};

inline KeystrokeEvent makeEvent(const std::string& key,
                                Millis press,
                                Millis release,
                                bool correct = true,
                                std::size_t position = 0) {
    KeystrokeEvent ev;
    ev.key = key;
    ev.press_time = press;
    ev.release_time = release;
    ev.dwell_time = release - press;
    ev.is_correct = correct;
    ev.expected_key = key;
    ev.position = position;
    return ev;
}

// press[i+1] = press[i] + intervals[i]; release = press + dwells[i]. Flights follow from both.
inline EventLog logFromTimings(const std::vector<Millis>& intervals, const std::vector<Millis>& dwells) {
    static const std::string kKeys = "abcdefghijklmnopqrstuvwxyz";
    EventLog log;
    Millis press = 0.0;
    for (std::size_t i = 0; i < dwells.size(); ++i) {
        auto ev = makeEvent(std::string(1, kKeys[i % kKeys.size()]), press, press + dwells[i], true, i);
        if (!log.empty()) {
            ev.flight_time = press - log.back().release_time;
        }
        log.push_back(ev);
        if (i < intervals.size()) {
            press += intervals[i];
        }
    }
    return log;
}

inline EventLog logFromIntervals(const std::vector<Millis>& intervals, Millis dwell = 20.0) {
    return logFromTimings(intervals, std::vector<Millis>(intervals.size() + 1, dwell));
}

// Human-like press gaps: mean 150 ms, standard deviation about 38 ms.
inline std::vector<Millis> humanIntervals(std::size_t count, Millis mean = 150.0) {
    static const Millis kJitter[] = {-60, 25, -10, 55, -30, 5, 40, -50, 45, -20};
    std::vector<Millis> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(mean + kJitter[i % 10]);
    }
    return out;
}

}  // namespace ks::analytics::fixtures
