#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "keystroke_analytics/key_layout.hpp"

namespace ks::analytics {

// Monotonic host clock, milliseconds.
using Millis = double;

struct KeystrokeEvent {
    std::string key;
    std::string code;
    Millis press_time{0.0};
    Millis release_time{0.0};
    Millis dwell_time{0.0};
    std::optional<Millis> flight_time;
    bool is_correct{false};
    std::optional<std::string> expected_key;
    std::size_t position{0};
    std::optional<Finger> finger;
    std::optional<Hand> hand;
};

using EventLog = std::vector<KeystrokeEvent>;

// Host-computed headline numbers for a finished test.
struct SessionSummary {
    double wpm{0.0};
    double raw_wpm{0.0};
    double accuracy{0.0};
};

}  // namespace ks::analytics
