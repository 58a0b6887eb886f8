#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "keystroke_analytics/types.hpp"

namespace ks::analytics {

struct DigraphTiming {
    std::string digraph;
    int avg_time_ms{0};
    std::size_t count{0};
};

struct DigraphSamples {
    std::string digraph;
    std::vector<Millis> transitions;
};

struct DigraphProfile {
    std::optional<std::string> fastest;
    std::optional<std::string> slowest;
    std::optional<std::vector<DigraphTiming>> top;
    std::optional<std::vector<DigraphTiming>> bottom;
    std::size_t distinct_digraphs{0};
};

// Release-to-press transition of every consecutive event pair, grouped by
// digraph in first-seen order.
[[nodiscard]] std::vector<DigraphSamples> collectDigraphs(const EventLog& events);

[[nodiscard]] DigraphProfile profileDigraphs(const EventLog& events,
                                             std::size_t min_occurrences = 2,
                                             std::size_t list_size = 5);

}  // namespace ks::analytics
