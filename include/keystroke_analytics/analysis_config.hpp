#pragma once

#include <cstddef>

#include "keystroke_analytics/types.hpp"

namespace ks::analytics {

struct AnalysisConfig {
    // Below this many events the windowed metrics, error bursts and slow words are absent.
    std::size_t min_sample_events{5};
    std::size_t position_buckets{10};
    std::size_t accuracy_buckets{5};
    Millis burst_window_ms{5000.0};
    double peak_window_fraction{0.2};
    int wpm_cap{300};
    // Flights at or above this are pauses, not rhythm.
    Millis flight_outlier_ms{1000.0};
    double slow_word_factor{1.3};
    std::size_t max_slow_words{10};
    std::size_t digraph_min_occurrences{2};
    std::size_t digraph_list_size{5};
};

}  // namespace ks::analytics
