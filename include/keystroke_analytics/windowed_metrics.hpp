#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "keystroke_analytics/analysis_config.hpp"
#include "keystroke_analytics/types.hpp"

namespace ks::analytics {

struct PeakWindow {
    std::size_t start_position{0};
    std::size_t end_position{0};
    int wpm{0};
};

// Splits [0, count) into `buckets` contiguous ranges of ceil(count / buckets)
// events each. Trailing ranges may be empty.
[[nodiscard]] std::vector<std::pair<std::size_t, std::size_t>> chunkRanges(std::size_t count,
                                                                         std::size_t buckets);

// (correct / 5) / minutes, from the first press to the last release of
// events[begin, end). nullopt for an empty range or non-positive duration.
[[nodiscard]] std::optional<double> spanWpm(const EventLog& events, std::size_t begin, std::size_t end);

[[nodiscard]] std::optional<int> burstWpm(const EventLog& events, const AnalysisConfig& config = {});
[[nodiscard]] std::optional<std::vector<int>> wpmByPosition(const EventLog& events,
                                                            const AnalysisConfig& config = {});
[[nodiscard]] std::optional<std::vector<int>> rollingAccuracy(const EventLog& events,
                                                              const AnalysisConfig& config = {});
[[nodiscard]] std::optional<PeakWindow> peakPerformanceWindow(const EventLog& events,
                                                              const AnalysisConfig& config = {});

// Percent speed change from the first half to the second; positive means slowing down.
[[nodiscard]] std::optional<int> fatigueIndicator(const EventLog& events, const AnalysisConfig& config = {});

// Time-normalised WPM over the whole log; net_wpm is used when the log has no usable duration.
[[nodiscard]] int adjustedWpm(const EventLog& events, double net_wpm);

// Derives wpm, raw wpm and accuracy from the log when the host did not supply them.
[[nodiscard]] std::optional<SessionSummary> summarizeSession(const EventLog& events);

}  // namespace ks::analytics
