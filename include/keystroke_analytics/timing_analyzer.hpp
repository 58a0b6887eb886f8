#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "keystroke_analytics/types.hpp"

namespace ks::analytics {

// Weight applied to the coefficient of variation of flight times when mapping
// it onto the 0-100 rhythm scale.
inline constexpr double kVariationScale = 50.0;

inline constexpr Millis kDefaultFlightOutlierMs = 1000.0;
inline constexpr std::size_t kConsistencyMinSamples = 2;
inline constexpr std::size_t kRhythmMinSamples = 3;

struct TimingStats {
    std::optional<double> avg_dwell_ms;
    std::optional<double> avg_flight_ms;
    std::optional<double> std_dev_flight_ms;
    std::size_t dwell_samples{0};
    std::size_t flight_samples{0};
};

[[nodiscard]] std::vector<Millis> dwellTimes(const EventLog& events);
[[nodiscard]] std::vector<Millis> flightTimes(const EventLog& events);

[[nodiscard]] TimingStats computeTimingStats(const EventLog& events);

// 100 - cv * kVariationScale over flights in (0, outlier_ms), falling back to
// every positive flight when fewer than min_samples survive the band.
[[nodiscard]] std::optional<double> flightRhythmScore(const std::vector<Millis>& flights,
                                                      Millis outlier_ms,
                                                      std::size_t min_samples);

[[nodiscard]] std::optional<double> consistencyScore(const std::vector<Millis>& flights,
                                                     Millis outlier_ms = kDefaultFlightOutlierMs);

[[nodiscard]] std::optional<int> typingRhythmScore(const std::vector<Millis>& flights,
                                                   Millis outlier_ms = kDefaultFlightOutlierMs);

[[nodiscard]] std::optional<int> consistencyRating(std::optional<double> consistency);

}  // namespace ks::analytics
