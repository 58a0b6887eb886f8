#include "keystroke_analytics/timing_analyzer.hpp"

#include <algorithm>
#include <iterator>

#include "keystroke_analytics/statistics.hpp"

namespace ks::analytics {

namespace {

std::vector<Millis> positiveWithin(const std::vector<Millis>& flights, Millis upper) {
    std::vector<Millis> out;
    for (Millis t : flights) {
        if (t > 0.0 && t < upper) {
            out.push_back(t);
        }
    }
    return out;
}

std::vector<Millis> positive(const std::vector<Millis>& flights) {
    std::vector<Millis> out;
    std::copy_if(flights.begin(), flights.end(), std::back_inserter(out),
                 [](Millis t) { return t > 0.0; });
    return out;
}

}  // namespace

std::vector<Millis> dwellTimes(const EventLog& events) {
    std::vector<Millis> out;
    out.reserve(events.size());
    for (const auto& ev : events) {
        out.push_back(ev.dwell_time);
    }
    return out;
}

std::vector<Millis> flightTimes(const EventLog& events) {
    std::vector<Millis> out;
    out.reserve(events.size());
    for (const auto& ev : events) {
        if (ev.flight_time) {
            out.push_back(*ev.flight_time);
        }
    }
    return out;
}

TimingStats computeTimingStats(const EventLog& events) {
    const auto dwells = dwellTimes(events);
    const auto flights = flightTimes(events);

    TimingStats stats;
    stats.dwell_samples = dwells.size();
    stats.flight_samples = flights.size();
    stats.avg_dwell_ms = stats::mean(dwells);
    stats.avg_flight_ms = stats::mean(flights);
    if (flights.size() > 1) {
        stats.std_dev_flight_ms = stats::standardDeviation(flights);
    }
    return stats;
}

std::optional<double> flightRhythmScore(const std::vector<Millis>& flights,
                                        Millis outlier_ms,
                                        std::size_t min_samples) {
    if (flights.size() < min_samples) {
        return std::nullopt;
    }
    auto sample = positiveWithin(flights, outlier_ms);
    if (sample.size() < min_samples) {
        sample = positive(flights);
    }
    if (sample.size() < min_samples || sample.empty()) {
        return std::nullopt;
    }

    const double avg = *stats::mean(sample);
    const double cv = *stats::standardDeviation(sample) / avg;
    return std::clamp(100.0 - cv * kVariationScale, 0.0, 100.0);
}

std::optional<double> consistencyScore(const std::vector<Millis>& flights, Millis outlier_ms) {
    return flightRhythmScore(flights, outlier_ms, kConsistencyMinSamples);
}

std::optional<int> typingRhythmScore(const std::vector<Millis>& flights, Millis outlier_ms) {
    auto score = flightRhythmScore(flights, outlier_ms, kRhythmMinSamples);
    if (!score) {
        return std::nullopt;
    }
    return static_cast<int>(stats::roundHalfUp(*score));
}

std::optional<int> consistencyRating(std::optional<double> consistency) {
    if (!consistency) {
        return std::nullopt;
    }
    return std::clamp(static_cast<int>(stats::roundHalfUp(*consistency)), 0, 100);
}

}  // namespace ks::analytics
