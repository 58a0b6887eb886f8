#include "keystroke_analytics/anti_cheat_validator.hpp"

#include <algorithm>
#include <cmath>

#include "keystroke_analytics/statistics.hpp"
#include "keystroke_analytics/timing_analyzer.hpp"

namespace ks::analytics {

const char* flagName(SuspicionFlag flag) noexcept {
    switch (flag) {
        case SuspicionFlag::InhumanSpeed: return "inhuman_speed";
        case SuspicionFlag::ImpossibleWpm: return "impossible_wpm";
        case SuspicionFlag::ProgrammaticPattern: return "programmatic_pattern";
        case SuspicionFlag::BurstTyping: return "burst_typing";
        case SuspicionFlag::PerfectRhythm: return "perfect_rhythm";
        case SuspicionFlag::UniformFlightTimes: return "uniform_flight_times";
    }
    return "unknown";
}

bool AntiCheatResult::hasFlag(SuspicionFlag flag) const {
    return std::find(flags.begin(), flags.end(), flag) != flags.end();
}

std::vector<Millis> pressIntervals(const EventLog& events) {
    std::vector<Millis> intervals;
    for (std::size_t i = 1; i < events.size(); ++i) {
        const Millis gap = events[i].press_time - events[i - 1].press_time;
        if (gap > 0.0) {
            intervals.push_back(gap);
        }
    }
    return intervals;
}

AntiCheatValidator::AntiCheatValidator(AntiCheatThresholds thresholds)
    : thresholds_(thresholds) {}

AntiCheatResult AntiCheatValidator::validate(const EventLog& events, double wpm) const {
    return evaluate(events.size(), pressIntervals(events), flightTimes(events), wpm);
}

AntiCheatResult AntiCheatValidator::evaluate(std::size_t event_count,
                                             const std::vector<Millis>& intervals,
                                             const std::vector<Millis>& flights,
                                             double wpm) const {
    AntiCheatResult result;
    if (event_count < thresholds_.min_keystrokes_for_analysis) {
        return result;
    }

    std::optional<double> min_interval;
    if (!intervals.empty()) {
        min_interval = *std::min_element(intervals.begin(), intervals.end());
    }
    std::optional<double> variance;
    if (intervals.size() > 1) {
        variance = stats::variance(intervals);
    }

    if (min_interval && *min_interval < thresholds_.min_keystroke_interval_ms) {
        result.flags.push_back(SuspicionFlag::InhumanSpeed);
        result.synthetic_input_detected = true;
    }

    if (wpm > thresholds_.max_wpm_without_flag) {
        result.flags.push_back(SuspicionFlag::ImpossibleWpm);
    }

    if (variance && *variance < thresholds_.max_consistent_variance &&
        intervals.size() > thresholds_.programmatic_min_intervals) {
        result.flags.push_back(SuspicionFlag::ProgrammaticPattern);
        result.synthetic_input_detected = true;
    }

    if (detectSuspiciousBursts(intervals)) {
        result.flags.push_back(SuspicionFlag::BurstTyping);
    }

    if (detectPerfectRhythm(intervals)) {
        result.flags.push_back(SuspicionFlag::PerfectRhythm);
        result.synthetic_input_detected = true;
    }

    if (detectUniformFlights(flights)) {
        // Same signal as programmatic_pattern seen from the release side; flag it once.
        if (!result.hasFlag(SuspicionFlag::ProgrammaticPattern)) {
            result.flags.push_back(SuspicionFlag::UniformFlightTimes);
        }
        result.synthetic_input_detected = true;
    }

    int score = 100 - thresholds_.score_penalty_per_flag * static_cast<int>(result.flags.size());
    if (result.synthetic_input_detected) {
        score -= thresholds_.synthetic_input_penalty;
    }
    result.validation_score = std::clamp(score, 0, 100);
    result.is_suspicious = result.flags.size() >= thresholds_.suspicious_flag_threshold;

    if (min_interval) {
        result.min_interval_ms = static_cast<double>(stats::roundHalfUp(*min_interval));
    }
    if (variance) {
        result.interval_variance = stats::roundTo(*variance, 2);
    }
    return result;
}

bool AntiCheatValidator::detectSuspiciousBursts(const std::vector<Millis>& intervals) const {
    const std::size_t window = thresholds_.burst_window_size;
    if (window == 0 || intervals.size() < window * 2) {
        return false;
    }

    for (std::size_t i = 0; i + window <= intervals.size(); ++i) {
        const auto fast = std::count_if(intervals.begin() + static_cast<std::ptrdiff_t>(i),
                                        intervals.begin() + static_cast<std::ptrdiff_t>(i + window),
                                        [this](Millis t) { return t < thresholds_.suspect_interval_ms; });
        if (static_cast<double>(fast) / static_cast<double>(window) >= thresholds_.burst_threshold_ratio) {
            return true;
        }
    }
    return false;
}

bool AntiCheatValidator::detectPerfectRhythm(const std::vector<Millis>& intervals) const {
    if (intervals.empty() || intervals.size() < thresholds_.perfect_rhythm_min_intervals) {
        return false;
    }

    std::size_t steady = 0;
    for (std::size_t i = 1; i < intervals.size(); ++i) {
        if (std::fabs(intervals[i] - intervals[i - 1]) < thresholds_.max_consistent_variance) {
            ++steady;
        }
    }
    return static_cast<double>(steady) / static_cast<double>(intervals.size()) >
           thresholds_.perfect_rhythm_ratio;
}

bool AntiCheatValidator::detectUniformFlights(const std::vector<Millis>& flights) const {
    if (flights.size() <= thresholds_.flight_check_min_flights) {
        return false;
    }

    std::vector<Millis> plausible;
    for (Millis t : flights) {
        if (t > 0.0 && t < thresholds_.flight_plausible_max_ms) {
            plausible.push_back(t);
        }
    }
    if (plausible.size() <= thresholds_.flight_check_min_filtered) {
        return false;
    }
    return *stats::variance(plausible) < thresholds_.max_consistent_variance;
}

}  // namespace ks::analytics
