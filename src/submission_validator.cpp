#include "keystroke_analytics/submission_validator.hpp"

#include <algorithm>
#include <cmath>

#include "keystroke_analytics/statistics.hpp"

namespace ks::analytics {

SubmissionValidator::SubmissionValidator(SubmissionThresholds thresholds)
    : thresholds_(thresholds) {}

double SubmissionValidator::serverWpm(const EventLog& events) {
    if (events.size() < 2) {
        return 0.0;
    }
    const Millis total = events.back().press_time - events.front().press_time;
    if (total <= 0.0) {
        return 0.0;
    }
    const auto correct = std::count_if(events.begin(), events.end(),
                                       [](const KeystrokeEvent& ev) { return ev.is_correct; });
    const double words = static_cast<double>(correct) / 5.0;
    return static_cast<double>(stats::roundHalfUp(words / (total / 60000.0)));
}

std::vector<Millis> SubmissionValidator::rawIntervals(const EventLog& events) {
    std::vector<Millis> intervals;
    for (std::size_t i = 1; i < events.size(); ++i) {
        intervals.push_back(events[i].press_time - events[i - 1].press_time);
    }
    return intervals;
}

bool SubmissionValidator::detectBurstTyping(const std::vector<Millis>& intervals) const {
    const std::size_t window = thresholds_.burst_window_size;
    // Needs 2 * window keystrokes, i.e. 2 * window - 1 intervals.
    if (window == 0 || intervals.size() + 1 < window * 2) {
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

bool SubmissionValidator::detectProgrammaticPattern(const std::vector<Millis>& intervals) const {
    if (intervals.empty() || intervals.size() < thresholds_.programmatic_min_intervals) {
        return false;
    }
    std::size_t steady = 0;
    for (std::size_t i = 1; i < intervals.size(); ++i) {
        if (std::fabs(intervals[i] - intervals[i - 1]) < thresholds_.max_consistent_delta_ms) {
            ++steady;
        }
    }
    return static_cast<double>(steady) / static_cast<double>(intervals.size()) > thresholds_.programmatic_ratio;
}

SubmissionVerdict SubmissionValidator::validate(const EventLog& events,
                                                double reported_wpm,
                                                const AntiCheatResult& anti_cheat) const {
    SubmissionVerdict verdict;
    verdict.reported_wpm = reported_wpm;
    if (events.size() < thresholds_.min_keystrokes_for_analysis) {
        verdict.server_wpm = reported_wpm;
        return verdict;
    }

    verdict.server_wpm = serverWpm(events);
    verdict.wpm_discrepancy = std::fabs(verdict.server_wpm - reported_wpm);

    auto flag = [&verdict](const char* reason, bool review) {
        verdict.flag_reasons.emplace_back(reason);
        ++verdict.suspicious_patterns;
        verdict.requires_review = verdict.requires_review || review;
    };

    const bool inhuman = anti_cheat.hasFlag(SuspicionFlag::InhumanSpeed);
    if (inhuman) {
        flag(flagName(SuspicionFlag::InhumanSpeed), true);
    }
    if (verdict.wpm_discrepancy > thresholds_.wpm_discrepancy_threshold) {
        flag("wpm_discrepancy", true);
    }

    const auto intervals = rawIntervals(events);
    if (detectBurstTyping(intervals)) {
        flag(flagName(SuspicionFlag::BurstTyping), false);
    }
    if (detectProgrammaticPattern(intervals)) {
        flag(flagName(SuspicionFlag::ProgrammaticPattern), true);
    }

    const bool all_correct = std::all_of(events.begin(), events.end(),
                                         [](const KeystrokeEvent& ev) { return ev.is_correct; });
    if (all_correct && verdict.server_wpm > thresholds_.perfect_accuracy_wpm_threshold) {
        flag("perfect_accuracy_high_wpm", false);
    }

    if (anti_cheat.synthetic_input_detected) {
        verdict.requires_review = true;
    }

    verdict.is_flagged = !verdict.flag_reasons.empty();
    verdict.is_valid = verdict.suspicious_patterns < thresholds_.max_suspicious_patterns && !inhuman;
    return verdict;
}

}  // namespace ks::analytics
