#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "keystroke_analytics/anti_cheat_validator.hpp"
#include "keystroke_analytics/types.hpp"

namespace ks::analytics {

struct SubmissionThresholds {
    std::size_t min_keystrokes_for_analysis{20};
    double wpm_discrepancy_threshold{15.0};
    double perfect_accuracy_wpm_threshold{80.0};
    std::size_t max_suspicious_patterns{3};
    Millis suspect_interval_ms{25.0};
    std::size_t burst_window_size{10};
    double burst_threshold_ratio{0.8};
    std::size_t programmatic_min_intervals{10};
    Millis max_consistent_delta_ms{5.0};
    double programmatic_ratio{0.9};
};

struct SubmissionVerdict {
    bool is_valid{true};
    bool is_flagged{false};
    bool requires_review{false};
    std::vector<std::string> flag_reasons;
    std::size_t suspicious_patterns{0};
    double server_wpm{0.0};
    double reported_wpm{0.0};
    double wpm_discrepancy{0.0};
};

// Re-derives a result from its event log and checks the numbers a client reported.
class SubmissionValidator {
public:
    explicit SubmissionValidator(SubmissionThresholds thresholds = {});

    [[nodiscard]] SubmissionVerdict validate(const EventLog& events,
                                             double reported_wpm,
                                             const AntiCheatResult& anti_cheat) const;

    // round((correct / 5) / minutes) between the first and last press.
    [[nodiscard]] static double serverWpm(const EventLog& events);

    // Press-to-press gaps between consecutive events, including non-positive ones.
    [[nodiscard]] static std::vector<Millis> rawIntervals(const EventLog& events);

    [[nodiscard]] bool detectBurstTyping(const std::vector<Millis>& intervals) const;
    [[nodiscard]] bool detectProgrammaticPattern(const std::vector<Millis>& intervals) const;

    [[nodiscard]] const SubmissionThresholds& thresholds() const noexcept { return thresholds_; }

private:
    SubmissionThresholds thresholds_;
};

}  // namespace ks::analytics
