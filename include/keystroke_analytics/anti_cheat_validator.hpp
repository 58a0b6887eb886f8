#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "keystroke_analytics/types.hpp"

namespace ks::analytics {

enum class SuspicionFlag {
    InhumanSpeed,
    ImpossibleWpm,
    ProgrammaticPattern,
    BurstTyping,
    PerfectRhythm,
    UniformFlightTimes,
};

[[nodiscard]] const char* flagName(SuspicionFlag flag) noexcept;

struct AntiCheatThresholds {
    std::size_t min_keystrokes_for_analysis{20};
    Millis min_keystroke_interval_ms{10.0};
    Millis suspect_interval_ms{25.0};
    double max_wpm_without_flag{200.0};
    // ms^2 for variances, ms for interval-to-interval deltas.
    double max_consistent_variance{5.0};
    std::size_t programmatic_min_intervals{20};
    std::size_t burst_window_size{10};
    double burst_threshold_ratio{0.8};
    std::size_t perfect_rhythm_min_intervals{20};
    double perfect_rhythm_ratio{0.95};
    std::size_t flight_check_min_flights{20};
    std::size_t flight_check_min_filtered{10};
    Millis flight_plausible_max_ms{500.0};
    std::size_t suspicious_flag_threshold{2};
    int score_penalty_per_flag{20};
    int synthetic_input_penalty{30};
};

struct AntiCheatResult {
    bool is_suspicious{false};
    std::vector<SuspicionFlag> flags;
    int validation_score{100};
    std::optional<double> min_interval_ms;
    std::optional<double> interval_variance;
    bool synthetic_input_detected{false};

    [[nodiscard]] bool hasFlag(SuspicionFlag flag) const;
};

// Strictly positive press-to-press gaps between consecutive events.
[[nodiscard]] std::vector<Millis> pressIntervals(const EventLog& events);

class AntiCheatValidator {
public:
    explicit AntiCheatValidator(AntiCheatThresholds thresholds = {});

    [[nodiscard]] AntiCheatResult validate(const EventLog& events, double wpm) const;

    // event_count gates the analysis; intervals and flights are used as given.
    [[nodiscard]] AntiCheatResult evaluate(std::size_t event_count,
                                           const std::vector<Millis>& intervals,
                                           const std::vector<Millis>& flights,
                                           double wpm) const;

    [[nodiscard]] const AntiCheatThresholds& thresholds() const noexcept { return thresholds_; }

private:
    bool detectSuspiciousBursts(const std::vector<Millis>& intervals) const;
    bool detectPerfectRhythm(const std::vector<Millis>& intervals) const;
    bool detectUniformFlights(const std::vector<Millis>& flights) const;

    AntiCheatThresholds thresholds_;
};

}  // namespace ks::analytics
