#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "keystroke_analytics/analysis_config.hpp"
#include "keystroke_analytics/anti_cheat_validator.hpp"
#include "keystroke_analytics/digraph_profiler.hpp"
#include "keystroke_analytics/error_classifier.hpp"
#include "keystroke_analytics/key_layout.hpp"
#include "keystroke_analytics/typing_session.hpp"
#include "keystroke_analytics/windowed_metrics.hpp"

namespace ks::analytics {

// Every optional field is absent when the log holds too little data for it.
struct AnalyticsReport {
    std::optional<double> wpm;
    std::optional<double> raw_wpm;
    std::optional<double> accuracy;

    std::optional<double> consistency;
    std::optional<int> consistency_rating;
    std::optional<double> avg_dwell_ms;
    std::optional<double> avg_flight_ms;
    std::optional<double> std_dev_flight_ms;

    std::optional<std::string> fastest_digraph;
    std::optional<std::string> slowest_digraph;
    std::optional<std::vector<DigraphTiming>> top_digraphs;
    std::optional<std::vector<DigraphTiming>> bottom_digraphs;

    std::optional<std::map<Finger, std::size_t>> finger_usage;
    std::optional<double> hand_balance;
    std::optional<std::map<std::string, std::size_t>> key_heatmap;

    std::size_t total_errors{0};
    std::optional<std::map<ErrorType, std::size_t>> errors_by_type;
    std::optional<std::vector<std::string>> error_keys;
    std::optional<std::size_t> error_burst_count;
    std::optional<std::vector<std::string>> slowest_words;

    std::optional<std::vector<int>> wpm_by_position;
    std::optional<int> burst_wpm;
    std::optional<int> adjusted_wpm;
    std::optional<std::vector<int>> rolling_accuracy;
    std::optional<int> typing_rhythm;
    std::optional<PeakWindow> peak_performance;
    std::optional<int> fatigue_indicator;

    std::size_t event_count{0};
    AntiCheatResult anti_cheat;
};

class ReportAssembler {
public:
    explicit ReportAssembler(AnalysisConfig analysis = {}, AntiCheatThresholds anti_cheat = {});

    // Speed and accuracy are derived from the log.
    [[nodiscard]] AnalyticsReport assemble(const TypingSession& session) const;
    [[nodiscard]] AnalyticsReport assemble(const TypingSession& session, const SessionSummary& summary) const;

    [[nodiscard]] AnalyticsReport assemble(const EventLog& events,
                                           const std::string& expected_text,
                                           std::optional<SessionSummary> summary) const;

    [[nodiscard]] const AnalysisConfig& analysisConfig() const noexcept { return analysis_; }
    [[nodiscard]] const AntiCheatValidator& antiCheat() const noexcept { return validator_; }

private:
    AnalysisConfig analysis_;
    AntiCheatValidator validator_;
};

}  // namespace ks::analytics
