#include "keystroke_analytics/report_assembler.hpp"

#include <algorithm>
#include <cctype>

#include "keystroke_analytics/timing_analyzer.hpp"

namespace ks::analytics {

namespace {

std::string upperGlyph(const std::string& key) {
    std::string out;
    out.reserve(key.size());
    for (char ch : key) {
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    return out;
}

void fillKeyUsage(const EventLog& events, AnalyticsReport& report) {
    std::map<Finger, std::size_t> fingers;
    std::map<std::string, std::size_t> heatmap;
    std::size_t left = 0;
    std::size_t right = 0;
    for (const auto& ev : events) {
        ++heatmap[upperGlyph(ev.key)];
        if (ev.finger) {
            ++fingers[*ev.finger];
        }
        if (ev.hand == Hand::Left) {
            ++left;
        } else if (ev.hand == Hand::Right) {
            ++right;
        }
    }
    report.finger_usage = std::move(fingers);
    report.key_heatmap = std::move(heatmap);
    if (left + right > 0) {
        report.hand_balance = static_cast<double>(left) / static_cast<double>(left + right) * 100.0;
    }
}

}  // namespace

ReportAssembler::ReportAssembler(AnalysisConfig analysis, AntiCheatThresholds anti_cheat)
    : analysis_(analysis), validator_(anti_cheat) {}

AnalyticsReport ReportAssembler::assemble(const TypingSession& session) const {
    return assemble(session.events(), session.expectedText(), std::nullopt);
}

AnalyticsReport ReportAssembler::assemble(const TypingSession& session, const SessionSummary& summary) const {
    return assemble(session.events(), session.expectedText(), summary);
}

AnalyticsReport ReportAssembler::assemble(const EventLog& events,
                                          const std::string& expected_text,
                                          std::optional<SessionSummary> summary) const {
    AnalyticsReport report;
    report.event_count = events.size();

    if (!summary) {
        summary = summarizeSession(events);
    }
    if (summary) {
        report.wpm = summary->wpm;
        report.raw_wpm = summary->raw_wpm;
        report.accuracy = summary->accuracy;
    }

    report.anti_cheat = validator_.validate(events, report.wpm.value_or(0.0));
    if (events.empty()) {
        return report;
    }

    const auto timing = computeTimingStats(events);
    const auto flights = flightTimes(events);
    report.avg_dwell_ms = timing.avg_dwell_ms;
    report.avg_flight_ms = timing.avg_flight_ms;
    report.std_dev_flight_ms = timing.std_dev_flight_ms;
    report.consistency = consistencyScore(flights, analysis_.flight_outlier_ms);
    report.consistency_rating = consistencyRating(report.consistency);
    report.typing_rhythm = typingRhythmScore(flights, analysis_.flight_outlier_ms);

    auto digraphs = profileDigraphs(events, analysis_.digraph_min_occurrences, analysis_.digraph_list_size);
    report.fastest_digraph = std::move(digraphs.fastest);
    report.slowest_digraph = std::move(digraphs.slowest);
    report.top_digraphs = std::move(digraphs.top);
    report.bottom_digraphs = std::move(digraphs.bottom);

    fillKeyUsage(events, report);

    auto errors = classifyErrors(events, analysis_);
    report.total_errors = errors.total_errors;
    report.errors_by_type = std::move(errors.errors_by_type);
    report.error_keys = std::move(errors.error_keys);
    report.error_burst_count = errors.error_burst_count;
    report.slowest_words = slowestWords(events, expected_text, analysis_);

    report.wpm_by_position = wpmByPosition(events, analysis_);
    report.burst_wpm = burstWpm(events, analysis_);
    report.adjusted_wpm = adjustedWpm(events, report.wpm.value_or(0.0));
    report.rolling_accuracy = rollingAccuracy(events, analysis_);
    report.peak_performance = peakPerformanceWindow(events, analysis_);
    report.fatigue_indicator = fatigueIndicator(events, analysis_);
    return report;
}

}  // namespace ks::analytics
