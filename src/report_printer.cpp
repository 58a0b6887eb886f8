#include "keystroke_analytics/report_printer.hpp"

#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace ks::analytics {

namespace {

template <typename T>
std::string orAbsent(const std::optional<T>& value) {
    if (!value) {
        return "n/a";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << *value;
    return oss.str();
}

std::string joinInts(const std::vector<int>& values) {
    std::ostringstream oss;
    bool first = true;
    for (int v : values) {
        if (!first) oss << ' ';
        oss << v;
        first = false;
    }
    return oss.str();
}

std::string joinDigraphs(const std::vector<DigraphTiming>& list) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& d : list) {
        if (!first) oss << ", ";
        oss << '"' << d.digraph << "\" " << d.avg_time_ms << "ms x" << d.count;
        first = false;
    }
    return oss.str();
}

}  // namespace

ReportPrinter::ReportPrinter(std::ostream& out, bool verbose) : out_(out), verbose_(verbose) {}

void ReportPrinter::printReport(const AnalyticsReport& report) const {
    out_ << "Session (" << report.event_count << " keystrokes):" << '\n'
         << "  wpm " << orAbsent(report.wpm)
         << "  raw " << orAbsent(report.raw_wpm)
         << "  accuracy " << orAbsent(report.accuracy) << "%" << '\n'
         << "  adjusted " << orAbsent(report.adjusted_wpm)
         << "  burst " << orAbsent(report.burst_wpm) << '\n'
         << "  consistency " << orAbsent(report.consistency)
         << "  rhythm " << orAbsent(report.typing_rhythm)
         << "  fatigue " << orAbsent(report.fatigue_indicator) << "%" << '\n'
         << "  dwell avg " << orAbsent(report.avg_dwell_ms) << "ms"
         << "  flight avg " << orAbsent(report.avg_flight_ms) << "ms"
         << "  flight sd " << orAbsent(report.std_dev_flight_ms) << "ms" << '\n';

    out_ << "  errors " << report.total_errors
         << "  bursts " << orAbsent(report.error_burst_count) << '\n';
    if (report.errors_by_type) {
        out_ << "  error types:";
        for (const auto& [type, count] : *report.errors_by_type) {
            out_ << ' ' << errorTypeName(type) << '=' << count;
        }
        out_ << '\n';
    }
    if (report.error_keys && !report.error_keys->empty()) {
        out_ << "  mistyped:";
        for (const auto& key : *report.error_keys) {
            out_ << " '" << key << "'";
        }
        out_ << '\n';
    }
    if (report.slowest_words && !report.slowest_words->empty()) {
        out_ << "  slow words:";
        for (const auto& word : *report.slowest_words) {
            out_ << ' ' << word;
        }
        out_ << '\n';
    }

    if (report.wpm_by_position) {
        out_ << "  wpm by position: " << joinInts(*report.wpm_by_position) << '\n';
    }
    if (report.rolling_accuracy) {
        out_ << "  rolling accuracy: " << joinInts(*report.rolling_accuracy) << '\n';
    }
    if (report.peak_performance) {
        out_ << "  peak window: chars " << report.peak_performance->start_position << "-"
             << report.peak_performance->end_position << " at " << report.peak_performance->wpm
             << " wpm" << '\n';
    }

    if (report.fastest_digraph && report.slowest_digraph) {
        out_ << "  digraphs: fastest \"" << *report.fastest_digraph << "\" slowest \""
             << *report.slowest_digraph << "\"" << '\n';
    }
    if (report.top_digraphs) {
        out_ << "  top digraphs: " << joinDigraphs(*report.top_digraphs) << '\n';
    }
    if (report.bottom_digraphs) {
        out_ << "  bottom digraphs: " << joinDigraphs(*report.bottom_digraphs) << '\n';
    }

    if (report.hand_balance) {
        out_ << "  hand balance: " << orAbsent(report.hand_balance) << "% left" << '\n';
    }
    if (verbose_ && report.finger_usage) {
        out_ << "  fingers:" << '\n';
        for (const auto& [finger, count] : *report.finger_usage) {
            out_ << "    " << std::left << std::setw(13) << fingerName(finger) << std::right
                 << count << '\n';
        }
    }
    if (verbose_ && report.key_heatmap) {
        out_ << "  heatmap:";
        for (const auto& [key, count] : *report.key_heatmap) {
            out_ << " [" << key << "]=" << count;
        }
        out_ << '\n';
    }

    printAntiCheat(report.anti_cheat);
}

void ReportPrinter::printAntiCheat(const AntiCheatResult& result) const {
    out_ << "Anti-cheat: score " << result.validation_score
         << (result.is_suspicious ? " (suspicious" : " (clean");
    if (result.synthetic_input_detected) {
        out_ << ", synthetic input";
    }
    out_ << ")" << '\n';
    if (!result.flags.empty()) {
        out_ << "  flags:";
        for (auto flag : result.flags) {
            out_ << ' ' << flagName(flag);
        }
        out_ << '\n';
    }
    out_ << "  min interval " << orAbsent(result.min_interval_ms) << "ms"
         << "  variance " << orAbsent(result.interval_variance) << '\n';
}

void ReportPrinter::printVerdict(const SubmissionVerdict& verdict) const {
    out_ << "Submission: " << (verdict.is_valid ? "valid" : "rejected")
         << (verdict.requires_review ? ", needs review" : "") << '\n'
         << "  server wpm " << verdict.server_wpm
         << "  reported " << verdict.reported_wpm
         << "  discrepancy " << verdict.wpm_discrepancy << '\n';
    if (!verdict.flag_reasons.empty()) {
        out_ << "  reasons:";
        for (const auto& reason : verdict.flag_reasons) {
            out_ << ' ' << reason;
        }
        out_ << '\n';
    }
}

}  // namespace ks::analytics
