#include "keystroke_analytics/config_loader.hpp"

#define TOML_EXCEPTIONS 1
#include <toml++/toml.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ks::analytics {

namespace {

std::string readTextFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open text file: " + path.string());
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    std::string text = oss.str();
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

template <typename Node>
void readCount(const Node& section, const char* key, std::size_t& target) {
    if (auto value = section[key].template value<std::int64_t>()) {
        if (*value < 0) {
            throw std::runtime_error(std::string("Negative value for ") + key);
        }
        target = static_cast<std::size_t>(*value);
    }
}

template <typename Node>
void readNumber(const Node& section, const char* key, double& target) {
    if (auto value = section[key].template value<double>()) {
        if (*value < 0.0) {
            throw std::runtime_error(std::string("Negative value for ") + key);
        }
        target = *value;
    }
}

template <typename Node>
void readInt(const Node& section, const char* key, int& target) {
    if (auto value = section[key].template value<std::int64_t>()) {
        if (*value < 0) {
            throw std::runtime_error(std::string("Negative value for ") + key);
        }
        target = static_cast<int>(*value);
    }
}

template <typename Node>
void loadAnalysis(const Node& section, AnalysisConfig& cfg) {
    readCount(section, "min_sample_events", cfg.min_sample_events);
    readCount(section, "position_buckets", cfg.position_buckets);
    readCount(section, "accuracy_buckets", cfg.accuracy_buckets);
    readNumber(section, "burst_window_ms", cfg.burst_window_ms);
    readNumber(section, "peak_window_fraction", cfg.peak_window_fraction);
    readInt(section, "wpm_cap", cfg.wpm_cap);
    readNumber(section, "flight_outlier_ms", cfg.flight_outlier_ms);
    readNumber(section, "slow_word_factor", cfg.slow_word_factor);
    readCount(section, "max_slow_words", cfg.max_slow_words);
    readCount(section, "digraph_min_occurrences", cfg.digraph_min_occurrences);
    readCount(section, "digraph_list_size", cfg.digraph_list_size);
    if (cfg.peak_window_fraction > 1.0) {
        throw std::runtime_error("peak_window_fraction must be within [0, 1]");
    }
}

template <typename Node>
void loadAntiCheat(const Node& section, AntiCheatThresholds& cfg) {
    readCount(section, "min_keystrokes_for_analysis", cfg.min_keystrokes_for_analysis);
    readNumber(section, "min_keystroke_interval_ms", cfg.min_keystroke_interval_ms);
    readNumber(section, "suspect_interval_ms", cfg.suspect_interval_ms);
    readNumber(section, "max_wpm_without_flag", cfg.max_wpm_without_flag);
    readNumber(section, "max_consistent_variance", cfg.max_consistent_variance);
    readCount(section, "programmatic_min_intervals", cfg.programmatic_min_intervals);
    readCount(section, "burst_window_size", cfg.burst_window_size);
    readNumber(section, "burst_threshold_ratio", cfg.burst_threshold_ratio);
    readCount(section, "perfect_rhythm_min_intervals", cfg.perfect_rhythm_min_intervals);
    readNumber(section, "perfect_rhythm_ratio", cfg.perfect_rhythm_ratio);
    readCount(section, "flight_check_min_flights", cfg.flight_check_min_flights);
    readCount(section, "flight_check_min_filtered", cfg.flight_check_min_filtered);
    readNumber(section, "flight_plausible_max_ms", cfg.flight_plausible_max_ms);
    readCount(section, "suspicious_flag_threshold", cfg.suspicious_flag_threshold);
    readInt(section, "score_penalty_per_flag", cfg.score_penalty_per_flag);
    readInt(section, "synthetic_input_penalty", cfg.synthetic_input_penalty);
}

template <typename Node>
void loadSubmission(const Node& section, SubmissionThresholds& cfg) {
    readCount(section, "min_keystrokes_for_analysis", cfg.min_keystrokes_for_analysis);
    readNumber(section, "wpm_discrepancy_threshold", cfg.wpm_discrepancy_threshold);
    readNumber(section, "perfect_accuracy_wpm_threshold", cfg.perfect_accuracy_wpm_threshold);
    readCount(section, "max_suspicious_patterns", cfg.max_suspicious_patterns);
    readNumber(section, "suspect_interval_ms", cfg.suspect_interval_ms);
    readCount(section, "burst_window_size", cfg.burst_window_size);
    readNumber(section, "burst_threshold_ratio", cfg.burst_threshold_ratio);
    readCount(section, "programmatic_min_intervals", cfg.programmatic_min_intervals);
    readNumber(section, "max_consistent_delta_ms", cfg.max_consistent_delta_ms);
    readNumber(section, "programmatic_ratio", cfg.programmatic_ratio);
}

RuntimeConfig buildConfig(const toml::table& tbl, const std::filesystem::path& root_dir) {
    RuntimeConfig config;

    auto session = tbl["session"];
    if (!session) throw std::runtime_error("Missing [session] section");

    if (auto text = session["expected_text"].value<std::string>()) {
        config.expected_text = *text;
    } else if (auto text_file = session["text_file"].value<std::string>()) {
        config.expected_text = readTextFile(root_dir / *text_file);
    } else {
        throw std::runtime_error("[session] needs expected_text or text_file");
    }

    auto events = session["events"].value<std::string>();
    if (!events || events->empty()) {
        throw std::runtime_error("[session] is missing the events replay file");
    }
    config.events_path = root_dir / *events;

    auto wpm = session["wpm"].value<double>();
    auto raw_wpm = session["raw_wpm"].value<double>();
    auto accuracy = session["accuracy"].value<double>();
    if (wpm || raw_wpm || accuracy) {
        if (!(wpm && raw_wpm && accuracy)) {
            throw std::runtime_error("[session] wpm, raw_wpm and accuracy must be given together");
        }
        config.summary = SessionSummary{*wpm, *raw_wpm, *accuracy};
    }

    if (auto analysis = tbl["analysis"]) loadAnalysis(analysis, config.analysis);
    if (auto anti_cheat = tbl["anticheat"]) loadAntiCheat(anti_cheat, config.anti_cheat);
    if (auto submission = tbl["submission"]) loadSubmission(submission, config.submission);

    config.verbose = tbl["output"]["verbose"].value_or(false);
    return config;
}

}  // namespace

RuntimeConfig ConfigLoader::loadFromFile(const std::string& path) const {
    const auto file_path = std::filesystem::absolute(path);

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        throw std::runtime_error("TOML Parse Error: " + std::string(err.description()));
    }

    auto config = buildConfig(tbl, file_path.parent_path());
    std::cout << "[ConfigLoader] Loaded " << file_path.filename().string() << " ("
              << config.expected_text.size() << " characters of expected text)" << '\n';
    return config;
}

RuntimeConfig ConfigLoader::loadFromString(const std::string& toml_text,
                                           const std::filesystem::path& base_dir) const {
    toml::table tbl;
    try {
        tbl = toml::parse(toml_text);
    } catch (const toml::parse_error& err) {
        throw std::runtime_error("TOML Parse Error: " + std::string(err.description()));
    }
    return buildConfig(tbl, base_dir);
}

}  // namespace ks::analytics
