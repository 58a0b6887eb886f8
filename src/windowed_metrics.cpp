#include "keystroke_analytics/windowed_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

#include "keystroke_analytics/statistics.hpp"

namespace ks::analytics {

namespace {

constexpr double kCharsPerWord = 5.0;
constexpr double kMillisPerMinute = 60000.0;

double wordsPerMinute(std::size_t chars, Millis duration_ms) {
    return (static_cast<double>(chars) / kCharsPerWord) / (duration_ms / kMillisPerMinute);
}

std::size_t countCorrect(const EventLog& events, std::size_t begin, std::size_t end) {
    return static_cast<std::size_t>(std::count_if(events.begin() + static_cast<std::ptrdiff_t>(begin),
                                                  events.begin() + static_cast<std::ptrdiff_t>(end),
                                                  [](const KeystrokeEvent& ev) { return ev.is_correct; }));
}

}  // namespace

std::vector<std::pair<std::size_t, std::size_t>> chunkRanges(std::size_t count, std::size_t buckets) {
    std::vector<std::pair<std::size_t, std::size_t>> ranges;
    if (buckets == 0) {
        return ranges;
    }
    const std::size_t chunk = (count + buckets - 1) / buckets;
    ranges.reserve(buckets);
    for (std::size_t i = 0; i < buckets; ++i) {
        const std::size_t begin = std::min(i * chunk, count);
        const std::size_t end = std::min(begin + chunk, count);
        ranges.emplace_back(begin, end);
    }
    return ranges;
}

std::optional<double> spanWpm(const EventLog& events, std::size_t begin, std::size_t end) {
    if (begin >= end || end > events.size()) {
        return std::nullopt;
    }
    const Millis duration = events[end - 1].release_time - events[begin].press_time;
    if (duration <= 0.0) {
        return std::nullopt;
    }
    return wordsPerMinute(countCorrect(events, begin, end), duration);
}

std::optional<int> burstWpm(const EventLog& events, const AnalysisConfig& config) {
    if (events.size() < config.min_sample_events || config.burst_window_ms <= 0.0) {
        return std::nullopt;
    }

    int best = 0;
    for (std::size_t i = 0; i < events.size(); ++i) {
        const Millis window_end = events[i].press_time + config.burst_window_ms;
        std::size_t correct = 0;
        for (std::size_t j = i; j < events.size(); ++j) {
            if (events[j].press_time > window_end) {
                break;
            }
            if (events[j].is_correct) {
                ++correct;
            }
        }
        const int wpm = static_cast<int>(stats::roundHalfUp(wordsPerMinute(correct, config.burst_window_ms)));
        best = std::max(best, wpm);
    }

    if (best <= 0) {
        return std::nullopt;
    }
    return std::min(best, config.wpm_cap);
}

std::optional<std::vector<int>> wpmByPosition(const EventLog& events, const AnalysisConfig& config) {
    if (config.position_buckets == 0 || events.size() < config.position_buckets) {
        return std::nullopt;
    }

    std::vector<int> buckets;
    buckets.reserve(config.position_buckets);
    for (const auto& [begin, end] : chunkRanges(events.size(), config.position_buckets)) {
        if (end - begin < 2) {
            buckets.push_back(0);
            continue;
        }
        auto wpm = spanWpm(events, begin, end);
        if (!wpm) {
            buckets.push_back(0);
            continue;
        }
        buckets.push_back(std::min(static_cast<int>(stats::roundHalfUp(*wpm)), config.wpm_cap));
    }
    return buckets;
}

std::optional<std::vector<int>> rollingAccuracy(const EventLog& events, const AnalysisConfig& config) {
    if (config.accuracy_buckets == 0 || events.size() < config.min_sample_events) {
        return std::nullopt;
    }

    std::vector<int> buckets;
    buckets.reserve(config.accuracy_buckets);
    for (const auto& [begin, end] : chunkRanges(events.size(), config.accuracy_buckets)) {
        if (begin == end) {
            buckets.push_back(0);
            continue;
        }
        const double ratio = static_cast<double>(countCorrect(events, begin, end)) /
                             static_cast<double>(end - begin);
        buckets.push_back(static_cast<int>(stats::roundHalfUp(ratio * 100.0)));
    }
    return buckets;
}

std::optional<PeakWindow> peakPerformanceWindow(const EventLog& events, const AnalysisConfig& config) {
    if (events.empty() || events.size() < config.min_sample_events) {
        return std::nullopt;
    }

    const auto window = std::clamp<std::size_t>(
        static_cast<std::size_t>(std::ceil(static_cast<double>(events.size()) * config.peak_window_fraction)),
        1, events.size());

    PeakWindow best;
    for (std::size_t i = 0; i + window <= events.size(); ++i) {
        auto raw = spanWpm(events, i, i + window);
        if (!raw) {
            continue;
        }
        const int wpm = static_cast<int>(stats::roundHalfUp(*raw));
        if (wpm > best.wpm) {
            best.start_position = events[i].position;
            best.end_position = events[i + window - 1].position;
            best.wpm = std::min(wpm, config.wpm_cap);
        }
    }

    if (best.wpm <= 0) {
        return std::nullopt;
    }
    return best;
}

std::optional<int> fatigueIndicator(const EventLog& events, const AnalysisConfig& config) {
    const std::size_t half_minimum = std::max<std::size_t>(config.min_sample_events, 1);
    const std::size_t midpoint = events.size() / 2;
    if (midpoint < half_minimum || events.size() - midpoint < half_minimum) {
        return std::nullopt;
    }

    const double first = spanWpm(events, 0, midpoint).value_or(0.0);
    const double second = spanWpm(events, midpoint, events.size()).value_or(0.0);
    if (first <= 0.0) {
        return std::nullopt;
    }
    return static_cast<int>(stats::roundHalfUp((first - second) / first * 100.0));
}

int adjustedWpm(const EventLog& events, double net_wpm) {
    if (events.size() >= 2) {
        if (auto wpm = spanWpm(events, 0, events.size())) {
            return static_cast<int>(stats::roundHalfUp(*wpm));
        }
    }
    return static_cast<int>(stats::roundHalfUp(std::max(0.0, net_wpm)));
}

std::optional<SessionSummary> summarizeSession(const EventLog& events) {
    if (events.empty()) {
        return std::nullopt;
    }
    const Millis duration = events.back().release_time - events.front().press_time;
    if (duration <= 0.0) {
        return std::nullopt;
    }

    const std::size_t correct = countCorrect(events, 0, events.size());
    SessionSummary summary;
    summary.wpm = wordsPerMinute(correct, duration);
    summary.raw_wpm = wordsPerMinute(events.size(), duration);
    summary.accuracy = static_cast<double>(correct) / static_cast<double>(events.size()) * 100.0;
    return summary;
}

}  // namespace ks::analytics
