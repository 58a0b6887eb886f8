#include "keystroke_analytics/error_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <unordered_set>

namespace ks::analytics {

namespace {

constexpr std::size_t kMinResolvableWords = 3;

struct WordTiming {
    std::string word;
    Millis duration{0.0};
};

}  // namespace

const char* errorTypeName(ErrorType type) noexcept {
    switch (type) {
        case ErrorType::Substitution: return "substitution";
        case ErrorType::Doublet: return "doublet";
        case ErrorType::Other: return "other";
    }
    return "other";
}

ErrorType classifyError(const KeystrokeEvent& event) noexcept {
    if (!event.expected_key) {
        return ErrorType::Other;
    }
    if (event.key == *event.expected_key) {
        return ErrorType::Doublet;
    }
    return ErrorType::Substitution;
}

ErrorProfile classifyErrors(const EventLog& events, const AnalysisConfig& config) {
    ErrorProfile profile;
    profile.errors_by_type = {
        {ErrorType::Substitution, 0},
        {ErrorType::Doublet, 0},
        {ErrorType::Other, 0},
    };

    std::unordered_set<std::string> seen_keys;
    for (const auto& ev : events) {
        if (ev.is_correct) {
            continue;
        }
        ++profile.total_errors;
        ++profile.errors_by_type[classifyError(ev)];
        if (ev.expected_key && seen_keys.insert(*ev.expected_key).second) {
            profile.error_keys.push_back(*ev.expected_key);
        }
    }

    profile.error_burst_count = errorBurstCount(events, config.min_sample_events);
    return profile;
}

std::optional<std::size_t> errorBurstCount(const EventLog& events, std::size_t min_events) {
    if (events.size() < min_events) {
        return std::nullopt;
    }

    std::size_t bursts = 0;
    bool in_burst = false;
    for (const auto& ev : events) {
        if (!ev.is_correct) {
            if (!in_burst) {
                ++bursts;
                in_burst = true;
            }
        } else {
            in_burst = false;
        }
    }
    return bursts;
}

std::vector<WordSpan> wordSpans(const std::string& text) {
    std::vector<WordSpan> spans;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) != 0) {
            ++i;
        }
        const std::size_t begin = i;
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) == 0) {
            ++i;
        }
        if (i > begin) {
            spans.push_back({text.substr(begin, i - begin), begin, i});
        }
    }
    return spans;
}

std::optional<std::vector<std::string>> slowestWords(const EventLog& events,
                                                     const std::string& expected_text,
                                                     const AnalysisConfig& config) {
    if (events.size() < config.min_sample_events || expected_text.empty()) {
        return std::nullopt;
    }

    std::vector<WordTiming> timings;
    for (const auto& span : wordSpans(expected_text)) {
        const KeystrokeEvent* first = nullptr;
        const KeystrokeEvent* last = nullptr;
        std::size_t hits = 0;
        for (const auto& ev : events) {
            if (ev.position < span.begin || ev.position >= span.end) {
                continue;
            }
            if (!first) {
                first = &ev;
            }
            last = &ev;
            ++hits;
        }
        if (hits < 2) {
            continue;
        }
        const Millis duration = last->release_time - first->press_time;
        if (duration > 0.0) {
            timings.push_back({span.word, duration});
        }
    }

    if (timings.size() < kMinResolvableWords) {
        return std::nullopt;
    }

    double total = 0.0;
    for (const auto& t : timings) {
        total += t.duration;
    }
    const double threshold = total / static_cast<double>(timings.size()) * config.slow_word_factor;

    std::vector<WordTiming> slow;
    std::copy_if(timings.begin(), timings.end(), std::back_inserter(slow),
                 [threshold](const WordTiming& t) { return t.duration > threshold; });
    std::stable_sort(slow.begin(), slow.end(), [](const WordTiming& a, const WordTiming& b) {
        return a.duration > b.duration;
    });
    if (slow.empty()) {
        return std::nullopt;
    }
    if (slow.size() > config.max_slow_words) {
        slow.resize(config.max_slow_words);
    }

    std::vector<std::string> words;
    words.reserve(slow.size());
    for (auto& t : slow) {
        words.push_back(std::move(t.word));
    }
    return words;
}

}  // namespace ks::analytics
