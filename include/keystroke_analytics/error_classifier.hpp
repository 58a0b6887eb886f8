#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "keystroke_analytics/analysis_config.hpp"
#include "keystroke_analytics/types.hpp"

namespace ks::analytics {

enum class ErrorType {
    Substitution,
    Doublet,
    Other,
};

[[nodiscard]] const char* errorTypeName(ErrorType type) noexcept;

// Only meaningful for events with is_correct == false.
[[nodiscard]] ErrorType classifyError(const KeystrokeEvent& event) noexcept;

struct ErrorProfile {
    std::size_t total_errors{0};
    std::map<ErrorType, std::size_t> errors_by_type;
    std::vector<std::string> error_keys;
    std::optional<std::size_t> error_burst_count;
};

[[nodiscard]] ErrorProfile classifyErrors(const EventLog& events, const AnalysisConfig& config = {});

// Number of maximal runs of consecutive incorrect events.
[[nodiscard]] std::optional<std::size_t> errorBurstCount(const EventLog& events,
                                                         std::size_t min_events);

struct WordSpan {
    std::string word;
    std::size_t begin{0};  // offset of the first character
    std::size_t end{0};    // one past the last character
};

[[nodiscard]] std::vector<WordSpan> wordSpans(const std::string& text);

[[nodiscard]] std::optional<std::vector<std::string>> slowestWords(const EventLog& events,
                                                                   const std::string& expected_text,
                                                                   const AnalysisConfig& config = {});

}  // namespace ks::analytics
