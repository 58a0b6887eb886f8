#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "keystroke_analytics/analysis_config.hpp"
#include "keystroke_analytics/anti_cheat_validator.hpp"
#include "keystroke_analytics/submission_validator.hpp"
#include "keystroke_analytics/types.hpp"

namespace ks::analytics {

struct RuntimeConfig {
    std::string expected_text;
    std::filesystem::path events_path;
    std::optional<SessionSummary> summary;

    AnalysisConfig analysis;
    AntiCheatThresholds anti_cheat;
    SubmissionThresholds submission;

    bool verbose{false};
};

class ConfigLoader {
public:
    [[nodiscard]] RuntimeConfig loadFromFile(const std::string& path) const;
    [[nodiscard]] RuntimeConfig loadFromString(const std::string& toml_text,
                                               const std::filesystem::path& base_dir = {}) const;
};

}  // namespace ks::analytics
