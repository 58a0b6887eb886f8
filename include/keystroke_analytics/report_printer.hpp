#pragma once

#include <ostream>

#include "keystroke_analytics/report_assembler.hpp"
#include "keystroke_analytics/submission_validator.hpp"

namespace ks::analytics {

class ReportPrinter {
public:
    explicit ReportPrinter(std::ostream& out, bool verbose = false);

    void printReport(const AnalyticsReport& report) const;
    void printAntiCheat(const AntiCheatResult& result) const;
    void printVerdict(const SubmissionVerdict& verdict) const;

private:
    std::ostream& out_;
    bool verbose_;
};

}  // namespace ks::analytics
