#include <exception>
#include <iostream>
#include <string>

#include "keystroke_analytics/config_loader.hpp"
#include "keystroke_analytics/replay_loader.hpp"
#include "keystroke_analytics/report_assembler.hpp"
#include "keystroke_analytics/report_printer.hpp"
#include "keystroke_analytics/submission_validator.hpp"
#include "keystroke_analytics/typing_session.hpp"

using ks::analytics::AnalyticsReport;
using ks::analytics::ConfigLoader;
using ks::analytics::ReplayLoader;
using ks::analytics::ReportAssembler;
using ks::analytics::ReportPrinter;
using ks::analytics::RuntimeConfig;
using ks::analytics::SubmissionValidator;
using ks::analytics::TypingSession;

int main(int argc, char** argv) {
    try {
        std::string config_path = "configs/example.toml";
        if (argc > 1) {
            config_path = argv[1];
        }

        ConfigLoader loader;
        RuntimeConfig runtime = loader.loadFromFile(config_path);

        TypingSession session(runtime.expected_text);
        ReplayLoader replay;
        replay.replayFile(runtime.events_path, session);
        if (session.pendingKeyCount() > 0) {
            std::cout << "[Analyzer] " << session.pendingKeyCount()
                      << " keys still held at end of replay" << '\n';
        }

        ReportAssembler assembler(runtime.analysis, runtime.anti_cheat);
        AnalyticsReport report = runtime.summary ? assembler.assemble(session, *runtime.summary)
                                                 : assembler.assemble(session);

        SubmissionValidator submission(runtime.submission);
        auto verdict = submission.validate(session.events(), report.wpm.value_or(0.0), report.anti_cheat);

        ReportPrinter printer(std::cout, runtime.verbose);
        printer.printReport(report);
        printer.printVerdict(verdict);
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << "\n";
        return 1;
    }
}
