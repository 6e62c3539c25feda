#include "analyze_command.hpp"

#include <lens/metadata_extractor.hpp>
#include <lens/report_json.hpp>
#include <lens/script_classifier.hpp>
#include <lens/stats_collector.hpp>

namespace lens::cli {

void AnalyzeCommand::setup(CLI::App& app) {
    add_script_option(app, script_);
    app.add_flag("--json", json_, "Print the report as JSON");
}

int AnalyzeCommand::execute(CommandContext& ctx) {
    auto text = load_script(script_);
    if (!text.ok()) {
        return report_load_error(text.error(), *ctx.logger);
    }

    ScriptAnalyzer analyzer(ctx.config);
    AnalysisReport report = analyzer.analyze_text(text.value());

    if (json_) {
        std::cout << to_json(report).dump(2) << "\n";
    } else {
        print_text(report);
    }

    return report.validation.valid() ? LENS_EXIT_SUCCESS : LENS_EXIT_INVALID;
}

void AnalyzeCommand::print_text(const AnalysisReport& report) const {
    std::cout << "Type: " << ScriptClassifier::to_string(report.type) << "\n";

    std::cout << "Interpreter: " << report.plan.interpreter;
    for (const auto& arg : report.plan.args) {
        std::cout << " " << arg;
    }
    if (!report.plan.from_shebang) {
        std::cout << " (default)";
    }
    std::cout << "\n";

    std::cout << "Valid: " << (report.validation.valid() ? "yes" : "no") << "\n";
    for (const auto& failure : report.validation.failures) {
        std::cout << "  " << failure.to_string() << "\n";
    }
    std::cout << "Executable: " << (report.executable ? "yes" : "no") << "\n";

    std::cout << "\n" << MetadataExtractor::format(report.metadata) << "\n";
    std::cout << "\n" << StatsCollector::format(report.stats, report.type) << "\n";
}

}  // namespace lens::cli
