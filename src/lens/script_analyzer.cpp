#include <lens/script_analyzer.hpp>
#include <lens/highlighter.hpp>
#include <lens/metadata_extractor.hpp>
#include <lens/script_classifier.hpp>
#include <lens/shebang_parser.hpp>
#include <lens/stats_collector.hpp>
#include <lens/util/text.hpp>

#include <string>
#include <utility>

namespace lens {

ScriptAnalyzer::ScriptAnalyzer(Config config)
    : config_(std::move(config)),
      logger_(config_.logger ? config_.logger : std::make_shared<NullLogger>()) {}

Result<AnalysisReport> ScriptAnalyzer::analyze(const char* data, long len) const {
    auto text = Text::make_script_text(data, len);
    if (!text.ok()) {
        logger_->warning("Rejected script: " + text.error().to_string());
        return text.error();
    }
    return analyze_text(text.value());
}

AnalysisReport ScriptAnalyzer::analyze_text(std::string_view text) const {
    AnalysisReport report;

    report.shebang = ShebangParser::parse(text, config_.max_shebang_args);
    report.plan = ShebangParser::plan_execution(text, config_.max_shebang_args);

    report.validation = SyntaxValidator::report(text);
    report.type = report.validation.type;
    logger_->debug(std::string("Classified as ") + ScriptClassifier::to_string(report.type));

    for (const auto& failure : report.validation.failures) {
        logger_->debug("Validation: " + failure.to_string());
    }

    auto exec_gate = ShebangParser::check_runnable(text, report.type);
    if (!exec_gate.ok()) {
        logger_->debug("Not executable: " + exec_gate.error().to_string());
    }
    report.executable = report.validation.valid() && exec_gate.ok();

    report.metadata = MetadataExtractor::extract(text);
    logger_->debug("Metadata entries: " + std::to_string(report.metadata.size()));

    report.stats = StatsCollector::collect(text);

    if (config_.verbose) {
        logger_->info(std::string("Analyzed ") + std::to_string(report.stats.total_lines) +
                      " line(s) of " + ScriptClassifier::to_string(report.type));
    }

    return report;
}

Result<std::string> ScriptAnalyzer::render(const char* data, long len) const {
    auto text = Text::make_script_text(data, len);
    if (!text.ok()) {
        logger_->warning("Rejected script: " + text.error().to_string());
        return text.error();
    }
    logger_->debug(std::string("Rendering with scheme ") +
                   Highlighter::scheme_name(config_.scheme));
    return Highlighter::render(text.value(), config_.scheme);
}

}  // namespace lens
