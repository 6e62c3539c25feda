#pragma once

#include <lens/result.hpp>
#include <lens/syntax_validator.hpp>
#include <lens/types.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lens {

/**
 * Everything the engine can say about one script.
 */
struct AnalysisReport {
    ScriptType type = ScriptType::UNKNOWN;
    std::optional<Shebang> shebang;
    ExecutionPlan plan;
    ValidationReport validation;
    bool executable = false;        // Passed validation and the pre-exec gate
    std::vector<MetadataEntry> metadata;
    ScriptStats stats;
};

/**
 * ScriptAnalyzer - Main API for scriptlens.
 *
 * Runs the classifier, validator, metadata extractor and stats collector
 * over one script and renders highlighted output. Holds configuration
 * only; every call works on its own input.
 */
class ScriptAnalyzer {
public:
    explicit ScriptAnalyzer(Config config = {});

    /**
     * Analyze a caller-owned buffer.
     *
     * @param data Script bytes
     * @param len Byte count
     * @return The report, or INVALID_INPUT / INVALID_ENCODING
     */
    Result<AnalysisReport> analyze(const char* data, long len) const;

    // Analyze text that already passed Text::make_script_text()
    AnalysisReport analyze_text(std::string_view text) const;

    // Highlight with the configured scheme
    Result<std::string> render(const char* data, long len) const;

    const Config& config() const { return config_; }

private:
    Config config_;
    std::shared_ptr<Logger> logger_;
};

}  // namespace lens
