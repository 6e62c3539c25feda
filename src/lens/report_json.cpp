#include <lens/report_json.hpp>
#include <lens/metadata_extractor.hpp>
#include <lens/script_classifier.hpp>

namespace lens {

using json = nlohmann::json;

json to_json(const ScriptStats& stats) {
    return json{
        {"total_lines", stats.total_lines},
        {"code_lines", stats.code_lines},
        {"comment_lines", stats.comment_lines},
        {"blank_lines", stats.blank_lines},
        {"total_chars", stats.total_chars}
    };
}

json to_json(const std::vector<MetadataEntry>& entries) {
    json arr = json::array();
    for (const auto& entry : entries) {
        arr.push_back(json{
            {"field", MetadataExtractor::field_name(entry.field)},
            {"value", entry.value},
            {"line", entry.line_number}
        });
    }
    return arr;
}

json to_json(const ValidationReport& validation) {
    json failures = json::array();
    for (const auto& failure : validation.failures) {
        failures.push_back(json{
            {"code", Error::error_code_name(failure.code())},
            {"message", failure.message()}
        });
    }

    json j = {
        {"valid", validation.valid()},
        {"quotes_balanced", validation.quotes_balanced},
        {"brackets_balanced", validation.brackets_balanced},
        {"shebang_well_formed", validation.shebang_well_formed},
        {"structure_balanced", validation.structure_balanced},
        {"failures", failures}
    };

    if (!validation.python_block_indents.empty()) {
        j["python_block_indents"] = validation.python_block_indents;
    }
    return j;
}

json to_json(const AnalysisReport& report) {
    json j;
    j["type"] = ScriptClassifier::to_string(report.type);

    if (report.shebang) {
        j["shebang"] = {
            {"interpreter", report.shebang->interpreter},
            {"args", report.shebang->args}
        };
    } else {
        j["shebang"] = nullptr;
    }

    j["execution"] = {
        {"interpreter", report.plan.interpreter},
        {"args", report.plan.args},
        {"from_shebang", report.plan.from_shebang},
        {"executable", report.executable}
    };
    j["validation"] = to_json(report.validation);
    j["metadata"] = to_json(report.metadata);
    j["stats"] = to_json(report.stats);
    return j;
}

}  // namespace lens
