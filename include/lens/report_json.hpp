#pragma once

#include <lens/script_analyzer.hpp>

#include <nlohmann/json.hpp>

namespace lens {

nlohmann::json to_json(const ScriptStats& stats);
nlohmann::json to_json(const std::vector<MetadataEntry>& entries);
nlohmann::json to_json(const ValidationReport& validation);
nlohmann::json to_json(const AnalysisReport& report);

}  // namespace lens
