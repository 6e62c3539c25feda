#include <lens/stats_collector.hpp>
#include <lens/script_classifier.hpp>
#include <lens/util/text.hpp>

#include <sstream>

namespace lens {

ScriptStats StatsCollector::collect(std::string_view text) {
    ScriptStats stats;
    auto lines = Text::split_lines(text);

    stats.total_lines = lines.size();
    stats.total_chars = text.size();

    for (auto line : lines) {
        auto trimmed = Text::trim(line);
        if (trimmed.empty()) {
            stats.blank_lines++;
        } else if (trimmed.front() == '#') {
            stats.comment_lines++;
        } else {
            stats.code_lines++;
        }
    }

    return stats;
}

std::string StatsCollector::format(const ScriptStats& stats, ScriptType type) {
    std::ostringstream ss;
    ss << "Script Statistics:\n"
       << "Type: " << ScriptClassifier::to_string(type) << "\n"
       << "Total lines: " << stats.total_lines << "\n"
       << "Code lines: " << stats.code_lines << "\n"
       << "Comment lines: " << stats.comment_lines << "\n"
       << "Blank lines: " << stats.blank_lines << "\n"
       << "Total characters: " << stats.total_chars;
    return ss.str();
}

}  // namespace lens
