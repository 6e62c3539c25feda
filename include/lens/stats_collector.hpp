#pragma once

#include <lens/types.hpp>

#include <string>
#include <string_view>

namespace lens {

/**
 * Line and character counts for a script.
 * Blank: trims to nothing. Comment: trimmed line starts with '#'.
 * Code: everything else.
 */
class StatsCollector {
public:
    static ScriptStats collect(std::string_view text);

    // Multi-line summary, headed "Script Statistics:"
    static std::string format(const ScriptStats& stats, ScriptType type);
};

}  // namespace lens
