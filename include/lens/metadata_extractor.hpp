#pragma once

#include <lens/types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lens {

/**
 * Reads "field: value" annotations from a script's leading comment block.
 *
 * Only the first METADATA_WINDOW_LINES lines are inspected, and scanning
 * ends at the first line that is neither blank, a comment, nor the
 * shebang. Field names are matched case-insensitively anywhere in the
 * comment, in vocabulary order; the first field found with a non-empty value
 * decides the entry.
 */
class MetadataExtractor {
public:
    static std::vector<MetadataEntry> extract(std::string_view text);

    /**
     * Render entries as "Field: value" lines.
     *
     * @return The joined lines, or NO_METADATA when entries is empty
     */
    static std::string format(const std::vector<MetadataEntry>& entries);

    // Display name of a field ("Author", "Interpreter", ...)
    static const char* field_name(MetadataField field);

    static std::optional<MetadataField> field_from_name(const std::string& name);

    static constexpr const char* NO_METADATA = "No metadata found";
};

}  // namespace lens
