#include <lens/metadata_extractor.hpp>
#include <lens/shebang_parser.hpp>
#include <lens/util/text.hpp>

#include <array>

namespace lens {

namespace {

struct FieldPattern {
    std::string_view pattern;   // Lowercase, including the colon
    MetadataField field;
    const char* name;
};

const std::array<FieldPattern, 16> FIELD_PATTERNS = {{
    {"author:", MetadataField::AUTHOR, "Author"},
    {"version:", MetadataField::VERSION, "Version"},
    {"description:", MetadataField::DESCRIPTION, "Description"},
    {"date:", MetadataField::DATE, "Date"},
    {"license:", MetadataField::LICENSE, "License"},
    {"copyright:", MetadataField::COPYRIGHT, "Copyright"},
    {"filename:", MetadataField::FILENAME, "Filename"},
    {"usage:", MetadataField::USAGE, "Usage"},
    {"purpose:", MetadataField::PURPOSE, "Purpose"},
    {"note:", MetadataField::NOTE, "Note"},
    {"todo:", MetadataField::TODO, "Todo"},
    {"fixme:", MetadataField::FIXME, "Fixme"},
    {"bug:", MetadataField::BUG, "Bug"},
    {"created:", MetadataField::CREATED, "Created"},
    {"modified:", MetadataField::MODIFIED, "Modified"},
    {"updated:", MetadataField::UPDATED, "Updated"},
}};

std::optional<MetadataEntry> match_comment(std::string_view comment, size_t line_number) {
    // ASCII lowercasing keeps byte offsets aligned with the comment
    std::string lower = Text::to_lower(comment);

    for (const auto& p : FIELD_PATTERNS) {
        size_t pos = lower.find(p.pattern);
        if (pos == std::string::npos) {
            continue;
        }

        auto value = Text::trim(comment.substr(pos + p.pattern.size()));
        if (value.empty()) {
            continue;
        }

        MetadataEntry entry;
        entry.field = p.field;
        entry.value = std::string(value);
        entry.line_number = line_number;
        return entry;
    }

    return std::nullopt;
}

}  // namespace

std::vector<MetadataEntry> MetadataExtractor::extract(std::string_view text) {
    std::vector<MetadataEntry> entries;
    auto lines = Text::split_lines(text);

    for (size_t i = 0; i < lines.size() && i < METADATA_WINDOW_LINES; ++i) {
        auto trimmed = Text::trim(lines[i]);

        if (trimmed.empty()) {
            continue;
        }

        if (i == 0 && ShebangParser::has_marker(lines[i])) {
            MetadataEntry entry;
            entry.field = MetadataField::INTERPRETER;
            entry.value = std::string(trimmed);
            entry.line_number = 1;
            entries.push_back(std::move(entry));
            continue;
        }

        if (trimmed.front() != '#') {
            break;  // End of header block
        }

        auto entry = match_comment(Text::trim(trimmed.substr(1)), i + 1);
        if (entry) {
            entries.push_back(std::move(*entry));
        }
    }

    return entries;
}

std::string MetadataExtractor::format(const std::vector<MetadataEntry>& entries) {
    if (entries.empty()) {
        return NO_METADATA;
    }

    std::string out;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) out += '\n';
        out += field_name(entries[i].field);
        out += ": ";
        out += entries[i].value;
    }
    return out;
}

const char* MetadataExtractor::field_name(MetadataField field) {
    if (field == MetadataField::INTERPRETER) {
        return "Interpreter";
    }
    for (const auto& p : FIELD_PATTERNS) {
        if (p.field == field) {
            return p.name;
        }
    }
    return "Unknown";
}

std::optional<MetadataField> MetadataExtractor::field_from_name(const std::string& name) {
    std::string lower = Text::to_lower(name);
    if (lower == "interpreter") {
        return MetadataField::INTERPRETER;
    }
    for (const auto& p : FIELD_PATTERNS) {
        if (Text::to_lower(p.name) == lower) {
            return p.field;
        }
    }
    return std::nullopt;
}

}  // namespace lens
