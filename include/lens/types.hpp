#pragma once

#include <lens/util/logger.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lens {

// Default bound on shebang arguments kept by the parser
constexpr size_t DEFAULT_MAX_SHEBANG_ARGS = 16;

// Leading lines inspected by metadata extraction
constexpr size_t METADATA_WINDOW_LINES = 50;

// Interpreter used when a script names none
constexpr const char* DEFAULT_INTERPRETER = "/bin/sh";

/**
 * Script language, as decided by the classifier.
 * Values match the C boundary enum.
 */
enum class ScriptType : uint8_t {
    SHELL = 0,
    PYTHON = 1,
    PERL = 2,
    RUBY = 3,
    UNKNOWN = 4
};

/**
 * Terminal color scheme. Affects color intensity only, never tokenization.
 */
enum class HighlightScheme : uint8_t {
    NANO = 0,
    VIM = 1,
    DEFAULT = 2
};

// Semantic category of a highlighted span
enum class Category : uint8_t {
    COMMENT,
    STRING_LITERAL,
    VARIABLE,
    KEYWORD,
    OPERATOR,
    PLAIN
};

/**
 * A contiguous slice of one line. Concatenating the text of every span of a
 * line reproduces the line exactly.
 */
struct Span {
    Category category = Category::PLAIN;
    size_t offset = 0;          // Byte offset within the line
    std::string text;

    bool operator==(const Span& other) const {
        return category == other.category && offset == other.offset &&
               text == other.text;
    }
};

struct HighlightedLine {
    size_t line_number = 0;     // 1-based
    std::vector<Span> spans;
};

/**
 * Parsed "#!" line.
 */
struct Shebang {
    std::string interpreter;
    std::vector<std::string> args;
};

/**
 * What the process executor should run, derived from the shebang.
 */
struct ExecutionPlan {
    std::string interpreter;
    std::vector<std::string> args;
    bool from_shebang = false;  // false when DEFAULT_INTERPRETER was substituted
};

// Recognized header comment fields, in matching priority order
enum class MetadataField : uint8_t {
    AUTHOR,
    VERSION,
    DESCRIPTION,
    DATE,
    LICENSE,
    COPYRIGHT,
    FILENAME,
    USAGE,
    PURPOSE,
    NOTE,
    TODO,
    FIXME,
    BUG,
    CREATED,
    MODIFIED,
    UPDATED,
    INTERPRETER     // Synthetic, from the shebang line
};

struct MetadataEntry {
    MetadataField field = MetadataField::NOTE;
    std::string value;
    size_t line_number = 0;     // 1-based

    bool operator==(const MetadataEntry& other) const {
        return field == other.field && value == other.value &&
               line_number == other.line_number;
    }
};

/**
 * Line counts by category. code_lines + comment_lines + blank_lines
 * always equals total_lines.
 */
struct ScriptStats {
    size_t total_lines = 0;
    size_t code_lines = 0;
    size_t comment_lines = 0;
    size_t blank_lines = 0;
    size_t total_chars = 0;     // Bytes of the validated text
};

/**
 * Configuration for a ScriptAnalyzer.
 */
struct Config {
    HighlightScheme scheme = HighlightScheme::DEFAULT;
    size_t max_shebang_args = DEFAULT_MAX_SHEBANG_ARGS;
    bool verbose = false;
    std::shared_ptr<Logger> logger;   // NullLogger when unset
};

}  // namespace lens
