#pragma once

#include <lens/types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lens {

/**
 * Single-pass tokenizer that assigns a semantic category to every part of
 * a line, plus an ANSI renderer on top of it.
 *
 * The rule set is shell-flavored and is applied to every script type:
 *   '#'            rest of line is a comment
 *   '"' or '\''    string through the matching quote (backslash escapes),
 *                  or to end of line
 *   '$'            variable: '$' plus following [A-Za-z0-9_{}]
 *   letter         word of [A-Za-z0-9_]; keyword if in the shell vocabulary
 *   = < > ! & |    single-character operator
 *   anything else  single-character plain text
 *
 * Spans always partition the line exactly. Non-ASCII characters are kept
 * whole and emitted as plain text.
 */
class Highlighter {
public:
    static std::vector<Span> tokenize_line(std::string_view line);

    // Tokenize every line of the text, in order
    static std::vector<HighlightedLine> highlight(std::string_view text);

    /**
     * Render the text with ANSI colors. Every line, including the last,
     * is followed by '\n'.
     */
    static std::string render(std::string_view text, HighlightScheme scheme);

    // Escape sequence for a category, empty for PLAIN
    static const char* color_code(Category category, HighlightScheme scheme);

    static bool is_keyword(std::string_view word);

    static const char* category_name(Category category);

    // ========================================================================
    // Theme discovery
    // ========================================================================

    static size_t theme_count();

    /**
     * @param index Position in the theme list
     * @return Theme name ("nano", "vim", "default"), or nullopt if out of range
     */
    static std::optional<std::string_view> theme_name(long index);

    static std::optional<HighlightScheme> scheme_from_name(const std::string& name);

    static const char* scheme_name(HighlightScheme scheme);

    static constexpr const char* RESET = "\033[0m";
};

}  // namespace lens
