#pragma once

#include <lens/result.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace lens {

/**
 * Text helpers shared by every analysis component.
 *
 * All analysis runs on text that has passed make_script_text(), so the
 * helpers below may assume well-formed UTF-8.
 */
class Text {
public:
    /**
     * Check that a byte buffer is well-formed UTF-8.
     * Rejects overlong forms, surrogates, values above U+10FFFF and
     * truncated sequences.
     */
    static bool validate_utf8(const char* data, size_t len);

    /**
     * Copy a caller buffer into an owned, validated script text.
     *
     * @param data Script bytes (need not be NUL-terminated)
     * @param len Byte count
     * @return The text, INVALID_INPUT for a null buffer or len <= 0,
     *         INVALID_ENCODING for malformed UTF-8
     */
    static Result<std::string> make_script_text(const char* data, long len);

    /**
     * Split into lines on '\n'. One trailing '\r' is dropped from each line
     * and a final newline does not start an extra empty line.
     */
    static std::vector<std::string_view> split_lines(std::string_view text);

    // The first line (without terminator), empty for empty text
    static std::string_view first_line(std::string_view text);

    // Strip leading and trailing ASCII whitespace
    static std::string_view trim(std::string_view s);

    // ASCII lowercase; byte offsets are preserved
    static std::string to_lower(std::string_view s);

    static bool starts_with(std::string_view s, std::string_view prefix);

    /**
     * Byte length of the UTF-8 sequence starting at pos (1 to 4).
     * Returns 1 for a stray continuation byte so callers always advance.
     */
    static size_t sequence_length(std::string_view text, size_t pos);
};

}  // namespace lens
