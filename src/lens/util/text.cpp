#include <lens/util/text.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace lens {

namespace {

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

bool is_ascii_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
           c == '\v' || c == '\f';
}

}  // namespace

bool Text::validate_utf8(const char* data, size_t len) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(data);
    size_t i = 0;

    while (i < len) {
        unsigned char c = bytes[i];

        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t need = 0;
        uint32_t cp = 0;
        uint32_t min_cp = 0;

        if ((c & 0xE0) == 0xC0) {
            need = 1;
            cp = c & 0x1F;
            min_cp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            need = 2;
            cp = c & 0x0F;
            min_cp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            need = 3;
            cp = c & 0x07;
            min_cp = 0x10000;
        } else {
            return false;  // Continuation or invalid lead byte
        }

        if (i + need >= len) {
            return false;  // Truncated sequence
        }

        for (size_t k = 1; k <= need; ++k) {
            unsigned char cc = bytes[i + k];
            if (!is_continuation(cc)) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (cp < min_cp) return false;                   // Overlong
        if (cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;  // Surrogate

        i += need + 1;
    }

    return true;
}

Result<std::string> Text::make_script_text(const char* data, long len) {
    if (data == nullptr || len <= 0) {
        return Error(ErrorCode::INVALID_INPUT, "null buffer or non-positive length");
    }

    size_t size = static_cast<size_t>(len);
    if (!validate_utf8(data, size)) {
        return Error(ErrorCode::INVALID_ENCODING, "script is not valid UTF-8");
    }

    return std::string(data, size);
}

std::vector<std::string_view> Text::split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;

    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }

        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);

        start = end + 1;
    }

    return lines;
}

std::string_view Text::first_line(std::string_view text) {
    size_t end = text.find('\n');
    std::string_view line = text.substr(0, end);
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

std::string_view Text::trim(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && is_ascii_space(s[start])) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && is_ascii_space(s[end - 1])) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string Text::to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool Text::starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

size_t Text::sequence_length(std::string_view text, size_t pos) {
    auto c = static_cast<unsigned char>(text[pos]);
    size_t len = 1;
    if ((c & 0xE0) == 0xC0) {
        len = 2;
    } else if ((c & 0xF0) == 0xE0) {
        len = 3;
    } else if ((c & 0xF8) == 0xF0) {
        len = 4;
    }
    return std::min(len, text.size() - pos);
}

}  // namespace lens
