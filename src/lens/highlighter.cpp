#include <lens/highlighter.hpp>
#include <lens/util/text.hpp>

#include <algorithm>
#include <array>

namespace lens {

namespace {

const std::array<std::string_view, 24> SHELL_KEYWORDS = {
    "if", "then", "else", "elif", "fi",
    "for", "while", "until", "do", "done",
    "case", "esac", "function", "return",
    "local", "export", "declare", "readonly",
    "echo", "printf", "read", "test", "true", "false"
};

struct Theme {
    std::string_view name;
    HighlightScheme scheme;
};

const std::array<Theme, 3> THEMES = {{
    {"nano", HighlightScheme::NANO},
    {"vim", HighlightScheme::VIM},
    {"default", HighlightScheme::DEFAULT},
}};

// Indexed by Category
const std::array<const char*, 6> NORMAL_PALETTE = {
    "\033[32m",     // COMMENT: green
    "\033[33m",     // STRING_LITERAL: yellow
    "\033[36m",     // VARIABLE: cyan
    "\033[34m",     // KEYWORD: blue
    "\033[35m",     // OPERATOR: magenta
    "",             // PLAIN
};

const std::array<const char*, 6> BRIGHT_PALETTE = {
    "\033[92m",
    "\033[93m",
    "\033[96m",
    "\033[94m",
    "\033[95m",
    "",
};

bool is_ascii_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_ascii_alnum(char c) {
    return is_ascii_alpha(c) || (c >= '0' && c <= '9');
}

bool is_word_char(char c) {
    return is_ascii_alnum(c) || c == '_';
}

bool is_variable_char(char c) {
    return is_word_char(c) || c == '{' || c == '}';
}

bool is_operator(char c) {
    return c == '=' || c == '<' || c == '>' || c == '!' || c == '&' || c == '|';
}

// End of a quoted string starting at 'start', one past the closing quote
size_t scan_string(std::string_view line, size_t start) {
    char quote = line[start];
    size_t i = start + 1;

    while (i < line.size() && line[i] != quote) {
        if (line[i] == '\\' && i + 1 < line.size()) {
            ++i;
        }
        i += Text::sequence_length(line, i);
    }

    if (i < line.size()) {
        ++i;  // Closing quote
    }
    return i;
}

}  // namespace

std::vector<Span> Highlighter::tokenize_line(std::string_view line) {
    std::vector<Span> spans;
    size_t i = 0;

    auto emit = [&](Category category, size_t start, size_t end) {
        spans.push_back(Span{category, start, std::string(line.substr(start, end - start))});
    };

    while (i < line.size()) {
        char c = line[i];
        size_t start = i;

        if (c == '#') {
            emit(Category::COMMENT, start, line.size());
            break;
        }

        if (c == '"' || c == '\'') {
            i = scan_string(line, start);
            emit(Category::STRING_LITERAL, start, i);
        } else if (c == '$') {
            ++i;
            while (i < line.size() && is_variable_char(line[i])) {
                ++i;
            }
            emit(Category::VARIABLE, start, i);
        } else if (is_ascii_alpha(c)) {
            while (i < line.size() && is_word_char(line[i])) {
                ++i;
            }
            Category category = is_keyword(line.substr(start, i - start))
                                    ? Category::KEYWORD
                                    : Category::PLAIN;
            emit(category, start, i);
        } else if (is_operator(c)) {
            ++i;
            emit(Category::OPERATOR, start, i);
        } else {
            i += Text::sequence_length(line, i);
            emit(Category::PLAIN, start, i);
        }
    }

    return spans;
}

std::vector<HighlightedLine> Highlighter::highlight(std::string_view text) {
    std::vector<HighlightedLine> result;
    auto lines = Text::split_lines(text);
    result.reserve(lines.size());

    for (size_t n = 0; n < lines.size(); ++n) {
        HighlightedLine hl;
        hl.line_number = n + 1;
        hl.spans = tokenize_line(lines[n]);
        result.push_back(std::move(hl));
    }

    return result;
}

std::string Highlighter::render(std::string_view text, HighlightScheme scheme) {
    std::string out;
    out.reserve(text.size() * 2);

    for (auto line : Text::split_lines(text)) {
        for (const auto& span : tokenize_line(line)) {
            const char* color = color_code(span.category, scheme);
            if (*color == '\0') {
                out += span.text;
                continue;
            }
            out += color;
            out += span.text;
            out += RESET;
        }
        out += '\n';
    }

    return out;
}

const char* Highlighter::color_code(Category category, HighlightScheme scheme) {
    const auto& palette = (scheme == HighlightScheme::VIM) ? BRIGHT_PALETTE : NORMAL_PALETTE;
    return palette[static_cast<size_t>(category)];
}

bool Highlighter::is_keyword(std::string_view word) {
    return std::find(SHELL_KEYWORDS.begin(), SHELL_KEYWORDS.end(), word) != SHELL_KEYWORDS.end();
}

const char* Highlighter::category_name(Category category) {
    switch (category) {
        case Category::COMMENT: return "comment";
        case Category::STRING_LITERAL: return "string";
        case Category::VARIABLE: return "variable";
        case Category::KEYWORD: return "keyword";
        case Category::OPERATOR: return "operator";
        case Category::PLAIN: return "plain";
    }
    return "plain";
}

size_t Highlighter::theme_count() {
    return THEMES.size();
}

std::optional<std::string_view> Highlighter::theme_name(long index) {
    if (index < 0 || static_cast<size_t>(index) >= THEMES.size()) {
        return std::nullopt;
    }
    return THEMES[static_cast<size_t>(index)].name;
}

std::optional<HighlightScheme> Highlighter::scheme_from_name(const std::string& name) {
    std::string lower = Text::to_lower(name);
    for (const auto& theme : THEMES) {
        if (theme.name == lower) {
            return theme.scheme;
        }
    }
    return std::nullopt;
}

const char* Highlighter::scheme_name(HighlightScheme scheme) {
    for (const auto& theme : THEMES) {
        if (theme.scheme == scheme) {
            return theme.name.data();
        }
    }
    return "default";
}

}  // namespace lens
