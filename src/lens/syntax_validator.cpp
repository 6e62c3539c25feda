#include <lens/syntax_validator.hpp>
#include <lens/script_classifier.hpp>
#include <lens/shebang_parser.hpp>
#include <lens/util/text.hpp>

#include <array>

namespace lens {

namespace {

/**
 * Tracks quoted regions over a character stream. Only one kind of region
 * is open at a time and a backslash escapes the next character.
 */
class QuoteTracker {
public:
    // Returns true if c is outside any quoted region and is not an
    // escaped character or a quote delimiter
    bool feed(char c) {
        if (escape_next_) {
            escape_next_ = false;
            return false;
        }

        if (c == '\\') {
            escape_next_ = true;
            return false;
        }

        if (c == '\'' && !in_double_) {
            in_single_ = !in_single_;
            return false;
        }

        if (c == '"' && !in_single_) {
            in_double_ = !in_double_;
            return false;
        }

        return !in_single_ && !in_double_;
    }

    bool open() const { return in_single_ || in_double_; }

private:
    bool in_single_ = false;
    bool in_double_ = false;
    bool escape_next_ = false;
};

const std::array<std::string_view, 8> RUBY_BLOCK_OPENERS = {
    "def ", "class ", "module ", "if ", "unless ", "while ", "for ", "begin"
};

bool check_shell_structure(std::string_view text) {
    int if_count = 0;
    int fi_count = 0;
    int for_count = 0;
    int done_count = 0;

    for (auto line : Text::split_lines(text)) {
        auto trimmed = Text::trim(line);

        if (Text::starts_with(trimmed, "if ")) {
            if_count++;
        } else if (trimmed == "fi") {
            fi_count++;
        } else if (Text::starts_with(trimmed, "for ")) {
            for_count++;
        } else if (trimmed == "done") {
            done_count++;
        }
    }

    return if_count == fi_count && for_count == done_count;
}

bool check_perl_structure(std::string_view text) {
    long brace_count = 0;
    for (char c : text) {
        if (c == '{') brace_count++;
        if (c == '}') brace_count--;
    }
    return brace_count == 0;
}

bool check_ruby_structure(std::string_view text) {
    int open_count = 0;
    int end_count = 0;

    for (auto line : Text::split_lines(text)) {
        auto trimmed = Text::trim(line);

        bool opener = false;
        for (auto keyword : RUBY_BLOCK_OPENERS) {
            if (Text::starts_with(trimmed, keyword)) {
                opener = true;
                break;
            }
        }

        if (opener) {
            open_count++;
        } else if (trimmed == "end") {
            end_count++;
        }
    }

    return open_count == end_count;
}

Error structure_error(ScriptType type) {
    return Error(ErrorCode::STRUCTURAL_MISMATCH,
                 std::string("block keywords do not balance for ") +
                     ScriptClassifier::to_string(type));
}

}  // namespace

bool SyntaxValidator::check_quotes(std::string_view text) {
    QuoteTracker tracker;
    for (char c : text) {
        tracker.feed(c);
    }
    return !tracker.open();
}

bool SyntaxValidator::check_brackets(std::string_view text) {
    QuoteTracker tracker;
    long braces = 0;
    long brackets = 0;
    long parens = 0;

    for (char c : text) {
        if (!tracker.feed(c)) {
            continue;
        }

        switch (c) {
            case '{': braces++; break;
            case '}': braces--; break;
            case '[': brackets++; break;
            case ']': brackets--; break;
            case '(': parens++; break;
            case ')': parens--; break;
            default: break;
        }

        if (braces < 0 || brackets < 0 || parens < 0) {
            return false;
        }
    }

    return braces == 0 && brackets == 0 && parens == 0;
}

bool SyntaxValidator::check_shebang(std::string_view text) {
    if (!ShebangParser::has_marker(text)) {
        return true;
    }

    auto shebang = ShebangParser::parse(text, 0);
    if (!shebang || shebang->interpreter.empty()) {
        return false;
    }

    return shebang->interpreter.find('\0') == std::string::npos;
}

bool SyntaxValidator::check_structure(std::string_view text, ScriptType type) {
    switch (type) {
        case ScriptType::SHELL: return check_shell_structure(text);
        case ScriptType::PYTHON: return true;
        case ScriptType::PERL: return check_perl_structure(text);
        case ScriptType::RUBY: return check_ruby_structure(text);
        case ScriptType::UNKNOWN: return true;
    }
    return true;
}

Result<void> SyntaxValidator::validate(std::string_view text) {
    return validate_as(text, ScriptClassifier::classify(text));
}

Result<void> SyntaxValidator::validate_as(std::string_view text, ScriptType type) {
    if (!check_quotes(text)) {
        return Error(ErrorCode::UNBALANCED_QUOTES, "unterminated quoted string");
    }

    if (!check_brackets(text)) {
        return Error(ErrorCode::UNBALANCED_BRACKETS,
                     "unmatched brace, bracket or parenthesis");
    }

    if (!check_shebang(text)) {
        return Error(ErrorCode::MALFORMED_SHEBANG, "interpreter line names no interpreter");
    }

    if (!check_structure(text, type)) {
        return structure_error(type);
    }

    return Ok();
}

ValidationReport SyntaxValidator::report(std::string_view text) {
    ValidationReport result;
    result.type = ScriptClassifier::classify(text);

    result.quotes_balanced = check_quotes(text);
    if (!result.quotes_balanced) {
        result.failures.emplace_back(ErrorCode::UNBALANCED_QUOTES,
                                     "unterminated quoted string");
    }

    result.brackets_balanced = check_brackets(text);
    if (!result.brackets_balanced) {
        result.failures.emplace_back(ErrorCode::UNBALANCED_BRACKETS,
                                     "unmatched brace, bracket or parenthesis");
    }

    result.shebang_well_formed = check_shebang(text);
    if (!result.shebang_well_formed) {
        result.failures.emplace_back(ErrorCode::MALFORMED_SHEBANG,
                                     "interpreter line names no interpreter");
    }

    result.structure_balanced = check_structure(text, result.type);
    if (!result.structure_balanced) {
        result.failures.push_back(structure_error(result.type));
    }

    if (result.type == ScriptType::PYTHON) {
        result.python_block_indents = python_block_indents(text);
    }

    return result;
}

std::vector<size_t> SyntaxValidator::python_block_indents(std::string_view text) {
    std::vector<size_t> indents;

    for (auto line : Text::split_lines(text)) {
        auto trimmed = Text::trim(line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }

        if (trimmed.back() == ':') {
            size_t indent = 0;
            while (indent < line.size() && line[indent] == ' ') {
                indent++;
            }
            indents.push_back(indent);
        }
    }

    return indents;
}

}  // namespace lens
