#include <lens/shebang_parser.hpp>
#include <lens/util/text.hpp>

namespace lens {

namespace {

constexpr std::string_view SHEBANG_MARKER = "#!";

bool is_word_separator(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}

std::vector<std::string> split_words(std::string_view s) {
    std::vector<std::string> words;
    size_t i = 0;

    while (i < s.size()) {
        while (i < s.size() && is_word_separator(s[i])) {
            ++i;
        }
        size_t start = i;
        while (i < s.size() && !is_word_separator(s[i])) {
            ++i;
        }
        if (i > start) {
            words.emplace_back(s.substr(start, i - start));
        }
    }

    return words;
}

}  // namespace

bool ShebangParser::has_marker(std::string_view text) {
    return Text::starts_with(text, SHEBANG_MARKER);
}

std::optional<Shebang> ShebangParser::parse(std::string_view text, size_t max_args) {
    if (!has_marker(text)) {
        return std::nullopt;
    }

    std::string_view line = Text::first_line(text);
    auto words = split_words(line.substr(SHEBANG_MARKER.size()));
    if (words.empty()) {
        return std::nullopt;
    }

    Shebang shebang;
    shebang.interpreter = std::move(words[0]);
    for (size_t i = 1; i < words.size() && shebang.args.size() < max_args; ++i) {
        shebang.args.push_back(std::move(words[i]));
    }

    return shebang;
}

std::string ShebangParser::interpreter_for(std::string_view text) {
    auto shebang = parse(text, 0);
    if (shebang) {
        return shebang->interpreter;
    }
    return DEFAULT_INTERPRETER;
}

ExecutionPlan ShebangParser::plan_execution(std::string_view text, size_t max_args) {
    ExecutionPlan plan;

    auto shebang = parse(text, max_args);
    if (shebang) {
        plan.interpreter = std::move(shebang->interpreter);
        plan.args = std::move(shebang->args);
        plan.from_shebang = true;
    } else {
        plan.interpreter = DEFAULT_INTERPRETER;
    }

    return plan;
}

Result<void> ShebangParser::check_before_exec(std::string_view text) {
    if (text.empty()) {
        return Error(ErrorCode::INVALID_INPUT, "empty script");
    }

    if (!has_marker(text)) {
        return Error(ErrorCode::MALFORMED_SHEBANG,
                     "script has no interpreter line");
    }

    auto shebang = parse(text, 0);
    if (!shebang) {
        return Error(ErrorCode::MALFORMED_SHEBANG, "interpreter line is empty");
    }

    if (shebang->interpreter.find('\0') != std::string::npos) {
        return Error(ErrorCode::MALFORMED_SHEBANG,
                     "interpreter path contains a NUL byte");
    }

    return Ok();
}

Result<void> ShebangParser::check_runnable(std::string_view text, ScriptType type) {
    if (type == ScriptType::UNKNOWN) {
        return Error(ErrorCode::UNSUPPORTED_SCRIPT_TYPE,
                     "script type is unknown");
    }
    return check_before_exec(text);
}

}  // namespace lens
