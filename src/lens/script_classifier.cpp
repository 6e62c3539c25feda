#include <lens/script_classifier.hpp>
#include <lens/util/text.hpp>

#include <array>
#include <vector>

namespace lens {

namespace {

struct InterpreterRule {
    std::string_view needle;
    ScriptType type;
};

// Searched in order against the text after "#!"
const std::array<InterpreterRule, 6> INTERPRETER_RULES = {{
    {"python", ScriptType::PYTHON},
    {"perl", ScriptType::PERL},
    {"ruby", ScriptType::RUBY},
    {"bash", ScriptType::SHELL},
    {"zsh", ScriptType::SHELL},
    {"sh", ScriptType::SHELL},
}};

// A content rule matches when every marker occurs in the lowercased text
struct ContentRule {
    std::vector<std::string_view> all_of;
    ScriptType type;
};

const std::vector<ContentRule> CONTENT_RULES = {
    // Python
    {{"import ", "def "}, ScriptType::PYTHON},
    {{"print("}, ScriptType::PYTHON},
    {{"from "}, ScriptType::PYTHON},
    {{"class "}, ScriptType::PYTHON},

    // Perl
    {{"use strict"}, ScriptType::PERL},
    {{"my $"}, ScriptType::PERL},
    {{"print \""}, ScriptType::PERL},

    // Ruby
    {{"def "}, ScriptType::RUBY},
    {{"puts "}, ScriptType::RUBY},
    {{"require "}, ScriptType::RUBY},
    {{"end"}, ScriptType::RUBY},

    // Shell
    {{"if ["}, ScriptType::SHELL},
    {{"echo "}, ScriptType::SHELL},
    {{"for "}, ScriptType::SHELL},
    {{"while "}, ScriptType::SHELL},
    {{"function "}, ScriptType::SHELL},
};

bool matches(const ContentRule& rule, const std::string& lower_text) {
    for (auto marker : rule.all_of) {
        if (lower_text.find(marker) == std::string::npos) {
            return false;
        }
    }
    return true;
}

}  // namespace

ScriptType ScriptClassifier::classify(std::string_view text) {
    if (text.empty()) {
        return ScriptType::UNKNOWN;
    }

    std::string_view first = Text::first_line(text);
    if (Text::starts_with(first, "#!")) {
        ScriptType from_shebang = classify_shebang(first);
        if (from_shebang != ScriptType::UNKNOWN) {
            return from_shebang;
        }
    }

    auto from_content = classify_content(text);
    if (from_content) {
        return *from_content;
    }

    // Free-form scripts are most often shell
    return ScriptType::SHELL;
}

ScriptType ScriptClassifier::classify_shebang(std::string_view shebang_line) {
    std::string_view rest = shebang_line;
    if (Text::starts_with(rest, "#!")) {
        rest.remove_prefix(2);
    }

    for (const auto& rule : INTERPRETER_RULES) {
        if (rest.find(rule.needle) != std::string_view::npos) {
            return rule.type;
        }
    }

    return ScriptType::UNKNOWN;
}

std::optional<ScriptType> ScriptClassifier::classify_content(std::string_view text) {
    std::string lower = Text::to_lower(text);

    for (const auto& rule : CONTENT_RULES) {
        if (matches(rule, lower)) {
            return rule.type;
        }
    }

    return std::nullopt;
}

const char* ScriptClassifier::to_string(ScriptType type) {
    switch (type) {
        case ScriptType::SHELL: return "shell";
        case ScriptType::PYTHON: return "python";
        case ScriptType::PERL: return "perl";
        case ScriptType::RUBY: return "ruby";
        case ScriptType::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::optional<ScriptType> ScriptClassifier::from_string(const std::string& name) {
    std::string lower = Text::to_lower(name);

    if (lower == "shell" || lower == "sh" || lower == "bash") return ScriptType::SHELL;
    if (lower == "python") return ScriptType::PYTHON;
    if (lower == "perl") return ScriptType::PERL;
    if (lower == "ruby") return ScriptType::RUBY;
    if (lower == "unknown") return ScriptType::UNKNOWN;

    return std::nullopt;
}

}  // namespace lens
