#include <lens/c_api.h>
#include <lens/highlighter.hpp>
#include <lens/metadata_extractor.hpp>
#include <lens/script_classifier.hpp>
#include <lens/shebang_parser.hpp>
#include <lens/stats_collector.hpp>
#include <lens/syntax_validator.hpp>
#include <lens/util/text.hpp>
#include <lens/version.hpp>

#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>
#include <vector>

using lens::Text;

namespace {

// Copy into a malloc'd C string. Content with embedded NUL cannot be
// represented and yields NULL.
char* to_c_string(const std::string& s) {
    if (s.find('\0') != std::string::npos) {
        return nullptr;
    }
    auto* out = static_cast<char*>(std::malloc(s.size() + 1));
    if (out == nullptr) {
        return nullptr;
    }
    std::memcpy(out, s.c_str(), s.size() + 1);
    return out;
}

char* to_token_buffer(const std::vector<std::string>& tokens) {
    size_t total = 1;
    for (const auto& t : tokens) {
        total += t.size() + 1;
    }

    auto* out = static_cast<char*>(std::malloc(total));
    if (out == nullptr) {
        return nullptr;
    }

    char* p = out;
    for (const auto& t : tokens) {
        std::memcpy(p, t.data(), t.size());
        p += t.size();
        *p++ = '\0';
    }
    *p = '\0';
    return out;
}

}  // namespace

extern "C" {

LensScriptType lens_detect_script_type(const char* script, int len) {
    try {
        auto text = Text::make_script_text(script, len);
        if (!text.ok()) {
            return LENS_SCRIPT_UNKNOWN;
        }
        return static_cast<LensScriptType>(lens::ScriptClassifier::classify(text.value()));
    } catch (const std::exception&) {
        return LENS_SCRIPT_UNKNOWN;
    }
}

int lens_validate_script_syntax(const char* script, int len) {
    try {
        auto text = Text::make_script_text(script, len);
        if (!text.ok()) {
            return 0;
        }
        return lens::SyntaxValidator::validate(text.value()).ok() ? 1 : 0;
    } catch (const std::exception&) {
        return 0;
    }
}

int lens_validate_script_before_exec(const char* script, int len) {
    try {
        auto text = Text::make_script_text(script, len);
        if (!text.ok()) {
            return 0;
        }
        return lens::ShebangParser::check_before_exec(text.value()).ok() ? 1 : 0;
    } catch (const std::exception&) {
        return 0;
    }
}

char* lens_parse_shebang(const char* script, int len) {
    try {
        auto text = Text::make_script_text(script, len);
        if (!text.ok()) {
            return nullptr;
        }
        return to_c_string(lens::ShebangParser::interpreter_for(text.value()));
    } catch (const std::exception&) {
        return nullptr;
    }
}

char* lens_parse_shebang_with_args(const char* script, int len, int max_args, int* count) {
    if (count != nullptr) {
        *count = 0;
    }
    if (max_args <= 0) {
        return nullptr;
    }

    try {
        auto text = Text::make_script_text(script, len);
        if (!text.ok()) {
            return nullptr;
        }

        auto shebang = lens::ShebangParser::parse(text.value(),
                                                  static_cast<size_t>(max_args - 1));
        if (!shebang) {
            return nullptr;
        }

        std::vector<std::string> tokens;
        tokens.push_back(shebang->interpreter);
        tokens.insert(tokens.end(), shebang->args.begin(), shebang->args.end());

        char* buffer = to_token_buffer(tokens);
        if (buffer != nullptr && count != nullptr) {
            *count = static_cast<int>(tokens.size());
        }
        return buffer;
    } catch (const std::exception&) {
        return nullptr;
    }
}

char* lens_extract_script_metadata(const char* script, int len) {
    try {
        auto text = Text::make_script_text(script, len);
        if (!text.ok()) {
            return nullptr;
        }
        auto entries = lens::MetadataExtractor::extract(text.value());
        return to_c_string(lens::MetadataExtractor::format(entries));
    } catch (const std::exception&) {
        return nullptr;
    }
}

char* lens_get_script_stats(const char* script, int len) {
    try {
        auto text = Text::make_script_text(script, len);
        if (!text.ok()) {
            return nullptr;
        }
        auto stats = lens::StatsCollector::collect(text.value());
        auto type = lens::ScriptClassifier::classify(text.value());
        return to_c_string(lens::StatsCollector::format(stats, type));
    } catch (const std::exception&) {
        return nullptr;
    }
}

char* lens_highlight_script(const char* script, int len, LensHighlightScheme scheme) {
    if (scheme < LENS_SCHEME_NANO || scheme > LENS_SCHEME_DEFAULT) {
        return nullptr;
    }

    try {
        auto text = Text::make_script_text(script, len);
        if (!text.ok()) {
            return nullptr;
        }
        return to_c_string(lens::Highlighter::render(
            text.value(), static_cast<lens::HighlightScheme>(scheme)));
    } catch (const std::exception&) {
        return nullptr;
    }
}

void lens_free_string(char* ptr) {
    std::free(ptr);
}

int lens_get_theme_count(void) {
    return static_cast<int>(lens::Highlighter::theme_count());
}

const char* lens_get_theme_name(int index) {
    auto name = lens::Highlighter::theme_name(index);
    if (!name) {
        return nullptr;
    }
    return name->data();
}

const char* lens_get_version(void) {
    return LENS_VERSION_STRING;
}

}  // extern "C"
