#pragma once

#include <lens/types.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace lens {

/**
 * Decides which of the supported languages a script is written in.
 *
 * Detection priority:
 * 1. Shebang line (#!/bin/bash, #!/usr/bin/env python3)
 * 2. Case-insensitive content markers, Python > Perl > Ruby > Shell
 * 3. Shell, for any non-empty text nothing else matched
 *
 * Empty text is UNKNOWN; whitespace-only text falls back to Shell. Rules are evaluated in table order and
 * the first match wins; there is no scoring.
 */
class ScriptClassifier {
public:
    static ScriptType classify(std::string_view text);

    /**
     * Classify from the text after the "#!" marker only.
     *
     * @param shebang_line First line of the script, with or without "#!"
     * @return Matched type, or UNKNOWN when no interpreter rule applies
     */
    static ScriptType classify_shebang(std::string_view shebang_line);

    /**
     * Classify from content markers only.
     *
     * @return Matched type, or nullopt when no marker is present
     */
    static std::optional<ScriptType> classify_content(std::string_view text);

    static const char* to_string(ScriptType type);
    static std::optional<ScriptType> from_string(const std::string& name);
};

}  // namespace lens
