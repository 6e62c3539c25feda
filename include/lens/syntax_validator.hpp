#pragma once

#include <lens/result.hpp>
#include <lens/types.hpp>

#include <string_view>
#include <vector>

namespace lens {

/**
 * Outcome of running every validation check, without stopping at the
 * first failure.
 */
struct ValidationReport {
    ScriptType type = ScriptType::UNKNOWN;
    bool quotes_balanced = true;
    bool brackets_balanced = true;
    bool shebang_well_formed = true;
    bool structure_balanced = true;
    std::vector<Error> failures;            // In check order

    // Indentation (in spaces) of colon-terminated Python lines. Recorded
    // for display only; never causes a failure.
    std::vector<size_t> python_block_indents;

    bool valid() const { return failures.empty(); }
};

/**
 * Heuristic structural checks deciding whether a script looks sound enough
 * to attempt execution. This is not a parser: passing scripts may still
 * fail to run, and nothing here is a safety guarantee.
 */
class SyntaxValidator {
public:
    /**
     * Single and double quoted regions must all be closed. A quote of the
     * other kind inside a region is ordinary text, and a backslash escapes
     * the next character.
     */
    static bool check_quotes(std::string_view text);

    /**
     * {}, [] and () must balance outside quoted regions. Fails as soon as
     * any closer appears before its opener.
     */
    static bool check_brackets(std::string_view text);

    // An interpreter line, if present, must name a NUL-free interpreter
    static bool check_shebang(std::string_view text);

    /**
     * Keyword-count check for the given language:
     * - SHELL:   "if "/"for " line openers vs lines equal to "fi"/"done"
     * - PYTHON:  always passes
     * - PERL:    '{' and '}' counts match (quotes not considered)
     * - RUBY:    block keyword line openers vs lines equal to "end"
     * - UNKNOWN: always passes
     */
    static bool check_structure(std::string_view text, ScriptType type);

    /**
     * Classify the script, then run the checks in order: quotes, brackets,
     * shebang, structure.
     *
     * @return OK, or the code of the first failing check
     *         (UNBALANCED_QUOTES, UNBALANCED_BRACKETS, MALFORMED_SHEBANG,
     *         STRUCTURAL_MISMATCH)
     */
    static Result<void> validate(std::string_view text);

    // Same as validate() with the type supplied by the caller
    static Result<void> validate_as(std::string_view text, ScriptType type);

    // Run every check and collect all failures
    static ValidationReport report(std::string_view text);

    static std::vector<size_t> python_block_indents(std::string_view text);
};

}  // namespace lens
