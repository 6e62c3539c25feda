#pragma once

#include <lens/result.hpp>
#include <lens/types.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace lens {

/**
 * Reads the interpreter line ("#!") of a script.
 *
 * The text after the marker is split on whitespace. The first word is the
 * interpreter, the following words are its arguments. Quotes and escapes
 * are not interpreted, matching how kernels treat the line.
 */
class ShebangParser {
public:
    /**
     * Parse the first line of a script.
     *
     * @param text Validated script text
     * @param max_args Maximum number of arguments kept after the interpreter
     * @return The shebang, or nullopt if the first line has no "#!" marker
     *         or the marker is followed only by whitespace
     */
    static std::optional<Shebang> parse(std::string_view text,
                                        size_t max_args = DEFAULT_MAX_SHEBANG_ARGS);

    // True if the first line starts with "#!", well-formed or not
    static bool has_marker(std::string_view text);

    /**
     * Interpreter named by the script, or DEFAULT_INTERPRETER.
     */
    static std::string interpreter_for(std::string_view text);

    /**
     * Build the command the process executor should run for this script.
     */
    static ExecutionPlan plan_execution(std::string_view text,
                                        size_t max_args = DEFAULT_MAX_SHEBANG_ARGS);

    /**
     * Gate applied before a script is handed to the process executor.
     * Scripts must carry a shebang with a usable interpreter.
     *
     * @return MALFORMED_SHEBANG describing the problem, or OK
     */
    static Result<void> check_before_exec(std::string_view text);

    /**
     * check_before_exec() for a script already classified as type. An
     * UNKNOWN script cannot be run automatically.
     *
     * @return UNSUPPORTED_SCRIPT_TYPE, any check_before_exec() error, or OK
     */
    static Result<void> check_runnable(std::string_view text, ScriptType type);
};

}  // namespace lens
