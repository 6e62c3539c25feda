#pragma once

#include "exit_codes.hpp"

#include <lens/result.hpp>
#include <lens/types.hpp>
#include <lens/util/text.hpp>
#include <CLI/CLI.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace lens::cli {

/**
 * Context passed to command execution.
 */
struct CommandContext {
    Config config;
    std::shared_ptr<Logger> logger;
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     * Called during CLI initialization.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing succeeds.
     *
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    virtual std::string name() const = 0;

    virtual std::string description() const = 0;
};

// Helper functions used by multiple commands

/**
 * Read the script named on the command line ("-" for stdin) and run it
 * through the UTF-8 gate.
 */
inline Result<std::string> load_script(const std::string& path) {
    std::string raw;

    if (path == "-") {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        raw = ss.str();
    } else {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Error(ErrorCode::IO_ERROR, "cannot open " + path);
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        if (file.fail() && !file.eof()) {
            return Error(ErrorCode::IO_ERROR, "read error on " + path);
        }
        raw = ss.str();
    }

    return Text::make_script_text(raw.data(), static_cast<long>(raw.size()));
}

/**
 * Print a load failure and map it to an exit code.
 */
inline int report_load_error(const Error& error, Logger& logger) {
    logger.error(error.to_string());
    if (error.code() == ErrorCode::IO_ERROR) {
        return LENS_EXIT_IO_ERROR;
    }
    return LENS_EXIT_USER_ERROR;
}

// Positional script argument shared by every command that reads one
inline void add_script_option(CLI::App& app, std::string& path) {
    app.add_option("script", path, "Script file, or - for stdin")
        ->required()
        ->type_name("<file|->");
}

}  // namespace lens::cli
