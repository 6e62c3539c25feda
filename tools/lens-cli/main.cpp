#include "commands/analyze_command.hpp"
#include "commands/highlight_command.hpp"
#include "commands/meta_command.hpp"
#include "commands/shebang_command.hpp"
#include "commands/stats_command.hpp"
#include "commands/themes_command.hpp"
#include "commands/type_command.hpp"
#include "commands/validate_command.hpp"

#include <lens/highlighter.hpp>
#include <lens/version.hpp>

#include <cstdlib>
#include <exception>
#include <memory>
#include <vector>

namespace {

// Default theme from the environment, falling back to "default"
lens::HighlightScheme default_scheme(lens::Logger& logger) {
    const char* env = std::getenv("LENS_THEME");
    if (env && env[0] != '\0') {
        auto scheme = lens::Highlighter::scheme_from_name(env);
        if (scheme) {
            return *scheme;
        }
        logger.warning(std::string("Ignoring unknown LENS_THEME: ") + env);
    }
    return lens::HighlightScheme::DEFAULT;
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"lens - classify, validate and highlight install scripts"};
    app.set_version_flag("--version", LENS_VERSION_STRING);
    app.require_subcommand(1);

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Log each analysis stage to stderr");

    std::vector<std::unique_ptr<lens::cli::Command>> commands;
    commands.push_back(std::make_unique<lens::cli::TypeCommand>());
    commands.push_back(std::make_unique<lens::cli::ValidateCommand>());
    commands.push_back(std::make_unique<lens::cli::ShebangCommand>());
    commands.push_back(std::make_unique<lens::cli::MetaCommand>());
    commands.push_back(std::make_unique<lens::cli::StatsCommand>());
    commands.push_back(std::make_unique<lens::cli::HighlightCommand>());
    commands.push_back(std::make_unique<lens::cli::ThemesCommand>());
    commands.push_back(std::make_unique<lens::cli::AnalyzeCommand>());

    for (auto& cmd : commands) {
        CLI::App* sub = app.add_subcommand(cmd->name(), cmd->description());
        cmd->setup(*sub);
    }

    CLI11_PARSE(app, argc, argv);

    auto logger = std::make_shared<lens::ConsoleLogger>();
    logger->set_min_level(verbose ? lens::LogLevel::DEBUG : lens::LogLevel::INFO);

    lens::cli::CommandContext ctx;
    ctx.logger = logger;
    ctx.config.logger = logger;
    ctx.config.verbose = verbose;
    ctx.config.scheme = default_scheme(*logger);

    for (auto& cmd : commands) {
        if (!app.got_subcommand(cmd->name())) {
            continue;
        }
        try {
            return cmd->execute(ctx);
        } catch (const std::exception& e) {
            logger->error(std::string("Unexpected failure: ") + e.what());
            return lens::cli::LENS_EXIT_INTERNAL;
        }
    }

    return lens::cli::LENS_EXIT_USER_ERROR;
}
