#include "shebang_command.hpp"

#include <lens/shebang_parser.hpp>

namespace lens::cli {

void ShebangCommand::setup(CLI::App& app) {
    add_script_option(app, script_);

    app.add_option("-n,--max-args", max_args_, "Maximum arguments kept (default: 16)")
        ->type_name("<num>");
}

int ShebangCommand::execute(CommandContext& ctx) {
    auto text = load_script(script_);
    if (!text.ok()) {
        return report_load_error(text.error(), *ctx.logger);
    }

    auto plan = ShebangParser::plan_execution(text.value(), max_args_);

    std::cout << "Interpreter: " << plan.interpreter;
    if (!plan.from_shebang) {
        std::cout << " (default, no interpreter line)";
    }
    std::cout << "\n";

    for (size_t i = 0; i < plan.args.size(); ++i) {
        std::cout << "Arg " << (i + 1) << ": " << plan.args[i] << "\n";
    }

    auto gate = ShebangParser::check_before_exec(text.value());
    std::cout << "Executable: " << (gate.ok() ? "yes" : "no");
    if (!gate.ok()) {
        std::cout << " (" << gate.error().message() << ")";
    }
    std::cout << "\n";

    return LENS_EXIT_SUCCESS;
}

}  // namespace lens::cli
