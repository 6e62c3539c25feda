#include "validate_command.hpp"

#include <lens/script_classifier.hpp>
#include <lens/shebang_parser.hpp>
#include <lens/syntax_validator.hpp>

namespace lens::cli {

void ValidateCommand::setup(CLI::App& app) {
    add_script_option(app, script_);

    app.add_option("--as", as_type_, "Skip detection and check as this language")
        ->type_name("<shell|python|perl|ruby|unknown>");

    app.add_flag("--exec", for_exec_,
                 "Also require an interpreter line, as for automatic execution");

    app.add_flag("-q,--quiet", quiet_, "Print nothing, exit status only");
}

int ValidateCommand::execute(CommandContext& ctx) {
    auto text = load_script(script_);
    if (!text.ok()) {
        return report_load_error(text.error(), *ctx.logger);
    }

    std::vector<Error> failures;
    ScriptType type = ScriptType::UNKNOWN;

    if (!as_type_.empty()) {
        auto forced = ScriptClassifier::from_string(as_type_);
        if (!forced) {
            std::cerr << "Error: Unknown script type: " << as_type_ << "\n";
            return LENS_EXIT_USER_ERROR;
        }
        type = *forced;

        auto result = SyntaxValidator::validate_as(text.value(), type);
        if (!result.ok()) {
            failures.push_back(result.error());
        }
    } else {
        auto report = SyntaxValidator::report(text.value());
        type = report.type;
        failures = report.failures;
    }

    if (for_exec_) {
        auto gate = ShebangParser::check_runnable(text.value(), type);
        if (!gate.ok()) {
            failures.push_back(gate.error());
        }
    }

    ctx.logger->debug(std::string("Validated as ") + ScriptClassifier::to_string(type));

    if (!quiet_) {
        if (failures.empty()) {
            std::cout << "valid (" << ScriptClassifier::to_string(type) << ")\n";
        } else {
            std::cout << "invalid (" << ScriptClassifier::to_string(type) << ")\n";
            for (const auto& failure : failures) {
                std::cout << "  " << failure.to_string() << "\n";
            }
        }
    }

    return failures.empty() ? LENS_EXIT_SUCCESS : LENS_EXIT_INVALID;
}

}  // namespace lens::cli
