#include "type_command.hpp"

#include <lens/script_classifier.hpp>

namespace lens::cli {

void TypeCommand::setup(CLI::App& app) {
    add_script_option(app, script_);
    app.add_flag("--shebang-only", shebang_only_,
                 "Use only the interpreter line (unknown when it matches nothing)");
}

int TypeCommand::execute(CommandContext& ctx) {
    auto text = load_script(script_);
    if (!text.ok()) {
        return report_load_error(text.error(), *ctx.logger);
    }

    ScriptType type = shebang_only_
        ? ScriptClassifier::classify_shebang(Text::first_line(text.value()))
        : ScriptClassifier::classify(text.value());

    std::cout << ScriptClassifier::to_string(type) << "\n";
    return LENS_EXIT_SUCCESS;
}

}  // namespace lens::cli
