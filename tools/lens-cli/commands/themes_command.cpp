#include "themes_command.hpp"

#include <lens/highlighter.hpp>

namespace lens::cli {

void ThemesCommand::setup(CLI::App& app) {
    app.add_flag("-n,--numbered", numbered_, "Prefix each theme with its index");
}

int ThemesCommand::execute(CommandContext& ctx) {
    const char* current = Highlighter::scheme_name(ctx.config.scheme);

    for (size_t i = 0; i < Highlighter::theme_count(); ++i) {
        auto name = Highlighter::theme_name(static_cast<long>(i));
        if (!name) break;

        if (numbered_) {
            std::cout << i << " ";
        }
        std::cout << *name;
        if (*name == current) {
            std::cout << " *";
        }
        std::cout << "\n";
    }
    return LENS_EXIT_SUCCESS;
}

}  // namespace lens::cli
