#include "highlight_command.hpp"

#include <lens/highlighter.hpp>

#include <iomanip>

namespace lens::cli {

void HighlightCommand::setup(CLI::App& app) {
    add_script_option(app, script_);

    app.add_option("-t,--theme", theme_, "Color theme (see 'lens themes')")
        ->type_name("<theme>");

    app.add_flag("--spans", spans_, "Print categorized spans instead of colors");
}

int HighlightCommand::execute(CommandContext& ctx) {
    HighlightScheme scheme = ctx.config.scheme;
    if (!theme_.empty()) {
        auto selected = Highlighter::scheme_from_name(theme_);
        if (!selected) {
            std::cerr << "Error: Unknown theme: " << theme_ << "\n";
            return LENS_EXIT_USER_ERROR;
        }
        scheme = *selected;
    }

    auto text = load_script(script_);
    if (!text.ok()) {
        return report_load_error(text.error(), *ctx.logger);
    }

    if (!spans_) {
        std::cout << Highlighter::render(text.value(), scheme);
        return LENS_EXIT_SUCCESS;
    }

    for (const auto& line : Highlighter::highlight(text.value())) {
        for (const auto& span : line.spans) {
            std::cout << std::right << std::setw(5) << line.line_number << ":"
                      << std::left << std::setw(4) << span.offset
                      << std::setw(10) << Highlighter::category_name(span.category)
                      << span.text << "\n";
        }
    }
    return LENS_EXIT_SUCCESS;
}

}  // namespace lens::cli
