#include "meta_command.hpp"

#include <lens/metadata_extractor.hpp>

namespace lens::cli {

void MetaCommand::setup(CLI::App& app) {
    add_script_option(app, script_);
}

int MetaCommand::execute(CommandContext& ctx) {
    auto text = load_script(script_);
    if (!text.ok()) {
        return report_load_error(text.error(), *ctx.logger);
    }

    auto entries = MetadataExtractor::extract(text.value());
    std::cout << MetadataExtractor::format(entries) << "\n";
    return LENS_EXIT_SUCCESS;
}

}  // namespace lens::cli
