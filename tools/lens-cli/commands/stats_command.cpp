#include "stats_command.hpp"

#include <lens/script_classifier.hpp>
#include <lens/stats_collector.hpp>

namespace lens::cli {

void StatsCommand::setup(CLI::App& app) {
    add_script_option(app, script_);
}

int StatsCommand::execute(CommandContext& ctx) {
    auto text = load_script(script_);
    if (!text.ok()) {
        return report_load_error(text.error(), *ctx.logger);
    }

    auto stats = StatsCollector::collect(text.value());
    auto type = ScriptClassifier::classify(text.value());
    std::cout << StatsCollector::format(stats, type) << "\n";
    return LENS_EXIT_SUCCESS;
}

}  // namespace lens::cli
