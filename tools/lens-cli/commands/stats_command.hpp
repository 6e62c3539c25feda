#pragma once

#include "command.hpp"

namespace lens::cli {

/**
 * Print line counts by category.
 */
class StatsCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "stats"; }
    std::string description() const override {
        return "Count code, comment and blank lines";
    }

private:
    std::string script_;
};

}  // namespace lens::cli
