#pragma once

#include "command.hpp"

namespace lens::cli {

/**
 * Print the script with ANSI colors, or its spans with --spans.
 */
class HighlightCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "highlight"; }
    std::string description() const override {
        return "Render the script with syntax colors";
    }

private:
    std::string script_;
    std::string theme_;
    bool spans_ = false;
};

}  // namespace lens::cli
