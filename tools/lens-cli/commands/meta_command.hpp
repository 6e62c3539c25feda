#pragma once

#include "command.hpp"

namespace lens::cli {

/**
 * Print header comment metadata (Author, Version, ...).
 */
class MetaCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "meta"; }
    std::string description() const override {
        return "Extract header comment metadata";
    }

private:
    std::string script_;
};

}  // namespace lens::cli
