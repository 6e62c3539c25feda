#pragma once

#include "command.hpp"

namespace lens::cli {

/**
 * List the available color themes.
 */
class ThemesCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "themes"; }
    std::string description() const override {
        return "List color themes";
    }

private:
    bool numbered_ = false;
};

}  // namespace lens::cli
