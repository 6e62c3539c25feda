#pragma once

#include "command.hpp"

namespace lens::cli {

/**
 * Print the detected script language.
 */
class TypeCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "type"; }
    std::string description() const override {
        return "Detect the script language";
    }

private:
    std::string script_;
    bool shebang_only_ = false;
};

}  // namespace lens::cli
