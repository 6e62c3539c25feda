#pragma once

#include "command.hpp"

namespace lens::cli {

/**
 * Show the interpreter line and the command an executor would run.
 */
class ShebangCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "shebang"; }
    std::string description() const override {
        return "Parse the interpreter line";
    }

private:
    std::string script_;
    size_t max_args_ = DEFAULT_MAX_SHEBANG_ARGS;
};

}  // namespace lens::cli
