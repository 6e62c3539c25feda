#pragma once

#include "command.hpp"

namespace lens::cli {

/**
 * Run the structural checks and report every failure.
 *
 * Exits with LENS_EXIT_INVALID when any check fails, so hosts can refuse
 * automatic execution while still allowing a manual override.
 */
class ValidateCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "validate"; }
    std::string description() const override {
        return "Check quotes, brackets, shebang and block keywords";
    }

private:
    std::string script_;
    std::string as_type_;
    bool for_exec_ = false;
    bool quiet_ = false;
};

}  // namespace lens::cli
