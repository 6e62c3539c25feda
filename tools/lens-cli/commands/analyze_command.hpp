#pragma once

#include "command.hpp"

#include <lens/script_analyzer.hpp>

namespace lens::cli {

/**
 * Run every analysis and print a combined report.
 */
class AnalyzeCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "analyze"; }
    std::string description() const override {
        return "Full analysis report";
    }

private:
    std::string script_;
    bool json_ = false;

    void print_text(const AnalysisReport& report) const;
};

}  // namespace lens::cli
