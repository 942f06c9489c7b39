#pragma once

#include "command.hpp"

namespace boxhunt::cli {

class ResumeCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "resume"; }
    std::string description() const override {
        return "Resume a keyword crawl, skipping images already collected";
    }

private:
    std::vector<std::string> keywords_;
    std::string lang_ = "all";
    int max_images_ = 20;
    double delay_seconds_ = 1.0;
};

}  // namespace boxhunt::cli
