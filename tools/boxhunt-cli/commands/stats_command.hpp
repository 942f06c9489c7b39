#pragma once

#include "command.hpp"

namespace boxhunt::cli {

class StatsCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "stats"; }
    std::string description() const override {
        return "Show collection statistics";
    }

private:
    std::string site_;   // Empty = default collection
};

}  // namespace boxhunt::cli
