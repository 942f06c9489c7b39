#pragma once

#include "command.hpp"

namespace boxhunt::cli {

class CleanupCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "cleanup"; }
    std::string description() const override {
        return "Remove orphaned image files and forget failed URLs";
    }

private:
    std::string site_;   // Empty = default collection
};

}  // namespace boxhunt::cli
