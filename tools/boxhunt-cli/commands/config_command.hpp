#pragma once

#include "command.hpp"

namespace boxhunt::cli {

class ConfigCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "config"; }
    std::string description() const override {
        return "Show the effective configuration";
    }

private:
    bool json_ = false;
};

}  // namespace boxhunt::cli
