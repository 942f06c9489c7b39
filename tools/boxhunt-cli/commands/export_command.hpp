#pragma once

#include "command.hpp"

namespace boxhunt::cli {

/**
 * Write a collection's metadata as CSV or JSON.
 */
class ExportCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "export"; }
    std::string description() const override {
        return "Export collection metadata";
    }

private:
    std::string format_ = "csv";
    std::string output_;
    std::string site_;
};

}  // namespace boxhunt::cli
