#pragma once

#include "command.hpp"

namespace boxhunt::cli {

/**
 * Harvest images for keywords from every configured API source.
 */
class CrawlCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "crawl"; }
    std::string description() const override {
        return "Search the keyword APIs and download images";
    }

private:
    std::vector<std::string> keywords_;
    std::string lang_ = "all";
    int max_images_ = 20;
    double delay_seconds_ = 1.0;
    std::vector<std::string> sources_;
};

}  // namespace boxhunt::cli
