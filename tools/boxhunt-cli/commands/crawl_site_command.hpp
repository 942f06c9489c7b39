#pragma once

#include "command.hpp"

namespace boxhunt::cli {

/**
 * Crawl one website into its own per-domain collection.
 */
class CrawlSiteCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "crawl-site"; }
    std::string description() const override {
        return "Crawl a website and download its images";
    }

private:
    std::string url_;
    int max_images_ = 0;   // 0 = max_images_per_website
    int depth_ = -1;       // -1 = config max_depth
    bool no_robots_ = false;
};

}  // namespace boxhunt::cli
