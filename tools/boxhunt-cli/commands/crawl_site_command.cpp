#include "crawl_site_command.hpp"

namespace boxhunt::cli {

void CrawlSiteCommand::setup(CLI::App& app) {
    app.add_option("url", url_, "Start page (http or https)")
        ->required();

    app.add_option("-n,--max-images", max_images_, "Maximum images to collect (default: from config)")
        ->check(CLI::PositiveNumber);

    app.add_option("--depth", depth_, "Link depth to follow from the start page (default: from config)")
        ->check(CLI::NonNegativeNumber);

    app.add_flag("--no-robots", no_robots_, "Ignore robots.txt");
}

int CrawlSiteCommand::execute(CommandContext& ctx) {
    std::string domain = net::collection_domain(url_);
    if (domain.empty()) {
        std::cerr << "Error: Invalid URL: " << url_ << "\n";
        return BOXHUNT_EXIT_USER_ERROR;
    }

    Collection collection = ctx.config.domain_collection(domain);
    int max_images = max_images_ > 0 ? max_images_ : ctx.config.max_images_per_website;

    SiteCrawlOptions options;
    if (depth_ >= 0) options.max_depth = depth_;
    if (no_robots_) options.respect_robots = false;

    std::cout << "Crawling website: " << url_ << "\n";
    std::cout << "  Domain: " << domain << "\n";
    std::cout << "  Max images: " << max_images << "\n";
    std::cout << "  Depth: " << options.max_depth.value_or(ctx.config.max_depth) << "\n";

    int exit_code = BOXHUNT_EXIT_SUCCESS;
    auto harvester = open_harvester(ctx, collection, exit_code);
    if (!harvester) return exit_code;

    auto result = harvester->crawl_site(url_, max_images, options);
    if (!result.ok()) {
        return report_error(result.error());
    }

    const SiteReport& report = result.value();
    if (report.found == 0) {
        std::cout << "No images found\n";
        return BOXHUNT_EXIT_SUCCESS;
    }

    std::cout << "\nWebsite crawl completed:\n";
    std::cout << "  Pages visited: " << report.crawl.pages.size() << "\n";
    std::cout << "  Images found: " << report.found << "\n";
    std::cout << "  Images saved: " << report.saved << "\n";
    std::cout << "  Images directory: " << collection.images_dir.string() << "\n";
    std::cout << "  Metadata file: " << collection.metadata_file.string() << "\n";
    return BOXHUNT_EXIT_SUCCESS;
}

}  // namespace boxhunt::cli
