#include "crawl_command.hpp"

namespace boxhunt::cli {

void CrawlCommand::setup(CLI::App& app) {
    app.add_option("-k,--keywords", keywords_, "Keywords to search (default: configured list)");

    app.add_option("--lang", lang_, "Configured keyword list to use: en, cn or all")
        ->check(CLI::IsMember({"en", "cn", "all"}));

    app.add_option("-n,--max-images", max_images_, "Maximum images per source per keyword (default: 20)")
        ->check(CLI::PositiveNumber);

    app.add_option("--delay", delay_seconds_, "Seconds to wait between keywords (default: 1.0)")
        ->check(CLI::NonNegativeNumber);

    app.add_option("--sources", sources_, "Restrict to these sources (pexels, unsplash)")
        ->check(CLI::IsMember({"pexels", "unsplash"}));
}

int CrawlCommand::execute(CommandContext& ctx) {
    std::vector<std::string> keywords = keywords_;
    if (keywords.empty()) {
        auto configured = keywords_for_language(ctx.config, lang_);
        if (!configured.ok()) {
            return report_error(configured.error());
        }
        keywords = configured.value();
    }
    if (keywords.empty()) {
        std::cerr << "Error: No keywords to search\n";
        return BOXHUNT_EXIT_USER_ERROR;
    }

    if (!sources_.empty()) {
        ctx.config.enabled_sources = sources_;
    }

    int exit_code = BOXHUNT_EXIT_SUCCESS;
    auto harvester = open_harvester(ctx, ctx.config.default_collection(), exit_code);
    if (!harvester) return exit_code;

    if (keywords.size() == 1) {
        auto result = harvester->crawl_keyword(keywords.front(), max_images_);
        if (!result.ok()) {
            return report_error(result.error());
        }
        std::cout << "\nCrawl completed for '" << result->keyword << "':\n";
        std::cout << "  Found: " << result->found << " images\n";
        std::cout << "  Saved: " << result->saved << " images\n";
        return BOXHUNT_EXIT_SUCCESS;
    }

    auto result = harvester->crawl_keywords(keywords, max_images_, seconds_to_ms(delay_seconds_));
    if (!result.ok()) {
        return report_error(result.error());
    }

    const MultiKeywordReport& report = result.value();
    std::cout << "\nMulti-keyword crawl completed:\n";
    std::cout << "  Keywords processed: " << report.completed_keywords << "/"
              << report.total_keywords << "\n";
    std::cout << "  Total images found: " << report.total_found << "\n";
    std::cout << "  Total images saved: " << report.total_saved << "\n";
    if (!report.errors.empty()) {
        std::cout << "  Errors: " << report.errors.size() << "\n";
        for (const auto& error : report.errors) {
            std::cout << "    - " << error << "\n";
        }
    }
    return BOXHUNT_EXIT_SUCCESS;
}

}  // namespace boxhunt::cli
