#include "resume_command.hpp"

namespace boxhunt::cli {

void ResumeCommand::setup(CLI::App& app) {
    app.add_option("-k,--keywords", keywords_, "Keywords to search (default: configured list)");

    app.add_option("--lang", lang_, "Configured keyword list to use: en, cn or all")
        ->check(CLI::IsMember({"en", "cn", "all"}));

    app.add_option("-n,--max-images", max_images_, "Maximum images per source per keyword (default: 20)")
        ->check(CLI::PositiveNumber);

    app.add_option("--delay", delay_seconds_, "Seconds to wait between keywords (default: 1.0)")
        ->check(CLI::NonNegativeNumber);
}

int ResumeCommand::execute(CommandContext& ctx) {
    std::vector<std::string> keywords = keywords_;
    if (keywords.empty()) {
        auto configured = keywords_for_language(ctx.config, lang_);
        if (!configured.ok()) {
            return report_error(configured.error());
        }
        keywords = configured.value();
    }

    int exit_code = BOXHUNT_EXIT_SUCCESS;
    auto harvester = open_harvester(ctx, ctx.config.default_collection(), exit_code);
    if (!harvester) return exit_code;

    auto result = harvester->resume(keywords, max_images_, seconds_to_ms(delay_seconds_));
    if (!result.ok()) {
        return report_error(result.error());
    }

    std::cout << "\nResume crawl completed:\n";
    std::cout << "  Keywords processed: " << result->completed_keywords << "/"
              << result->total_keywords << "\n";
    std::cout << "  Total images saved: " << result->total_saved << "\n";
    return BOXHUNT_EXIT_SUCCESS;
}

}  // namespace boxhunt::cli
