#include "stats_command.hpp"

namespace boxhunt::cli {

void StatsCommand::setup(CLI::App& app) {
    app.add_option("--site", site_, "Show a website collection (URL or domain)");
}

int StatsCommand::execute(CommandContext& ctx) {
    auto collection = select_collection(ctx.config, site_);
    if (!collection.ok()) {
        return report_error(collection.error());
    }

    int exit_code = BOXHUNT_EXIT_SUCCESS;
    auto harvester = open_harvester(ctx, collection.value(), exit_code);
    if (!harvester) return exit_code;

    auto result = harvester->statistics();
    if (!result.ok()) {
        return report_error(result.error());
    }

    const HarvestStatistics& stats = result.value();
    std::cout << "\nBoxHunt Statistics (" << collection->name << "):\n";
    std::cout << "  Total images: " << stats.storage.total_images << "\n";
    std::cout << "  Total size: " << format_megabytes(stats.storage.total_size) << "\n";
    std::cout << "  Average dimensions: " << stats.storage.avg_width << "x"
              << stats.storage.avg_height << "\n";

    if (!stats.storage.sources.empty()) {
        std::cout << "  Sources:\n";
        for (const auto& [source, count] : stats.storage.sources) {
            std::cout << "    - " << source << ": " << count << " images\n";
        }
    }
    if (!stats.storage.file_formats.empty()) {
        std::cout << "  File formats:\n";
        for (const auto& [format, count] : stats.storage.file_formats) {
            std::cout << "    - " << format << ": " << count << " files\n";
        }
    }

    std::string apis;
    for (size_t i = 0; i < stats.sources.size(); ++i) {
        if (i > 0) apis += ", ";
        apis += stats.sources[i];
    }
    std::cout << "  Available APIs: " << (apis.empty() ? "none" : apis) << "\n";
    return BOXHUNT_EXIT_SUCCESS;
}

}  // namespace boxhunt::cli
