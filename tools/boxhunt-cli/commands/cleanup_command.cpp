#include "cleanup_command.hpp"

namespace boxhunt::cli {

void CleanupCommand::setup(CLI::App& app) {
    app.add_option("--site", site_, "Clean a website collection (URL or domain)");
}

int CleanupCommand::execute(CommandContext& ctx) {
    auto collection = select_collection(ctx.config, site_);
    if (!collection.ok()) {
        return report_error(collection.error());
    }

    int exit_code = BOXHUNT_EXIT_SUCCESS;
    auto harvester = open_harvester(ctx, collection.value(), exit_code);
    if (!harvester) return exit_code;

    auto result = harvester->cleanup();
    if (!result.ok()) {
        return report_error(result.error());
    }

    std::cout << "\nCleanup completed:\n";
    std::cout << "  Orphaned files removed: " << result->orphaned_files_removed << "\n";
    std::cout << "  Failed URLs cleared: " << result->failed_urls_cleared << "\n";
    return BOXHUNT_EXIT_SUCCESS;
}

}  // namespace boxhunt::cli
