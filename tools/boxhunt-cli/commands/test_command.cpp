#include "test_command.hpp"

namespace boxhunt::cli {

void TestCommand::setup(CLI::App& /* app */) {
    // No options for test command
}

int TestCommand::execute(CommandContext& ctx) {
    int exit_code = BOXHUNT_EXIT_SUCCESS;
    auto harvester = open_harvester(ctx, ctx.config.default_collection(), exit_code);
    if (!harvester) return exit_code;

    std::cout << "Testing API connections...\n";
    auto results = harvester->test_sources();
    if (results.empty()) {
        std::cout << "No sources configured. Set PEXELS_API_KEY or UNSPLASH_ACCESS_KEY.\n";
        return BOXHUNT_EXIT_USER_ERROR;
    }

    std::cout << "\nAPI Test Results:\n";
    bool all_ok = true;
    for (const auto& r : results) {
        if (r.ok) {
            std::cout << "  [ok]   " << r.name << ": " << r.candidates << " results\n";
        } else {
            all_ok = false;
            std::cout << "  [fail] " << r.name << ": " << r.error << "\n";
        }
    }
    return all_ok ? BOXHUNT_EXIT_SUCCESS : BOXHUNT_EXIT_IO_ERROR;
}

}  // namespace boxhunt::cli
