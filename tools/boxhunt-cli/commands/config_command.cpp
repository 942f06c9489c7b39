#include "config_command.hpp"

namespace boxhunt::cli {

void ConfigCommand::setup(CLI::App& app) {
    app.add_flag("--json", json_, "Print every setting as JSON");
}

int ConfigCommand::execute(CommandContext& ctx) {
    const HarvestConfig& c = ctx.config;
    if (json_) {
        std::cout << describe_config(c) << "\n";
        return BOXHUNT_EXIT_SUCCESS;
    }

    std::cout << "\nCurrent Configuration:\n";
    std::cout << "  Data directory: " << c.data_dir.string() << "\n";
    std::cout << "  Storage: " << c.default_collection().metadata_file.string()
              << " (websites: " << (c.data_dir / "<domain>").string() << ")\n";
    std::cout << "  Min image size: " << c.min_width << "x" << c.min_height << "\n";
    std::cout << "  Max file size: " << format_megabytes(c.max_file_size) << "\n";
    std::cout << "  Request delay: " << c.request_delay_ms << " ms\n";
    std::cout << "  Max concurrent: " << c.max_concurrent_requests << "\n";
    std::cout << "  Crawl depth: " << c.max_depth
              << ", robots.txt: " << (c.respect_robots ? "respected" : "ignored") << "\n";

    std::cout << "\nAPI Keys Status:\n";
    std::cout << "  pexels: " << (c.pexels_api_key.empty() ? "not set" : "configured") << "\n";
    std::cout << "  unsplash: " << (c.unsplash_access_key.empty() ? "not set" : "configured") << "\n";

    auto keywords = c.all_keywords();
    std::cout << "\nSearch Keywords (" << keywords.size() << " total):\n";
    std::cout << "  English: ";
    for (size_t i = 0; i < c.keywords_en.size(); ++i) {
        std::cout << (i > 0 ? ", " : "") << c.keywords_en[i];
    }
    std::cout << "\n  Chinese: ";
    for (size_t i = 0; i < c.keywords_cn.size(); ++i) {
        std::cout << (i > 0 ? ", " : "") << c.keywords_cn[i];
    }
    std::cout << "\n";
    return BOXHUNT_EXIT_SUCCESS;
}

}  // namespace boxhunt::cli
