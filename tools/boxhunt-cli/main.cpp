#include "commands/cleanup_command.hpp"
#include "commands/config_command.hpp"
#include "commands/crawl_command.hpp"
#include "commands/crawl_site_command.hpp"
#include "commands/export_command.hpp"
#include "commands/resume_command.hpp"
#include "commands/stats_command.hpp"
#include "commands/test_command.hpp"

#include <boxhunt/boxhunt.hpp>
#include <CLI/CLI.hpp>

#include <iostream>
#include <memory>
#include <vector>

namespace {

struct GlobalOptions {
    std::string config_file = "boxhunt.json";
    std::string data_dir;
    std::string log_level = "info";
    std::string log_file = "boxhunt.log";
};

std::unique_ptr<boxhunt::TeeLogger> make_logger(const GlobalOptions& opts, boxhunt::LogLevel level) {
    auto tee = std::make_unique<boxhunt::TeeLogger>();

    auto console = std::make_unique<boxhunt::ConsoleLogger>();
    console->set_min_level(level);
    tee->add(std::move(console));

    if (!opts.log_file.empty()) {
        auto file = std::make_unique<boxhunt::FileLogger>(opts.log_file);
        if (file->is_open()) {
            file->set_min_level(level);
            tee->add(std::move(file));
        } else {
            std::cerr << "Warning: cannot open log file " << opts.log_file << "\n";
        }
    }
    return tee;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace boxhunt::cli;

    CLI::App app{"BoxHunt - cardboard box image collector"};
    app.require_subcommand(1);

    GlobalOptions opts;
    app.add_option("--config", opts.config_file, "JSON config file (default: boxhunt.json)");
    app.add_option("--data-dir", opts.data_dir, "Data directory (overrides config)");
    app.add_option("--log-level", opts.log_level, "debug, info, warning or error")
        ->check(CLI::IsMember({"debug", "info", "warning", "warn", "error"}, CLI::ignore_case));
    app.add_option("--log-file", opts.log_file, "Log file; empty disables (default: boxhunt.log)");

    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<CrawlCommand>());
    commands.push_back(std::make_unique<CrawlSiteCommand>());
    commands.push_back(std::make_unique<ResumeCommand>());
    commands.push_back(std::make_unique<TestCommand>());
    commands.push_back(std::make_unique<StatsCommand>());
    commands.push_back(std::make_unique<CleanupCommand>());
    commands.push_back(std::make_unique<ExportCommand>());
    commands.push_back(std::make_unique<ConfigCommand>());

    std::vector<std::pair<CLI::App*, Command*>> registered;
    for (auto& command : commands) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        registered.emplace_back(sub, command.get());
    }

    CLI11_PARSE(app, argc, argv);

    boxhunt::LogLevel level = boxhunt::LogLevel::INFO;
    if (!boxhunt::parse_log_level(opts.log_level, level)) {
        std::cerr << "Error: Unknown log level: " << opts.log_level << "\n";
        return BOXHUNT_EXIT_USER_ERROR;
    }
    auto logger = make_logger(opts, level);

    auto config = boxhunt::load_config(opts.config_file);
    if (!config.ok()) {
        return report_error(config.error());
    }

    CommandContext ctx;
    ctx.config = std::move(config.value());
    boxhunt::apply_env_overrides(ctx.config);
    if (!opts.data_dir.empty()) {
        ctx.config.data_dir = opts.data_dir;
    }

    boxhunt::net::CurlHttpClient http;
    ctx.http = &http;
    ctx.logger = logger.get();

    for (auto& [sub, command] : registered) {
        if (!sub->parsed()) continue;
        try {
            return command->execute(ctx);
        } catch (const std::exception& e) {
            logger->error(std::string("Unexpected error: ") + e.what());
            std::cerr << "Error: " << e.what() << "\n";
            return BOXHUNT_EXIT_INTERNAL;
        }
    }

    std::cerr << app.help();
    return BOXHUNT_EXIT_USER_ERROR;
}
