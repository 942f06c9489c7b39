#pragma once

#include "exit_codes.hpp"

#include <boxhunt/boxhunt.hpp>
#include <CLI/CLI.hpp>

#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace boxhunt::cli {

/**
 * Context passed to command execution.
 * Holds the effective configuration and the shared transport and logger.
 */
struct CommandContext {
    HarvestConfig config;
    net::HttpClient* http = nullptr;
    Logger* logger = nullptr;
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     * Called during CLI initialization.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing succeeds.
     *
     * @param ctx Execution context with config, transport and logger
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    /**
     * Get the command name (e.g., "crawl", "stats").
     */
    virtual std::string name() const = 0;

    /**
     * Get a brief description for help text.
     */
    virtual std::string description() const = 0;
};

// Helper functions used by multiple commands

/**
 * Map a library error to a process exit code.
 */
inline int exit_code_for(const Error& error) {
    switch (error.code()) {
        case ErrorCode::OK:
            return BOXHUNT_EXIT_SUCCESS;
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::NO_SOURCES:
        case ErrorCode::ROBOTS_DISALLOWED:
        case ErrorCode::AUTH_ERROR:
            return BOXHUNT_EXIT_USER_ERROR;
        case ErrorCode::NOT_FOUND:
            return BOXHUNT_EXIT_NOT_FOUND;
        case ErrorCode::IO_ERROR:
        case ErrorCode::CORRUPTION:
        case ErrorCode::PERMISSION_DENIED:
        case ErrorCode::TIMEOUT:
        case ErrorCode::NETWORK_ERROR:
        case ErrorCode::RATE_LIMITED:
        case ErrorCode::HTTP_ERROR:
        case ErrorCode::PAYLOAD_TOO_LARGE:
            return BOXHUNT_EXIT_IO_ERROR;
        default:
            return BOXHUNT_EXIT_INTERNAL;
    }
}

/**
 * Print an error to stderr and return its exit code.
 */
inline int report_error(const Error& error) {
    std::cerr << "Error: " << error.to_string() << "\n";
    return exit_code_for(error);
}

/**
 * Collection selected by an optional --site argument: the default
 * collection when empty, otherwise the per-domain one. A bare domain
 * ("shop.com") is accepted as well as a URL.
 */
inline Result<Collection> select_collection(const HarvestConfig& config, const std::string& site) {
    if (site.empty()) {
        return config.default_collection();
    }
    std::string domain = net::collection_domain(site);
    if (domain.empty()) {
        domain = net::collection_domain("http://" + site);
    }
    if (domain.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Cannot derive a domain from: " + site);
    }
    return config.domain_collection(domain);
}

/**
 * Create a harvester for a collection.
 * Prints error to stderr on failure and stores the exit code.
 */
inline std::unique_ptr<Harvester> open_harvester(CommandContext& ctx,
                                                 const Collection& collection,
                                                 int& exit_code) {
    auto result = Harvester::create(ctx.config, collection, ctx.http, ctx.logger);
    if (!result.ok()) {
        exit_code = report_error(result.error());
        return nullptr;
    }
    exit_code = BOXHUNT_EXIT_SUCCESS;
    return std::move(result.value());
}

/**
 * Keyword list for --lang: "en", "cn" or "all".
 */
inline Result<std::vector<std::string>> keywords_for_language(const HarvestConfig& config,
                                                              const std::string& lang) {
    if (lang == "en") return config.keywords_en;
    if (lang == "cn") return config.keywords_cn;
    if (lang == "all") return config.all_keywords();
    return Error(ErrorCode::INVALID_ARGUMENT, "Unknown language: " + lang + " (use en, cn or all)");
}

inline std::string format_megabytes(uint64_t bytes) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f MB", static_cast<double>(bytes) / (1024.0 * 1024.0));
    return buf;
}

inline int seconds_to_ms(double seconds) {
    return seconds <= 0.0 ? 0 : static_cast<int>(seconds * 1000.0 + 0.5);
}

}  // namespace boxhunt::cli
