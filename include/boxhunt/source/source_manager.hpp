#pragma once

#include <boxhunt/config.hpp>
#include <boxhunt/net/http_client.hpp>
#include <boxhunt/source/source_client.hpp>
#include <boxhunt/util/logger.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace boxhunt::source {

/**
 * Outcome of probing one client with a small query.
 */
struct SourceTestResult {
    std::string name;
    bool ok = false;
    size_t candidates = 0;
    std::string error;
};

/**
 * Fans a query out to every registered client concurrently.
 *
 * A client that fails (error result or exception) contributes zero
 * candidates and never affects its siblings. Results are concatenated in
 * registration order once every client has finished; no cross-client
 * dedup happens here.
 */
class SourceManager {
public:
    explicit SourceManager(Logger* logger = nullptr);

    SourceManager(const SourceManager&) = delete;
    SourceManager& operator=(const SourceManager&) = delete;

    /**
     * Build a manager with the keyword API clients enabled in the config.
     * Clients without credentials are skipped with a warning.
     *
     * @param config Provider endpoints, keys and enabled source names
     * @param http Transport shared by all clients; must outlive the manager
     * @param logger Optional log sink
     */
    static std::unique_ptr<SourceManager> from_config(
        const HarvestConfig& config, net::HttpClient* http, Logger* logger);

    void add_client(SourceClientPtr client);
    size_t client_count() const;

    // Client names in registration order
    std::vector<std::string> available_sources() const;

    /**
     * Query every client with the same per-source limit.
     *
     * @param query Non-empty search string
     * @param limit Positive per-client result cap
     * @return Union of candidates; empty when no clients are registered or
     *         the arguments are invalid
     */
    std::vector<Candidate> search(const std::string& query, int limit);

    /**
     * Run a small search against each client and report success per client.
     */
    std::vector<SourceTestResult> test_sources(const std::string& query = "cardboard box",
                                               int count = 5);

private:
    struct ClientOutcome {
        std::vector<Candidate> candidates;
        Error error;
    };

    ClientOutcome run_client(SourceClient* client, const std::string& query, int limit);

    std::vector<SourceClientPtr> clients_;
    mutable std::mutex clients_mutex_;
    Logger* logger_;
};

}  // namespace boxhunt::source
