#include <boxhunt/source/source_manager.hpp>
#include <boxhunt/source/keyword_api_client.hpp>

#include <algorithm>
#include <future>

namespace boxhunt::source {

namespace {

bool is_enabled(const HarvestConfig& config, const std::string& name) {
    return std::find(config.enabled_sources.begin(), config.enabled_sources.end(), name) !=
           config.enabled_sources.end();
}

}  // namespace

SourceManager::SourceManager(Logger* logger)
    : logger_(logger ? logger : null_logger()) {}

std::unique_ptr<SourceManager> SourceManager::from_config(
    const HarvestConfig& config, net::HttpClient* http, Logger* logger) {
    auto manager = std::make_unique<SourceManager>(logger);
    Logger* log = logger ? logger : null_logger();

    if (is_enabled(config, "pexels")) {
        if (config.pexels_api_key.empty()) {
            log->warning("[SourceManager] Pexels enabled but PEXELS_API_KEY is not set");
        } else {
            KeywordApiConfig api;
            api.api_key = config.pexels_api_key;
            api.endpoint = config.pexels_search_url;
            api.user_agent = config.user_agent;
            api.timeout_ms = config.api_timeout_ms;
            manager->add_client(std::make_unique<PexelsClient>(api, http, logger));
        }
    }

    if (is_enabled(config, "unsplash")) {
        if (config.unsplash_access_key.empty()) {
            log->warning("[SourceManager] Unsplash enabled but UNSPLASH_ACCESS_KEY is not set");
        } else {
            KeywordApiConfig api;
            api.api_key = config.unsplash_access_key;
            api.endpoint = config.unsplash_search_url;
            api.user_agent = config.user_agent;
            api.timeout_ms = config.api_timeout_ms;
            manager->add_client(std::make_unique<UnsplashClient>(api, http, logger));
        }
    }

    log->info("[SourceManager] Initialized " + std::to_string(manager->client_count()) +
              " source client(s)");
    return manager;
}

void SourceManager::add_client(SourceClientPtr client) {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    clients_.push_back(std::move(client));
}

size_t SourceManager::client_count() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.size();
}

std::vector<std::string> SourceManager::available_sources() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    std::vector<std::string> names;
    names.reserve(clients_.size());
    for (const auto& client : clients_) {
        names.push_back(client->name());
    }
    return names;
}

SourceManager::ClientOutcome SourceManager::run_client(
    SourceClient* client, const std::string& query, int limit) {
    ClientOutcome outcome;
    try {
        auto result = client->search(query, limit);
        if (result.ok()) {
            outcome.candidates = std::move(result).value();
        } else {
            outcome.error = result.error();
        }
    } catch (const std::exception& e) {
        outcome.error = Error(ErrorCode::INTERNAL_ERROR, e.what());
    }
    return outcome;
}

std::vector<Candidate> SourceManager::search(const std::string& query, int limit) {
    std::vector<Candidate> merged;

    if (query.empty() || limit <= 0) {
        logger_->error("[SourceManager] Search needs a non-empty query and a positive limit");
        return merged;
    }

    std::lock_guard<std::mutex> lock(clients_mutex_);
    if (clients_.empty()) {
        logger_->error("[SourceManager] No source clients configured");
        return merged;
    }

    std::vector<std::future<ClientOutcome>> tasks;
    tasks.reserve(clients_.size());
    for (auto& client : clients_) {
        SourceClient* raw = client.get();
        tasks.push_back(std::async(std::launch::async, [this, raw, &query, limit]() {
            return run_client(raw, query, limit);
        }));
    }

    for (size_t i = 0; i < tasks.size(); ++i) {
        ClientOutcome outcome = tasks[i].get();
        const std::string client_name = clients_[i]->name();
        if (outcome.error) {
            logger_->error("[SourceManager] Error from " + client_name + ": " +
                           outcome.error.to_string());
            continue;
        }
        logger_->info("[SourceManager] Got " + std::to_string(outcome.candidates.size()) +
                      " images from " + client_name);
        merged.insert(merged.end(),
                      std::make_move_iterator(outcome.candidates.begin()),
                      std::make_move_iterator(outcome.candidates.end()));
    }

    logger_->info("[SourceManager] Total images found: " + std::to_string(merged.size()));
    return merged;
}

std::vector<SourceTestResult> SourceManager::test_sources(const std::string& query, int count) {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    std::vector<SourceTestResult> results;
    results.reserve(clients_.size());

    for (auto& client : clients_) {
        SourceTestResult r;
        r.name = client->name();
        ClientOutcome outcome = run_client(client.get(), query, count);
        if (outcome.error) {
            r.error = outcome.error.to_string();
        } else {
            r.ok = true;
            r.candidates = outcome.candidates.size();
        }
        results.push_back(std::move(r));
    }
    return results;
}

}  // namespace boxhunt::source
