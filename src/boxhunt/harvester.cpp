#include <boxhunt/harvester.hpp>

#include <algorithm>
#include <chrono>
#include <thread>

namespace boxhunt {

namespace {

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

}  // namespace

Result<std::unique_ptr<Harvester>> Harvester::create(
    const HarvestConfig& config,
    const Collection& collection,
    net::HttpClient* http,
    Logger* logger,
    std::unique_ptr<source::SourceManager> sources) {
    if (http == nullptr) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Harvester requires an HTTP client");
    }
    auto valid = config.validate();
    if (!valid.ok()) {
        return valid.error();
    }

    auto harvester = std::unique_ptr<Harvester>(new Harvester());
    harvester->config_ = config;
    harvester->collection_ = collection;
    harvester->http_ = http;
    harvester->logger_ = logger ? logger : null_logger();

    auto store = MetadataStore::open(collection.metadata_file, collection.images_dir,
                                     harvester->logger_);
    if (!store.ok()) {
        return store.error();
    }
    harvester->store_ = std::move(store.value());

    harvester->dedup_ = std::make_unique<image::DedupIndex>(config.dedup_threshold);
    harvester->failed_urls_ = std::make_unique<image::FailedUrlSet>();
    harvester->processor_ = std::make_unique<image::ImageProcessor>(
        image::ProcessorConfig::from(config),
        collection.images_dir,
        http,
        harvester->dedup_.get(),
        harvester->failed_urls_.get(),
        harvester->logger_);

    harvester->sources_ = sources
        ? std::move(sources)
        : source::SourceManager::from_config(config, http, harvester->logger_);

    auto loaded = harvester->reload_dedup_index();
    if (!loaded.ok()) {
        return loaded.error();
    }

    auto names = harvester->sources_->available_sources();
    if (names.empty()) {
        harvester->logger_->warning(
            "[Harvester] No API sources available. Please check your API keys.");
    } else {
        harvester->logger_->info("[Harvester] Available API sources: " + join(names, ", "));
    }
    return harvester;
}

Result<size_t> Harvester::reload_dedup_index() {
    auto hashes = store_->load_existing_hashes();
    if (!hashes.ok()) {
        return hashes.error();
    }
    std::vector<std::string> list(hashes->begin(), hashes->end());
    size_t loaded = dedup_->load(list);
    logger_->info("[Harvester] Loaded " + std::to_string(loaded) + " existing hashes for " +
                  collection_.name);
    return loaded;
}

// ============================================================================
// Batch processing
// ============================================================================

Result<Harvester::BatchTotals> Harvester::process_and_save(
    const std::vector<Candidate>& candidates) {
    BatchTotals totals;
    const size_t batch_size = static_cast<size_t>(std::max(1, config_.save_batch_size));

    for (size_t start = 0; start < candidates.size(); start += batch_size) {
        size_t end = std::min(candidates.size(), start + batch_size);
        std::vector<Candidate> chunk(candidates.begin() + static_cast<std::ptrdiff_t>(start),
                                     candidates.begin() + static_cast<std::ptrdiff_t>(end));

        image::BatchResult batch = processor_->process_batch(chunk);
        totals.processed += batch.attempted;

        if (!batch.records.empty()) {
            auto saved = store_->save(std::move(batch.records));
            if (!saved.ok()) {
                logger_->error("[Harvester] Failed to save metadata: " +
                               saved.error().to_string());
                return saved.error();
            }
            totals.saved += saved->size();
        }

        logger_->info("[Harvester] Progress: " + std::to_string(end) + "/" +
                      std::to_string(candidates.size()) + " processed, " +
                      std::to_string(totals.saved) + " saved");

        if (!batch.persist_errors.empty()) {
            return batch.persist_errors.front();
        }
    }
    return totals;
}

// ============================================================================
// Keyword harvesting
// ============================================================================

Result<KeywordReport> Harvester::crawl_keyword(const std::string& keyword, int max_per_source) {
    if (sources_->client_count() == 0) {
        return Error(ErrorCode::NO_SOURCES, "No source clients are configured");
    }

    KeywordReport report;
    report.keyword = keyword;
    logger_->info("[Harvester] Crawling keyword: '" + keyword + "'");

    std::vector<Candidate> candidates = sources_->search(keyword, max_per_source);
    report.found = candidates.size();
    if (candidates.empty()) {
        logger_->warning("[Harvester] No images found for keyword: " + keyword);
        return report;
    }
    logger_->info("[Harvester] Found " + std::to_string(candidates.size()) +
                  " candidate images for '" + keyword + "'");

    auto totals = process_and_save(candidates);
    if (!totals.ok()) {
        return totals.error();
    }
    report.processed = totals->processed;
    report.saved = totals->saved;

    logger_->info("[Harvester] Completed keyword '" + keyword + "': " +
                  std::to_string(report.saved) + " images saved");
    return report;
}

Result<MultiKeywordReport> Harvester::crawl_keywords(const std::vector<std::string>& keywords,
                                                     int max_per_source, int delay_ms) {
    if (sources_->client_count() == 0) {
        return Error(ErrorCode::NO_SOURCES, "No source clients are configured");
    }

    MultiKeywordReport report;
    report.total_keywords = keywords.size();
    logger_->info("[Harvester] Starting crawl for " + std::to_string(keywords.size()) +
                  " keywords");

    for (size_t i = 0; i < keywords.size(); ++i) {
        const std::string& keyword = keywords[i];
        logger_->info("[Harvester] Processing keyword " + std::to_string(i + 1) + "/" +
                      std::to_string(keywords.size()) + ": " + keyword);

        auto result = crawl_keyword(keyword, max_per_source);
        if (!result.ok()) {
            logger_->error("[Harvester] Stopping after '" + keyword + "': " +
                           result.error().to_string() + " (" +
                           std::to_string(report.total_saved) + " images saved so far)");
            return result.error();
        }

        const KeywordReport& kr = result.value();
        if (kr.found == 0) {
            report.errors.push_back("No images found for '" + keyword + "'");
        }
        report.total_found += kr.found;
        report.total_processed += kr.processed;
        report.total_saved += kr.saved;
        ++report.completed_keywords;
        report.keyword_results.push_back(kr);

        if (delay_ms > 0 && i + 1 < keywords.size()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
    }

    logger_->info("[Harvester] Crawl completed. Total saved: " +
                  std::to_string(report.total_saved));
    return report;
}

Result<MultiKeywordReport> Harvester::resume(const std::vector<std::string>& keywords,
                                             int max_per_source, int delay_ms) {
    logger_->info("[Harvester] Resuming crawl");
    auto loaded = reload_dedup_index();
    if (!loaded.ok()) {
        return loaded.error();
    }
    return crawl_keywords(keywords, max_per_source, delay_ms);
}

// ============================================================================
// Website harvesting
// ============================================================================

Result<SiteReport> Harvester::crawl_site(const std::string& seed_url, int max_images,
                                         const SiteCrawlOptions& options) {
    if (max_images <= 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "max_images must be positive");
    }

    source::WebsiteCrawlerConfig crawler_config = source::WebsiteCrawlerConfig::from(config_);
    if (options.max_depth) crawler_config.max_depth = *options.max_depth;
    if (options.respect_robots) crawler_config.respect_robots = *options.respect_robots;
    if (crawler_config.max_depth < 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "max_depth must not be negative");
    }

    source::WebsiteCrawler crawler(crawler_config, http_, logger_);
    auto candidates = crawler.crawl(seed_url, max_images);

    SiteReport report;
    report.seed = seed_url;
    report.collection = collection_.name;
    report.crawl = crawler.last_report();
    if (!candidates.ok()) {
        return candidates.error();
    }
    report.found = candidates->size();
    if (candidates->empty()) {
        logger_->warning("[Harvester] No images found on " + seed_url);
        return report;
    }

    auto totals = process_and_save(candidates.value());
    if (!totals.ok()) {
        return totals.error();
    }
    report.processed = totals->processed;
    report.saved = totals->saved;

    logger_->info("[Harvester] Website crawl of " + seed_url + " saved " +
                  std::to_string(report.saved) + "/" + std::to_string(report.found) +
                  " images");
    return report;
}

// ============================================================================
// Maintenance
// ============================================================================

Result<CleanupReport> Harvester::cleanup() {
    CleanupReport report;
    auto removed = store_->cleanup_orphans(config_.allowed_formats);
    if (!removed.ok()) {
        return removed.error();
    }
    report.orphaned_files_removed = removed.value();
    report.failed_urls_cleared = failed_urls_->clear();

    logger_->info("[Harvester] Cleanup removed " + std::to_string(report.orphaned_files_removed) +
                  " orphaned files and cleared " + std::to_string(report.failed_urls_cleared) +
                  " failed URLs");
    return report;
}

Result<HarvestStatistics> Harvester::statistics() const {
    auto storage = store_->statistics();
    if (!storage.ok()) {
        return storage.error();
    }

    HarvestStatistics stats;
    stats.storage = std::move(storage.value());
    stats.sources = sources_->available_sources();
    stats.failed_urls = failed_urls_->size();
    stats.unique_hashes = dedup_->size();
    return stats;
}

Result<fs::path> Harvester::export_metadata(ExportFormat format, const fs::path& output) const {
    return store_->export_to(format, output);
}

std::vector<source::SourceTestResult> Harvester::test_sources() {
    return sources_->test_sources();
}

}  // namespace boxhunt
