#pragma once

#include <boxhunt/config.hpp>
#include <boxhunt/image/dedup_index.hpp>
#include <boxhunt/image/failed_url_set.hpp>
#include <boxhunt/image/image_processor.hpp>
#include <boxhunt/net/http_client.hpp>
#include <boxhunt/result.hpp>
#include <boxhunt/source/source_manager.hpp>
#include <boxhunt/source/website_crawler.hpp>
#include <boxhunt/storage/metadata_store.hpp>
#include <boxhunt/types.hpp>
#include <boxhunt/util/logger.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace boxhunt {

struct KeywordReport {
    std::string keyword;
    size_t found = 0;       // Candidates returned by the sources
    size_t processed = 0;   // Candidates run through the processor
    size_t saved = 0;       // Records appended to the store
};

struct MultiKeywordReport {
    size_t total_keywords = 0;
    size_t completed_keywords = 0;
    size_t total_found = 0;
    size_t total_processed = 0;
    size_t total_saved = 0;
    std::vector<KeywordReport> keyword_results;
    std::vector<std::string> errors;   // Keywords that produced no candidates
};

struct SiteReport {
    std::string seed;
    std::string collection;
    size_t found = 0;
    size_t processed = 0;
    size_t saved = 0;
    source::CrawlReport crawl;
};

// Per-call overrides for crawl_site(); unset fields use the config
struct SiteCrawlOptions {
    std::optional<int> max_depth;
    std::optional<bool> respect_robots;
};

struct CleanupReport {
    size_t orphaned_files_removed = 0;
    size_t failed_urls_cleared = 0;
};

struct HarvestStatistics {
    StoreStatistics storage;
    std::vector<std::string> sources;
    size_t failed_urls = 0;
    size_t unique_hashes = 0;
};

/**
 * Harvester - one collection's end-to-end pipeline.
 *
 * Ties the source clients, the image processor and the metadata store
 * together for a single collection (the default data directory or a
 * per-domain one). The dedup index is seeded from the store when the
 * harvester is created, so images accepted in earlier runs are never
 * accepted again.
 */
class Harvester {
public:
    /**
     * Open the collection's store and build the pipeline.
     *
     * @param config Run-wide settings
     * @param collection Where images and metadata live
     * @param http Transport for every request; must outlive the harvester
     * @param logger Optional log sink; must outlive the harvester
     * @param sources Client set to use; null means SourceManager::from_config
     * @return The harvester, or the error from reading the store
     */
    static Result<std::unique_ptr<Harvester>> create(
        const HarvestConfig& config,
        const Collection& collection,
        net::HttpClient* http,
        Logger* logger = nullptr,
        std::unique_ptr<source::SourceManager> sources = nullptr);

    Harvester(const Harvester&) = delete;
    Harvester& operator=(const Harvester&) = delete;

    // ========================================================================
    // Keyword harvesting
    // ========================================================================

    /**
     * Search every source for one keyword, then process and save the
     * candidates in batches of save_batch_size.
     *
     * @param keyword Search text
     * @param max_per_source Per-client result cap
     * @return Counts for the keyword; NO_SOURCES without clients; the store
     *         or disk error that stopped the batch loop
     */
    Result<KeywordReport> crawl_keyword(const std::string& keyword, int max_per_source);

    /**
     * Harvest keywords one after another, pausing delay_ms between them.
     * A keyword without candidates is recorded in errors and the run goes
     * on; a store or disk failure stops it.
     */
    Result<MultiKeywordReport> crawl_keywords(const std::vector<std::string>& keywords,
                                              int max_per_source, int delay_ms);

    /**
     * Re-seed the dedup index from the store, then crawl_keywords().
     */
    Result<MultiKeywordReport> resume(const std::vector<std::string>& keywords,
                                      int max_per_source, int delay_ms);

    // ========================================================================
    // Website harvesting
    // ========================================================================

    /**
     * Breadth-first crawl of one site, then process and save what it found.
     *
     * @param seed_url Absolute http(s) start page
     * @param max_images Candidate cap for the crawl
     * @param options Depth and robots overrides
     */
    Result<SiteReport> crawl_site(const std::string& seed_url, int max_images,
                                  const SiteCrawlOptions& options = {});

    // ========================================================================
    // Maintenance
    // ========================================================================

    /**
     * Delete orphaned image files and forget failed URLs.
     */
    Result<CleanupReport> cleanup();

    Result<HarvestStatistics> statistics() const;

    Result<fs::path> export_metadata(ExportFormat format, const fs::path& output = {}) const;

    std::vector<source::SourceTestResult> test_sources();

    /**
     * Replace the dedup index contents with the hashes in the store.
     * @return Number of hashes loaded
     */
    Result<size_t> reload_dedup_index();

    source::SourceManager& sources() { return *sources_; }
    MetadataStore& store() { return *store_; }
    image::ImageProcessor& processor() { return *processor_; }
    const image::DedupIndex& dedup_index() const { return *dedup_; }
    const image::FailedUrlSet& failed_urls() const { return *failed_urls_; }
    const Collection& collection() const { return collection_; }

private:
    Harvester() = default;

    struct BatchTotals {
        size_t processed = 0;
        size_t saved = 0;
    };

    // Process in save_batch_size chunks, saving each chunk before the next
    Result<BatchTotals> process_and_save(const std::vector<Candidate>& candidates);

    HarvestConfig config_;
    Collection collection_;
    net::HttpClient* http_ = nullptr;
    Logger* logger_ = nullptr;

    std::unique_ptr<MetadataStore> store_;
    std::unique_ptr<image::DedupIndex> dedup_;
    std::unique_ptr<image::FailedUrlSet> failed_urls_;
    std::unique_ptr<image::ImageProcessor> processor_;
    std::unique_ptr<source::SourceManager> sources_;
};

}  // namespace boxhunt
