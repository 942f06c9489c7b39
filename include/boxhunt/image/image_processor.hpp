#pragma once

#include <boxhunt/config.hpp>
#include <boxhunt/image/dedup_index.hpp>
#include <boxhunt/image/failed_url_set.hpp>
#include <boxhunt/net/http_client.hpp>
#include <boxhunt/types.hpp>
#include <boxhunt/util/logger.hpp>
#include <boxhunt/util/semaphore.hpp>

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace boxhunt::image {

enum class OutputFormat {
    JPEG,
    PNG
};

struct ProcessorConfig {
    int min_width = 256;
    int min_height = 256;
    uint64_t max_file_size = 10ull * 1024 * 1024;
    int max_concurrent_requests = 3;  // Simultaneous downloads
    int worker_threads = 0;           // 0 = max_concurrent_requests + 2
    int download_timeout_ms = 30000;
    std::string user_agent = DEFAULT_USER_AGENT;
    OutputFormat output_format = OutputFormat::JPEG;
    int jpeg_quality = 95;

    static ProcessorConfig from(const HarvestConfig& config);
};

// Where a candidate's pipeline stopped
enum class Disposition {
    ACCEPTED,
    SKIPPED_FAILED_URL,   // Already failed earlier this run
    DOWNLOAD_FAILED,      // Transport error, bad status or oversized
    UNDECODABLE,
    TOO_SMALL,
    DUPLICATE,
    PERSIST_FAILED,
    INTERNAL_FAILURE      // Unexpected exception
};

const char* disposition_name(Disposition d);

struct ProcessOutcome {
    Disposition disposition = Disposition::INTERNAL_FAILURE;
    std::optional<MetadataRecord> record;   // Set when ACCEPTED
    Error error;
};

struct BatchResult {
    std::vector<MetadataRecord> records;    // Accepted, in candidate order
    std::vector<Error> persist_errors;      // Disk write failures

    size_t attempted = 0;
    size_t skipped = 0;
    size_t download_failed = 0;
    size_t rejected = 0;                    // Undecodable or too small
    size_t duplicates = 0;
    size_t internal_failures = 0;
};

/**
 * Download, validate, fingerprint, deduplicate and persist candidates.
 *
 * The dedup index and failed-URL set are supplied by the owner so that
 * several processors (one per collection) never share state by accident.
 * All pointers must outlive the processor.
 *
 * At most max_concurrent_requests downloads are in flight at once;
 * decoding, hashing and writing run outside that limit.
 */
class ImageProcessor {
public:
    ImageProcessor(ProcessorConfig config,
                   fs::path images_dir,
                   net::HttpClient* http,
                   DedupIndex* dedup,
                   FailedUrlSet* failed_urls,
                   Logger* logger = nullptr);

    ImageProcessor(const ImageProcessor&) = delete;
    ImageProcessor& operator=(const ImageProcessor&) = delete;

    /**
     * Run the full pipeline for one candidate.
     * Does not throw for network or content problems; the outcome says
     * where the candidate stopped.
     */
    ProcessOutcome process(const Candidate& candidate);

    /**
     * Process a batch on a worker pool. A failure in one candidate never
     * aborts the others.
     */
    BatchResult process_batch(const std::vector<Candidate>& candidates);

    // Highest number of simultaneous downloads seen so far
    int peak_in_flight_downloads() const { return peak_in_flight_.load(); }

    // Names claimed by writes that have not yet reached their final path
    size_t reserved_filename_count() const;

    const fs::path& images_dir() const { return images_dir_; }
    const ProcessorConfig& config() const { return config_; }

private:
    Result<std::vector<uint8_t>> download(const std::string& url);
    Result<std::string> persist(const Candidate& candidate, const std::vector<uint8_t>& bytes,
                                int64_t timestamp);
    std::string reserve_filename(const std::string& source, const std::string& url,
                                 int64_t timestamp);
    void release_filename(const std::string& filename);
    int worker_count(size_t batch_size) const;

    ProcessorConfig config_;
    fs::path images_dir_;
    net::HttpClient* http_;
    DedupIndex* dedup_;
    FailedUrlSet* failed_urls_;
    Logger* logger_;

    CountingSemaphore download_slots_;
    std::atomic<int> in_flight_{0};
    std::atomic<int> peak_in_flight_{0};

    mutable std::mutex names_mutex_;
    std::unordered_set<std::string> reserved_names_;
};

}  // namespace boxhunt::image
