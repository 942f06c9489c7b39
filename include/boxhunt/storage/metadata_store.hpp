#pragma once

#include <boxhunt/result.hpp>
#include <boxhunt/types.hpp>
#include <boxhunt/util/logger.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace boxhunt {

enum class ExportFormat {
    CSV,
    JSON
};

// "csv" / "json" (any case); other names are INVALID_ARGUMENT
Result<ExportFormat> parse_export_format(const std::string& name);

struct StoreStatistics {
    uint64_t total_images = 0;
    uint64_t total_size = 0;                       // Bytes
    std::map<std::string, uint64_t> sources;       // Source tag -> count
    std::map<std::string, uint64_t> file_formats;  // Extension -> count
    int avg_width = 0;
    int avg_height = 0;
};

/**
 * Append-only CSV record of accepted images for one collection.
 *
 * Columns: id, filename, url, source, title, width, height, file_size,
 * perceptual_hash, download_time, created_at, status. The first row is
 * the header; readers locate columns by name.
 *
 * One writer per collection at a time; within a process, calls are
 * serialized by an internal mutex.
 */
class MetadataStore {
public:
    static const std::vector<std::string>& columns();

    /**
     * Open (without creating) the store for a collection.
     *
     * @param metadata_file CSV file; created with its header on first save
     * @param images_dir Directory holding the collection's image files
     * @param logger Optional log sink
     */
    static Result<std::unique_ptr<MetadataStore>> open(const fs::path& metadata_file,
                                                       const fs::path& images_dir,
                                                       Logger* logger = nullptr);

    /**
     * Append records in a single write. Each gets id = max existing id + 1
     * (then incrementing), a created_at timestamp and status "downloaded".
     *
     * @return The records as stored
     */
    Result<std::vector<MetadataRecord>> save(std::vector<MetadataRecord> records);

    Result<std::vector<MetadataRecord>> load_all() const;

    Result<std::unordered_set<std::string>> load_existing_hashes() const;
    Result<std::unordered_set<std::string>> load_existing_urls() const;

    Result<StoreStatistics> statistics() const;

    /**
     * Delete image files that no record references.
     * Only regular files whose extension is in allowed_extensions are
     * considered. Without a metadata file nothing is removed.
     *
     * @return Number of files deleted
     */
    Result<size_t> cleanup_orphans(const std::vector<std::string>& allowed_extensions);

    /**
     * Write every record to another file.
     *
     * @param output Destination; empty means
     *        <store dir>/metadata_export_YYYYmmdd_HHMMSS.<ext>
     * @return Path written; INVALID_ARGUMENT when output is the metadata
     *         file itself
     */
    Result<fs::path> export_to(ExportFormat format, const fs::path& output = {}) const;

    const fs::path& metadata_file() const { return metadata_file_; }
    const fs::path& images_dir() const { return images_dir_; }

private:
    MetadataStore() = default;

    Result<std::vector<MetadataRecord>> load_all_unlocked() const;

    fs::path metadata_file_;
    fs::path images_dir_;
    Logger* logger_ = nullptr;
    mutable std::mutex mutex_;
};

}  // namespace boxhunt
