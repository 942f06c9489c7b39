#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace boxhunt {

namespace fs = std::filesystem;

using RecordId = uint64_t;
constexpr RecordId INVALID_RECORD_ID = 0;

/**
 * A discovered reference to a possible image.
 * Identity is the url until the image is processed.
 */
struct Candidate {
    std::string url;
    std::string thumbnail_url;
    std::string title;
    std::string source;         // Source tag: "pexels", "unsplash", site label
    int width = 0;              // Declared dimensions, 0 when unknown
    int height = 0;
};

/**
 * Durable record of one accepted image.
 * Created once by the image processor; id, created_at and status are
 * filled in by the metadata store when the record is written.
 */
struct MetadataRecord {
    RecordId id = INVALID_RECORD_ID;
    std::string filename;
    std::string url;
    std::string source;
    std::string title;
    int width = 0;
    int height = 0;
    uint64_t file_size = 0;
    std::string perceptual_hash;  // 16 hex digits
    double download_time = 0.0;   // Seconds since the epoch
    std::string created_at;       // ISO-8601 local time
    std::string status;
};

constexpr const char* RECORD_STATUS_DOWNLOADED = "downloaded";

/**
 * One image collection: a directory of images plus its metadata file.
 */
struct Collection {
    std::string name;
    fs::path images_dir;
    fs::path metadata_file;
};

}  // namespace boxhunt
