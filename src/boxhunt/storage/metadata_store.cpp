#include <boxhunt/storage/metadata_store.hpp>
#include <boxhunt/storage/csv.hpp>
#include <boxhunt/util/strings.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <sstream>

namespace boxhunt {

using json = nlohmann::json;

namespace {

enum Column {
    COL_ID = 0,
    COL_FILENAME,
    COL_URL,
    COL_SOURCE,
    COL_TITLE,
    COL_WIDTH,
    COL_HEIGHT,
    COL_FILE_SIZE,
    COL_PERCEPTUAL_HASH,
    COL_DOWNLOAD_TIME,
    COL_CREATED_AT,
    COL_STATUS,
    COL_COUNT
};

uint64_t to_u64(const std::string& s) {
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    return end == s.c_str() ? 0 : static_cast<uint64_t>(v);
}

int to_int(const std::string& s) {
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    return end == s.c_str() ? 0 : static_cast<int>(v);
}

double to_double(const std::string& s) {
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    return end == s.c_str() ? 0.0 : v;
}

std::string format_double(double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.6f", v);
    return buf;
}

// 2025-01-31T14:02:11.123456, local time
std::string iso_timestamp_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%06lld", date, static_cast<long long>(micros));
    return out;
}

std::string file_stamp_now() {
    std::time_t t = std::time(nullptr);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm_buf);
    return buf;
}

CsvRow to_row(const MetadataRecord& r) {
    return {
        std::to_string(r.id),
        r.filename,
        r.url,
        r.source,
        r.title,
        std::to_string(r.width),
        std::to_string(r.height),
        std::to_string(r.file_size),
        r.perceptual_hash,
        format_double(r.download_time),
        r.created_at,
        r.status,
    };
}

json to_json(const MetadataRecord& r) {
    return json{
        {"id", r.id},
        {"filename", r.filename},
        {"url", r.url},
        {"source", r.source},
        {"title", r.title},
        {"width", r.width},
        {"height", r.height},
        {"file_size", r.file_size},
        {"perceptual_hash", r.perceptual_hash},
        {"download_time", r.download_time},
        {"created_at", r.created_at},
        {"status", r.status},
    };
}

std::string extension_of(const std::string& filename) {
    std::string ext = fs::path(filename).extension().string();
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    return util::to_lower(ext);
}

Result<std::string> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Cannot open " + path.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Error(ErrorCode::IO_ERROR, "Failed reading " + path.string());
    }
    return ss.str();
}

}  // namespace

Result<ExportFormat> parse_export_format(const std::string& name) {
    std::string lower = util::to_lower(name);
    if (lower == "csv") return ExportFormat::CSV;
    if (lower == "json") return ExportFormat::JSON;
    return Error(ErrorCode::INVALID_ARGUMENT, "Unsupported export format: " + name);
}

const std::vector<std::string>& MetadataStore::columns() {
    static const std::vector<std::string> names = {
        "id", "filename", "url", "source", "title", "width", "height",
        "file_size", "perceptual_hash", "download_time", "created_at", "status"};
    return names;
}

Result<std::unique_ptr<MetadataStore>> MetadataStore::open(const fs::path& metadata_file,
                                                           const fs::path& images_dir,
                                                           Logger* logger) {
    if (metadata_file.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Metadata file path is empty");
    }

    std::error_code ec;
    if (fs::exists(metadata_file, ec) && !fs::is_regular_file(metadata_file, ec)) {
        return Error(ErrorCode::INVALID_ARGUMENT,
            metadata_file.string() + " exists and is not a regular file");
    }

    auto store = std::unique_ptr<MetadataStore>(new MetadataStore());
    store->metadata_file_ = metadata_file;
    store->images_dir_ = images_dir;
    store->logger_ = logger ? logger : null_logger();
    return store;
}

// ============================================================================
// Reading
// ============================================================================

Result<std::vector<MetadataRecord>> MetadataStore::load_all_unlocked() const {
    std::vector<MetadataRecord> records;

    std::error_code ec;
    if (!fs::exists(metadata_file_, ec)) {
        return records;
    }

    auto text = read_file(metadata_file_);
    if (!text.ok()) {
        return text.error();
    }
    auto rows = CsvCodec::parse(text.value());
    if (!rows.ok()) {
        return Error(ErrorCode::CORRUPTION,
            metadata_file_.string() + ": " + rows.error().message());
    }
    if (rows->empty()) {
        return records;
    }

    // Map known columns to their position in this file's header
    const auto& header = rows->front();
    int position[COL_COUNT];
    std::fill(std::begin(position), std::end(position), -1);
    for (size_t i = 0; i < header.size(); ++i) {
        const auto& names = columns();
        auto it = std::find(names.begin(), names.end(), util::trim(header[i]));
        if (it != names.end()) {
            position[it - names.begin()] = static_cast<int>(i);
        }
    }
    if (position[COL_FILENAME] < 0 || position[COL_PERCEPTUAL_HASH] < 0) {
        return Error(ErrorCode::CORRUPTION,
            metadata_file_.string() + ": header lacks filename/perceptual_hash columns");
    }

    records.reserve(rows->size() - 1);
    for (size_t r = 1; r < rows->size(); ++r) {
        const CsvRow& row = (*rows)[r];
        auto field = [&](Column col) -> std::string {
            int p = position[col];
            if (p < 0 || static_cast<size_t>(p) >= row.size()) return "";
            return row[static_cast<size_t>(p)];
        };

        MetadataRecord rec;
        rec.id = to_u64(field(COL_ID));
        rec.filename = field(COL_FILENAME);
        rec.url = field(COL_URL);
        rec.source = field(COL_SOURCE);
        rec.title = field(COL_TITLE);
        rec.width = to_int(field(COL_WIDTH));
        rec.height = to_int(field(COL_HEIGHT));
        rec.file_size = to_u64(field(COL_FILE_SIZE));
        rec.perceptual_hash = field(COL_PERCEPTUAL_HASH);
        rec.download_time = to_double(field(COL_DOWNLOAD_TIME));
        rec.created_at = field(COL_CREATED_AT);
        rec.status = field(COL_STATUS);
        records.push_back(std::move(rec));
    }
    return records;
}

Result<std::vector<MetadataRecord>> MetadataStore::load_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_all_unlocked();
}

Result<std::unordered_set<std::string>> MetadataStore::load_existing_hashes() const {
    auto records = load_all();
    if (!records.ok()) {
        return records.error();
    }
    std::unordered_set<std::string> hashes;
    for (const auto& r : records.value()) {
        if (!r.perceptual_hash.empty()) hashes.insert(r.perceptual_hash);
    }
    logger_->info("Loaded " + std::to_string(hashes.size()) + " existing image hashes");
    return hashes;
}

Result<std::unordered_set<std::string>> MetadataStore::load_existing_urls() const {
    auto records = load_all();
    if (!records.ok()) {
        return records.error();
    }
    std::unordered_set<std::string> urls;
    for (const auto& r : records.value()) {
        if (!r.url.empty()) urls.insert(r.url);
    }
    return urls;
}

// ============================================================================
// Writing
// ============================================================================

Result<std::vector<MetadataRecord>> MetadataStore::save(std::vector<MetadataRecord> records) {
    if (records.empty()) {
        return records;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = load_all_unlocked();
    if (!existing.ok()) {
        return existing.error();
    }
    RecordId max_id = 0;
    for (const auto& r : existing.value()) {
        max_id = std::max(max_id, r.id);
    }

    std::error_code ec;
    if (metadata_file_.has_parent_path()) {
        fs::create_directories(metadata_file_.parent_path(), ec);
        if (ec) {
            return Error(ErrorCode::IO_ERROR,
                "Failed to create directory for " + metadata_file_.string() + ": " + ec.message());
        }
    }

    // Repair a trailing partial line left by an interrupted writer
    std::string payload;
    uintmax_t current_size = fs::exists(metadata_file_, ec) ? fs::file_size(metadata_file_, ec) : 0;
    if (ec) current_size = 0;
    if (current_size == 0) {
        payload += CsvCodec::format_row(columns());
    } else {
        std::ifstream tail(metadata_file_, std::ios::binary);
        tail.seekg(-1, std::ios::end);
        char last = '\n';
        if (tail.get(last) && last != '\n') {
            payload += '\n';
        }
    }

    const std::string created_at = iso_timestamp_now();
    RecordId next_id = max_id + 1;
    for (auto& r : records) {
        r.id = next_id++;
        r.created_at = created_at;
        r.status = RECORD_STATUS_DOWNLOADED;
        payload += CsvCodec::format_row(to_row(r));
    }

    std::ofstream out(metadata_file_, std::ios::binary | std::ios::app);
    if (!out) {
        return Error(ErrorCode::IO_ERROR, "Cannot open " + metadata_file_.string() + " for append");
    }
    out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    out.flush();
    if (!out.good()) {
        return Error(ErrorCode::IO_ERROR, "Failed to append to " + metadata_file_.string());
    }

    logger_->info("Saved " + std::to_string(records.size()) + " records to " +
                  metadata_file_.string());
    return records;
}

// ============================================================================
// Reporting and maintenance
// ============================================================================

Result<StoreStatistics> MetadataStore::statistics() const {
    auto records = load_all();
    if (!records.ok()) {
        return records.error();
    }

    StoreStatistics stats;
    uint64_t width_sum = 0;
    uint64_t height_sum = 0;
    for (const auto& r : records.value()) {
        ++stats.total_images;
        stats.total_size += r.file_size;
        stats.sources[r.source] += 1;
        stats.file_formats[extension_of(r.filename)] += 1;
        width_sum += static_cast<uint64_t>(std::max(0, r.width));
        height_sum += static_cast<uint64_t>(std::max(0, r.height));
    }
    if (stats.total_images > 0) {
        stats.avg_width = static_cast<int>(width_sum / stats.total_images);
        stats.avg_height = static_cast<int>(height_sum / stats.total_images);
    }
    return stats;
}

Result<size_t> MetadataStore::cleanup_orphans(const std::vector<std::string>& allowed_extensions) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (!fs::exists(metadata_file_, ec)) {
        logger_->info("No metadata file; nothing to clean up");
        return size_t{0};
    }
    if (!fs::is_directory(images_dir_, ec)) {
        return size_t{0};
    }

    auto records = load_all_unlocked();
    if (!records.ok()) {
        return records.error();
    }
    std::unordered_set<std::string> referenced;
    for (const auto& r : records.value()) {
        referenced.insert(r.filename);
    }

    std::unordered_set<std::string> allowed;
    for (const auto& ext : allowed_extensions) {
        std::string e = util::to_lower(ext);
        if (!e.empty() && e[0] == '.') e.erase(0, 1);
        allowed.insert(e);
    }

    std::vector<fs::path> orphans;
    for (fs::directory_iterator it(images_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        std::string name = it->path().filename().string();
        if (allowed.count(extension_of(name)) == 0) continue;
        if (referenced.count(name) > 0) continue;
        orphans.push_back(it->path());
    }
    if (ec) {
        return Error(ErrorCode::IO_ERROR,
            "Failed to list " + images_dir_.string() + ": " + ec.message());
    }

    size_t removed = 0;
    for (const auto& path : orphans) {
        std::error_code rm_ec;
        if (fs::remove(path, rm_ec)) {
            ++removed;
            logger_->info("Removed orphaned file: " + path.filename().string());
        } else if (rm_ec) {
            logger_->warning("Failed to remove " + path.string() + ": " + rm_ec.message());
        }
    }
    return removed;
}

Result<fs::path> MetadataStore::export_to(ExportFormat format, const fs::path& output) const {
    std::error_code same_ec;
    if (!output.empty() && fs::equivalent(output, metadata_file_, same_ec)) {
        return Error(ErrorCode::INVALID_ARGUMENT,
            "Export target " + output.string() + " is the metadata file itself");
    }

    auto records = load_all();
    if (!records.ok()) {
        return records.error();
    }

    const char* ext = format == ExportFormat::JSON ? "json" : "csv";
    fs::path target = output;
    if (target.empty()) {
        fs::path dir = metadata_file_.has_parent_path() ? metadata_file_.parent_path() : fs::path(".");
        target = dir / ("metadata_export_" + file_stamp_now() + "." + ext);
    }

    std::string payload;
    if (format == ExportFormat::JSON) {
        json array = json::array();
        for (const auto& r : records.value()) {
            array.push_back(to_json(r));
        }
        payload = array.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
    } else {
        payload = CsvCodec::format_row(columns());
        for (const auto& r : records.value()) {
            payload += CsvCodec::format_row(to_row(r));
        }
    }

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error(ErrorCode::IO_ERROR, "Cannot create " + target.string());
    }
    out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    if (!out.good()) {
        return Error(ErrorCode::IO_ERROR, "Failed to write " + target.string());
    }

    logger_->info("Exported " + std::to_string(records->size()) + " records to " + target.string());
    return target;
}

}  // namespace boxhunt
