#include <boxhunt/image/image_processor.hpp>
#include <boxhunt/image/image_codec.hpp>
#include <boxhunt/image/perceptual_hash.hpp>
#include <boxhunt/util/crc32.hpp>

#include <algorithm>
#include <chrono>
#include <cctype>
#include <fstream>
#include <thread>

namespace boxhunt::image {

namespace {

// Keeps [a-z0-9_-]; anything else becomes '_'
std::string sanitize_source(const std::string& source) {
    std::string out;
    for (char c : source) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            out += static_cast<char>(std::tolower(uc));
        } else if (c == '-' || c == '_') {
            out += c;
        } else {
            out += '_';
        }
    }
    return out.empty() ? std::string("image") : out;
}

const char* extension_for(OutputFormat format) {
    return format == OutputFormat::PNG ? ".png" : ".jpg";
}

double epoch_seconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

// Tracks one in-flight download for the peak counter
class InFlightCounter {
public:
    InFlightCounter(std::atomic<int>& current, std::atomic<int>& peak) : current_(current) {
        int now = ++current_;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
    }
    ~InFlightCounter() { --current_; }

private:
    std::atomic<int>& current_;
};

}  // namespace

ProcessorConfig ProcessorConfig::from(const HarvestConfig& config) {
    ProcessorConfig c;
    c.min_width = config.min_width;
    c.min_height = config.min_height;
    c.max_file_size = config.max_file_size;
    c.max_concurrent_requests = config.max_concurrent_requests;
    c.download_timeout_ms = config.image_timeout_ms;
    c.user_agent = config.user_agent;
    c.jpeg_quality = config.jpeg_quality;
    return c;
}

const char* disposition_name(Disposition d) {
    switch (d) {
        case Disposition::ACCEPTED: return "accepted";
        case Disposition::SKIPPED_FAILED_URL: return "skipped";
        case Disposition::DOWNLOAD_FAILED: return "download-failed";
        case Disposition::UNDECODABLE: return "undecodable";
        case Disposition::TOO_SMALL: return "too-small";
        case Disposition::DUPLICATE: return "duplicate";
        case Disposition::PERSIST_FAILED: return "persist-failed";
        case Disposition::INTERNAL_FAILURE: return "internal-failure";
    }
    return "unknown";
}

ImageProcessor::ImageProcessor(ProcessorConfig config,
                               fs::path images_dir,
                               net::HttpClient* http,
                               DedupIndex* dedup,
                               FailedUrlSet* failed_urls,
                               Logger* logger)
    : config_(std::move(config))
    , images_dir_(std::move(images_dir))
    , http_(http)
    , dedup_(dedup)
    , failed_urls_(failed_urls)
    , logger_(logger ? logger : null_logger())
    , download_slots_(static_cast<size_t>(std::max(1, config_.max_concurrent_requests))) {}

// ============================================================================
// Pipeline stages
// ============================================================================

Result<std::vector<uint8_t>> ImageProcessor::download(const std::string& url) {
    net::HttpRequest request;
    request.url = url;
    request.user_agent = config_.user_agent;
    request.timeout_ms = config_.download_timeout_ms;
    request.max_body_bytes = config_.max_file_size;

    Result<net::HttpResponse> response = Error(ErrorCode::INTERNAL_ERROR);
    {
        SemaphoreGuard slot(download_slots_);
        InFlightCounter counter(in_flight_, peak_in_flight_);
        response = http_->get(request);
    }

    if (!response.ok()) {
        return response.error();
    }
    if (response->status != 200) {
        return net::status_error(response->status, url);
    }

    int64_t declared = response->content_length();
    if (declared > 0 && static_cast<uint64_t>(declared) > config_.max_file_size) {
        return Error(ErrorCode::PAYLOAD_TOO_LARGE,
            "Content-Length " + std::to_string(declared) + " exceeds limit");
    }
    if (response->body.size() > config_.max_file_size) {
        return Error(ErrorCode::PAYLOAD_TOO_LARGE,
            "Body of " + std::to_string(response->body.size()) + " bytes exceeds limit");
    }

    return std::vector<uint8_t>(response->body.begin(), response->body.end());
}

std::string ImageProcessor::reserve_filename(const std::string& source, const std::string& url,
                                             int64_t timestamp) {
    const std::string stem = sanitize_source(source) + "_" + std::to_string(timestamp) + "_" +
                             CRC32::hex(url);
    const std::string ext = extension_for(config_.output_format);

    std::lock_guard<std::mutex> lock(names_mutex_);
    std::string name = stem + ext;
    std::error_code ec;
    for (int suffix = 1; reserved_names_.count(name) > 0 || fs::exists(images_dir_ / name, ec);
         ++suffix) {
        name = stem + "_" + std::to_string(suffix) + ext;
    }
    reserved_names_.insert(name);
    return name;
}

void ImageProcessor::release_filename(const std::string& filename) {
    std::lock_guard<std::mutex> lock(names_mutex_);
    reserved_names_.erase(filename);
}

size_t ImageProcessor::reserved_filename_count() const {
    std::lock_guard<std::mutex> lock(names_mutex_);
    return reserved_names_.size();
}

Result<std::string> ImageProcessor::persist(const Candidate& candidate,
                                            const std::vector<uint8_t>& bytes,
                                            int64_t timestamp) {
    std::error_code ec;
    fs::create_directories(images_dir_, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR,
            "Failed to create images directory " + images_dir_.string() + ": " + ec.message());
    }

    std::string filename = reserve_filename(candidate.source, candidate.url, timestamp);
    fs::path final_path = images_dir_ / filename;
    fs::path temp_path = images_dir_ / (filename + ".part");

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (out) {
            out.write(reinterpret_cast<const char*>(bytes.data()),
                      static_cast<std::streamsize>(bytes.size()));
        }
        if (!out.good()) {
            out.close();
            fs::remove(temp_path, ec);
            release_filename(filename);
            return Error(ErrorCode::IO_ERROR, "Failed to write " + temp_path.string());
        }
    }

    fs::rename(temp_path, final_path, ec);
    // From here on the file on disk blocks the name
    release_filename(filename);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        return Error(ErrorCode::IO_ERROR,
            "Failed to move image into place " + final_path.string() + ": " + ec.message());
    }
    return filename;
}

ProcessOutcome ImageProcessor::process(const Candidate& candidate) {
    ProcessOutcome outcome;

    if (failed_urls_->contains(candidate.url)) {
        outcome.disposition = Disposition::SKIPPED_FAILED_URL;
        return outcome;
    }

    // 1. Download
    auto bytes = download(candidate.url);
    if (!bytes.ok()) {
        failed_urls_->add(candidate.url);
        logger_->warning("[ImageProcessor] Download failed " + candidate.url + ": " +
                         bytes.error().to_string());
        outcome.disposition = Disposition::DOWNLOAD_FAILED;
        outcome.error = bytes.error();
        return outcome;
    }
    const double download_time = epoch_seconds();

    // 2. Validate
    auto decoded = decode_image(bytes.value());
    if (!decoded.ok()) {
        logger_->debug("[ImageProcessor] Cannot decode " + candidate.url + ": " +
                       decoded.error().to_string());
        outcome.disposition = Disposition::UNDECODABLE;
        outcome.error = decoded.error();
        return outcome;
    }
    const cv::Mat& image = decoded.value();
    if (image.cols < config_.min_width || image.rows < config_.min_height) {
        logger_->debug("[ImageProcessor] Image too small: " + std::to_string(image.cols) + "x" +
                       std::to_string(image.rows) + " " + candidate.url);
        outcome.disposition = Disposition::TOO_SMALL;
        return outcome;
    }

    // 3. Fingerprint
    PerceptualHash hash = PerceptualHash::compute(image);

    // 4. Deduplicate (check and claim in one step)
    if (!dedup_->try_insert(hash)) {
        logger_->debug("[ImageProcessor] Duplicate image detected: " + candidate.url);
        outcome.disposition = Disposition::DUPLICATE;
        return outcome;
    }

    // 5. Persist
    auto encoded = config_.output_format == OutputFormat::PNG
        ? encode_png(image)
        : encode_jpeg(image, config_.jpeg_quality);
    if (!encoded.ok()) {
        dedup_->erase(hash);
        outcome.disposition = Disposition::PERSIST_FAILED;
        outcome.error = encoded.error();
        return outcome;
    }

    auto filename = persist(candidate, encoded.value(), static_cast<int64_t>(download_time));
    if (!filename.ok()) {
        dedup_->erase(hash);
        logger_->error("[ImageProcessor] " + filename.error().to_string());
        outcome.disposition = Disposition::PERSIST_FAILED;
        outcome.error = filename.error();
        return outcome;
    }

    MetadataRecord record;
    record.filename = filename.value();
    record.url = candidate.url;
    record.source = candidate.source;
    record.title = candidate.title;
    record.width = image.cols;
    record.height = image.rows;
    record.file_size = encoded->size();
    record.perceptual_hash = hash.to_hex();
    record.download_time = download_time;

    logger_->info("[ImageProcessor] Saved image: " + record.filename);
    outcome.disposition = Disposition::ACCEPTED;
    outcome.record = std::move(record);
    return outcome;
}

// ============================================================================
// Batch processing
// ============================================================================

int ImageProcessor::worker_count(size_t batch_size) const {
    int workers = config_.worker_threads > 0
        ? config_.worker_threads
        : std::max(1, config_.max_concurrent_requests) + 2;
    return static_cast<int>(std::min<size_t>(static_cast<size_t>(workers), batch_size));
}

BatchResult ImageProcessor::process_batch(const std::vector<Candidate>& candidates) {
    BatchResult result;
    result.attempted = candidates.size();
    if (candidates.empty()) {
        return result;
    }

    std::vector<ProcessOutcome> outcomes(candidates.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        while (true) {
            size_t i = next.fetch_add(1);
            if (i >= candidates.size()) break;
            try {
                outcomes[i] = process(candidates[i]);
            } catch (const std::exception& e) {
                logger_->error("[ImageProcessor] Error processing " + candidates[i].url + ": " +
                               e.what());
                outcomes[i].disposition = Disposition::INTERNAL_FAILURE;
                outcomes[i].error = Error(ErrorCode::INTERNAL_ERROR, e.what());
            }
        }
    };

    const int workers = worker_count(candidates.size());
    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(workers));
    for (int t = 0; t < workers; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (auto& outcome : outcomes) {
        switch (outcome.disposition) {
            case Disposition::ACCEPTED:
                result.records.push_back(std::move(*outcome.record));
                break;
            case Disposition::SKIPPED_FAILED_URL:
                ++result.skipped;
                break;
            case Disposition::DOWNLOAD_FAILED:
                ++result.download_failed;
                break;
            case Disposition::UNDECODABLE:
            case Disposition::TOO_SMALL:
                ++result.rejected;
                break;
            case Disposition::DUPLICATE:
                ++result.duplicates;
                break;
            case Disposition::PERSIST_FAILED:
                result.persist_errors.push_back(outcome.error);
                break;
            case Disposition::INTERNAL_FAILURE:
                ++result.internal_failures;
                break;
        }
    }

    logger_->info("[ImageProcessor] Processed " + std::to_string(result.records.size()) + "/" +
                  std::to_string(candidates.size()) + " images successfully");
    return result;
}

}  // namespace boxhunt::image
