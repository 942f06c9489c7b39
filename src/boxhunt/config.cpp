#include <boxhunt/config.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>

namespace boxhunt {

using json = nlohmann::json;

namespace {

template<typename T>
void read_key(const json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

std::string mask_key(const std::string& key) {
    if (key.empty()) return "(not set)";
    if (key.size() <= 4) return "****";
    return key.substr(0, 4) + std::string(key.size() - 4, '*');
}

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return (value && value[0] != '\0') ? std::string(value) : std::string();
}

}  // namespace

Collection HarvestConfig::default_collection() const {
    Collection c;
    c.name = "default";
    c.images_dir = data_dir / "images";
    c.metadata_file = data_dir / "metadata.csv";
    return c;
}

Collection HarvestConfig::domain_collection(const std::string& domain) const {
    Collection c;
    c.name = domain;
    c.images_dir = data_dir / domain / "images";
    c.metadata_file = data_dir / domain / "metadata.csv";
    return c;
}

std::vector<std::string> HarvestConfig::all_keywords() const {
    std::vector<std::string> all = keywords_en;
    all.insert(all.end(), keywords_cn.begin(), keywords_cn.end());
    return all;
}

Result<void> HarvestConfig::validate() const {
    if (min_width <= 0 || min_height <= 0) {
        return Err(ErrorCode::INVALID_ARGUMENT, "min_width/min_height must be positive");
    }
    if (max_concurrent_requests <= 0) {
        return Err(ErrorCode::INVALID_ARGUMENT, "max_concurrent_requests must be positive");
    }
    if (max_file_size == 0) {
        return Err(ErrorCode::INVALID_ARGUMENT, "max_file_size must be positive");
    }
    if (dedup_threshold < 0 || dedup_threshold > 64) {
        return Err(ErrorCode::INVALID_ARGUMENT, "dedup_threshold must be within 0..64");
    }
    if (jpeg_quality < 1 || jpeg_quality > 100) {
        return Err(ErrorCode::INVALID_ARGUMENT, "jpeg_quality must be within 1..100");
    }
    if (save_batch_size <= 0) {
        return Err(ErrorCode::INVALID_ARGUMENT, "save_batch_size must be positive");
    }
    if (max_depth < 0) {
        return Err(ErrorCode::INVALID_ARGUMENT, "max_depth must not be negative");
    }
    if (request_delay_ms < 0) {
        return Err(ErrorCode::INVALID_ARGUMENT, "request_delay_ms must not be negative");
    }
    return Ok();
}

Result<HarvestConfig> load_config(const fs::path& path) {
    HarvestConfig config;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return config;
    }

    std::ifstream file(path);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Cannot open config file: " + path.string());
    }

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            return Error(ErrorCode::INVALID_ARGUMENT, "Config root must be an object");
        }

        std::string data_dir;
        read_key(j, "data_dir", data_dir);
        if (!data_dir.empty()) config.data_dir = data_dir;

        read_key(j, "user_agent", config.user_agent);
        read_key(j, "pexels_api_key", config.pexels_api_key);
        read_key(j, "pexels_search_url", config.pexels_search_url);
        read_key(j, "unsplash_access_key", config.unsplash_access_key);
        read_key(j, "unsplash_search_url", config.unsplash_search_url);
        read_key(j, "enabled_sources", config.enabled_sources);
        read_key(j, "api_timeout_ms", config.api_timeout_ms);
        read_key(j, "keywords_en", config.keywords_en);
        read_key(j, "keywords_cn", config.keywords_cn);
        read_key(j, "min_width", config.min_width);
        read_key(j, "min_height", config.min_height);
        read_key(j, "allowed_formats", config.allowed_formats);
        read_key(j, "max_file_size", config.max_file_size);
        read_key(j, "jpeg_quality", config.jpeg_quality);
        read_key(j, "dedup_threshold", config.dedup_threshold);
        read_key(j, "request_delay_ms", config.request_delay_ms);
        read_key(j, "max_concurrent_requests", config.max_concurrent_requests);
        read_key(j, "image_timeout_ms", config.image_timeout_ms);
        read_key(j, "save_batch_size", config.save_batch_size);
        read_key(j, "max_depth", config.max_depth);
        read_key(j, "max_images_per_website", config.max_images_per_website);
        read_key(j, "respect_robots", config.respect_robots);
        read_key(j, "page_timeout_ms", config.page_timeout_ms);
        read_key(j, "robots_timeout_ms", config.robots_timeout_ms);
    } catch (const json::exception& e) {
        return Error(ErrorCode::INVALID_ARGUMENT,
            "Invalid config file " + path.string() + ": " + e.what());
    }

    auto valid = config.validate();
    if (!valid.ok()) {
        return valid.error();
    }
    return config;
}

void apply_env_overrides(HarvestConfig& config) {
    std::string pexels = env_or_empty("PEXELS_API_KEY");
    if (!pexels.empty()) config.pexels_api_key = pexels;

    std::string unsplash = env_or_empty("UNSPLASH_ACCESS_KEY");
    if (!unsplash.empty()) config.unsplash_access_key = unsplash;

    std::string data_dir = env_or_empty("BOXHUNT_DATA_DIR");
    if (!data_dir.empty()) config.data_dir = data_dir;
}

std::string describe_config(const HarvestConfig& config) {
    json j;
    j["data_dir"] = config.data_dir.string();
    j["user_agent"] = config.user_agent;
    j["pexels_api_key"] = mask_key(config.pexels_api_key);
    j["unsplash_access_key"] = mask_key(config.unsplash_access_key);
    j["enabled_sources"] = config.enabled_sources;
    j["keywords_en"] = config.keywords_en;
    j["keywords_cn"] = config.keywords_cn;
    j["min_width"] = config.min_width;
    j["min_height"] = config.min_height;
    j["allowed_formats"] = config.allowed_formats;
    j["max_file_size"] = config.max_file_size;
    j["jpeg_quality"] = config.jpeg_quality;
    j["dedup_threshold"] = config.dedup_threshold;
    j["request_delay_ms"] = config.request_delay_ms;
    j["max_concurrent_requests"] = config.max_concurrent_requests;
    j["save_batch_size"] = config.save_batch_size;
    j["max_depth"] = config.max_depth;
    j["max_images_per_website"] = config.max_images_per_website;
    j["respect_robots"] = config.respect_robots;
    return j.dump(2);
}

}  // namespace boxhunt
