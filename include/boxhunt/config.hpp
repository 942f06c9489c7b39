#pragma once

#include <boxhunt/result.hpp>
#include <boxhunt/types.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace boxhunt {

constexpr const char* DEFAULT_USER_AGENT = "BoxHunt/1.0 (Image Scraper for Research Purposes)";

/**
 * Run-wide settings. Defaults reproduce the stock collector; load_config()
 * overlays a JSON file and apply_env_overrides() the environment.
 */
struct HarvestConfig {
    fs::path data_dir = "data";
    std::string user_agent = DEFAULT_USER_AGENT;

    // Keyword API providers
    std::string pexels_api_key;
    std::string pexels_search_url = "https://api.pexels.com/v1/search";
    std::string unsplash_access_key;
    std::string unsplash_search_url = "https://api.unsplash.com/search/photos";
    std::vector<std::string> enabled_sources = {"pexels", "unsplash"};
    int api_timeout_ms = 30000;

    std::vector<std::string> keywords_en = {
        "cardboard box", "corrugated box", "carton", "shipping box",
        "moving box", "packaging box", "brown cardboard box", "empty cardboard box"};
    std::vector<std::string> keywords_cn = {
        "纸箱", "瓦楞纸箱", "搬家箱", "快递箱", "包装箱", "纸盒", "牛皮纸箱"};

    // Image validation
    int min_width = 256;
    int min_height = 256;
    std::vector<std::string> allowed_formats = {"jpg", "jpeg", "png", "webp"};
    uint64_t max_file_size = 10ull * 1024 * 1024;
    int jpeg_quality = 95;
    int dedup_threshold = 5;

    // Request pacing
    int request_delay_ms = 1000;
    int max_concurrent_requests = 3;
    int image_timeout_ms = 30000;
    int save_batch_size = 20;         // Candidates processed between metadata saves

    // Website crawling
    int max_depth = 2;
    int max_images_per_website = 100;
    bool respect_robots = true;
    int page_timeout_ms = 30000;
    int robots_timeout_ms = 5000;

    Collection default_collection() const;

    // data/<domain>/images and data/<domain>/metadata.csv
    Collection domain_collection(const std::string& domain) const;

    std::vector<std::string> all_keywords() const;

    Result<void> validate() const;
};

/**
 * Loads settings from a JSON file. A missing file yields the defaults;
 * unknown keys are ignored; a key with the wrong type is INVALID_ARGUMENT.
 */
Result<HarvestConfig> load_config(const fs::path& path);

/**
 * PEXELS_API_KEY, UNSPLASH_ACCESS_KEY and BOXHUNT_DATA_DIR take precedence
 * over file values when set and non-empty.
 */
void apply_env_overrides(HarvestConfig& config);

// Pretty-printed JSON of the effective settings with keys masked
std::string describe_config(const HarvestConfig& config);

}  // namespace boxhunt
