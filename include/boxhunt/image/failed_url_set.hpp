#pragma once

#include <mutex>
#include <string>
#include <unordered_set>

namespace boxhunt::image {

/**
 * URLs that failed to download during this run. Entries stay until
 * clear() is called explicitly.
 */
class FailedUrlSet {
public:
    bool contains(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return urls_.count(url) > 0;
    }

    void add(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        urls_.insert(url);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return urls_.size();
    }

    // Returns how many entries were dropped
    size_t clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = urls_.size();
        urls_.clear();
        return n;
    }

private:
    std::unordered_set<std::string> urls_;
    mutable std::mutex mutex_;
};

}  // namespace boxhunt::image
