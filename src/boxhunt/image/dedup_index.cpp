#include <boxhunt/image/dedup_index.hpp>

#include <algorithm>

namespace boxhunt::image {

size_t DedupIndex::load(const std::vector<std::string>& hex_hashes) {
    std::vector<PerceptualHash> loaded;
    loaded.reserve(hex_hashes.size());
    for (const auto& hex : hex_hashes) {
        if (auto hash = PerceptualHash::from_hex(hex)) {
            loaded.push_back(*hash);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    hashes_ = std::move(loaded);
    return hashes_.size();
}

bool DedupIndex::contains_near_unlocked(const PerceptualHash& hash) const {
    return std::any_of(hashes_.begin(), hashes_.end(), [&](const PerceptualHash& existing) {
        return existing.distance(hash) <= threshold_;
    });
}

bool DedupIndex::contains_near(const PerceptualHash& hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contains_near_unlocked(hash);
}

bool DedupIndex::try_insert(const PerceptualHash& hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (contains_near_unlocked(hash)) {
        return false;
    }
    hashes_.push_back(hash);
    return true;
}

bool DedupIndex::erase(const PerceptualHash& hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(hashes_.begin(), hashes_.end(), hash);
    if (it == hashes_.end()) {
        return false;
    }
    hashes_.erase(it);
    return true;
}

size_t DedupIndex::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hashes_.size();
}

void DedupIndex::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    hashes_.clear();
}

}  // namespace boxhunt::image
