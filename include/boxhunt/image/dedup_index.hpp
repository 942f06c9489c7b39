#pragma once

#include <boxhunt/image/perceptual_hash.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace boxhunt::image {

/**
 * In-memory set of accepted perceptual hashes.
 *
 * A hash within `threshold` bits of any member is a near-duplicate.
 * try_insert() performs the check and the insert under one lock, so two
 * near-identical images processed concurrently cannot both be accepted.
 *
 * Lookups scan every member; fine for a collection of a few thousand
 * images.
 */
class DedupIndex {
public:
    explicit DedupIndex(int threshold = 5) : threshold_(threshold) {}

    DedupIndex(const DedupIndex&) = delete;
    DedupIndex& operator=(const DedupIndex&) = delete;

    /**
     * Replace the contents with hashes loaded from a store.
     * @return Number of valid hashes loaded (malformed entries are skipped)
     */
    size_t load(const std::vector<std::string>& hex_hashes);

    // True if a member lies within the threshold
    bool contains_near(const PerceptualHash& hash) const;

    /**
     * Insert unless a near-duplicate is already present.
     * @return true if inserted
     */
    bool try_insert(const PerceptualHash& hash);

    // Remove one exact occurrence (undo of a try_insert)
    bool erase(const PerceptualHash& hash);

    size_t size() const;
    void clear();

    int threshold() const { return threshold_; }

private:
    bool contains_near_unlocked(const PerceptualHash& hash) const;

    int threshold_;
    std::vector<PerceptualHash> hashes_;
    mutable std::mutex mutex_;
};

}  // namespace boxhunt::image
