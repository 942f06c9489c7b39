#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace boxhunt::image {

/**
 * 64-bit average hash.
 *
 * The image is area-resampled to 8x8 and converted to grayscale; bit i is
 * set when cell i is brighter than the mean of all cells. Cell 0 (top-left)
 * is the most significant bit, so the 16-digit hex form reads cells row by
 * row.
 */
class PerceptualHash {
public:
    static constexpr int GRID = 8;
    static constexpr int BITS = GRID * GRID;

    PerceptualHash() = default;
    explicit PerceptualHash(uint64_t bits) : bits_(bits) {}

    // Expects 8-bit BGR or grayscale; an empty image hashes to zero
    static PerceptualHash compute(const cv::Mat& image);

    // Exactly 16 hex digits (either case); nullopt otherwise
    static std::optional<PerceptualHash> from_hex(std::string_view hex);

    std::string to_hex() const;

    // Hamming distance
    int distance(const PerceptualHash& other) const;

    uint64_t bits() const { return bits_; }

    bool operator==(const PerceptualHash& other) const { return bits_ == other.bits_; }
    bool operator!=(const PerceptualHash& other) const { return bits_ != other.bits_; }

private:
    uint64_t bits_ = 0;
};

}  // namespace boxhunt::image
