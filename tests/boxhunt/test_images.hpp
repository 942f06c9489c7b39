#pragma once

#include <boxhunt/image/image_codec.hpp>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace boxhunt::testing {

// Block patterns whose perceptual hashes are pairwise at least 16 bits apart
constexpr uint64_t PATTERN_TOP_DARK = 0x00000000FFFFFFFFull;
constexpr uint64_t PATTERN_BOTTOM_DARK = 0xFFFFFFFF00000000ull;
constexpr uint64_t PATTERN_LEFT_COLUMNS = 0x0F0F0F0F0F0F0F0Full;
constexpr uint64_t PATTERN_RIGHT_COLUMNS = 0xF0F0F0F0F0F0F0F0ull;
constexpr uint64_t PATTERN_STRIPES_2 = 0x3333333333333333ull;
constexpr uint64_t PATTERN_STRIPES_2B = 0xCCCCCCCCCCCCCCCCull;
constexpr uint64_t PATTERN_STRIPES_1 = 0x5555555555555555ull;
constexpr uint64_t PATTERN_STRIPES_1B = 0xAAAAAAAAAAAAAAAAull;

/**
 * Image split into an 8x8 grid of black or white blocks. Bit 63 of the
 * pattern is the top-left block, bit 0 the bottom-right; a set bit is
 * white. Its perceptual hash equals the pattern for any size that is a
 * multiple of 8 (patterns must mix both colors).
 */
inline cv::Mat make_block_image(uint64_t pattern, int width = 256, int height = 256) {
    cv::Mat img(height, width, CV_8UC3);
    for (int y = 0; y < height; ++y) {
        int row = y * 8 / height;
        for (int x = 0; x < width; ++x) {
            int col = x * 8 / width;
            bool white = (pattern >> (63 - (row * 8 + col))) & 1u;
            uint8_t v = white ? 255 : 0;
            img.at<cv::Vec3b>(y, x) = cv::Vec3b(v, v, v);
        }
    }
    return img;
}

inline std::vector<uint8_t> make_block_png(uint64_t pattern, int width = 256, int height = 256) {
    auto encoded = image::encode_png(make_block_image(pattern, width, height));
    if (!encoded.ok()) {
        throw std::runtime_error(encoded.error().to_string());
    }
    return encoded.value();
}

// Any container OpenCV can write, chosen by extension (".webp", ".bmp")
inline std::vector<uint8_t> make_block_encoded(uint64_t pattern, const std::string& ext,
                                               int width = 256, int height = 256) {
    std::vector<uchar> out;
    if (!cv::imencode(ext, make_block_image(pattern, width, height), out)) {
        throw std::runtime_error("cannot encode " + ext);
    }
    return std::vector<uint8_t>(out.begin(), out.end());
}

}  // namespace boxhunt::testing
