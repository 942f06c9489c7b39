#include <boxhunt/image/perceptual_hash.hpp>

#include <opencv2/imgproc.hpp>

#include <bitset>
#include <cstdio>

namespace boxhunt::image {

PerceptualHash PerceptualHash::compute(const cv::Mat& image) {
    if (image.empty()) {
        return PerceptualHash();
    }

    cv::Mat small;
    cv::resize(image, small, cv::Size(GRID, GRID), 0, 0, cv::INTER_AREA);
    if (small.channels() > 1) {
        cv::cvtColor(small, small, cv::COLOR_BGR2GRAY);
    }
    const double mean = cv::mean(small)[0];

    uint64_t bits = 0;
    for (int row = 0; row < GRID; ++row) {
        for (int col = 0; col < GRID; ++col) {
            bits <<= 1;
            if (small.at<uint8_t>(row, col) > mean) bits |= 1;
        }
    }
    return PerceptualHash(bits);
}

std::optional<PerceptualHash> PerceptualHash::from_hex(std::string_view hex) {
    if (hex.size() != 16) {
        return std::nullopt;
    }
    uint64_t bits = 0;
    for (char c : hex) {
        int digit;
        if (c >= '0' && c <= '9') digit = c - '0';
        else if (c >= 'a' && c <= 'f') digit = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') digit = c - 'A' + 10;
        else return std::nullopt;
        bits = (bits << 4) | static_cast<uint64_t>(digit);
    }
    return PerceptualHash(bits);
}

std::string PerceptualHash::to_hex() const {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(bits_));
    return buf;
}

int PerceptualHash::distance(const PerceptualHash& other) const {
    return static_cast<int>(std::bitset<64>(bits_ ^ other.bits_).count());
}

}  // namespace boxhunt::image
