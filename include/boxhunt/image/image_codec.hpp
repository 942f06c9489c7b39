#pragma once

#include <boxhunt/result.hpp>

#include <opencv2/core.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace boxhunt::image {

enum class ImageFormat {
    UNKNOWN,
    JPEG,
    PNG,
    GIF,
    WEBP,
    BMP
};

const char* image_format_name(ImageFormat format);

// Identifies the container from magic bytes
ImageFormat detect_format(const std::vector<uint8_t>& bytes);

/**
 * Decodes any container OpenCV's imgcodecs reads (JPEG, PNG, WebP, BMP,
 * and GIF where the OpenCV build has it) to an 8-bit, 3-channel BGR
 * matrix. Gray images are expanded and alpha is dropped.
 *
 * @return UNSUPPORTED_FORMAT when the bytes carry no known image
 *         signature, DECODE_ERROR when OpenCV cannot read them
 */
Result<cv::Mat> decode_image(const std::vector<uint8_t>& bytes);

/**
 * @param quality 1..100
 */
Result<std::vector<uint8_t>> encode_jpeg(const cv::Mat& image, int quality);

Result<std::vector<uint8_t>> encode_png(const cv::Mat& image);

}  // namespace boxhunt::image
