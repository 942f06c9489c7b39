#include <boxhunt/image/image_codec.hpp>

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cstring>

namespace boxhunt::image {

namespace {

bool has_prefix(const std::vector<uint8_t>& data, const uint8_t* sig, size_t len) {
    return data.size() >= len && std::memcmp(data.data(), sig, len) == 0;
}

Result<std::vector<uint8_t>> encode(const cv::Mat& image, const char* ext,
                                    const std::vector<int>& params) {
    if (image.empty() || image.type() != CV_8UC3) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Expected a non-empty 8-bit BGR image");
    }
    std::vector<uchar> out;
    try {
        if (!cv::imencode(ext, image, out, params)) {
            return Error(ErrorCode::INTERNAL_ERROR, std::string("Encoding ") + ext + " failed");
        }
    } catch (const cv::Exception& e) {
        return Error(ErrorCode::INTERNAL_ERROR, std::string("Encoding ") + ext + " failed: " + e.what());
    }
    return std::vector<uint8_t>(out.begin(), out.end());
}

}  // namespace

const char* image_format_name(ImageFormat format) {
    switch (format) {
        case ImageFormat::JPEG: return "jpeg";
        case ImageFormat::PNG:  return "png";
        case ImageFormat::GIF:  return "gif";
        case ImageFormat::WEBP: return "webp";
        case ImageFormat::BMP:  return "bmp";
        case ImageFormat::UNKNOWN: break;
    }
    return "unknown";
}

ImageFormat detect_format(const std::vector<uint8_t>& bytes) {
    static constexpr uint8_t kPngSig[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    static constexpr uint8_t kJpegSig[3] = {0xFF, 0xD8, 0xFF};
    static constexpr uint8_t kGifSig[4] = {'G', 'I', 'F', '8'};
    static constexpr uint8_t kBmpSig[2] = {'B', 'M'};

    if (has_prefix(bytes, kPngSig, sizeof(kPngSig))) return ImageFormat::PNG;
    if (has_prefix(bytes, kJpegSig, sizeof(kJpegSig))) return ImageFormat::JPEG;
    if (has_prefix(bytes, kGifSig, sizeof(kGifSig))) return ImageFormat::GIF;
    if (bytes.size() >= 12 && std::memcmp(bytes.data(), "RIFF", 4) == 0 &&
        std::memcmp(bytes.data() + 8, "WEBP", 4) == 0) {
        return ImageFormat::WEBP;
    }
    if (has_prefix(bytes, kBmpSig, sizeof(kBmpSig))) return ImageFormat::BMP;
    return ImageFormat::UNKNOWN;
}

Result<cv::Mat> decode_image(const std::vector<uint8_t>& bytes) {
    ImageFormat format = detect_format(bytes);
    if (format == ImageFormat::UNKNOWN) {
        return Error(ErrorCode::UNSUPPORTED_FORMAT, "No image signature in data");
    }

    cv::Mat img;
    try {
        img = cv::imdecode(bytes, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        return Error(ErrorCode::DECODE_ERROR,
            std::string("Corrupt ") + image_format_name(format) + " data: " + e.what());
    }
    if (img.empty()) {
        return Error(ErrorCode::DECODE_ERROR,
            std::string("Cannot decode ") + image_format_name(format) + " data");
    }
    return img;
}

Result<std::vector<uint8_t>> encode_jpeg(const cv::Mat& image, int quality) {
    return encode(image, ".jpg", {cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 1, 100)});
}

Result<std::vector<uint8_t>> encode_png(const cv::Mat& image) {
    return encode(image, ".png", {});
}

}  // namespace boxhunt::image
