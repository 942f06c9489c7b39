#include <gtest/gtest.h>
#include <boxhunt/image/image_codec.hpp>
#include <boxhunt/image/image_processor.hpp>
#include <boxhunt/util/crc32.hpp>
#include "fake_http_client.hpp"
#include "test_images.hpp"

#include <fstream>
#include <regex>

using namespace boxhunt;
using namespace boxhunt::image;
using namespace boxhunt::testing;

namespace {

const uint64_t DISTINCT_PATTERNS[] = {
    PATTERN_TOP_DARK, PATTERN_BOTTOM_DARK, PATTERN_LEFT_COLUMNS, PATTERN_RIGHT_COLUMNS,
    PATTERN_STRIPES_2, PATTERN_STRIPES_2B, PATTERN_STRIPES_1, PATTERN_STRIPES_1B};

Candidate candidate(const std::string& url, const std::string& source = "pexels") {
    Candidate c;
    c.url = url;
    c.thumbnail_url = url;
    c.title = "box";
    c.source = source;
    return c;
}

std::vector<uint8_t> read_bytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

}  // namespace

class ImageProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "boxhunt_processor_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        images_dir_ = test_dir_ / "images";
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    std::unique_ptr<ImageProcessor> make_processor(ProcessorConfig config = {}) {
        return std::make_unique<ImageProcessor>(config, images_dir_, &http_, &dedup_, &failed_);
    }

    fs::path test_dir_;
    fs::path images_dir_;
    FakeHttpClient http_;
    DedupIndex dedup_{5};
    FailedUrlSet failed_;
};

// ============================================================================
// Single candidate pipeline
// ============================================================================

TEST_F(ImageProcessorTest, AcceptsValidImage) {
    const std::string url = "https://img.test/box.png";
    http_.serve_image(url, make_block_png(PATTERN_TOP_DARK, 320, 256));

    auto processor = make_processor();
    ProcessOutcome outcome = processor->process(candidate(url));
    ASSERT_EQ(outcome.disposition, Disposition::ACCEPTED) << outcome.error.to_string();
    ASSERT_TRUE(outcome.record.has_value());

    const MetadataRecord& record = *outcome.record;
    EXPECT_EQ(record.url, url);
    EXPECT_EQ(record.source, "pexels");
    EXPECT_EQ(record.title, "box");
    EXPECT_EQ(record.width, 320);
    EXPECT_EQ(record.height, 256);
    EXPECT_EQ(record.perceptual_hash, "00000000ffffffff");
    EXPECT_GT(record.download_time, 0.0);

    std::regex name_pattern("pexels_[0-9]+_" + CRC32::hex(url) + "\\.jpg");
    EXPECT_TRUE(std::regex_match(record.filename, name_pattern)) << record.filename;

    fs::path saved = images_dir_ / record.filename;
    ASSERT_TRUE(fs::exists(saved));
    EXPECT_EQ(fs::file_size(saved), record.file_size);
    EXPECT_FALSE(fs::exists(images_dir_ / (record.filename + ".part")));

    auto bytes = read_bytes(saved);
    EXPECT_EQ(detect_format(bytes), ImageFormat::JPEG);
    auto decoded = decode_image(bytes);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded->width, 320);

    EXPECT_EQ(dedup_.size(), 1u);
}

TEST_F(ImageProcessorTest, PngOutputFormat) {
    const std::string url = "https://img.test/box.png";
    http_.serve_image(url, make_block_png(PATTERN_TOP_DARK));

    ProcessorConfig config;
    config.output_format = OutputFormat::PNG;
    auto processor = make_processor(config);
    ProcessOutcome outcome = processor->process(candidate(url, "Deprinted Box!"));
    ASSERT_EQ(outcome.disposition, Disposition::ACCEPTED);
    EXPECT_EQ(outcome.record->filename.rfind("deprinted_box__", 0), 0u) << outcome.record->filename;
    EXPECT_EQ(fs::path(outcome.record->filename).extension(), ".png");
}

TEST_F(ImageProcessorTest, AcceptsWebpAndBmpDownloads) {
    http_.serve_image("https://img.test/box.webp",
                      make_block_encoded(PATTERN_RIGHT_COLUMNS, ".webp", 300, 300));
    http_.serve_image("https://img.test/box.bmp",
                      make_block_encoded(PATTERN_BOTTOM_DARK, ".bmp", 300, 300));

    auto processor = make_processor();
    ProcessOutcome webp = processor->process(candidate("https://img.test/box.webp"));
    ASSERT_EQ(webp.disposition, Disposition::ACCEPTED) << webp.error.to_string();
    EXPECT_EQ(webp.record->width, 300);
    EXPECT_EQ(webp.record->perceptual_hash, "f0f0f0f0f0f0f0f0");

    ProcessOutcome bmp = processor->process(candidate("https://img.test/box.bmp"));
    ASSERT_EQ(bmp.disposition, Disposition::ACCEPTED) << bmp.error.to_string();
    EXPECT_EQ(bmp.record->perceptual_hash, "ffffffff00000000");

    // Saved in the configured output format regardless of the source container
    EXPECT_EQ(detect_format(read_bytes(images_dir_ / bmp.record->filename)), ImageFormat::JPEG);
}

TEST_F(ImageProcessorTest, SavedNamesAreReleasedButNeverReused) {
    const std::string url = "https://img.test/rotating.png";
    auto processor = make_processor();

    http_.serve_image(url, make_block_png(PATTERN_TOP_DARK));
    ProcessOutcome first = processor->process(candidate(url));
    ASSERT_EQ(first.disposition, Disposition::ACCEPTED);
    EXPECT_EQ(processor->reserved_filename_count(), 0u);

    // Same URL, new content: the file already on disk keeps its name
    http_.serve_image(url, make_block_png(PATTERN_STRIPES_2));
    ProcessOutcome second = processor->process(candidate(url));
    ASSERT_EQ(second.disposition, Disposition::ACCEPTED);
    EXPECT_NE(second.record->filename, first.record->filename);
    EXPECT_EQ(processor->reserved_filename_count(), 0u);
    EXPECT_TRUE(fs::exists(images_dir_ / first.record->filename));
    EXPECT_TRUE(fs::exists(images_dir_ / second.record->filename));
}

TEST_F(ImageProcessorTest, RejectsSmallImages) {
    const std::string url = "https://img.test/small.png";
    http_.serve_image(url, make_block_png(PATTERN_TOP_DARK, 255, 400));

    auto processor = make_processor();
    ProcessOutcome outcome = processor->process(candidate(url));
    EXPECT_EQ(outcome.disposition, Disposition::TOO_SMALL);
    EXPECT_FALSE(fs::exists(images_dir_));
    EXPECT_EQ(dedup_.size(), 0u);
}

TEST_F(ImageProcessorTest, RejectsUndecodableContent) {
    const std::string url = "https://img.test/not-an-image.jpg";
    http_.serve(url, 200, "<html>nope</html>");

    auto processor = make_processor();
    ProcessOutcome outcome = processor->process(candidate(url));
    EXPECT_EQ(outcome.disposition, Disposition::UNDECODABLE);
    EXPECT_EQ(outcome.error.code(), ErrorCode::UNSUPPORTED_FORMAT);
    EXPECT_FALSE(failed_.contains(url));
}

TEST_F(ImageProcessorTest, FailedDownloadsAreRemembered) {
    const std::string url = "https://img.test/missing.jpg";

    auto processor = make_processor();
    ProcessOutcome first = processor->process(candidate(url));
    EXPECT_EQ(first.disposition, Disposition::DOWNLOAD_FAILED);
    EXPECT_EQ(first.error.code(), ErrorCode::NOT_FOUND);
    EXPECT_TRUE(failed_.contains(url));

    ProcessOutcome second = processor->process(candidate(url));
    EXPECT_EQ(second.disposition, Disposition::SKIPPED_FAILED_URL);
    EXPECT_EQ(http_.request_count(url), 1u);
}

TEST_F(ImageProcessorTest, OversizedDownloadFails) {
    const std::string url = "https://img.test/huge.png";
    http_.serve_image(url, make_block_png(PATTERN_TOP_DARK));

    ProcessorConfig config;
    config.max_file_size = 64;
    auto processor = make_processor(config);
    ProcessOutcome outcome = processor->process(candidate(url));
    EXPECT_EQ(outcome.disposition, Disposition::DOWNLOAD_FAILED);
    EXPECT_EQ(outcome.error.code(), ErrorCode::PAYLOAD_TOO_LARGE);
}

TEST_F(ImageProcessorTest, DeclaredLengthAboveLimitFails) {
    const std::string url = "https://img.test/declared.png";
    net::HttpResponse response;
    response.status = 200;
    response.body = "tiny";
    response.headers["content-length"] = "999999999";
    http_.set_fallback([response](const net::HttpRequest&) -> Result<net::HttpResponse> {
        return response;
    });

    auto processor = make_processor();
    ProcessOutcome outcome = processor->process(candidate(url));
    EXPECT_EQ(outcome.disposition, Disposition::DOWNLOAD_FAILED);
    EXPECT_EQ(outcome.error.code(), ErrorCode::PAYLOAD_TOO_LARGE);
}

TEST_F(ImageProcessorTest, NearDuplicatesAreRejected) {
    http_.serve_image("https://img.test/a.png", make_block_png(PATTERN_LEFT_COLUMNS));
    // One block flipped: hash differs by a single bit
    http_.serve_image("https://img.test/b.png", make_block_png(PATTERN_LEFT_COLUMNS ^ 1ull, 512, 512));

    auto processor = make_processor();
    EXPECT_EQ(processor->process(candidate("https://img.test/a.png")).disposition,
              Disposition::ACCEPTED);
    EXPECT_EQ(processor->process(candidate("https://img.test/b.png")).disposition,
              Disposition::DUPLICATE);
    EXPECT_EQ(dedup_.size(), 1u);
}

TEST_F(ImageProcessorTest, PersistFailureReleasesHash) {
    // A regular file where the images directory should be
    std::ofstream(images_dir_) << "in the way";
    const std::string url = "https://img.test/a.png";
    http_.serve_image(url, make_block_png(PATTERN_TOP_DARK));

    auto processor = make_processor();
    ProcessOutcome outcome = processor->process(candidate(url));
    EXPECT_EQ(outcome.disposition, Disposition::PERSIST_FAILED);
    EXPECT_EQ(outcome.error.code(), ErrorCode::IO_ERROR);
    EXPECT_EQ(dedup_.size(), 0u);
    EXPECT_EQ(processor->reserved_filename_count(), 0u);
}

// ============================================================================
// Batches
// ============================================================================

TEST_F(ImageProcessorTest, BatchAcceptsNoNearDuplicates) {
    std::vector<Candidate> batch;
    for (int copy = 0; copy < 3; ++copy) {
        for (int i = 0; i < 4; ++i) {
            std::string url = "https://img.test/" + std::to_string(copy) + "/" + std::to_string(i) + ".png";
            http_.serve_image(url, make_block_png(DISTINCT_PATTERNS[i]));
            batch.push_back(candidate(url));
        }
    }
    http_.set_latency(std::chrono::milliseconds(10));

    ProcessorConfig config;
    config.max_concurrent_requests = 4;
    auto processor = make_processor(config);
    BatchResult result = processor->process_batch(batch);

    ASSERT_EQ(result.records.size(), 4u);
    EXPECT_EQ(result.duplicates, 8u);
    EXPECT_EQ(result.attempted, 12u);
    EXPECT_EQ(processor->reserved_filename_count(), 0u);

    for (size_t i = 0; i < result.records.size(); ++i) {
        auto a = PerceptualHash::from_hex(result.records[i].perceptual_hash).value();
        for (size_t j = i + 1; j < result.records.size(); ++j) {
            auto b = PerceptualHash::from_hex(result.records[j].perceptual_hash).value();
            EXPECT_GT(a.distance(b), dedup_.threshold());
        }
    }
}

TEST_F(ImageProcessorTest, DownloadConcurrencyNeverExceedsLimit) {
    http_.set_latency(std::chrono::milliseconds(20));
    for (size_t batch_size : {1u, 5u, 24u}) {
        std::vector<Candidate> batch;
        for (size_t i = 0; i < batch_size; ++i) {
            // Mostly 404s: download is the stage under test
            batch.push_back(candidate("https://img.test/n" + std::to_string(batch_size) + "_" +
                                      std::to_string(i) + ".jpg"));
        }

        ProcessorConfig config;
        config.max_concurrent_requests = 3;
        auto processor = make_processor(config);
        BatchResult result = processor->process_batch(batch);

        EXPECT_EQ(result.download_failed, batch_size);
        EXPECT_LE(processor->peak_in_flight_downloads(), 3);
        EXPECT_GE(processor->peak_in_flight_downloads(), 1);
    }
    EXPECT_LE(http_.peak_in_flight(), 3);
}

TEST_F(ImageProcessorTest, BatchCountersAndOrder) {
    http_.serve_image("https://img.test/1.png", make_block_png(PATTERN_TOP_DARK));
    http_.serve_image("https://img.test/2.png", make_block_png(PATTERN_STRIPES_1, 100, 100));
    http_.serve("https://img.test/3.png", 200, "garbage", "image/png");
    http_.serve_image("https://img.test/4.png", make_block_png(PATTERN_BOTTOM_DARK));
    failed_.add("https://img.test/5.png");

    auto processor = make_processor();
    BatchResult result = processor->process_batch({
        candidate("https://img.test/1.png"),
        candidate("https://img.test/2.png"),
        candidate("https://img.test/3.png"),
        candidate("https://img.test/4.png"),
        candidate("https://img.test/5.png"),
        candidate("https://img.test/6.png"),
    });

    ASSERT_EQ(result.records.size(), 2u);
    EXPECT_EQ(result.records[0].url, "https://img.test/1.png");
    EXPECT_EQ(result.records[1].url, "https://img.test/4.png");
    EXPECT_EQ(result.rejected, 2u);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_EQ(result.download_failed, 1u);
    EXPECT_TRUE(result.persist_errors.empty());
    EXPECT_EQ(result.internal_failures, 0u);
}

TEST_F(ImageProcessorTest, EmptyBatch) {
    auto processor = make_processor();
    BatchResult result = processor->process_batch({});
    EXPECT_EQ(result.attempted, 0u);
    EXPECT_TRUE(result.records.empty());
}
