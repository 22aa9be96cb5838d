#include "sync_fakes.h"

#include <gtest/gtest.h>
#include <mediasync/sync/transfer_engine.h>

#include <sstream>

using namespace mediasync;
using namespace mediasync::sync;
using namespace mediasync::sync::test;

namespace {

// 4 byte chunks
constexpr double kTinyRate = 4.0 / static_cast<double>(MiB);

class TransferEngineTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = make_temp_dir("mediasync-transfer-"); }
    void TearDown() override { std::filesystem::remove_all(dir_); }

    TransferEngine makeEngine() {
        TransferEngine engine(http_, [this](std::chrono::milliseconds d) { sleeps_.push_back(d); });
        engine.setProgressStream(progress_, false);
        return engine;
    }

    std::filesystem::path dir_;
    FakeHttpAdapter http_;
    std::vector<std::chrono::milliseconds> sleeps_;
    std::ostringstream progress_;
};

} // namespace

TEST_F(TransferEngineTest, FreshTransferRequestsFromZero) {
    http_.status = 200;
    http_.contentLength = 11;
    http_.pieces = {"hello ", "world"};
    auto engine = makeEngine();

    auto r = engine.transfer("https://x/clip.mp4", dir_ / "clip.mp4.part", TransferOptions{});
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(http_.rangeHeader(), "bytes=0-");
    EXPECT_EQ(read_file(dir_ / "clip.mp4.part"), "hello world");
    EXPECT_EQ(r.value().startOffset, 0u);
    EXPECT_EQ(r.value().bytesReceived, 11u);
    ASSERT_TRUE(r.value().totalBytes.has_value());
    EXPECT_EQ(*r.value().totalBytes, 11u);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(TransferEngineTest, FreshTransferTruncatesExistingFile) {
    write_file(dir_ / "clip.part", "stale content");
    http_.pieces = {"new"};
    auto engine = makeEngine();

    TransferOptions opts;
    opts.resume = false;
    ASSERT_TRUE(engine.transfer("https://x/clip", dir_ / "clip.part", opts));
    EXPECT_EQ(http_.rangeHeader(), "bytes=0-");
    EXPECT_EQ(read_file(dir_ / "clip.part"), "new");
}

TEST_F(TransferEngineTest, ResumeAppendsFromCurrentSize) {
    write_file(dir_ / "clip.part", "hello ");
    http_.status = 206;
    http_.contentLength = 5;
    http_.pieces = {"world"};
    auto engine = makeEngine();

    TransferOptions opts;
    opts.resume = true;
    auto r = engine.transfer("https://x/clip", dir_ / "clip.part", opts);
    ASSERT_TRUE(r);
    EXPECT_EQ(http_.rangeHeader(), "bytes=6-");
    EXPECT_EQ(read_file(dir_ / "clip.part"), "hello world");
    EXPECT_EQ(r.value().startOffset, 6u);
    EXPECT_EQ(r.value().bytesReceived, 5u);
    EXPECT_EQ(*r.value().totalBytes, 11u);
}

TEST_F(TransferEngineTest, ResumeWithoutFileStartsAtZero) {
    http_.pieces = {"abc"};
    auto engine = makeEngine();

    TransferOptions opts;
    opts.resume = true;
    ASSERT_TRUE(engine.transfer("https://x/clip", dir_ / "clip.part", opts));
    EXPECT_EQ(http_.rangeHeader(), "bytes=0-");
    EXPECT_EQ(read_file(dir_ / "clip.part"), "abc");
}

TEST_F(TransferEngineTest, IgnoredRangeRestartsFile) {
    write_file(dir_ / "clip.part", "hello ");
    http_.status = 200; // server sends the whole body again
    http_.contentLength = 11;
    http_.pieces = {"hello world"};
    auto engine = makeEngine();

    TransferOptions opts;
    opts.resume = true;
    auto r = engine.transfer("https://x/clip", dir_ / "clip.part", opts);
    ASSERT_TRUE(r);
    EXPECT_EQ(read_file(dir_ / "clip.part"), "hello world");
    EXPECT_EQ(r.value().startOffset, 0u);
    EXPECT_EQ(*r.value().totalBytes, 11u);
}

TEST_F(TransferEngineTest, HttpErrorIsReturned) {
    http_.status = 404;
    auto engine = makeEngine();

    auto r = engine.transfer("https://x/missing", dir_ / "missing.part", TransferOptions{});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NetworkError);
}

TEST_F(TransferEngineTest, ThrottledTransferPacesEveryChunk) {
    http_.pieces = {"abcdefghij"};
    auto engine = makeEngine();

    TransferOptions opts;
    opts.rateLimitMBps = kTinyRate;
    ASSERT_TRUE(engine.transfer("https://x/clip", dir_ / "clip.part", opts));
    EXPECT_EQ(read_file(dir_ / "clip.part"), "abcdefghij");

    // 4 + 4 + 2 bytes: three chunks, each followed by the rest of its one second budget
    ASSERT_EQ(sleeps_.size(), 3u);
    for (auto d : sleeps_) {
        EXPECT_GT(d.count(), 0);
        EXPECT_LE(d, kChunkBudget);
    }
}

TEST_F(TransferEngineTest, PartialDataSurvivesTransportError) {
    http_.pieces = {"abcdef"};
    http_.failAfterPieces = Error{ErrorCode::NetworkError, "connection reset"};
    auto engine = makeEngine();

    TransferOptions opts;
    opts.rateLimitMBps = kTinyRate;
    auto r = engine.transfer("https://x/clip", dir_ / "clip.part", opts);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NetworkError);
    // The buffered tail of the second chunk is kept for the next resume
    EXPECT_EQ(read_file(dir_ / "clip.part"), "abcdef");
}

TEST_F(TransferEngineTest, ProgressOnlyOnInteractiveStream) {
    http_.contentLength = 8;
    http_.pieces = {"abcdefgh"};

    TransferOptions opts;
    opts.showProgress = true;
    opts.rateLimitMBps = kTinyRate;

    {
        auto engine = makeEngine();
        ASSERT_TRUE(engine.transfer("https://x/a", dir_ / "a.part", opts));
        EXPECT_TRUE(progress_.str().empty());
    }
    {
        TransferEngine engine(http_, [](std::chrono::milliseconds) {});
        engine.setProgressStream(progress_, true);
        ASSERT_TRUE(engine.transfer("https://x/b", dir_ / "b.part", opts));
        const auto out = progress_.str();
        EXPECT_NE(out.find(formatProgressLine(4, 8)), std::string::npos);
        EXPECT_NE(out.find(formatProgressLine(8, 8)), std::string::npos);
        EXPECT_EQ(out.back(), '\n');
    }
}

TEST_F(TransferEngineTest, NoProgressWithoutKnownTotal) {
    http_.pieces = {"abcdefgh"};
    TransferEngine engine(http_, [](std::chrono::milliseconds) {});
    engine.setProgressStream(progress_, true);

    TransferOptions opts;
    opts.showProgress = true;
    ASSERT_TRUE(engine.transfer("https://x/a", dir_ / "a.part", opts));
    EXPECT_TRUE(progress_.str().empty());
}

TEST(TransferEngineChunks, ChunkSizeFollowsRateLimit) {
    EXPECT_EQ(TransferEngine::chunkSizeFor(0.0), DEFAULT_TRANSFER_CHUNK_SIZE);
    EXPECT_EQ(TransferEngine::chunkSizeFor(2.0), 2 * MiB);
    EXPECT_EQ(TransferEngine::chunkSizeFor(0.5), MiB / 2);
}

TEST(ProgressLine, BarAndPercentage) {
    EXPECT_EQ(formatProgressLine(50, 100),
              "\r" + std::string(35, '#') + std::string(35, '-') + "  50.0%");
    EXPECT_EQ(formatProgressLine(100, 100), "\r" + std::string(70, '#') + " 100.0%");
    EXPECT_EQ(formatProgressLine(0, 100), "\r" + std::string(70, '-') + "   0.0%");
    EXPECT_EQ(formatProgressLine(10, 0), "");
}
