#include "sync_fakes.h"

#include <gtest/gtest.h>
#include <mediasync/sync/reconciler.h>

using namespace mediasync;
using namespace mediasync::sync;
using namespace mediasync::sync::test;

namespace {

constexpr const char* kAbcMd5 = "900150983cd24fb0d6963f7d28e17f72";
constexpr const char* kAbcdefMd5 = "e80b5017098950fc58aad83c8c14978e";

class ReconcilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = make_temp_dir("mediasync-reconcile-");
        settings_.mediaDir = dir_;
        fs_ = makeLocalFileSystem();
    }
    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::filesystem::path dir_;
    Settings settings_;
    std::unique_ptr<IFileSystem> fs_;
    RecordingTransferEngine transfer_;
};

} // namespace

TEST_F(ReconcilerTest, MissingFileIsNotValid) {
    Reconciler r(*fs_, transfer_);
    auto valid = r.isAlreadyValid(settings_, media("a.mp4", 3));
    ASSERT_TRUE(valid);
    EXPECT_FALSE(valid.value());
}

TEST_F(ReconcilerTest, ExistingFileTrustedWithoutFixBroken) {
    write_file(dir_ / "a.mp4", "wrong size");
    Reconciler r(*fs_, transfer_);
    auto m = media("a.mp4", 3);
    m.expectedChecksum = kAbcMd5;
    auto valid = r.isAlreadyValid(settings_, m);
    ASSERT_TRUE(valid);
    EXPECT_TRUE(valid.value());
}

TEST_F(ReconcilerTest, FixBrokenAuditsSize) {
    write_file(dir_ / "a.mp4", "abcd");
    settings_.fixBroken = true;
    Reconciler r(*fs_, transfer_);
    EXPECT_FALSE(r.isAlreadyValid(settings_, media("a.mp4", 3)).value());
    EXPECT_TRUE(r.isAlreadyValid(settings_, media("a.mp4", 4)).value());
    // Unknown size is not audited
    EXPECT_TRUE(r.isAlreadyValid(settings_, media("a.mp4")).value());
}

TEST_F(ReconcilerTest, FixBrokenAuditsChecksumOnlyWhenEnabled) {
    write_file(dir_ / "a.mp4", "abd");
    settings_.fixBroken = true;
    Reconciler r(*fs_, transfer_);
    auto m = media("a.mp4", 3);
    m.expectedChecksum = kAbcMd5;

    EXPECT_TRUE(r.isAlreadyValid(settings_, m).value());
    settings_.verifyChecksums = true;
    EXPECT_FALSE(r.isAlreadyValid(settings_, m).value());

    write_file(dir_ / "a.mp4", "abc");
    EXPECT_TRUE(r.isAlreadyValid(settings_, m).value());
}

TEST_F(ReconcilerTest, FreshDownloadIsPromotedWithPublishDate) {
    transfer_.setAction(writeReal("abc"));
    settings_.rateLimitMBps = 2.5;
    Reconciler r(*fs_, transfer_);
    auto m = media("a.mp4", 3, at(1'600'000'000));

    auto out = r.syncOne(settings_, m);
    ASSERT_TRUE(out) << out.error().message;
    EXPECT_EQ(out.value(), SyncOutcome::Synced);

    ASSERT_EQ(transfer_.calls.size(), 1u);
    EXPECT_EQ(transfer_.calls[0].destination, dir_ / "a.mp4.part");
    EXPECT_FALSE(transfer_.calls[0].options.resume);
    EXPECT_DOUBLE_EQ(transfer_.calls[0].options.rateLimitMBps, 2.5);

    EXPECT_FALSE(std::filesystem::exists(dir_ / "a.mp4.part"));
    auto st = fs_->stat(dir_ / "a.mp4");
    ASSERT_TRUE(st);
    EXPECT_EQ(st->sizeBytes, 3u);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(st->mtime.time_since_epoch()).count(),
              1'600'000'000);
}

TEST_F(ReconcilerTest, EmptyDownloadFails) {
    transfer_.setAction(writeReal(""));
    Reconciler r(*fs_, transfer_);

    auto out = r.syncOne(settings_, media("a.mp4", 3));
    ASSERT_TRUE(out);
    EXPECT_EQ(out.value(), SyncOutcome::Failed);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "a.mp4.part"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "a.mp4"));
}

TEST_F(ReconcilerTest, FreshMismatchIsKeptAndOnlyLogged) {
    transfer_.setAction(writeReal("abcd"));
    settings_.verifyChecksums = true;
    Reconciler r(*fs_, transfer_);
    auto m = media("a.mp4", 3);
    m.expectedChecksum = kAbcMd5;

    auto out = r.syncOne(settings_, m);
    ASSERT_TRUE(out);
    EXPECT_EQ(out.value(), SyncOutcome::Synced);
    EXPECT_EQ(read_file(dir_ / "a.mp4"), "abcd");
}

TEST_F(ReconcilerTest, ResumesLeftoverStagingFile) {
    write_file(dir_ / "a.mp4.part", "abc");
    transfer_.setAction(writeReal("def"));
    Reconciler r(*fs_, transfer_);
    auto m = media("a.mp4", 6, at(1'600'000'000));
    m.expectedChecksum = kAbcdefMd5;

    auto out = r.syncOne(settings_, m);
    ASSERT_TRUE(out) << out.error().message;
    EXPECT_EQ(out.value(), SyncOutcome::Synced);
    ASSERT_EQ(transfer_.calls.size(), 1u);
    EXPECT_TRUE(transfer_.calls[0].options.resume);
    EXPECT_EQ(read_file(dir_ / "a.mp4"), "abcdef");
    EXPECT_FALSE(std::filesystem::exists(dir_ / "a.mp4.part"));
    auto st = fs_->stat(dir_ / "a.mp4");
    ASSERT_TRUE(st);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(st->mtime.time_since_epoch()).count(),
              1'600'000'000);
}

TEST_F(ReconcilerTest, FreshDownloadWithMatchingChecksumIsSynced) {
    transfer_.setAction(writeReal("abc"));
    settings_.verifyChecksums = true;
    Reconciler r(*fs_, transfer_);
    auto m = media("a.mp4", 3);
    m.expectedChecksum = "900150983CD24FB0D6963F7D28E17F72";

    auto out = r.syncOne(settings_, m);
    ASSERT_TRUE(out) << out.error().message;
    EXPECT_EQ(out.value(), SyncOutcome::Synced);
    EXPECT_EQ(read_file(dir_ / "a.mp4"), "abc");
    EXPECT_FALSE(std::filesystem::exists(dir_ / "a.mp4.part"));
}

TEST_F(ReconcilerTest, CompleteStagingFileIsPromotedWithoutTransfer) {
    write_file(dir_ / "a.mp4.part", "abcdef");
    Reconciler r(*fs_, transfer_);

    auto out = r.syncOne(settings_, media("a.mp4", 6));
    ASSERT_TRUE(out);
    EXPECT_EQ(out.value(), SyncOutcome::Synced);
    EXPECT_TRUE(transfer_.calls.empty());
    EXPECT_EQ(read_file(dir_ / "a.mp4"), "abcdef");
}

TEST_F(ReconcilerTest, ResumedSizeMismatchDeletesStaging) {
    write_file(dir_ / "a.mp4.part", "abc");
    transfer_.setAction(writeReal("defgh"));
    Reconciler r(*fs_, transfer_);

    auto out = r.syncOne(settings_, media("a.mp4", 6));
    ASSERT_TRUE(out);
    EXPECT_EQ(out.value(), SyncOutcome::Failed);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "a.mp4.part"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "a.mp4"));
}

TEST_F(ReconcilerTest, ResumedChecksumMismatchDeletesStaging) {
    write_file(dir_ / "a.mp4.part", "abc");
    transfer_.setAction(writeReal("xyz"));
    Reconciler r(*fs_, transfer_);
    auto m = media("a.mp4", 6);
    m.expectedChecksum = kAbcdefMd5;

    auto out = r.syncOne(settings_, m);
    ASSERT_TRUE(out);
    EXPECT_EQ(out.value(), SyncOutcome::Failed);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "a.mp4.part"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "a.mp4"));
}

TEST_F(ReconcilerTest, TransferErrorKeepsStagingForNextRun) {
    write_file(dir_ / "a.mp4.part", "abc");
    transfer_.setAction([](const std::string&, const std::filesystem::path& dest,
                           const TransferOptions&) -> Result<TransferStats> {
        std::ofstream(dest, std::ios::binary | std::ios::app) << "d";
        return Error{ErrorCode::NetworkError, "connection reset"};
    });
    Reconciler r(*fs_, transfer_);

    auto out = r.syncOne(settings_, media("a.mp4", 6));
    ASSERT_FALSE(out);
    EXPECT_EQ(out.error().code, ErrorCode::NetworkError);
    EXPECT_EQ(read_file(dir_ / "a.mp4.part"), "abcd");
}
