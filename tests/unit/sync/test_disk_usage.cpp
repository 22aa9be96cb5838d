#include "sync_fakes.h"

#include <gtest/gtest.h>
#include <mediasync/sync/disk_usage.h>

using namespace mediasync;
using namespace mediasync::sync;
using namespace mediasync::sync::test;

namespace {

class DiskUsageTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.mediaDir = "/media";
        settings_.keepFreeBytes = 100 * MiB;
    }

    ConfirmCallback answer(bool yes) {
        return [this, yes](const std::string& prompt) {
            prompts_.push_back(prompt);
            return yes;
        };
    }

    Settings settings_;
    FakeFileSystem fs_;
    std::vector<std::string> prompts_;
};

} // namespace

TEST_F(DiskUsageTest, EnoughSpaceNeedsNoConfirmation) {
    fs_.setAvailable(200 * MiB);
    DiskUsageReporter usage(fs_, answer(false));

    auto r = usage.check(settings_);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value());
    EXPECT_TRUE(prompts_.empty());
}

TEST_F(DiskUsageTest, LowSpaceAsksTheUser) {
    fs_.setAvailable(40 * MiB);

    DiskUsageReporter yes(fs_, answer(true));
    EXPECT_TRUE(yes.check(settings_).value());
    ASSERT_EQ(prompts_.size(), 1u);
    EXPECT_EQ(prompts_[0], "Do you want to proceed anyway? [y/N]: ");

    DiskUsageReporter no(fs_, answer(false));
    EXPECT_FALSE(no.check(settings_).value());
}

TEST_F(DiskUsageTest, WarningDisabledSkipsQuestion) {
    fs_.setAvailable(40 * MiB);
    settings_.diskWarning = false;
    DiskUsageReporter usage(fs_, answer(false));

    EXPECT_TRUE(usage.check(settings_).value());
    EXPECT_TRUE(prompts_.empty());
}

TEST_F(DiskUsageTest, NoCallbackDeclines) {
    fs_.setAvailable(40 * MiB);
    DiskUsageReporter usage(fs_, nullptr);
    EXPECT_FALSE(usage.check(settings_).value());
}
