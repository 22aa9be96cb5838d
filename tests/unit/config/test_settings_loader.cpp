#include <gtest/gtest.h>
#include <mediasync/config/config_helpers.h>
#include <mediasync/config/settings_loader.h>

#include <cstdlib>
#include <fstream>
#include <random>

using namespace mediasync;
using namespace mediasync::config;

namespace {

namespace fs = std::filesystem;

fs::path make_temp_dir() {
    std::mt19937_64 gen(std::random_device{}());
    auto dir = fs::temp_directory_path() / ("mediasync-config-" + std::to_string(gen()));
    fs::create_directories(dir);
    return dir;
}

class SettingsLoaderTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = make_temp_dir(); }
    void TearDown() override { fs::remove_all(dir_); }

    fs::path write(const std::string& text) {
        auto p = dir_ / "config.toml";
        std::ofstream(p) << text;
        return p;
    }

    fs::path dir_;
};

} // namespace

TEST_F(SettingsLoaderTest, MissingFileGivesDefaults) {
    auto s = loadSettings(dir_ / "absent.toml");
    ASSERT_TRUE(s);
    EXPECT_EQ(s.value().mediaDir, fs::path("."));
    EXPECT_EQ(s.value().keepFreeBytes, 0u);
    EXPECT_EQ(s.value().primaryLanguage, "E");
    EXPECT_TRUE(s.value().diskWarning);
    EXPECT_EQ(s.value().mediaExtensions, (std::set<std::string>{".mp4"}));
}

TEST_F(SettingsLoaderTest, ReadsSyncSection) {
    auto p = write(R"(# mediasync
[other]
media_dir = "/wrong"

[sync]
media_dir = "/srv/media"   # mirror here
keep_free_mib = 512
rate_limit_mbps = 1.5
checksums = true
fix_broken = yes
quiet = 1
subtitles = "S, T"
language = 'F'
import_dir = /mnt/usb
warning = false
extensions = [".MP4", "m4v"]
)");
    auto r = loadSettings(p);
    ASSERT_TRUE(r) << r.error().message;
    const auto& s = r.value();
    EXPECT_EQ(s.mediaDir, fs::path("/srv/media"));
    EXPECT_EQ(s.keepFreeBytes, 512 * MiB);
    EXPECT_DOUBLE_EQ(s.rateLimitMBps, 1.5);
    EXPECT_TRUE(s.verifyChecksums);
    EXPECT_TRUE(s.fixBroken);
    EXPECT_EQ(s.quiet, 1);
    EXPECT_EQ(s.subtitleLanguages, (std::set<std::string>{"S", "T"}));
    EXPECT_FALSE(s.subtitlesForPrimaryLanguage);
    EXPECT_EQ(s.primaryLanguage, "F");
    ASSERT_TRUE(s.importDir.has_value());
    EXPECT_EQ(*s.importDir, fs::path("/mnt/usb"));
    EXPECT_FALSE(s.diskWarning);
    EXPECT_EQ(s.mediaExtensions, (std::set<std::string>{".mp4", ".m4v"}));
}

TEST_F(SettingsLoaderTest, DottedKeysAtTopLevel) {
    auto p = write("sync.keep_free_mib = 2\nsync.subtitles = true\n");
    auto r = loadSettings(p);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().keepFreeBytes, 2 * MiB);
    EXPECT_TRUE(r.value().subtitlesForPrimaryLanguage);
    EXPECT_TRUE(r.value().subtitlesRequested());
}

TEST_F(SettingsLoaderTest, InvalidNumberIsRejected) {
    auto p = write("[sync]\nkeep_free_mib = lots\n");
    auto r = loadSettings(p);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(r.error().message.find("keep_free_mib"), std::string::npos);
}

TEST_F(SettingsLoaderTest, InvalidBooleanIsRejected) {
    auto p = write("[sync]\nchecksums = maybe\n");
    auto r = loadSettings(p);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(ConfigHelpers, ParseList) {
    EXPECT_EQ(parse_list("a, b ,c"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(parse_list(R"(["x", 'y'])"), (std::vector<std::string>{"x", "y"}));
    EXPECT_TRUE(parse_list("").empty());
}

TEST(ConfigHelpers, ConfigPathHonoursEnvironment) {
    ::setenv("MEDIASYNC_CONFIG", "/etc/mediasync/custom.toml", 1);
    EXPECT_EQ(get_config_path(), fs::path("/etc/mediasync/custom.toml"));
    EXPECT_EQ(get_config_path("/tmp/explicit.toml"), fs::path("/tmp/explicit.toml"));
    ::unsetenv("MEDIASYNC_CONFIG");

    ::setenv("XDG_CONFIG_HOME", "/home/u/.cfg", 1);
    EXPECT_EQ(get_config_path(), fs::path("/home/u/.cfg/mediasync/config.toml"));
    ::unsetenv("XDG_CONFIG_HOME");
}
