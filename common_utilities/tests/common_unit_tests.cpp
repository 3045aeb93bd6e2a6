/**
 * @file common_unit_tests.cpp
 * @brief Common 模块基础单元测试
 */

#include <gtest/gtest.h>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include "common_utils/utilities/string_utils.h"
#include "common_utils/utilities/filesystem_utils.h"
#include "common_utils/time/time_utils.h"

namespace fs = std::filesystem;

namespace geobridge::common_utils::tests {

// =============================================================================
// 📝 字符串工具测试
// =============================================================================

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, TrimTest) {
    EXPECT_EQ(StringUtils::trim("  hello  "), "hello");
    EXPECT_EQ(StringUtils::trim("world"), "world");
    EXPECT_EQ(StringUtils::trim(""), "");
    EXPECT_EQ(StringUtils::trim("   "), "");
}

TEST_F(StringUtilsTest, CaseConversionTest) {
    EXPECT_EQ(StringUtils::toLower("GeoJSON"), "geojson");
    EXPECT_EQ(StringUtils::toUpper("cache.root_dir"), "CACHE.ROOT_DIR");
    EXPECT_TRUE(StringUtils::equalsIgnoreCase("KML", "kml"));
    EXPECT_FALSE(StringUtils::equalsIgnoreCase("kml", "kmz"));
}

TEST_F(StringUtilsTest, SplitAndJoinTest) {
    auto parts = StringUtils::split("a,b,,c", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[2], "c");

    auto withEmpty = StringUtils::split("a,b,,c", ',', false);
    EXPECT_EQ(withEmpty.size(), 4u);

    EXPECT_EQ(StringUtils::join({"x", "y", "z"}, "_"), "x_y_z");
    EXPECT_TRUE(StringUtils::startsWith("buffer_123_meta.json", "buffer_"));
    EXPECT_TRUE(StringUtils::endsWith("buffer_123_meta.json", "_meta.json"));
}

// =============================================================================
// 📁 文件系统工具测试
// =============================================================================

class FilesystemUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() /
               ("geobridge_fs_test_" + std::to_string(
                    std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(root);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    fs::path root;
};

TEST_F(FilesystemUtilsTest, AtomicWriteReplacesContent) {
    auto target = root / "nested" / "entry.json";
    ASSERT_TRUE(FilesystemUtils::writeStringToFileAtomic(target, "{\"v\":1}"));
    ASSERT_TRUE(FilesystemUtils::writeStringToFileAtomic(target, "{\"v\":2}"));

    auto content = FilesystemUtils::readFileToString(target);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "{\"v\":2}");

    // 不应残留临时文件
    EXPECT_EQ(FilesystemUtils::listFiles(target.parent_path()).size(), 1u);
}

TEST_F(FilesystemUtilsTest, CopyCreatesParentDirectories) {
    auto source = root / "source.txt";
    ASSERT_TRUE(FilesystemUtils::writeStringToFileAtomic(source, "payload"));

    auto destination = root / "a" / "b" / "copy.txt";
    ASSERT_TRUE(FilesystemUtils::copyFile(source, destination));
    EXPECT_EQ(FilesystemUtils::getFileSize(destination).value_or(0), 7u);
}

TEST_F(FilesystemUtilsTest, ReadMissingFileReturnsNullopt) {
    EXPECT_FALSE(FilesystemUtils::readFileToString(root / "missing.json").has_value());
    EXPECT_TRUE(FilesystemUtils::removeFile(root / "missing.json"));
}

TEST_F(FilesystemUtilsTest, ListFilesFiltersBySuffix) {
    FilesystemUtils::writeStringToFileAtomic(root / "x.json", "{}");
    FilesystemUtils::writeStringToFileAtomic(root / "x_meta.json", "{}");
    FilesystemUtils::writeStringToFileAtomic(root / "notes.txt", "");

    EXPECT_EQ(FilesystemUtils::listFiles(root, ".json").size(), 2u);
    EXPECT_EQ(FilesystemUtils::listFiles(root, "_meta.json").size(), 1u);
}

TEST_F(FilesystemUtilsTest, ExpandUserUsesHome) {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        GTEST_SKIP() << "HOME not set";
    }
    EXPECT_EQ(FilesystemUtils::expandUser("~/out.json"), fs::path(std::string(home) + "/out.json"));
    EXPECT_EQ(FilesystemUtils::expandUser("/abs/out.json"), fs::path("/abs/out.json"));
}

// =============================================================================
// 🕒 时间工具测试
// =============================================================================

TEST(TimeUtilsTest, IsoRoundTripAtSecondPrecision) {
    auto tp = std::chrono::system_clock::from_time_t(1714564800);  // 2024-05-01T12:00:00Z
    auto text = time::TimeUtils::toIsoString(tp);
    EXPECT_EQ(text, "2024-05-01T12:00:00Z");

    auto parsed = time::TimeUtils::parseIsoString(text);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, tp);
}

TEST(TimeUtilsTest, ParseTreatsTextAsUtc) {
    auto parsed = time::TimeUtils::parseIsoString("2024-03-01T12:30:45Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(time::TimeUtils::toEpochMillis(*parsed), 1709296245000LL);

    auto epoch = time::TimeUtils::parseIsoString("1970-01-01T00:00:00");
    ASSERT_TRUE(epoch.has_value());
    EXPECT_EQ(time::TimeUtils::toEpochMillis(*epoch), 0);
}

TEST(TimeUtilsTest, ParseRejectsGarbage) {
    EXPECT_FALSE(time::TimeUtils::parseIsoString("yesterday").has_value());
}

TEST(TimeUtilsTest, EpochMillis) {
    auto tp = std::chrono::system_clock::from_time_t(1) + std::chrono::milliseconds(250);
    EXPECT_EQ(time::TimeUtils::toEpochMillis(tp), 1250);
}

} // namespace geobridge::common_utils::tests
