#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Utils.h"
#include <fstream>
#include <filesystem>
#include <cstdio>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace daily_dash {
namespace utils {

class UtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / ("daily_dash_utils_" + std::to_string(::getpid()));
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::permissions(temp_dir, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(temp_dir, ec);
    }

    fs::path temp_dir;
    int counter = 0;
    fs::path create_temp_file(const std::string& content = "") {
        auto temp_file = temp_dir / ("test_" + std::to_string(counter++) + ".txt");
        std::ofstream file(temp_file);
        file << content;
        file.close();
        return temp_file;
    }
};

TEST_F(UtilsTest, ReadLinesMultipleLines) {
    auto temp_file = create_temp_file("Line 1\n\nLine 3\n");
    auto lines = read_lines(temp_file.string());
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "Line 1");
    EXPECT_EQ(lines[1], "");
    EXPECT_EQ(lines[2], "Line 3");
}

TEST_F(UtilsTest, ReadLinesNonExistentFile) {
    EXPECT_TRUE(read_lines("/non/existent/file.txt").empty());
}

TEST_F(UtilsTest, ReadFileEmptyFile) {
    auto content = read_file(create_temp_file("").string());
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(content.value(), "");
}

TEST_F(UtilsTest, ReadFileNonExistentFile) {
    EXPECT_FALSE(read_file("/non/existent/file.txt").has_value());
}

TEST_F(UtilsTest, ReadFileWithSizeLimit) {
    auto temp_file = create_temp_file(std::string(20000, 'A'));
    auto content = read_file(temp_file.string(), 1000);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(content.value(), std::string(1000, 'A'));

    auto full = read_file(temp_file.string());
    ASSERT_TRUE(full.has_value());
    EXPECT_EQ(full->size(), 20000u);
}

TEST_F(UtilsTest, BinaryFileHandling) {
    std::string binary_data;
    for (int i = 0; i < 256; ++i) binary_data += static_cast<char>(i);
    auto temp_file = temp_dir / "binary_test.bin";
    std::ofstream file(temp_file, std::ios::binary);
    file.write(binary_data.data(), binary_data.size());
    file.close();

    auto content = read_file(temp_file.string());
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(content.value(), binary_data);
}

TEST_F(UtilsTest, TrimVariants) {
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim("hello"), "hello");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(" \t\n hello world \n\t "), "hello world");
    EXPECT_EQ(trim("hello\r\n"), "hello");
}

TEST_F(UtilsTest, ToLower) {
    EXPECT_EQ(to_lower("AA:BB:CC:0D"), "aa:bb:cc:0d");
    EXPECT_EQ(to_lower("MixedCase-123"), "mixedcase-123");
}

TEST_F(UtilsTest, SplitCsvTrimsAndDropsEmpties) {
    auto parts = split_csv(" feeds, ,weather,,network ");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "feeds");
    EXPECT_EQ(parts[1], "weather");
    EXPECT_EQ(parts[2], "network");
    EXPECT_TRUE(split_csv("").empty());
}

TEST_F(UtilsTest, Sha256KnownVector) {
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256_hex("").size(), 64u);
}

TEST_F(UtilsTest, Sha256OfLongKeyIsShortFileName) {
    std::string url = "feed:https://example.org/rss?" + std::string(1000, 'q');
    EXPECT_EQ(sha256_hex(url), sha256_hex(url));
    EXPECT_EQ(sha256_hex(url).size(), 64u);
    EXPECT_NE(sha256_hex("feed:a"), sha256_hex("feed:b"));
}

TEST_F(UtilsTest, WriteFileAtomicReplacesContent) {
    std::string path = (temp_dir / "nested" / "state.json").string();
    std::string err;
    ASSERT_TRUE(write_file_atomic(path, "first", err)) << err;
    ASSERT_TRUE(write_file_atomic(path, "second", err)) << err;
    EXPECT_EQ(read_file(path).value_or(""), "second");

    // no temp files left behind
    size_t entries = 0;
    for (const auto& e : fs::directory_iterator(temp_dir / "nested")) { (void)e; ++entries; }
    EXPECT_EQ(entries, 1u);
}

TEST_F(UtilsTest, WriteFileAtomicFailureKeepsOldFile) {
    if (::geteuid() == 0) GTEST_SKIP() << "root ignores directory permissions";
    fs::path dir = temp_dir / "locked";
    fs::create_directories(dir);
    std::string path = (dir / "state.json").string();
    std::string err;
    ASSERT_TRUE(write_file_atomic(path, "old", err));
    fs::permissions(dir, fs::perms::owner_read | fs::perms::owner_exec);

    EXPECT_FALSE(write_file_atomic(path, "new", err));
    EXPECT_FALSE(err.empty());
    fs::permissions(dir, fs::perms::owner_all);
    EXPECT_EQ(read_file(path).value_or(""), "old");
}

} // namespace utils
} // namespace daily_dash

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
