#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "sandbox/sanitizer.hpp"

using namespace std;
using namespace sandbox;

class SanitizerTest : public ::testing::Test {
protected:
    runner_config config;
};

TEST_F(SanitizerTest, AcceptsRelativePaths) {
    EXPECT_EQ(safe_path("data.txt"), "data.txt");
    EXPECT_EQ(safe_path("data/input-1.csv"), "data/input-1.csv");
    EXPECT_EQ(safe_path("  notes_v2.md  "), "notes_v2.md");
    EXPECT_EQ(safe_path("dir\\file.txt"), "dir/file.txt");
    EXPECT_EQ(safe_path("a..b/c.txt"), "a..b/c.txt");
}

TEST_F(SanitizerTest, RejectsTraversal) {
    EXPECT_THROW(safe_path("../x.txt"), validation_error);
    EXPECT_THROW(safe_path(".."), validation_error);
    EXPECT_THROW(safe_path("a/../b.txt"), validation_error);
    EXPECT_THROW(safe_path("a/.."), validation_error);
    EXPECT_THROW(safe_path("..\\x.txt"), validation_error);
}

TEST_F(SanitizerTest, RejectsAbsoluteAndDotPaths) {
    EXPECT_THROW(safe_path("/etc/passwd"), validation_error);
    EXPECT_THROW(safe_path("\\etc\\passwd"), validation_error);
    EXPECT_THROW(safe_path("./x.txt"), validation_error);
    EXPECT_THROW(safe_path(".hidden"), validation_error);
    EXPECT_THROW(safe_path(""), validation_error);
    EXPECT_THROW(safe_path("   "), validation_error);
}

TEST_F(SanitizerTest, RejectsEmptyAndDotSegments) {
    EXPECT_THROW(safe_path("dir/"), validation_error);
    EXPECT_THROW(safe_path("dir\\"), validation_error);
    EXPECT_THROW(safe_path("a//b"), validation_error);
    EXPECT_THROW(safe_path("a/./b"), validation_error);
    EXPECT_THROW(safe_path("a/."), validation_error);
    EXPECT_EQ(safe_path("a/b.c/d"), "a/b.c/d");
}

TEST_F(SanitizerTest, RejectsDisallowedCharacters) {
    EXPECT_THROW(safe_path("my file.txt"), validation_error);
    EXPECT_THROW(safe_path("x;rm.txt"), validation_error);
    EXPECT_THROW(safe_path("_x.txt"), validation_error);
    EXPECT_THROW(safe_path("données.txt"), validation_error);
}

TEST_F(SanitizerTest, RejectsReservedNames) {
    EXPECT_THROW(safe_path("main.py"), validation_error);
    EXPECT_THROW(safe_path("turtle.py"), validation_error);
    EXPECT_EQ(safe_path("lib/main.py"), "lib/main.py");
}

TEST_F(SanitizerTest, InvalidPathMessage) {
    try {
        safe_path("../x.txt");
        FAIL() << "traversal accepted";
    } catch (validation_error &e) {
        EXPECT_STREQ(e.what(), "Invalid file path.");
        EXPECT_EQ(e.kind(), error_kind::VALIDATION);
    }
}

TEST_F(SanitizerTest, SanitizeKeepsOrder) {
    vector<raw_file> files = {{"b.txt", "second"}, {"a.txt", "first"}};
    auto cleaned = sanitize_files(files, config);
    ASSERT_EQ(cleaned.size(), 2);
    EXPECT_EQ(cleaned[0].path(), "b.txt");
    EXPECT_EQ(cleaned[0].content(), "second");
    EXPECT_EQ(cleaned[1].path(), "a.txt");
}

TEST_F(SanitizerTest, TooManyFiles) {
    config.max_files = 2;
    vector<raw_file> files = {{"a.txt", ""}, {"b.txt", ""}, {"c.txt", ""}};
    EXPECT_THROW(sanitize_files(files, config), validation_error);

    files.pop_back();
    EXPECT_EQ(sanitize_files(files, config).size(), 2);
}

TEST_F(SanitizerTest, FileSizeLimitIsInclusive) {
    config.max_file_bytes = 4;
    EXPECT_NO_THROW(sanitize_files({{"a.txt", "abcd"}}, config));
    EXPECT_THROW(sanitize_files({{"a.txt", "abcde"}}, config), validation_error);
    // 按 UTF-8 字节计算，"é" 占两个字节
    EXPECT_THROW(sanitize_files({{"a.txt", "ééé"}}, config), validation_error);
}

TEST_F(SanitizerTest, RejectsBinaryContent) {
    EXPECT_THROW(sanitize_files({{"a.bin", string("\xff\xfe", 2)}}, config), validation_error);
}

TEST_F(SanitizerTest, ValidateCode) {
    EXPECT_NO_THROW(validate_code("print('Hello')", config));
    EXPECT_THROW(validate_code("", config), validation_error);
    EXPECT_THROW(validate_code(" \n\t ", config), validation_error);
    EXPECT_THROW(validate_code(string("print('\xc3\x28')"), config), validation_error);

    config.max_code_bytes = 10;
    EXPECT_NO_THROW(validate_code(string(10, 'x'), config));
    EXPECT_THROW(validate_code(string(11, 'x'), config), validation_error);
}
