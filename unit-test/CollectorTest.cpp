#include "gtest/gtest.h"
#include <limits>
#include "common/base64.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/tar.hpp"
#include "sandbox/collector.hpp"

using namespace std;
using namespace sandbox;

static const string MARKER = "\n...[truncated]";

TEST(CollectorTest, ShortOutputUnchanged) {
    EXPECT_EQ(truncate_output("Hello\n", 100), "Hello\n");
    EXPECT_EQ(truncate_output("", 100), "");
}

TEST(CollectorTest, TruncatesAtCeiling) {
    string text = truncate_output(string(25, 'a'), 10);
    EXPECT_EQ(text, string(10, 'a') + MARKER);
    EXPECT_EQ(utf8_length(text), 10 + MARKER.size());

    // 恰好等于上限时不截断
    EXPECT_EQ(truncate_output(string(10, 'a'), 10), string(10, 'a'));
}

TEST(CollectorTest, CountsCodePoints) {
    // 每个汉字 3 个字节
    string text = "世界世界世界";
    EXPECT_EQ(truncate_output(text, 6), text);
    EXPECT_EQ(truncate_output(text, 2), "世界" + MARKER);
}

TEST(CollectorTest, ReplacesInvalidBytes) {
    EXPECT_EQ(truncate_output(string("ok\xff\n", 4), 100), "ok\xEF\xBF\xBD\n");
    // 被截断的多字节序列也被替换
    EXPECT_EQ(truncate_output(string("a\xe4\xb8", 3), 100), "a\xEF\xBF\xBD");
}

TEST(CollectorTest, OverflowedAlwaysMarked) {
    EXPECT_EQ(truncate_output("abc", 3, true), "abc" + MARKER);
}

TEST(CollectorTest, OutputByteLimit) {
    EXPECT_EQ(output_byte_limit(20000), 80004);
    EXPECT_EQ(output_byte_limit(0), 4);
    EXPECT_EQ(output_byte_limit(numeric_limits<size_t>::max() / 4), numeric_limits<size_t>::max());
    EXPECT_EQ(output_byte_limit(numeric_limits<size_t>::max()), numeric_limits<size_t>::max());
}

TEST(CollectorTest, MimeTypes) {
    EXPECT_EQ(mime_for("turtle.svg"), "image/svg+xml");
    EXPECT_EQ(mime_for("plot.PNG"), "image/png");
    EXPECT_EQ(mime_for("a.jpg"), "image/jpeg");
    EXPECT_EQ(mime_for("a.JPEG"), "image/jpeg");
    EXPECT_EQ(mime_for("data.json"), "application/json");
    EXPECT_EQ(mime_for("out.txt"), "text/plain");
    EXPECT_EQ(mime_for("table.csv"), "text/plain");
    EXPECT_EQ(mime_for("Makefile"), "text/plain");
}

TEST(CollectorTest, OutputNames) {
    EXPECT_EQ(output_name("tmp/out.txt"), "out.txt");
    EXPECT_EQ(output_name("./tmp/out.txt"), "out.txt");
    EXPECT_EQ(output_name("/tmp/data/x.csv"), "data/x.csv");
    EXPECT_EQ(output_name("tmp/"), "");
    EXPECT_EQ(output_name("out.txt"), "out.txt");
}

TEST(CollectorTest, ArchiveBufferLimit) {
    archive_buffer buffer(10);
    buffer.append("12345", 5);
    buffer.append("67890", 5);
    EXPECT_EQ(buffer.data(), "1234567890");
    try {
        buffer.append("x", 1);
        FAIL() << "archive limit not enforced";
    } catch (runner_error &e) {
        EXPECT_STREQ(e.what(), "Output archive too large.");
    }
}

class CollectFilesTest : public ::testing::Test {
protected:
    string post_run_archive() {
        tar_writer writer;
        writer.add_directory("tmp");
        writer.add_file("tmp/main.py", "print('x')");
        writer.add_file("tmp/turtle.py", "# shim");
        writer.add_file("tmp/out.txt", "result\n");
        writer.add_directory("tmp/plots");
        writer.add_file("tmp/plots/turtle.svg", "<svg/>");
        writer.add_file("tmp/data.json", "{}");
        return writer.finish();
    }

    runner_config config;
};

TEST_F(CollectFilesTest, ExtractsProducedFiles) {
    auto files = collect_files(post_run_archive(), config);
    ASSERT_EQ(files.size(), 3);

    EXPECT_EQ(files[0].path, "out.txt");
    EXPECT_EQ(files[0].size, 7);
    EXPECT_EQ(files[0].mime, "text/plain");
    EXPECT_EQ(base64_decode(files[0].content_base64), "result\n");

    EXPECT_EQ(files[1].path, "plots/turtle.svg");
    EXPECT_EQ(files[1].mime, "image/svg+xml");

    EXPECT_EQ(files[2].path, "data.json");
    EXPECT_EQ(files[2].mime, "application/json");
}

TEST_F(CollectFilesTest, CapsFileCount) {
    config.max_files = 2;
    auto files = collect_files(post_run_archive(), config);
    ASSERT_EQ(files.size(), 2);
    EXPECT_EQ(files[0].path, "out.txt");
    EXPECT_EQ(files[1].path, "plots/turtle.svg");
}

TEST_F(CollectFilesTest, TruncatesFileContent) {
    config.max_file_bytes = 3;
    auto files = collect_files(post_run_archive(), config);
    ASSERT_FALSE(files.empty());
    EXPECT_EQ(files[0].size, 3);
    EXPECT_EQ(base64_decode(files[0].content_base64), "res");
}

TEST_F(CollectFilesTest, MalformedArchive) {
    string archive = post_run_archive();
    archive[600] ^= 0x20;
    EXPECT_THROW(collect_files(archive, config), runner_error);
}

TEST_F(CollectFilesTest, EmptyArchive) {
    EXPECT_TRUE(collect_files("", config).empty());
}
