/**
 * @file test_input_source.cpp
 * @brief Unit tests for InputSource, BoundedReader and OutputTarget.
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <io/bounded_reader.hpp>
#include <io/input_source.hpp>
#include <io/output_target.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

using namespace Polydoc;

static std::string temp_path(const std::string& name) {
    return ::testing::TempDir() + name;
}

// ============================================================================
// InputSource
// ============================================================================

TEST(InputSourceTest, BytesExposeHintsAndRanges) {
    auto in = InputSource::from_bytes("hello world", std::string("greeting.txt"), std::string("text/plain"));
    EXPECT_EQ(in.kind(), InputSource::Kind::Bytes);
    EXPECT_EQ(in.filename(), "greeting.txt");
    EXPECT_EQ(in.mime_type(), "text/plain");
    EXPECT_EQ(in.describe(), "greeting.txt");
    EXPECT_EQ(in.read_prefix(5), "hello");
    EXPECT_EQ(in.read_range(6, 100), "world");
    EXPECT_EQ(in.read_range(50, 4), "");
    EXPECT_EQ(in.size(), 11u);
}

TEST(InputSourceTest, StreamPrefixReadsOnlyWhatIsNeeded) {
    std::istringstream stream(std::string(10 * 1024 * 1024, 'x'));
    auto in = InputSource::from_stream(stream);

    EXPECT_EQ(in.read_prefix(8192).size(), 8192u);
    EXPECT_EQ(in.bytes_read(), 8192u);
    EXPECT_FALSE(in.size().has_value());

    // Re-reading the buffered head costs nothing more.
    EXPECT_EQ(in.read_range(100, 10), std::string(10, 'x'));
    EXPECT_EQ(in.bytes_read(), 8192u);
}

TEST(InputSourceTest, StreamReadAllAfterPrefixKeepsHead) {
    std::istringstream stream("abcdefghij");
    auto in = InputSource::from_stream(stream, std::string("letters"));
    EXPECT_EQ(in.read_prefix(3), "abc");
    EXPECT_EQ(in.read_all(), "abcdefghij");
    EXPECT_EQ(in.size(), 10u);
}

TEST(InputSourceTest, PathReadsRangesFromDisk) {
    std::string path = temp_path("polydoc_input.bin");
    std::ofstream(path, std::ios::binary) << "0123456789";

    auto in = InputSource::from_path(path);
    EXPECT_EQ(in.kind(), InputSource::Kind::Path);
    EXPECT_EQ(in.size(), 10u);
    EXPECT_EQ(in.read_range(2, 3), "234");
    EXPECT_EQ(in.read_range(8, 100), "89");
    EXPECT_EQ(in.read_all(), "0123456789");
    std::remove(path.c_str());
}

TEST(InputSourceTest, MissingPathFailsOnFirstRead) {
    auto in = InputSource::from_path(temp_path("polydoc_missing.bin"));
    EXPECT_THROW(in.read_prefix(4), Error);
}

// ============================================================================
// BoundedReader
// ============================================================================

TEST(BoundedReaderTest, TruncatesAtBudget) {
    auto in = InputSource::from_bytes(std::string(1000, 'a'));
    BoundedReader reader(in, 100);

    EXPECT_EQ(reader.read(0, 60).size(), 60u);
    EXPECT_EQ(reader.remaining(), 40u);
    EXPECT_EQ(reader.read(500, 60).size(), 40u);
    EXPECT_TRUE(reader.exhausted());
    EXPECT_EQ(reader.read(0, 10), "");
}

TEST(BoundedReaderTest, StreamReadsStopAtBudgetOffset) {
    std::istringstream stream(std::string(1000, 'a'));
    auto in = InputSource::from_stream(stream);
    BoundedReader reader(in, 100);

    EXPECT_EQ(reader.read(500, 10), "");
    EXPECT_EQ(reader.read(90, 20).size(), 10u);
    EXPECT_LE(in.bytes_read(), 100u);
}

TEST(BoundedReaderTest, ShortInputDoesNotConsumeBudget) {
    auto in = InputSource::from_bytes("abc");
    BoundedReader reader(in, 100);
    EXPECT_EQ(reader.prefix(10), "abc");
    EXPECT_EQ(reader.remaining(), 97u);
    EXPECT_EQ(reader.size(), 3u);
}

// ============================================================================
// OutputTarget
// ============================================================================

TEST(OutputTargetTest, WritesToStream) {
    std::ostringstream out;
    auto target = OutputTarget::to_stream(out);
    target.write("abc");
    target.write("def");
    target.flush();
    EXPECT_EQ(out.str(), "abcdef");
    EXPECT_EQ(target.describe(), "<stream>");
}

TEST(OutputTargetTest, WritesToPath) {
    std::string path = temp_path("polydoc_output.txt");
    {
        auto target = OutputTarget::to_path(path);
        target.write("rendered");
        target.flush();
    }
    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "rendered");
    std::remove(path.c_str());
}
