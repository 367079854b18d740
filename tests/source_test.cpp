
#include <gtest/gtest.h>
#include "source.hpp"
#include "test_support.hpp"
#include <asio/error.hpp>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <type_traits>

using namespace ecdigest;
using ecdigest::test::bytes;
using ecdigest::test::ChunkySource;
using ecdigest::test::FaultySource;
using ecdigest::test::make_content;

TEST(SourceTest, BufferSourceReadsThenEof) {
    auto data = bytes("hello");
    BufferSource src(data);
    uint8_t buf[3];
    std::error_code ec;
    EXPECT_EQ(src.read_some(buf, sizeof(buf), ec), 3u);
    EXPECT_FALSE(ec);
    EXPECT_EQ(src.read_some(buf, sizeof(buf), ec), 2u);
    EXPECT_FALSE(ec);
    EXPECT_EQ(src.read_some(buf, sizeof(buf), ec), 0u);
    EXPECT_EQ(ec, asio::error::eof);
}

TEST(SourceTest, BufferSourceRejectsTemporaries) {
    static_assert(!std::is_constructible<BufferSource, std::vector<uint8_t>&&>::value,
                  "BufferSource must not bind to a temporary buffer");
    static_assert(std::is_constructible<BufferSource, const std::vector<uint8_t>&>::value,
                  "BufferSource reads from a caller-owned buffer");
    auto data = bytes("abc");
    BufferSource src(data);
    uint8_t buf[4];
    std::error_code ec;
    EXPECT_EQ(src.read_some(buf, sizeof(buf), ec), 3u);
}

TEST(SourceTest, StreamSourceReadsThenEof) {
    std::istringstream in("abcdefg");
    StreamSource src(in);
    std::vector<uint8_t> buf(4);
    std::error_code ec;
    EXPECT_EQ(read_full(src, buf.data(), buf.size(), ec), 4u);
    EXPECT_FALSE(ec);
    EXPECT_EQ(buf, bytes("abcd"));
    EXPECT_EQ(read_full(src, buf.data(), buf.size(), ec), 3u);
    EXPECT_FALSE(ec);
    EXPECT_EQ(read_full(src, buf.data(), buf.size(), ec), 0u);
    EXPECT_EQ(ec, asio::error::eof);
}

TEST(SourceTest, ReadFullFillsAcrossShortReads) {
    auto data = make_content(100);
    ChunkySource src(data, 3);
    std::vector<uint8_t> buf(40);
    std::error_code ec;
    EXPECT_EQ(read_full(src, buf.data(), buf.size(), ec), 40u);
    EXPECT_FALSE(ec);
    EXPECT_TRUE(std::equal(buf.begin(), buf.end(), data.begin()));
    EXPECT_EQ(read_full(src, buf.data(), buf.size(), ec), 40u);
    EXPECT_EQ(read_full(src, buf.data(), buf.size(), ec), 20u);
    EXPECT_FALSE(ec);
    EXPECT_EQ(read_full(src, buf.data(), buf.size(), ec), 0u);
    EXPECT_EQ(ec, asio::error::eof);
}

TEST(SourceTest, ReadFullReportsErrors) {
    FaultySource src(10);
    std::vector<uint8_t> buf(16);
    std::error_code ec;
    read_full(src, buf.data(), buf.size(), ec);
    EXPECT_EQ(ec, std::errc::io_error);
}

TEST(SourceTest, FileSourceReadsWholeFile) {
    auto data = make_content(777);
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    std::string path = std::string(::testing::TempDir()) + "ecdigest_source_" +
                       std::to_string((long long)now) + ".bin";
    {
        std::ofstream f(path, std::ios::binary);
        f.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
    }
    FileSource src;
    ASSERT_FALSE(src.open(path));
    EXPECT_TRUE(src.is_open());
    std::vector<uint8_t> buf(1000);
    std::error_code ec;
    size_t n = read_full(src, buf.data(), buf.size(), ec);
    EXPECT_FALSE(ec);
    ASSERT_EQ(n, data.size());
    buf.resize(n);
    EXPECT_EQ(buf, data);
    src.close();
    EXPECT_FALSE(src.is_open());
    std::remove(path.c_str());
}

TEST(SourceTest, FileSourceOpenFailure) {
    FileSource src;
    EXPECT_EQ(src.open("/nonexistent/ecdigest/input.bin"), std::errc::no_such_file_or_directory);
    EXPECT_FALSE(src.is_open());
    uint8_t b;
    std::error_code ec;
    EXPECT_EQ(src.read_some(&b, 1, ec), 0u);
    EXPECT_TRUE(ec);
}
