
#include <gtest/gtest.h>
#include "errors.hpp"
#include "fec.hpp"
#include "test_support.hpp"

using namespace ecdigest;
using ecdigest::test::bytes;
using ecdigest::test::make_content;

TEST(ReedSolomonTest, SplitsIntoEqualSizedShards) {
    ReedSolomon rs(ShardLayout{4, 2});
    ASSERT_TRUE(rs.valid());
    auto data = make_content(1001);
    std::vector<std::vector<uint8_t>> shards;
    ASSERT_FALSE(rs.encode(data.data(), data.size(), shards));
    ASSERT_EQ(shards.size(), 6u);
    for (const auto& s : shards)
        EXPECT_EQ(s.size(), 251u);
}

TEST(ReedSolomonTest, DataShardsAreZeroPaddedCopies) {
    ReedSolomon rs(ShardLayout{2, 1});
    auto data = bytes("abcde");
    std::vector<std::vector<uint8_t>> shards;
    ASSERT_FALSE(rs.encode(data.data(), data.size(), shards));
    ASSERT_EQ(shards.size(), 3u);
    EXPECT_EQ(shards[0], bytes("abc"));
    EXPECT_EQ(shards[1], (std::vector<uint8_t>{'d', 'e', 0}));
}

TEST(ReedSolomonTest, ParityMatchesHandComputedValue) {
    // For two data shards the parity row is {3, 2} over GF(2^8)/0x11d.
    ReedSolomon rs(ShardLayout{2, 1});
    auto data = bytes("abcd");
    std::vector<std::vector<uint8_t>> shards;
    ASSERT_FALSE(rs.encode(data.data(), data.size(), shards));
    EXPECT_EQ(shards[2], (std::vector<uint8_t>{0x65, 0x6e}));
}

TEST(ReedSolomonTest, SingleDataShardReplicates) {
    ReedSolomon rs(ShardLayout{1, 3});
    auto data = make_content(77);
    std::vector<std::vector<uint8_t>> shards;
    ASSERT_FALSE(rs.encode(data.data(), data.size(), shards));
    ASSERT_EQ(shards.size(), 4u);
    for (const auto& s : shards)
        EXPECT_EQ(s, data);
}

TEST(ReedSolomonTest, ParityIsLinear) {
    ReedSolomon rs(ShardLayout{5, 3});
    auto a = make_content(500, 1);
    auto b = make_content(500, 2);
    std::vector<uint8_t> x(a.size());
    for (size_t i = 0; i < a.size(); i++)
        x[i] = a[i] ^ b[i];

    std::vector<std::vector<uint8_t>> sa, sb, sx;
    ASSERT_FALSE(rs.encode(a.data(), a.size(), sa));
    ASSERT_FALSE(rs.encode(b.data(), b.size(), sb));
    ASSERT_FALSE(rs.encode(x.data(), x.size(), sx));
    for (size_t p = 5; p < 8; p++)
        for (size_t j = 0; j < sx[p].size(); j++)
            ASSERT_EQ(sx[p][j], sa[p][j] ^ sb[p][j]);
}

TEST(ReedSolomonTest, ParityShardsDiffer) {
    ReedSolomon rs(ShardLayout{3, 2});
    auto data = make_content(300);
    std::vector<std::vector<uint8_t>> shards;
    ASSERT_FALSE(rs.encode(data.data(), data.size(), shards));
    EXPECT_NE(shards[3], shards[4]);
}

TEST(ReedSolomonTest, NoParityMeansDataOnly) {
    ReedSolomon rs(ShardLayout{3, 0});
    auto data = bytes("abcdefgh");
    std::vector<std::vector<uint8_t>> shards;
    ASSERT_FALSE(rs.encode(data.data(), data.size(), shards));
    ASSERT_EQ(shards.size(), 3u);
    EXPECT_EQ(shards[2], (std::vector<uint8_t>{'g', 'h', 0}));
}

TEST(ReedSolomonTest, RejectsBadLayouts) {
    auto data = bytes("abcd");
    std::vector<std::vector<uint8_t>> shards;

    ReedSolomon no_data(ShardLayout{0, 2});
    EXPECT_FALSE(no_data.valid());
    EXPECT_EQ(no_data.encode(data.data(), data.size(), shards),
              errc::invalid_shard_layout);

    ReedSolomon too_many(ShardLayout{200, 57});
    EXPECT_FALSE(too_many.valid());
    EXPECT_EQ(too_many.encode(data.data(), data.size(), shards),
              errc::invalid_shard_layout);
    EXPECT_TRUE(shards.empty());

    ReedSolomon max(ShardLayout{200, 56});
    EXPECT_TRUE(max.valid());
}

TEST(ReedSolomonTest, RejectsEmptySegment) {
    ReedSolomon rs(ShardLayout{2, 1});
    std::vector<std::vector<uint8_t>> shards;
    EXPECT_EQ(rs.encode(nullptr, 0, shards), errc::empty_segment);
}
