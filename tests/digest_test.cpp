
#include <gtest/gtest.h>
#include "digest.hpp"
#include "test_support.hpp"

using namespace ecdigest;
using ecdigest::test::bytes;

TEST(DigestTest, Sha256KnownAnswers) {
    ASSERT_TRUE(digest_init());
    EXPECT_EQ(to_hex(checksum(bytes("abc"))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(to_hex(checksum(nullptr, 0)),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(DigestTest, RootHashOfEmptyListIsEmptySha256) {
    EXPECT_EQ(root_hash({}), checksum(nullptr, 0));
}

TEST(DigestTest, RootHashIsHashOfConcatenation) {
    Hash a = checksum(bytes("first"));
    Hash b = checksum(bytes("second"));
    std::vector<uint8_t> joined(a.begin(), a.end());
    joined.insert(joined.end(), b.begin(), b.end());
    EXPECT_EQ(root_hash({a, b}), checksum(joined));
}

TEST(DigestTest, RootHashIsOrderSensitive) {
    Hash a = checksum(bytes("first"));
    Hash b = checksum(bytes("second"));
    EXPECT_NE(root_hash({a, b}), root_hash({b, a}));
}
