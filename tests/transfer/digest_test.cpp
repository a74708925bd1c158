#include "chunkbus/transfer/digest.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace chunkbus::transfer;

namespace {

Bytes bytes_of(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

} // namespace

TEST(Sha256Test, KnownVectors) {
    EXPECT_EQ(digest_of(bytes_of("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(empty_digest(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, IncrementalMatchesOneShot) {
    const auto data = bytes_of("The quick brown fox jumps over the lazy dog");

    Sha256 hasher;
    hasher.update(data.data(), 10);
    hasher.update(data.data() + 10, data.size() - 10);
    EXPECT_EQ(hasher.finish(), digest_of(data));

    // finish() resets the hasher
    EXPECT_EQ(hasher.finish(), empty_digest());
}

TEST(HexTest, EncodeIsLowercase) {
    const Bytes data{0x00, 0xAB, 0x7F, 0xFF};
    EXPECT_EQ(hex_encode(data), "00ab7fff");
}

TEST(HexTest, DecodeAcceptsBothCases) {
    Bytes out;
    ASSERT_TRUE(hex_decode("00AbfF", out));
    EXPECT_EQ(out, (Bytes{0x00, 0xAB, 0xFF}));
}

TEST(HexTest, DecodeRejectsMalformedInput) {
    Bytes out{1, 2, 3};
    EXPECT_FALSE(hex_decode("abc", out));
    EXPECT_TRUE(out.empty());
    EXPECT_FALSE(hex_decode("zz", out));
    EXPECT_TRUE(out.empty());
}
