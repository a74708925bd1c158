#include "chunkbus/transfer/bitmap.hpp"

#include <gtest/gtest.h>

using chunkbus::transfer::ChunkBitmap;

TEST(ChunkBitmapTest, SetIsIdempotent) {
    ChunkBitmap bitmap(4);
    EXPECT_TRUE(bitmap.set(2));
    EXPECT_FALSE(bitmap.set(2));
    EXPECT_FALSE(bitmap.set(7));  // out of range

    EXPECT_EQ(bitmap.count(), 1u);
    EXPECT_TRUE(bitmap.test(2));
    EXPECT_FALSE(bitmap.test(7));
}

TEST(ChunkBitmapTest, MissingAndPresent) {
    ChunkBitmap bitmap(5);
    bitmap.set(0);
    bitmap.set(3);

    EXPECT_EQ(bitmap.missing(), (std::vector<std::uint32_t>{1, 2, 4}));
    EXPECT_EQ(bitmap.present(), (std::vector<std::uint32_t>{0, 3}));
    EXPECT_EQ(bitmap.highest(), 3);
    EXPECT_FALSE(bitmap.complete());
}

TEST(ChunkBitmapTest, ClearResetsEverything) {
    ChunkBitmap bitmap(3);
    bitmap.set(0);
    bitmap.set(1);
    bitmap.set(2);
    ASSERT_TRUE(bitmap.complete());

    bitmap.clear();
    EXPECT_EQ(bitmap.count(), 0u);
    EXPECT_EQ(bitmap.highest(), -1);
    EXPECT_EQ(bitmap.missing().size(), 3u);
}

TEST(ChunkBitmapTest, EmptyBitmapIsComplete) {
    ChunkBitmap bitmap(0);
    EXPECT_TRUE(bitmap.complete());
    EXPECT_TRUE(bitmap.missing().empty());
}

TEST(ChunkBitmapTest, HexPersistence) {
    ChunkBitmap bitmap(10);
    bitmap.set(0);
    bitmap.set(9);
    EXPECT_EQ(bitmap.to_hex(), "0102");

    ChunkBitmap restored;
    ASSERT_TRUE(ChunkBitmap::from_hex(bitmap.to_hex(), 10, restored));
    EXPECT_EQ(restored, bitmap);
    EXPECT_EQ(restored.count(), 2u);

    EXPECT_FALSE(ChunkBitmap::from_hex("01", 10, restored));   // wrong width
    EXPECT_FALSE(ChunkBitmap::from_hex("0g02", 10, restored));
}
