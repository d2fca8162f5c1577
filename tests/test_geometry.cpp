#include <gtest/gtest.h>

#include "engine/Geometry.hpp"

using namespace emberfall;

// =============================================================================
// Vec2
// =============================================================================

TEST(Vec2Test, Arithmetic) {
    Vec2 a(3.0f, 4.0f);
    Vec2 b(1.0f, -2.0f);

    EXPECT_EQ(a + b, Vec2(4.0f, 2.0f));
    EXPECT_EQ(a - b, Vec2(2.0f, 6.0f));
    EXPECT_EQ(b * 3.0f, Vec2(3.0f, -6.0f));

    a += b;
    EXPECT_EQ(a, Vec2(4.0f, 2.0f));
    EXPECT_NE(a, b);
}

TEST(Vec2Test, Length) {
    EXPECT_FLOAT_EQ(Vec2(3.0f, 4.0f).length(), 5.0f);
    EXPECT_FLOAT_EQ(Vec2().length(), 0.0f);
}

TEST(Vec2Test, IsZero) {
    EXPECT_TRUE(Vec2().isZero());
    EXPECT_FALSE(Vec2(0.0f, -1.0f).isZero());
}

// =============================================================================
// Tiles, Rect and PixelSize
// =============================================================================

TEST(RectTest, ContainsIsHalfOpen) {
    Rect rect(0.0f, 0.0f, 64.0f, 64.0f);
    EXPECT_TRUE(rect.contains(Vec2(0.0f, 0.0f)));
    EXPECT_TRUE(rect.contains(Vec2(63.9f, 63.9f)));
    EXPECT_FALSE(rect.contains(Vec2(64.0f, 10.0f)));
    EXPECT_FALSE(rect.contains(Vec2(-0.1f, 10.0f)));
}

TEST(TileCoordTest, FloorsMapPosition) {
    EXPECT_EQ(toTile(Vec2(2.9f, 0.0f)), (TileCoord{2, 0}));
    EXPECT_EQ(toTile(Vec2(-0.5f, 3.0f)), (TileCoord{-1, 3}));
    EXPECT_EQ(toTile(Vec2(-1.0f, -1.0f)), (TileCoord{-1, -1}));
}

TEST(PixelSizeTest, GridCell) {
    PixelSize frame(64, 32);
    EXPECT_EQ(frame.cell(0, 0), Rect(0.0f, 0.0f, 64.0f, 32.0f));
    EXPECT_EQ(frame.cell(3, 2), Rect(192.0f, 64.0f, 64.0f, 32.0f));
}

TEST(PixelSizeTest, Empty) {
    EXPECT_TRUE(PixelSize().isEmpty());
    EXPECT_TRUE(PixelSize(64, 0).isEmpty());
    EXPECT_FALSE(PixelSize(64, 64).isEmpty());
    EXPECT_EQ(PixelSize(64, 64), PixelSize(64, 64));
    EXPECT_NE(PixelSize(64, 64), PixelSize(64, 32));
}
