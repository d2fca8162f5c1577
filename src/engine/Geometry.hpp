#pragma once

#include <cmath>

namespace emberfall {

/// 2D vector for positions, directions and collision sizes
struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vec2() = default;
    constexpr Vec2(float x, float y) : x(x), y(y) {}

    Vec2 operator+(const Vec2& other) const { return {x + other.x, y + other.y}; }
    Vec2 operator-(const Vec2& other) const { return {x - other.x, y - other.y}; }
    Vec2 operator*(float scalar) const { return {x * scalar, y * scalar}; }
    Vec2& operator+=(const Vec2& other) { x += other.x; y += other.y; return *this; }

    bool operator==(const Vec2& other) const = default;

    bool isZero() const { return x == 0.0f && y == 0.0f; }
    float length() const { return std::hypot(x, y); }
};

/// Integer cell of the map grid
struct TileCoord {
    int x = 0;
    int y = 0;

    bool operator==(const TileCoord& other) const = default;
};

/// Tile containing a map-space position (floors, so -0.5 lies in tile -1)
inline TileCoord toTile(Vec2 mapPosition) {
    return {static_cast<int>(std::floor(mapPosition.x)), static_cast<int>(std::floor(mapPosition.y))};
}

/// Axis-aligned rectangle: frame source regions and collision cores
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float x, float y, float w, float h)
        : x(x), y(y), width(w), height(h) {}

    /// Half-open: the right and bottom edges are outside
    bool contains(Vec2 point) const {
        return point.x >= x && point.x < x + width &&
               point.y >= y && point.y < y + height;
    }

    bool operator==(const Rect& other) const = default;
};

/// Integer pixel size of a frame, sprite or sheet
struct PixelSize {
    int width = 0;
    int height = 0;

    constexpr PixelSize() = default;
    constexpr PixelSize(int w, int h) : width(w), height(h) {}

    bool isEmpty() const { return width <= 0 || height <= 0; }

    /// Cell (column, row) of a sheet laid out in a grid of this size
    Rect cell(int column, int row) const {
        return Rect(static_cast<float>(column * width), static_cast<float>(row * height),
                    static_cast<float>(width), static_cast<float>(height));
    }

    bool operator==(const PixelSize& other) const = default;
};

} // namespace emberfall
