#pragma once

#include <cstdint>
#include <map>
#include <vector>

// Color struct
struct Color {
    float r, g, b, a;

    Color(float r = 1.0f, float g = 1.0f, float b = 1.0f, float a = 1.0f)
        : r(r), g(g), b(b), a(a) {}

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
};

inline const Color COLOR_BLACK(0.0f, 0.0f, 0.0f, 1.0f);
inline const Color COLOR_WHITE(1.0f, 1.0f, 1.0f, 1.0f);

// Display pixel position
struct Point {
    int32_t x, y;

    Point(int32_t x = 0, int32_t y = 0) : x(x), y(y) {}

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

// Fractional position / displacement
struct Vec2 {
    float x, y;

    Vec2(float x = 0.0f, float y = 0.0f) : x(x), y(y) {}

    float magnitude() const;
};

// Decoded RGB8 image, rows packed top to bottom
struct Image {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> rgb;
};

// Font glyph rasterized into an 8-bit coverage bitmap
struct Glyph {
    std::vector<uint8_t> bitmap;
    int width, height;
    int bearing_x, bearing_y;
    int advance;
};

// Font metrics for proper text positioning
struct FontMetrics {
    int ascender;   // Max height above baseline
    int descender;  // Max depth below baseline (negative)
    int line_height;
};

// Font cache key
struct FontCacheKey {
    int size;

    bool operator<(const FontCacheKey& other) const {
        return size < other.size;
    }
};

// EPDC waveform modes (mxcfb numbering)
enum class WaveformMode : uint32_t {
    INIT = 0,
    DU = 1,
    GC16 = 2,
    GC16_FAST = 3,
    A2 = 4,
    GL16 = 5,
    AUTO = 257
};

enum class DisplayTemp : int32_t {
    AMBIENT = 0x1000,
    REMARKABLE_DRAW = 0x0018
};

enum class DitherMode : uint32_t {
    PASSTHROUGH = 0x0,
    FLOYD_STEINBERG = 0x1,
    ATKINSON = 0x2,
    ORDERED = 0x3
};

// Hardware update profile for a refresh
struct RefreshProfile {
    WaveformMode waveform = WaveformMode::GC16_FAST;
    DisplayTemp temperature = DisplayTemp::REMARKABLE_DRAW;
    DitherMode dither = DitherMode::PASSTHROUGH;
    int quant_bit = 0;
    bool wait = false;          // Block until the update completed
    bool force_full = false;
};
