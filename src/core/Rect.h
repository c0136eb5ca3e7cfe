#pragma once

#include "Types.h"
#include <cstdint>
#include <ostream>

// Draw cursor. Width and height never go below zero.
struct DrawRect {
    int32_t left, top;
    uint32_t width, height;

    DrawRect() : left(0), top(0), width(0), height(0) {}
    DrawRect(int32_t left, int32_t top, uint32_t width, uint32_t height)
        : left(left), top(top), width(width), height(height) {}

    Point position() const { return Point(left, top); }
    bool empty() const { return width == 0 || height == 0; }

    // Half-open containment: [left, left + width) x [top, top + height)
    bool contains(const Point& p) const;

    bool operator==(const DrawRect& other) const {
        return left == other.left && top == other.top &&
               width == other.width && height == other.height;
    }
    bool operator!=(const DrawRect& other) const { return !(*this == other); }

    // Cursor operations
    DrawRect margin_top(int32_t margin) const;
    DrawRect margin_left(int32_t margin) const;
    DrawRect margin_right(int32_t margin) const;
    DrawRect margin_bottom(int32_t margin) const;
    DrawRect offset(int32_t dx, int32_t dy) const;
    DrawRect offset_fraction(float fx, float fy) const;
};

// Shrink a dimension by a signed amount, clamping at zero
uint32_t shrink_dimension(uint32_t dimension, int32_t amount);

std::ostream& operator<<(std::ostream& os, const DrawRect& rect);
