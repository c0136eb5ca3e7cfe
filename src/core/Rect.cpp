#include "Rect.h"
#include <algorithm>
#include <cmath>

float Vec2::magnitude() const {
    return std::sqrt(x * x + y * y);
}

bool DrawRect::contains(const Point& p) const {
    int64_t right = (int64_t)left + width;
    int64_t bottom = (int64_t)top + height;
    return p.x >= left && p.x < right &&
           p.y >= top && p.y < bottom;
}

uint32_t shrink_dimension(uint32_t dimension, int32_t amount) {
    int64_t result = (int64_t)dimension - amount;
    return (uint32_t)std::clamp<int64_t>(result, 0, UINT32_MAX);
}

DrawRect DrawRect::margin_top(int32_t margin) const {
    DrawRect r = *this;
    r.top = std::max(top + margin, 0);
    r.height = shrink_dimension(height, margin);
    return r;
}

DrawRect DrawRect::margin_left(int32_t margin) const {
    DrawRect r = *this;
    r.left = std::max(left + margin, 0);
    r.width = shrink_dimension(width, margin);
    return r;
}

DrawRect DrawRect::margin_right(int32_t margin) const {
    DrawRect r = *this;
    r.width = shrink_dimension(width, margin);
    return r;
}

DrawRect DrawRect::margin_bottom(int32_t margin) const {
    DrawRect r = *this;
    r.height = shrink_dimension(height, margin);
    return r;
}

DrawRect DrawRect::offset(int32_t dx, int32_t dy) const {
    DrawRect r = *this;
    r.left += dx;
    r.top += dy;
    return r;
}

DrawRect DrawRect::offset_fraction(float fx, float fy) const {
    return offset((int32_t)(width * fx), (int32_t)(height * fy));
}

std::ostream& operator<<(std::ostream& os, const DrawRect& rect) {
    return os << "[" << rect.left << "," << rect.top << " "
              << rect.width << "x" << rect.height << "]";
}
