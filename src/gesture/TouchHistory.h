#pragma once

#include "../core/Types.h"
#include <cstdint>
#include <optional>
#include <vector>

using FingerId = int32_t;

enum class TouchPhase {
    PRESS,
    MOVE,
    RELEASE
};

struct TouchSample {
    TouchPhase phase;
    Point position;
};

// Samples of one finger from press to release, in arrival order
class TouchHistory {
public:
    TouchHistory() = default;
    TouchHistory(std::initializer_list<TouchSample> samples) : samples(samples) {}

    void push(TouchPhase phase, const Point& position) {
        samples.push_back({phase, position});
    }

    size_t size() const { return samples.size(); }
    bool empty() const { return samples.empty(); }

    const TouchSample& front() const { return samples.front(); }
    const TouchSample& back() const { return samples.back(); }
    const TouchSample& operator[](size_t i) const { return samples[i]; }

    // First position minus latest position
    std::optional<Vec2> displacement() const {
        if (samples.empty()) return std::nullopt;
        const Point& first = samples.front().position;
        const Point& last = samples.back().position;
        return Vec2((float)(first.x - last.x), (float)(first.y - last.y));
    }

private:
    std::vector<TouchSample> samples;
};
