#include "Recognizers.h"

Recognizer recognize_starting_zone(const DrawRect& zone, Recognizer inner) {
    return [zone, inner = std::move(inner)](const TouchHistory& history) {
        if (history.empty()) return false;
        if (!zone.contains(history.front().position)) return false;
        return inner(history);
    };
}

Recognizer recognize_tap(float hysteresis, PositionCallback callback) {
    return [hysteresis, callback = std::move(callback)](const TouchHistory& history) {
        if (history.size() < 2) return false;
        if (history.front().phase != TouchPhase::PRESS) return false;
        if (history.back().phase != TouchPhase::RELEASE) return false;

        auto delta = history.displacement();
        if (!delta || delta->magnitude() >= hysteresis) return false;

        callback(history.back().position);
        return true;
    };
}

Recognizer recognize_press(PositionCallback callback) {
    return [callback = std::move(callback)](const TouchHistory& history) {
        if (history.size() != 1 || history.front().phase != TouchPhase::PRESS) return false;

        callback(history.front().position);
        return true;
    };
}

Recognizer recognize_release(PositionCallback callback) {
    return [callback = std::move(callback)](const TouchHistory& history) {
        if (history.empty() || history.back().phase != TouchPhase::RELEASE) return false;

        callback(history.back().position);
        return true;
    };
}

Recognizer recognize_drag(DragCallback callback) {
    return [callback = std::move(callback)](const TouchHistory& history) {
        auto delta = history.displacement();
        if (!delta) return false;
        return callback(*delta);
    };
}
