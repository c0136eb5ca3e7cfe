#pragma once

#include "GestureRecognizer.h"
#include "../core/Rect.h"
#include <functional>

using PositionCallback = std::function<void(const Point&)>;
using DragCallback = std::function<bool(const Vec2&)>;

// Default movement tolerance in pixels separating a tap from a drag
constexpr float TAP_HYSTERESIS = 32.0f;

// Passes the history on to inner only if its first sample lies inside zone
Recognizer recognize_starting_zone(const DrawRect& zone, Recognizer inner);

// Press followed by release without moving hysteresis pixels or more
Recognizer recognize_tap(float hysteresis, PositionCallback callback);

// History consisting of exactly one press
Recognizer recognize_press(PositionCallback callback);

// Latest sample is a release
Recognizer recognize_release(PositionCallback callback);

// Called with first minus latest position on every sample; callback
// returns true to complete the gesture
Recognizer recognize_drag(DragCallback callback);
