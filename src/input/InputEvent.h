#pragma once

#include "../core/Types.h"
#include "../gesture/TouchHistory.h"
#include <variant>

enum class DeviceClass {
    BUTTONS,
    MULTITOUCH,
    PEN
};

const char* device_class_name(DeviceClass device_class);

struct TouchEvent {
    TouchPhase phase;
    FingerId finger;
    Point position;
};

struct ButtonEvent {
    int code;
    bool pressed;
};

struct PenEvent {
    Point position;
    int pressure;
    bool touching;
};

// Decoded device event forwarded to the consumer thread
using InputEvent = std::variant<TouchEvent, ButtonEvent, PenEvent>;
