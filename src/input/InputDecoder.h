#pragma once

#include "InputEvent.h"
#include "TouchSlot.h"
#include <array>
#include <cstdint>
#include <memory>
#include <vector>
#include <linux/input.h>

// Raw axis range reported by EVIOCGABS
struct AxisRange {
    int minimum;
    int maximum;

    int32_t scale(int value, uint32_t display_extent) const;
};

// Turns raw evdev events into decoded input events. Stateful: one decoder
// per device, fed in kernel order.
class InputDecoder {
public:
    virtual ~InputDecoder() = default;
    virtual std::vector<InputEvent> decode(const struct input_event& ev) = 0;
};

class MultitouchDecoder : public InputDecoder {
private:
    std::array<TouchSlot, 10> touch_slots;
    size_t current_slot;
    AxisRange x_range, y_range;
    uint32_t screen_width, screen_height;

    void process_complete_touch_frame(std::vector<InputEvent>& out);
    Point scaled(int x, int y) const;

public:
    MultitouchDecoder(AxisRange x_range, AxisRange y_range,
                      uint32_t screen_width, uint32_t screen_height);

    std::vector<InputEvent> decode(const struct input_event& ev) override;
};

class ButtonDecoder : public InputDecoder {
public:
    std::vector<InputEvent> decode(const struct input_event& ev) override;
};

class PenDecoder : public InputDecoder {
private:
    AxisRange x_range, y_range;
    uint32_t screen_width, screen_height;
    int x, y, pressure;
    bool touching;
    bool dirty;

public:
    PenDecoder(AxisRange x_range, AxisRange y_range,
               uint32_t screen_width, uint32_t screen_height);

    std::vector<InputEvent> decode(const struct input_event& ev) override;
};

// Synthetic events written to a device to flush its queue
std::vector<struct input_event> button_flood_events();
std::vector<struct input_event> touch_flood_events();
std::vector<struct input_event> repeat_events(const std::vector<struct input_event>& events,
                                              size_t times);
