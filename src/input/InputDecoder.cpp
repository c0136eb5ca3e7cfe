#include "InputDecoder.h"
#include <algorithm>
#include <cstring>

const char* device_class_name(DeviceClass device_class) {
    switch (device_class) {
        case DeviceClass::BUTTONS: return "buttons";
        case DeviceClass::MULTITOUCH: return "multitouch";
        case DeviceClass::PEN: return "pen";
    }
    return "unknown";
}

int32_t AxisRange::scale(int value, uint32_t display_extent) const {
    if (maximum <= minimum || display_extent == 0) return value;
    int64_t offset = (int64_t)value - minimum;
    int64_t scaled = offset * display_extent / ((int64_t)maximum - minimum + 1);
    return (int32_t)std::clamp<int64_t>(scaled, 0, display_extent - 1);
}

MultitouchDecoder::MultitouchDecoder(AxisRange x_range, AxisRange y_range,
                                     uint32_t screen_width, uint32_t screen_height)
    : current_slot(0), x_range(x_range), y_range(y_range),
      screen_width(screen_width), screen_height(screen_height) {}

Point MultitouchDecoder::scaled(int x, int y) const {
    return Point(x_range.scale(x, screen_width), y_range.scale(y, screen_height));
}

std::vector<InputEvent> MultitouchDecoder::decode(const struct input_event& ev) {
    std::vector<InputEvent> out;

    if (ev.type == EV_SYN && ev.code == SYN_REPORT) {
        process_complete_touch_frame(out);
    }
    else if (ev.type == EV_ABS) {
        switch (ev.code) {
            case ABS_MT_SLOT:
                current_slot = ev.value < 0 ? 0 : (size_t)ev.value;
                break;
            case ABS_MT_TRACKING_ID:
                if (current_slot < touch_slots.size()) {
                    TouchSlot& ts = touch_slots[current_slot];
                    if (ev.value == ts.tracking_id) break;

                    // A new id without a -1 in between also ends the old contact
                    if (ts.tracking_id != -1) {
                        ts.last_tracking_id = ts.tracking_id;
                        ts.release_x = ts.x;
                        ts.release_y = ts.y;
                        ts.pending_release = true;
                    }
                    ts.tracking_id = ev.value;
                    ts.pending_touch = ev.value != -1;
                }
                break;
            case ABS_MT_POSITION_X:
                if (current_slot < touch_slots.size()) {
                    touch_slots[current_slot].x = ev.value;
                    touch_slots[current_slot].has_position = true;
                }
                break;
            case ABS_MT_POSITION_Y:
                if (current_slot < touch_slots.size()) {
                    touch_slots[current_slot].y = ev.value;
                    touch_slots[current_slot].has_position = true;
                }
                break;
        }
    }

    return out;
}

void MultitouchDecoder::process_complete_touch_frame(std::vector<InputEvent>& out) {
    for (auto& ts : touch_slots) {
        // Release first, so that a slot reused within one frame ends its
        // old contact before the new one starts
        if (ts.pending_release) {
            if (ts.active) {
                out.push_back(TouchEvent{TouchPhase::RELEASE, ts.last_tracking_id,
                                         scaled(ts.release_x, ts.release_y)});
            }
            ts.active = false;
            ts.pending_release = false;
            ts.has_position = false;
        }
        // Touch down; the kernel omits unchanged coordinates, so the last
        // known position stands in when none arrived
        if (ts.pending_touch) {
            ts.active = true;
            ts.pending_touch = false;
            ts.has_position = false;
            out.push_back(TouchEvent{TouchPhase::PRESS, ts.tracking_id, scaled(ts.x, ts.y)});
        }
        // Touch move
        else if (ts.active && ts.has_position) {
            out.push_back(TouchEvent{TouchPhase::MOVE, ts.tracking_id, scaled(ts.x, ts.y)});
            ts.has_position = false;
        }
    }
}

std::vector<InputEvent> ButtonDecoder::decode(const struct input_event& ev) {
    // Autorepeat (value 2) is dropped
    if (ev.type == EV_KEY && (ev.value == 0 || ev.value == 1)) {
        return { ButtonEvent{ev.code, ev.value == 1} };
    }
    return {};
}

PenDecoder::PenDecoder(AxisRange x_range, AxisRange y_range,
                       uint32_t screen_width, uint32_t screen_height)
    : x_range(x_range), y_range(y_range),
      screen_width(screen_width), screen_height(screen_height),
      x(0), y(0), pressure(0), touching(false), dirty(false) {}

std::vector<InputEvent> PenDecoder::decode(const struct input_event& ev) {
    if (ev.type == EV_ABS) {
        switch (ev.code) {
            case ABS_X: x = ev.value; dirty = true; break;
            case ABS_Y: y = ev.value; dirty = true; break;
            case ABS_PRESSURE: pressure = ev.value; dirty = true; break;
        }
    }
    else if (ev.type == EV_KEY && ev.code == BTN_TOUCH) {
        touching = ev.value != 0;
        dirty = true;
    }
    else if (ev.type == EV_SYN && ev.code == SYN_REPORT && dirty) {
        dirty = false;
        Point position(x_range.scale(x, screen_width), y_range.scale(y, screen_height));
        return { PenEvent{position, pressure, touching} };
    }
    return {};
}

namespace {

struct input_event make_event(uint16_t type, uint16_t code, int32_t value) {
    struct input_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.type = type;
    ev.code = code;
    ev.value = value;
    return ev;
}

}

std::vector<struct input_event> button_flood_events() {
    return {
        make_event(EV_SYN, SYN_CONFIG, 0),
        make_event(EV_SYN, SYN_REPORT, 1),
    };
}

std::vector<struct input_event> touch_flood_events() {
    return {
        make_event(EV_ABS, ABS_DISTANCE, 1),
        make_event(EV_SYN, SYN_REPORT, 1),
        make_event(EV_ABS, ABS_DISTANCE, 2),
        make_event(EV_SYN, SYN_REPORT, 1),
    };
}

std::vector<struct input_event> repeat_events(const std::vector<struct input_event>& events,
                                              size_t times) {
    std::vector<struct input_event> out;
    out.reserve(events.size() * times);
    for (size_t i = 0; i < times; i++) {
        out.insert(out.end(), events.begin(), events.end());
    }
    return out;
}
