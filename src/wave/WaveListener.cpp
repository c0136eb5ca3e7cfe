#include "WaveListener.h"
#include "../gesture/Recognizers.h"

WaveListener::WaveListener(const Config& config)
    : zone(0, config.display_height - config.wave_zone_height,
           config.display_width, config.wave_zone_height),
      hysteresis(config.tap_hysteresis) {
    reset();
}

void WaveListener::reset() {
    recognizer = GestureRecognizer();

    float threshold = hysteresis;
    recognizer.add(recognize_starting_zone(zone, recognize_drag([threshold](const Vec2& delta) {
        return delta.y > threshold;
    })));
}

bool WaveListener::feed(const InputEvent& event) {
    const auto* touch = std::get_if<TouchEvent>(&event);
    if (!touch) return false;

    std::vector<FingerId> matched;
    switch (touch->phase) {
        case TouchPhase::PRESS:
            matched = recognizer.finger_press(touch->finger, touch->position);
            break;
        case TouchPhase::MOVE:
            matched = recognizer.finger_move(touch->finger, touch->position);
            break;
        case TouchPhase::RELEASE:
            matched = recognizer.finger_release(touch->finger, touch->position);
            break;
    }
    return !matched.empty();
}
