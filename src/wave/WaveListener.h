#pragma once

#include "../core/Config.h"
#include "../core/Rect.h"
#include "../gesture/GestureRecognizer.h"
#include "../input/InputEvent.h"

// Watches for an upward swipe starting in the bottom strip of the display
class WaveListener {
private:
    DrawRect zone;
    float hysteresis;
    GestureRecognizer recognizer;

public:
    explicit WaveListener(const Config& config);

    // True once a swipe completed with this event
    bool feed(const InputEvent& event);

    // Forgets every tracked finger
    void reset();

    const DrawRect& get_zone() const { return zone; }
};
