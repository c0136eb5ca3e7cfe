#pragma once

// State of one kernel multitouch slot between SYN_REPORT frames
struct TouchSlot {
    int tracking_id;
    int last_tracking_id;  // Id of the contact that is being released
    int x, y;
    int release_x, release_y;  // Last position of the contact being released
    bool active;
    bool has_position;
    bool pending_touch;
    bool pending_release;

    TouchSlot()
        : tracking_id(-1), last_tracking_id(-1), x(0), y(0), release_x(0), release_y(0), active(false),
          has_position(false), pending_touch(false), pending_release(false) {}
};
