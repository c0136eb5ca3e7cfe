#pragma once

#include "../core/Config.h"
#include "../core/Rect.h"
#include <cstdint>

// Panel geometry derived from the display size
struct TrayMetrics {
    static constexpr int ROWS = 2;
    static constexpr int COLUMNS = 7;
    static constexpr float FONT_SIZE = 42.0f;

    int32_t display_width;
    int32_t display_height;

    int32_t icon_size;
    int32_t icon_spacing;
    int32_t row_width;
    int32_t row_height;
    int32_t row_margin;
    int32_t panel_height;

    float tap_hysteresis;
    int kill_sleep_ms;

    DrawRect display_rect() const {
        return DrawRect(0, 0, display_width, display_height);
    }

    // Bottom strip holding the draft rows
    DrawRect panel_rect() const {
        return DrawRect(0, display_height - panel_height, display_width, panel_height);
    }

    static TrayMetrics from_config(const Config& config) {
        TrayMetrics m;
        m.display_width = config.display_width;
        m.display_height = config.display_height;
        m.icon_size = (config.display_height / 4) / 3;
        m.icon_spacing = m.icon_size / 4;
        m.row_width = m.icon_size * COLUMNS + m.icon_spacing * (COLUMNS - 1);
        m.row_height = m.icon_size + (int32_t)FONT_SIZE * 2;
        m.row_margin = (config.display_width - m.row_width) / 2;
        m.panel_height = m.row_height * ROWS;
        m.tap_hysteresis = config.tap_hysteresis;
        m.kill_sleep_ms = config.kill_sleep_ms;
        return m;
    }
};
