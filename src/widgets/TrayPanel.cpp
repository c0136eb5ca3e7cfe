#include "TrayPanel.h"
#include "Layout.h"
#include "../gesture/Recognizers.h"
#include <algorithm>
#include <iostream>

Draw tray(const TrayContext& tray) {
    const TrayMetrics& m = tray.metrics;

    Recognizer dismiss = recognize_press([tray](const Point&) {
        std::cout << "Tapped, exiting" << std::endl;
        dismiss_tray(tray.events, tray.stopped_draft);
    });

    return unit()
        .overlay(margin_bottom(m.panel_height).then(recognize_gesture(dismiss)))
        .overlay(margin_top(m.display_height - m.panel_height).then(drafts_panel(tray)));
}

Draw drafts_panel(const TrayContext& tray) {
    const TrayMetrics& m = tray.metrics;

    Recognizer swipe = recognize_drag([tray](const Vec2& delta) {
        if (delta.y >= -tray.metrics.tap_hysteresis) return false;

        std::cout << "Swiped, exiting" << std::endl;
        dismiss_tray(tray.events, tray.stopped_draft);
        return true;
    });

    return recognize_gesture(swipe)
        .then(rect_border(2, COLOR_WHITE, COLOR_BLACK))
        .then(margin_horizontal(m.row_margin))
        .then(margin_top(m.row_margin))
        .then(draft_icons(tray))
        .then(set_rect(m.panel_rect()))
        .then(partial_refresh());
}

Draw draft_icons(const TrayContext& tray) {
    return deferred([tray](const DrawRect&) {
        IconMap icons = tray.drafts.get_icons();

        std::vector<Draw> tiles;
        for (const auto& [name, draft] : tray.drafts.get_drafts()) {
            auto icon = icons.find(name);
            tiles.push_back(draft_program(tray, draft,
                                          icon != icons.end() ? icon->second : nullptr));
        }

        Draw rows = unit();
        for (size_t first = 0, row = 0; first < tiles.size(); first += TrayMetrics::COLUMNS, row++) {
            size_t last = std::min(first + TrayMetrics::COLUMNS, tiles.size());
            std::vector<Draw> cells(tiles.begin() + first, tiles.begin() + last);

            rows = rows.then(overlay(
                offset_relative(0, tray.metrics.row_height * (int32_t)row)
                    .then(horizontal(tray.metrics.icon_spacing, std::move(cells)))));
        }
        return rows;
    });
}

Draw draft_icon(const TrayMetrics& metrics, std::shared_ptr<const Image> icon) {
    if (!icon) return spinner(16, 4, COLOR_BLACK);

    return offset_relative((metrics.icon_size - (int32_t)icon->width) / 2,
                           (metrics.icon_size - (int32_t)icon->height) / 2)
        .then(image(std::move(icon)));
}

Draw spinner(int32_t offset, uint32_t radius, const Color& color) {
    return offset_absolute(0.5f, 0.5f)
        .overlay(offset_relative(-offset, 0).then(circle_fill(radius, color)))
        .overlay(circle_fill(radius, color))
        .overlay(offset_relative(offset, 0).then(circle_fill(radius, color)));
}
