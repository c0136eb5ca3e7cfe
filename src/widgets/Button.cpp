#include "Button.h"
#include "Label.h"
#include "Layout.h"
#include "TrayPanel.h"
#include "../gesture/Recognizers.h"
#include <chrono>
#include <iostream>
#include <thread>

void dismiss_tray(const MainSender& events, const std::optional<DraftProgram>& draft) {
    post(events, StopInput{});
    if (draft) {
        post(events, Run{*draft});
    }
    post(events, StopRenderer{});
    post(events, Exit{});
}

Draw draft_program(const TrayContext& tray, const DraftProgram& draft,
                   std::shared_ptr<const Image> icon) {
    const TrayMetrics& m = tray.metrics;

    Recognizer launch = recognize_tap(m.tap_hysteresis, [tray, draft](const Point&) {
        std::cout << "Sending run / exit events for " << draft.name << std::endl;
        dismiss_tray(tray.events, draft);
    });

    Draw tile = set_height(m.icon_size)
        .then(recognize_gesture(launch))
        .then(margin(-1))
        .then(rect_stroke(2, COLOR_BLACK))
        .overlay(draft_icon(m, icon))
        .overlay(close_button(tray, draft));

    Draw caption = margin_top(m.icon_size + m.icon_spacing)
        .then(offset_relative(m.icon_size / 2, 0))
        .then(vertical_fixed((int32_t)TrayMetrics::FONT_SIZE - 8,
                             words_aligned(draft.name, TrayMetrics::FONT_SIZE, Vec2(0.5f, 0.0f))));

    return set_width(m.icon_size).overlay(tile).overlay(caption);
}

Draw close_button(const TrayContext& tray, const DraftProgram& draft) {
    return deferred([tray, draft](const DrawRect&) {
        if (!tray.drafts.find_process(draft)) return unit();

        Recognizer terminate_tree = recognize_tap(tray.metrics.tap_hysteresis, [tray, draft](const Point&) {
            auto process = tray.drafts.find_process(draft);
            if (!process) return;

            tray.drafts.get_supervisor().terminate(process->pid);
            std::this_thread::sleep_for(std::chrono::milliseconds(tray.metrics.kill_sleep_ms));
            post(tray.events, Redraw{});
        });

        int32_t inset = tray.metrics.icon_size - 32;
        return margin_left(inset)
            .then(margin_bottom(inset))
            .then(recognize_gesture(terminate_tree))
            .then(rect_border(2, COLOR_WHITE, COLOR_BLACK))
            .then(offset_absolute(0.5f, 0.5f))
            .overlay(line(Point(-10, -10), Point(10, 10), 3, COLOR_BLACK))
            .overlay(line(Point(10, -10), Point(-10, 10), 3, COLOR_BLACK));
    });
}
