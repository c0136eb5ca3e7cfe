#include "MainLoop.h"
#include "../widgets/Layout.h"
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <utility>

MainLoop::MainLoop(Receiver<MainEvent> events,
                   InputHandles input_handles,
                   std::unique_ptr<RenderThread> render_thread,
                   Sender<RenderEvent> render_tx,
                   DraftPrograms& drafts,
                   std::vector<DraftProgram> stopped_drafts,
                   const Config& config)
    : events(std::move(events)), input_handles(std::move(input_handles)),
      render_thread(std::move(render_thread)), render_tx(std::move(render_tx)),
      drafts(drafts), stopped_drafts(std::move(stopped_drafts)), config(config),
      metrics(TrayMetrics::from_config(config)) {}

void MainLoop::execute(const Draw& plan, bool publish_recognizer) {
    if (renderer_stopped) {
        std::cout << "⚠️  Renderer stopped, draw request dropped" << std::endl;
        return;
    }
    if (!render_tx.send(Execute{plan, publish_recognizer})) {
        throw std::runtime_error("Render thread disconnected");
    }
}

std::optional<std::vector<uint8_t>> MainLoop::read_screenshot(const std::string& name) const {
    std::ifstream file(config.screenshot_path(name), std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                std::istreambuf_iterator<char>());
}

void MainLoop::run() {
    std::cout << "Entering event loop..." << std::endl;

    while (true) {
        auto event = events.recv();
        if (!event) {
            throw std::runtime_error("Event channel disconnected");
        }
        if (!handle(*event)) break;
    }
}

bool MainLoop::handle(MainEvent& event) {
    if (auto* e = std::get_if<LoadIcon>(&event)) {
        drafts.set_icon(e->name, std::move(e->icon));
    } else if (auto* e = std::get_if<SetGestureRecognizer>(&event)) {
        // Last drawn is topmost, so it gets first pick
        gesture_recognizer = std::move(e->recognizer);
        if (gesture_recognizer) gesture_recognizer->reverse_priority();
    } else if (auto* e = std::get_if<SetDraw>(&event)) {
        draw = std::move(e->draw);
        if (draw) execute(*draw, true);
    } else if (std::holds_alternative<Redraw>(event)) {
        if (draw) execute(*draw, true);
    } else if (auto* e = std::get_if<InputReceived>(&event)) {
        on_input(e->input);
    } else if (auto* e = std::get_if<Run>(&event)) {
        on_run(e->draft);
    } else if (std::holds_alternative<StopInput>(event)) {
        on_stop_input();
    } else if (std::holds_alternative<StopRenderer>(event)) {
        on_stop_renderer();
    } else if (std::holds_alternative<Exit>(event)) {
        std::cout << "tray exiting" << std::endl;
        return false;
    }
    return true;
}

void MainLoop::on_input(const InputEvent& input) {
    const auto* touch = std::get_if<TouchEvent>(&input);
    if (!touch || !gesture_recognizer) return;

    switch (touch->phase) {
        case TouchPhase::PRESS:
            gesture_recognizer->finger_press(touch->finger, touch->position);
            break;
        case TouchPhase::MOVE:
            gesture_recognizer->finger_move(touch->finger, touch->position);
            break;
        case TouchPhase::RELEASE:
            gesture_recognizer->finger_release(touch->finger, touch->position);
            break;
    }
}

void MainLoop::on_run(const DraftProgram& draft) {
    if (drafts.run_draft_program(draft) != RunType::CONTINUE) return;

    Draw clear_display = clear().then(full_refresh());

    if (!stopped_drafts.empty() && stopped_drafts.front().call == draft.call) {
        std::cout << "No application switch, restoring partial framebuffer..." << std::endl;
        if (auto panel = read_screenshot(PANEL_SCREENSHOT)) {
            execute(set_rect(metrics.panel_rect())
                        .then(restore_region(std::move(*panel)))
                        .then(partial_refresh()),
                    false);
        } else {
            std::cout << "⚠️  No panel screenshot for continued draft, clearing framebuffer..." << std::endl;
            execute(clear_display, false);
        }
        return;
    }

    std::cout << "Application switched, restoring full framebuffer..." << std::endl;
    if (auto full = read_screenshot(draft.file_name())) {
        execute(set_rect(metrics.display_rect())
                    .then(restore_region(std::move(*full)))
                    .then(full_refresh()),
                false);
    } else {
        std::cout << "⚠️  No full screenshot for continued draft, clearing framebuffer..." << std::endl;
        execute(clear_display, false);
    }
}

void MainLoop::on_stop_input() {
    std::cout << "Stopping input" << std::endl;

    const std::pair<InputCommand, const char*> steps[] = {
        {InputCommand::UNGRAB, "Ungrabbing input devices"},
        {InputCommand::CLEAR_BUFFER, "Clearing event queues"},
        {InputCommand::STOP, "Stopping input threads"},
    };
    for (const auto& [command, message] : steps) {
        std::cout << message << std::endl;
        if (!input_handles.broadcast(command)) {
            std::cerr << "⚠️  " << message << ": not every device thread accepted" << std::endl;
        }
    }

    input_handles.join();
    std::cout << "■ Input stopped" << std::endl;
}

void MainLoop::on_stop_renderer() {
    std::cout << "Stopping renderer" << std::endl;
    if (!render_thread) {
        throw std::runtime_error("Render thread already stopped");
    }
    if (!render_tx.send(RenderExit{})) {
        throw std::runtime_error("Render thread disconnected");
    }
    render_thread->join();
    render_thread.reset();
    renderer_stopped = true;
    std::cout << "■ Renderer stopped" << std::endl;
}
