#pragma once

#include "DraftPrograms.h"
#include "MainEvent.h"
#include "RenderThread.h"
#include "TrayMetrics.h"
#include "../core/Config.h"
#include "../input/InputHandles.h"
#include <memory>
#include <optional>
#include <vector>

// Single-threaded orchestrator. Owns the active recognizer, the active draw
// plan and the device threads; consumes its channel one event at a time.
class MainLoop {
private:
    Receiver<MainEvent> events;
    InputHandles input_handles;
    std::unique_ptr<RenderThread> render_thread;
    Sender<RenderEvent> render_tx;
    bool renderer_stopped = false;

    DraftPrograms& drafts;
    std::vector<DraftProgram> stopped_drafts;
    Config config;
    TrayMetrics metrics;

    std::optional<GestureRecognizer> gesture_recognizer;
    std::optional<Draw> draw;

    void execute(const Draw& plan, bool publish_recognizer);
    std::optional<std::vector<uint8_t>> read_screenshot(const std::string& name) const;

    // False once Exit was handled
    bool handle(MainEvent& event);

    void on_input(const InputEvent& input);
    void on_run(const DraftProgram& draft);
    void on_stop_input();
    void on_stop_renderer();

public:
    MainLoop(Receiver<MainEvent> events,
             InputHandles input_handles,
             std::unique_ptr<RenderThread> render_thread,
             Sender<RenderEvent> render_tx,
             DraftPrograms& drafts,
             std::vector<DraftProgram> stopped_drafts,
             const Config& config);

    // Returns after Exit. Throws std::runtime_error if a channel
    // disconnects or a worker cannot be joined.
    void run();

    bool has_gesture_recognizer() const { return gesture_recognizer.has_value(); }
};
