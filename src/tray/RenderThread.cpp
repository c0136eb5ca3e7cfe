#include "RenderThread.h"
#include <iostream>
#include <stdexcept>

RenderThread::RenderThread(SurfaceFactory surface_factory, Receiver<RenderEvent> commands,
                           MainSender events)
    : surface_factory(std::move(surface_factory)), commands(std::move(commands)),
      events(std::move(events)) {}

RenderThread::~RenderThread() {
    if (thread.joinable()) {
        thread.join();
    }
}

bool RenderThread::start() {
    if (thread.joinable()) return false;
    thread = std::thread(&RenderThread::run, this);
    return true;
}

void RenderThread::join() {
    if (!thread.joinable()) {
        throw std::runtime_error("Render thread not joinable");
    }
    thread.join();
}

void RenderThread::run() {
    // Dropped on return so that senders observe the disconnect
    Receiver<RenderEvent> rx = std::move(commands);

    std::unique_ptr<Surface> surface = surface_factory();
    if (!surface) {
        std::cerr << "❌ Render surface unavailable, render thread exiting" << std::endl;
        return;
    }
    std::cout << "▶ Render thread started (" << surface->get_width() << "x"
              << surface->get_height() << ")" << std::endl;

    while (auto event = rx.recv()) {
        if (std::holds_alternative<RenderExit>(*event)) break;

        const auto& execute = std::get<Execute>(*event);
        GestureRecognizer recognizer = render(execute.draw, *surface, surface->bounds());

        if (execute.publish_recognizer &&
            !events.send(SetGestureRecognizer{std::move(recognizer)})) {
            std::cerr << "⚠️  Orchestrator gone, recognizer dropped" << std::endl;
        }
    }

    std::cout << "■ Render thread done" << std::endl;
}
