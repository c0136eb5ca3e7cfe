#pragma once

#include "MainEvent.h"
#include "../core/Surface.h"
#include <functional>
#include <memory>
#include <thread>

// Creates the surface on the render thread; nullptr if it failed
using SurfaceFactory = std::function<std::unique_ptr<Surface>()>;

// Owns the drawing surface. Evaluates plans against the whole display and
// ships the recognizers they build back to the orchestrator.
class RenderThread {
private:
    SurfaceFactory surface_factory;
    Receiver<RenderEvent> commands;
    MainSender events;
    std::thread thread;

    void run();

public:
    RenderThread(SurfaceFactory surface_factory, Receiver<RenderEvent> commands, MainSender events);
    ~RenderThread();

    RenderThread(const RenderThread&) = delete;
    RenderThread& operator=(const RenderThread&) = delete;

    bool start();

    // Throws std::runtime_error if the thread cannot be joined
    void join();

    bool joinable() const { return thread.joinable(); }
};
