#pragma once

#include "InputThread.h"
#include "../core/Config.h"
#include <initializer_list>
#include <memory>
#include <vector>

// The set of running device threads, driven by the orchestrator
class InputHandles {
private:
    std::vector<std::unique_ptr<InputThread>> threads;

public:
    InputHandles() = default;
    InputHandles(InputHandles&&) = default;
    InputHandles& operator=(InputHandles&&) = default;

    // Opens and starts one thread per requested class. A class whose
    // device is missing is skipped with a warning.
    static InputHandles start(const Config& config,
                              std::initializer_list<DeviceClass> classes,
                              InputForward forward);

    void add(std::unique_ptr<InputThread> thread);

    // Sends to every thread; false if any of them rejected the command
    bool broadcast(InputCommand command);

    // Throws std::runtime_error if a thread cannot be joined
    void join();

    size_t size() const { return threads.size(); }
    bool empty() const { return threads.empty(); }
};
