#pragma once

#include "InputDecoder.h"
#include "InputDevice.h"
#include "InputEvent.h"
#include <boost/lockfree/spsc_queue.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

enum class InputCommand {
    STOP,
    GRAB,
    UNGRAB,
    CLEAR_BUFFER
};

// Delivers a decoded event; false when the receiving side is gone
using InputForward = std::function<bool(const InputEvent&)>;

// One capture thread per device. Polls the device with a bounded timeout
// and services its command queue between waits.
class InputThread {
private:
    static constexpr size_t COMMAND_QUEUE_SIZE = 64;

    DeviceClass device_class;
    std::unique_ptr<InputDevice> device;
    std::unique_ptr<InputDecoder> decoder;
    std::vector<struct input_event> flood_events;
    InputForward forward;
    int poll_timeout_ms;

    boost::lockfree::spsc_queue<InputCommand, boost::lockfree::capacity<COMMAND_QUEUE_SIZE>> commands;
    std::atomic<bool> running{false};
    std::thread thread;

    void run();
    bool handle_command(InputCommand command);

public:
    InputThread(DeviceClass device_class,
                std::unique_ptr<InputDevice> device,
                std::unique_ptr<InputDecoder> decoder,
                std::vector<struct input_event> flood_events,
                InputForward forward,
                int poll_timeout_ms);
    ~InputThread();

    InputThread(const InputThread&) = delete;
    InputThread& operator=(const InputThread&) = delete;

    bool start();

    // Queues a command; logged and ignored once the thread stopped
    bool send(InputCommand command);

    // Throws std::runtime_error if the thread cannot be joined
    void join();

    bool is_running() const { return running.load(); }
    DeviceClass get_device_class() const { return device_class; }
};
