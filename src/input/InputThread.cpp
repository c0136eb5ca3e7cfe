#include "InputThread.h"
#include <iostream>
#include <stdexcept>
#include <poll.h>
#include <cerrno>
#include <cstring>

InputThread::InputThread(DeviceClass device_class,
                         std::unique_ptr<InputDevice> device,
                         std::unique_ptr<InputDecoder> decoder,
                         std::vector<struct input_event> flood_events,
                         InputForward forward,
                         int poll_timeout_ms)
    : device_class(device_class), device(std::move(device)), decoder(std::move(decoder)),
      flood_events(std::move(flood_events)), forward(std::move(forward)),
      poll_timeout_ms(poll_timeout_ms) {}

InputThread::~InputThread() {
    if (thread.joinable()) {
        commands.push(InputCommand::STOP);
        thread.join();
    }
}

bool InputThread::start() {
    if (!device || !device->is_open() || !decoder) {
        std::cerr << "❌ No device for " << device_class_name(device_class) << " input" << std::endl;
        return false;
    }
    if (running.exchange(true)) return false;

    thread = std::thread(&InputThread::run, this);
    std::cout << "▶ Input thread started: " << device_class_name(device_class)
              << " (" << device->get_path() << ")" << std::endl;
    return true;
}

bool InputThread::send(InputCommand command) {
    if (!running.load()) {
        std::cerr << "⚠️  " << device_class_name(device_class)
                  << " input thread stopped, command ignored" << std::endl;
        return false;
    }
    if (!commands.push(command)) {
        std::cerr << "⚠️  " << device_class_name(device_class)
                  << " command queue full, command dropped" << std::endl;
        return false;
    }
    return true;
}

void InputThread::join() {
    if (!thread.joinable()) {
        throw std::runtime_error(std::string("Input thread not joinable: ") +
                                 device_class_name(device_class));
    }
    thread.join();
}

bool InputThread::handle_command(InputCommand command) {
    switch (command) {
        case InputCommand::STOP:
            return false;
        case InputCommand::GRAB:
            if (device->grab(true)) {
                std::cout << "Grabbed " << device_class_name(device_class) << " input" << std::endl;
            }
            break;
        case InputCommand::UNGRAB:
            if (device->grab(false)) {
                std::cout << "Ungrabbed " << device_class_name(device_class) << " input" << std::endl;
            }
            break;
        case InputCommand::CLEAR_BUFFER:
            if (flood_events.empty()) {
                std::cout << "No flood events for " << device_class_name(device_class)
                          << ", skipping" << std::endl;
            } else if (device->write_events(flood_events)) {
                std::cout << "Cleared " << device_class_name(device_class) << " buffer" << std::endl;
            }
            break;
    }
    return true;
}

void InputThread::run() {
    struct pollfd pfd;
    pfd.fd = device->get_fd();
    pfd.events = POLLIN | POLLPRI;

    bool active = true;
    while (active) {
        InputCommand command;
        while (active && commands.pop(command)) {
            active = handle_command(command);
        }
        if (!active) break;

        int ready = poll(&pfd, 1, poll_timeout_ms);
        if (ready < 0) {
            if (errno != EINTR) {
                std::cerr << "⚠️  poll failed: " << strerror(errno) << std::endl;
            }
            continue;
        }
        if (ready == 0) continue;

        if (pfd.revents & (POLLIN | POLLPRI)) {
            for (const auto& raw : device->read_events()) {
                for (const auto& event : decoder->decode(raw)) {
                    if (!forward(event)) {
                        std::cerr << "⚠️  Failed to forward " << device_class_name(device_class)
                                  << " event" << std::endl;
                    }
                }
            }
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            std::cerr << "❌ " << device_class_name(device_class) << " device lost ("
                      << device->get_path() << ")" << std::endl;
            break;
        }
    }

    running.store(false);
    device->close();
    std::cout << "■ Input thread done: " << device_class_name(device_class) << std::endl;
}
