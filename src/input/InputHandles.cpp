#include "InputHandles.h"
#include <iostream>

namespace {

std::string configured_path(const Config& config, DeviceClass device_class) {
    switch (device_class) {
        case DeviceClass::BUTTONS: return config.buttons_device;
        case DeviceClass::MULTITOUCH: return config.multitouch_device;
        case DeviceClass::PEN: return config.pen_device;
    }
    return "";
}

}

InputHandles InputHandles::start(const Config& config,
                                 std::initializer_list<DeviceClass> classes,
                                 InputForward forward) {
    InputHandles handles;

    for (DeviceClass device_class : classes) {
        std::string path = configured_path(config, device_class);
        if (path.empty()) {
            auto detected = InputDevice::autodetect(device_class);
            if (!detected) {
                std::cerr << "⚠️  No " << device_class_name(device_class)
                          << " device found, skipping" << std::endl;
                continue;
            }
            path = *detected;
        }

        auto device = std::make_unique<InputDevice>();
        if (!device->open(path)) {
            continue;
        }

        auto decoder = make_decoder(device_class, *device,
                                    config.display_width, config.display_height);
        auto flood = device_class == DeviceClass::BUTTONS ? button_flood_events()
                                                          : touch_flood_events();

        auto thread = std::make_unique<InputThread>(
            device_class, std::move(device), std::move(decoder),
            repeat_events(flood, config.input_buffer_size),
            forward, config.poll_timeout_ms);

        if (thread->start()) {
            handles.add(std::move(thread));
        }
    }

    return handles;
}

void InputHandles::add(std::unique_ptr<InputThread> thread) {
    threads.push_back(std::move(thread));
}

bool InputHandles::broadcast(InputCommand command) {
    bool delivered = true;
    for (auto& thread : threads) {
        delivered = thread->send(command) && delivered;
    }
    return delivered;
}

void InputHandles::join() {
    for (auto& thread : threads) {
        thread->join();
    }
    threads.clear();
}
