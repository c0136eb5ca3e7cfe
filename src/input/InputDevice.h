#pragma once

#include "InputDecoder.h"
#include "InputEvent.h"
#include <optional>
#include <string>
#include <vector>
#include <linux/input.h>

// Owned evdev file descriptor
class InputDevice {
private:
    int fd;
    std::string path;

public:
    InputDevice();
    InputDevice(int fd, const std::string& path);
    ~InputDevice();

    InputDevice(const InputDevice&) = delete;
    InputDevice& operator=(const InputDevice&) = delete;

    // Scans /dev/input/event* for the first device of the given class
    static std::optional<std::string> autodetect(DeviceClass device_class);

    bool open(const std::string& device_path);
    void close();

    int get_fd() const { return fd; }
    const std::string& get_path() const { return path; }
    bool is_open() const { return fd >= 0; }

    bool grab(bool exclusive);
    std::optional<AxisRange> abs_range(int code) const;

    // Drains pending events without blocking
    std::vector<struct input_event> read_events();
    bool write_events(const std::vector<struct input_event>& events);
};

// Decoder for a device class, scaled to the display
std::unique_ptr<InputDecoder> make_decoder(DeviceClass device_class, const InputDevice& device,
                                           uint32_t display_width, uint32_t display_height);
