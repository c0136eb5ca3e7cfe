#include "InputDevice.h"
#include <iostream>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <cerrno>
#include <cstring>

namespace {

constexpr size_t BITS_PER_LONG = sizeof(unsigned long) * 8;

bool test_bit(const unsigned long* bits, int bit) {
    return (bits[bit / BITS_PER_LONG] >> (bit % BITS_PER_LONG)) & 1UL;
}

bool matches_class(int fd, DeviceClass device_class) {
    unsigned long ev_bits[EV_MAX / BITS_PER_LONG + 1];
    unsigned long abs_bits[ABS_MAX / BITS_PER_LONG + 1];
    unsigned long key_bits[KEY_MAX / BITS_PER_LONG + 1];
    memset(ev_bits, 0, sizeof(ev_bits));
    memset(abs_bits, 0, sizeof(abs_bits));
    memset(key_bits, 0, sizeof(key_bits));

    if (ioctl(fd, EVIOCGBIT(0, sizeof(ev_bits)), ev_bits) < 0) return false;
    bool has_abs = test_bit(ev_bits, EV_ABS);
    bool has_key = test_bit(ev_bits, EV_KEY);

    if (has_abs && ioctl(fd, EVIOCGBIT(EV_ABS, sizeof(abs_bits)), abs_bits) < 0) return false;
    if (has_key && ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(key_bits)), key_bits) < 0) return false;

    switch (device_class) {
        case DeviceClass::MULTITOUCH:
            return has_abs && test_bit(abs_bits, ABS_MT_POSITION_X);
        case DeviceClass::PEN:
            return has_abs && test_bit(abs_bits, ABS_PRESSURE) &&
                   has_key && test_bit(key_bits, BTN_TOOL_PEN);
        case DeviceClass::BUTTONS:
            return has_key && !has_abs;
    }
    return false;
}

}

InputDevice::InputDevice() : fd(-1) {}

InputDevice::InputDevice(int fd, const std::string& path) : fd(fd), path(path) {}

InputDevice::~InputDevice() {
    close();
}

std::optional<std::string> InputDevice::autodetect(DeviceClass device_class) {
    for (int i = 0; i < 16; i++) {
        std::string candidate = "/dev/input/event" + std::to_string(i);
        int candidate_fd = ::open(candidate.c_str(), O_RDONLY);
        if (candidate_fd < 0) continue;

        bool found = matches_class(candidate_fd, device_class);
        ::close(candidate_fd);
        if (found) return candidate;
    }
    return std::nullopt;
}

bool InputDevice::open(const std::string& device_path) {
    close();
    fd = ::open(device_path.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        std::cerr << "❌ Failed to open " << device_path << ": " << strerror(errno) << std::endl;
        return false;
    }
    path = device_path;
    return true;
}

void InputDevice::close() {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

bool InputDevice::grab(bool exclusive) {
    if (ioctl(fd, EVIOCGRAB, exclusive ? 1 : 0) < 0) {
        std::cerr << "⚠️  " << (exclusive ? "Grab" : "Ungrab") << " failed on "
                  << path << ": " << strerror(errno) << std::endl;
        return false;
    }
    return true;
}

std::optional<AxisRange> InputDevice::abs_range(int code) const {
    struct input_absinfo info;
    if (ioctl(fd, EVIOCGABS(code), &info) < 0) {
        return std::nullopt;
    }
    return AxisRange{info.minimum, info.maximum};
}

std::vector<struct input_event> InputDevice::read_events() {
    std::vector<struct input_event> events;
    struct input_event ev;
    while (read(fd, &ev, sizeof(ev)) == (ssize_t)sizeof(ev)) {
        events.push_back(ev);
    }
    return events;
}

bool InputDevice::write_events(const std::vector<struct input_event>& events) {
    const char* data = reinterpret_cast<const char*>(events.data());
    size_t remaining = events.size() * sizeof(struct input_event);

    while (remaining > 0) {
        ssize_t written = write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            std::cerr << "⚠️  Write to " << path << " failed: " << strerror(errno) << std::endl;
            return false;
        }
        data += written;
        remaining -= (size_t)written;
    }
    return true;
}

std::unique_ptr<InputDecoder> make_decoder(DeviceClass device_class, const InputDevice& device,
                                           uint32_t display_width, uint32_t display_height) {
    AxisRange unscaled{0, 0};

    switch (device_class) {
        case DeviceClass::BUTTONS:
            return std::make_unique<ButtonDecoder>();
        case DeviceClass::MULTITOUCH:
            return std::make_unique<MultitouchDecoder>(
                device.abs_range(ABS_MT_POSITION_X).value_or(unscaled),
                device.abs_range(ABS_MT_POSITION_Y).value_or(unscaled),
                display_width, display_height);
        case DeviceClass::PEN:
            return std::make_unique<PenDecoder>(
                device.abs_range(ABS_X).value_or(unscaled),
                device.abs_range(ABS_Y).value_or(unscaled),
                display_width, display_height);
    }
    return nullptr;
}
