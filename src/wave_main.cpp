#include <iostream>
#include <stdexcept>

#include "core/Channel.h"
#include "core/Config.h"
#include "input/InputHandles.h"
#include "proc/ProcessTable.h"
#include "proc/Supervisor.h"
#include "wave/WaveListener.h"

namespace {

InputHandles start_input(const Config& config, const Sender<InputEvent>& input_tx) {
    return InputHandles::start(config, {DeviceClass::MULTITOUCH},
                               [input_tx](const InputEvent& event) { return input_tx.send(event); });
}

int run_wave() {
    Config config = Config::load();

    ProcFsSource process_source;
    PosixSignalSink signals;
    Supervisor supervisor(process_source, signals);

    if (!reset_runtime(config, supervisor)) {
        return 1;
    }

    auto channel = Channel<InputEvent>::create();
    Sender<InputEvent> input_tx = std::move(channel.first);
    Receiver<InputEvent> input_rx = std::move(channel.second);

    InputHandles input_handles = start_input(config, input_tx);
    if (input_handles.empty()) {
        std::cerr << "❌ No multitouch device, nothing to listen to" << std::endl;
        return 1;
    }

    WaveListener listener(config);
    std::cout << "Listening for swipes in " << listener.get_zone() << std::endl;

    while (auto event = input_rx.recv()) {
        if (!listener.feed(*event)) continue;

        std::cout << "Gesture triggered, spawning tray process" << std::endl;
        if (!input_handles.broadcast(InputCommand::STOP)) {
            std::cerr << "⚠️  Input thread already stopped" << std::endl;
        }
        input_handles.join();

        if (auto pid = spawn_process(config.tray_path)) {
            int status = wait_process(*pid);
            std::cout << "■ tray exited with status " << status << std::endl;
        }

        // Events queued before the tray took over are stale
        while (input_rx.try_recv()) {}
        listener.reset();

        input_handles = start_input(config, input_tx);
        if (input_handles.empty()) {
            throw std::runtime_error("Failed to restart multitouch input");
        }
    }

    throw std::runtime_error("Input channel closed unexpectedly");
}

}

int main() {
    std::cout << "🌊 wave starting..." << std::endl;

    try {
        return run_wave();
    } catch (const std::exception& e) {
        std::cerr << "❌ wave failed: " << e.what() << std::endl;
        return 1;
    }
}
