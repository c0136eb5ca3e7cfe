#include <fstream>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "core/Config.h"
#include "core/DrmSurface.h"
#include "proc/ProcessTable.h"
#include "proc/Supervisor.h"
#include "tray/DraftPrograms.h"
#include "tray/IconLoader.h"
#include "tray/MainLoop.h"
#include "tray/RenderThread.h"
#include "tray/TrayMetrics.h"
#include "widgets/Layout.h"
#include "widgets/TrayPanel.h"

namespace {

void write_screenshot(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(data.data()), data.size());
    if (!file.good()) {
        std::cerr << "⚠️  Failed to save screenshot " << path << std::endl;
        return;
    }
    std::cout << "Saved screenshot " << path << " (" << data.size() << " bytes)" << std::endl;
}

void send_render(const Sender<RenderEvent>& render_tx, RenderEvent event) {
    if (!render_tx.send(std::move(event))) {
        throw std::runtime_error("Render thread disconnected");
    }
}

int run_tray() {
    Config config = Config::load();
    TrayMetrics metrics = TrayMetrics::from_config(config);

    ProcFsSource process_source;
    PosixSignalSink signals;
    Supervisor supervisor(process_source, signals);

    std::cout << "Loading drafts..." << std::endl;
    DraftPrograms drafts(load_drafts(config.draft_dir), supervisor, config.pids_dir());

    IconLoader icon_loader(config, metrics.icon_size);
    for (const auto& [name, draft] : drafts.get_drafts()) {
        if (auto icon = icon_loader.load_cached(draft)) {
            drafts.set_icon(name, std::make_shared<const Image>(std::move(*icon)));
        }
    }

    // Remember the system launcher so that wave's reset leaves it alone
    if (auto launcher = supervisor.find_by_command_line(config.system_launcher)) {
        std::cout << "System launcher process: " << launcher->pid << std::endl;
        PidMarkers markers(config.pids_dir());
        if (!markers.write(SYSTEM_LAUNCHER_IDENTITY, launcher->pid)) {
            std::cerr << "⚠️  System launcher is untracked" << std::endl;
        }
    }

    // Suspend this session's drafts; the first is resumed on close
    std::vector<DraftProgram> stopped_drafts = drafts.stop_draft_programs();
    std::optional<DraftProgram> stopped_draft;
    if (!stopped_drafts.empty()) stopped_draft = stopped_drafts.front();

    auto main_channel = Channel<MainEvent>::create();
    MainSender event_tx = std::move(main_channel.first);
    auto render_channel = Channel<RenderEvent>::create();
    Sender<RenderEvent> render_tx = std::move(render_channel.first);

    std::cout << "Starting input threads..." << std::endl;
    InputHandles input_handles = InputHandles::start(
        config, {DeviceClass::BUTTONS, DeviceClass::MULTITOUCH, DeviceClass::PEN},
        [event_tx](const InputEvent& event) { return event_tx.send(InputReceived{event}); });

    if (!input_handles.broadcast(InputCommand::GRAB)) {
        std::cerr << "⚠️  Not every input device could be grabbed" << std::endl;
    }

    std::cout << "Starting renderer..." << std::endl;
    std::string font_path = config.font_path;
    auto render_thread = std::make_unique<RenderThread>(
        [font_path]() -> std::unique_ptr<Surface> {
            auto surface = std::make_unique<DrmSurface>(font_path);
            if (!surface->initialize()) return nullptr;
            return surface;
        },
        std::move(render_channel.second), event_tx);
    if (!render_thread->start()) {
        throw std::runtime_error("Failed to start render thread");
    }

    std::string panel_path = config.screenshot_path(PANEL_SCREENSHOT);
    send_render(render_tx, Execute{
        set_rect(metrics.panel_rect()).then(dump_region([panel_path](std::vector<uint8_t> data) {
            write_screenshot(panel_path, data);
        })),
        false});

    if (stopped_draft) {
        std::string full_path = config.screenshot_path(stopped_draft->file_name());
        send_render(render_tx, Execute{
            set_rect(metrics.display_rect()).then(dump_region([full_path](std::vector<uint8_t> data) {
                write_screenshot(full_path, data);
            })),
            false});
    }

    // Best effort; tiles show a spinner until their icon arrives
    std::thread icon_thread([&drafts, &icon_loader, event_tx]() {
        bool loaded = false;
        for (const auto& [name, draft] : drafts.get_drafts()) {
            auto icon = icon_loader.load(draft);
            if (!icon) continue;

            if (!event_tx.send(LoadIcon{name, std::make_shared<const Image>(std::move(*icon))})) return;
            loaded = true;
        }
        if (loaded && !event_tx.send(Redraw{})) {
            std::cerr << "⚠️  Icons loaded after exit" << std::endl;
        }
    });

    TrayContext context{event_tx, drafts, stopped_draft, metrics};
    post(event_tx, SetDraw{tray(context)});

    MainLoop main_loop(std::move(main_channel.second), std::move(input_handles),
                       std::move(render_thread), std::move(render_tx),
                       drafts, std::move(stopped_drafts), config);
    try {
        main_loop.run();
    } catch (...) {
        icon_thread.join();
        throw;
    }
    icon_thread.join();

    return 0;
}

}

int main() {
    std::cout << "📜 tray starting..." << std::endl;

    try {
        int status = run_tray();
        std::cout << "✅ Shutdown complete" << std::endl;
        return status;
    } catch (const std::exception& e) {
        std::cerr << "❌ tray failed: " << e.what() << std::endl;
        return 1;
    }
}
