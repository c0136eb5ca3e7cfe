#pragma once

#include <string>

// Runtime configuration. Every field has a built-in default; an optional
// JSON file overrides individual keys.
struct Config {
    std::string temp_dir = "/tmp/parchment";
    std::string draft_dir = "/opt/etc/draft";
    std::string tray_path = "/home/root/tray";
    std::string font_path = "/usr/share/fonts/ttf/noto/NotoSans-Regular.ttf";
    std::string system_launcher = "/usr/bin/xochitl --system";

    float tap_hysteresis = 32.0f;
    int input_buffer_size = 512 * 8;
    int poll_timeout_ms = 100;
    int wave_zone_height = 128;
    int kill_sleep_ms = 100;

    int display_width = 1404;
    int display_height = 1872;

    // Empty = autodetect
    std::string buttons_device;
    std::string multitouch_device;
    std::string pen_device;

    static constexpr const char* DEFAULT_PATH = "/etc/parchment.json";
    static constexpr const char* ENV_VAR = "PARCHMENT_CONFIG";

    // Reads $PARCHMENT_CONFIG or DEFAULT_PATH; falls back to defaults
    static Config load();
    static Config load_file(const std::string& path);
    bool parse(const std::string& json_text);

    // Runtime directory layout
    std::string screenshots_dir() const;
    std::string icons_dir() const;
    std::string pids_dir() const;
    std::string screenshot_path(const std::string& name) const;
    std::string icon_cache_path(const std::string& icon_file) const;
};

// Reserved pid marker identity of the system launcher
inline constexpr const char* SYSTEM_LAUNCHER_IDENTITY = "xochitl";
inline constexpr const char* PANEL_SCREENSHOT = "panel";
