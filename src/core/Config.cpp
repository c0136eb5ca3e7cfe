#include "Config.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <json/json.h>

namespace fs = std::filesystem;

Config Config::load() {
    const char* env_path = std::getenv(ENV_VAR);
    return load_file(env_path ? env_path : DEFAULT_PATH);
}

Config Config::load_file(const std::string& path) {
    Config config;

    std::ifstream file(path);
    if (!file.is_open()) {
        std::cout << "☰ No config at " << path << ", using defaults" << std::endl;
        return config;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!config.parse(buffer.str())) {
        std::cerr << "⚠️  Malformed config " << path << ", using defaults" << std::endl;
        return Config();
    }

    std::cout << "✅ Config loaded: " << path << std::endl;
    return config;
}

bool Config::parse(const std::string& json_text) {
    try {
        Json::Value root;
        Json::Reader reader;

        if (!reader.parse(json_text, root) || !root.isObject()) {
            return false;
        }

        temp_dir = root.get("temp_dir", temp_dir).asString();
        draft_dir = root.get("draft_dir", draft_dir).asString();
        tray_path = root.get("tray_path", tray_path).asString();
        font_path = root.get("font_path", font_path).asString();
        system_launcher = root.get("system_launcher", system_launcher).asString();

        tap_hysteresis = root.get("tap_hysteresis", tap_hysteresis).asFloat();
        input_buffer_size = root.get("input_buffer_size", input_buffer_size).asInt();
        poll_timeout_ms = root.get("poll_timeout_ms", poll_timeout_ms).asInt();
        wave_zone_height = root.get("wave_zone_height", wave_zone_height).asInt();
        kill_sleep_ms = root.get("kill_sleep_ms", kill_sleep_ms).asInt();
        display_width = root.get("display_width", display_width).asInt();
        display_height = root.get("display_height", display_height).asInt();

        const Json::Value& devices = root["devices"];
        if (devices.isObject()) {
            buttons_device = devices.get("buttons", buttons_device).asString();
            multitouch_device = devices.get("multitouch", multitouch_device).asString();
            pen_device = devices.get("pen", pen_device).asString();
        }
    } catch (const std::exception& e) {
        std::cerr << "❌ Config error: " << e.what() << std::endl;
        return false;
    }

    return true;
}

std::string Config::screenshots_dir() const {
    return (fs::path(temp_dir) / "screenshots").string();
}

std::string Config::icons_dir() const {
    return (fs::path(temp_dir) / "icons").string();
}

std::string Config::pids_dir() const {
    return (fs::path(temp_dir) / "processes").string();
}

std::string Config::screenshot_path(const std::string& name) const {
    return (fs::path(screenshots_dir()) / name).string();
}

std::string Config::icon_cache_path(const std::string& icon_file) const {
    fs::path path = fs::path(icons_dir()) / fs::path(icon_file).filename();
    path.replace_extension(".png");
    return path.string();
}
