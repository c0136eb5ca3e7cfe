#include "ProcessTable.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

RunState parse_run_state(char code) {
    switch (code) {
        case 'R': return RunState::RUNNING;
        case 'S': return RunState::SLEEPING;
        case 'D': return RunState::WAITING_IO;
        case 'Z':
        case 'X': return RunState::ZOMBIE;
        case 'T':
        case 't': return RunState::TRACED;
        default: return RunState::OTHER;
    }
}

const char* run_state_name(RunState state) {
    switch (state) {
        case RunState::RUNNING: return "running";
        case RunState::SLEEPING: return "sleeping";
        case RunState::WAITING_IO: return "waiting-io";
        case RunState::ZOMBIE: return "zombie";
        case RunState::TRACED: return "traced";
        case RunState::OTHER: return "other";
    }
    return "other";
}

bool is_alive(RunState state) {
    return state == RunState::RUNNING || state == RunState::SLEEPING ||
           state == RunState::WAITING_IO;
}

bool is_stopped(RunState state) {
    return state == RunState::TRACED;
}

bool is_dead(RunState state) {
    return state == RunState::ZOMBIE;
}

std::optional<ProcessRecord> parse_stat(const std::string& stat) {
    size_t open = stat.find('(');
    size_t close = stat.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }

    ProcessRecord record;
    record.command = stat.substr(open + 1, close - open - 1);

    std::istringstream head(stat.substr(0, open));
    if (!(head >> record.pid)) return std::nullopt;

    // state ppid pgrp session ...
    std::istringstream tail(stat.substr(close + 1));
    std::string state;
    long parent_pid, process_group, session_id;
    if (!(tail >> state >> parent_pid >> process_group >> session_id) || state.empty()) {
        return std::nullopt;
    }

    record.state = parse_run_state(state[0]);
    record.parent_pid = (pid_t)parent_pid;
    record.session_id = (pid_t)session_id;
    return record;
}

namespace {

bool is_pid_directory(const std::string& name) {
    return !name.empty() &&
           std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::optional<std::string> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::string clean_command_line(std::string cmdline) {
    std::replace(cmdline.begin(), cmdline.end(), '\0', ' ');
    size_t end = cmdline.find_last_not_of(" \n\t");
    return end == std::string::npos ? "" : cmdline.substr(0, end + 1);
}

}

ProcFsSource::ProcFsSource(const std::string& root) : root(root) {}

std::vector<ProcessRecord> ProcFsSource::snapshot() {
    std::error_code ec;
    fs::directory_iterator it(root, ec);
    if (ec) {
        throw std::runtime_error("Failed to enumerate " + root + ": " + ec.message());
    }

    std::vector<ProcessRecord> records;
    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (!is_pid_directory(name)) continue;

        auto stat = read_file(entry.path() / "stat");
        if (!stat) continue;

        auto record = parse_stat(*stat);
        if (!record) continue;

        auto cmdline = read_file(entry.path() / "cmdline");
        record->command_line = cmdline ? clean_command_line(*cmdline) : "";
        records.push_back(std::move(*record));
    }

    std::sort(records.begin(), records.end(),
              [](const ProcessRecord& a, const ProcessRecord& b) { return a.pid < b.pid; });
    return records;
}
