#include "Supervisor.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

namespace fs = std::filesystem;

bool PosixSignalSink::send(pid_t pid, int signal) {
    if (kill(pid, signal) == 0) return true;

    if (errno == ESRCH) {
        std::cout << "⚠️  Process " << pid << " already exited" << std::endl;
    } else {
        std::cerr << "❌ kill(" << pid << ", " << signal << ") failed: "
                  << strerror(errno) << std::endl;
    }
    return false;
}

Supervisor::Supervisor(ProcessSource& source, SignalSink& signals)
    : source(source), signals(signals) {}

std::vector<ProcessRecord> Supervisor::processes() {
    return source.snapshot();
}

std::vector<ProcessRecord> Supervisor::children_of(pid_t pid) {
    std::vector<ProcessRecord> children;
    for (auto& record : source.snapshot()) {
        if (record.parent_pid == pid && record.pid != pid) {
            children.push_back(std::move(record));
        }
    }
    return children;
}

std::optional<ProcessRecord> Supervisor::find(pid_t pid) {
    for (auto& record : source.snapshot()) {
        if (record.pid == pid) return record;
    }
    return std::nullopt;
}

std::optional<ProcessRecord> Supervisor::find_by_command_line(const std::string& command_line) {
    for (auto& record : source.snapshot()) {
        if (record.command_line == command_line) return record;
    }
    return std::nullopt;
}

std::optional<ProcessRecord> Supervisor::find_by_command(const std::string& command) {
    for (auto& record : source.snapshot()) {
        if (record.command == command) return record;
    }
    return std::nullopt;
}

void Supervisor::suspend(pid_t pid) {
    std::cout << "Stopping process " << pid << std::endl;
    signals.send(pid, SIGSTOP);
    for (const auto& child : children_of(pid)) {
        suspend(child.pid);
    }
}

void Supervisor::resume(pid_t pid) {
    for (const auto& child : children_of(pid)) {
        resume(child.pid);
    }
    std::cout << "Continuing process " << pid << std::endl;
    signals.send(pid, SIGCONT);
}

void Supervisor::terminate(pid_t pid) {
    for (const auto& child : children_of(pid)) {
        terminate(child.pid);
    }
    std::cout << "Killing process " << pid << std::endl;
    signals.send(pid, SIGKILL);
}

PidMarkers::PidMarkers(const std::string& directory) : directory(directory) {}

std::string PidMarkers::path(const std::string& identity) const {
    return (fs::path(directory) / (identity + ".pid")).string();
}

bool PidMarkers::write(const std::string& identity, pid_t pid) {
    std::ofstream file(path(identity), std::ios::trunc);
    if (!file.is_open()) {
        std::cerr << "❌ Failed to write pid marker " << path(identity) << std::endl;
        return false;
    }
    file << pid;
    return file.good();
}

std::optional<pid_t> PidMarkers::read(const std::string& identity) const {
    std::ifstream file(path(identity));
    if (!file.is_open()) return std::nullopt;

    long pid;
    if (!(file >> pid) || pid <= 0) {
        std::cerr << "⚠️  Unreadable pid marker " << path(identity) << std::endl;
        return std::nullopt;
    }
    return (pid_t)pid;
}

bool PidMarkers::remove(const std::string& identity) {
    std::error_code ec;
    bool removed = fs::remove(path(identity), ec);
    if (ec) {
        std::cerr << "⚠️  Failed to remove " << path(identity) << ": " << ec.message() << std::endl;
    }
    return removed;
}

std::vector<std::pair<std::string, pid_t>> PidMarkers::list() const {
    std::vector<std::pair<std::string, pid_t>> markers;

    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) return markers;

    for (const auto& entry : it) {
        if (!entry.is_regular_file() || entry.path().extension() != ".pid") continue;

        std::string identity = entry.path().stem().string();
        if (auto pid = read(identity)) {
            markers.emplace_back(identity, *pid);
        }
    }

    std::sort(markers.begin(), markers.end());
    return markers;
}

std::optional<pid_t> spawn_process(const std::string& command_line) {
    std::vector<std::string> args;
    std::istringstream stream(command_line);
    for (std::string arg; stream >> arg; ) {
        args.push_back(arg);
    }
    if (args.empty()) return std::nullopt;

    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    pid_t pid;
    int err = posix_spawn(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
    if (err != 0) {
        std::cerr << "❌ Failed to launch " << command_line << ": " << strerror(err) << std::endl;
        return std::nullopt;
    }

    std::cout << "▶ Launched " << command_line << " (pid " << pid << ")" << std::endl;
    return pid;
}

int wait_process(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            std::cerr << "❌ waitpid(" << pid << ") failed: " << strerror(errno) << std::endl;
            return -1;
        }
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

bool reset_runtime(const Config& config, Supervisor& supervisor) {
    PidMarkers markers(config.pids_dir());

    for (const auto& [identity, pid] : markers.list()) {
        if (identity == SYSTEM_LAUNCHER_IDENTITY) continue;

        auto process = supervisor.find(pid);
        if (!process || process->command_line == config.system_launcher) continue;

        std::cout << "Killing leftover " << identity << " process with pid " << pid << std::endl;
        supervisor.resume(pid);
        supervisor.terminate(pid);
    }

    std::error_code ec;
    fs::remove_all(config.temp_dir, ec);
    if (ec) {
        std::cerr << "⚠️  Failed to clear " << config.temp_dir << ": " << ec.message() << std::endl;
    }

    for (const auto& dir : {config.screenshots_dir(), config.icons_dir(), config.pids_dir()}) {
        fs::create_directories(dir, ec);
        if (ec) {
            std::cerr << "❌ Failed to create " << dir << ": " << ec.message() << std::endl;
            return false;
        }
    }

    std::cout << "✅ Runtime directory reset: " << config.temp_dir << std::endl;
    return true;
}
