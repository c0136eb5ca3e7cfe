#pragma once

#include "ProcessTable.h"
#include "../core/Config.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>

// Delivers a signal to a pid. False if it was not delivered.
class SignalSink {
public:
    virtual ~SignalSink() = default;
    virtual bool send(pid_t pid, int signal) = 0;
};

// kill(2); a process that already exited is logged, not an error
class PosixSignalSink : public SignalSink {
public:
    bool send(pid_t pid, int signal) override;
};

// Process tree control. Every query reads a fresh snapshot; nothing is
// cached between calls. Signalling is best-effort and is not rolled back
// on partial failure.
class Supervisor {
private:
    ProcessSource& source;
    SignalSink& signals;

public:
    Supervisor(ProcessSource& source, SignalSink& signals);

    std::vector<ProcessRecord> processes();
    std::vector<ProcessRecord> children_of(pid_t pid);
    std::optional<ProcessRecord> find(pid_t pid);
    std::optional<ProcessRecord> find_by_command_line(const std::string& command_line);
    std::optional<ProcessRecord> find_by_command(const std::string& command);

    // SIGSTOP the root, then its descendants
    void suspend(pid_t pid);
    // SIGCONT the descendants, then the root
    void resume(pid_t pid);
    // SIGKILL the descendants, then the root
    void terminate(pid_t pid);
};

// <identity>.pid files holding a decimal pid
class PidMarkers {
private:
    std::string directory;

public:
    explicit PidMarkers(const std::string& directory);

    std::string path(const std::string& identity) const;
    bool write(const std::string& identity, pid_t pid);
    std::optional<pid_t> read(const std::string& identity) const;
    bool remove(const std::string& identity);

    // (identity, pid) for every readable marker, sorted by identity
    std::vector<std::pair<std::string, pid_t>> list() const;
};

// Starts a process without a shell; argv is split on spaces
std::optional<pid_t> spawn_process(const std::string& command_line);

// Blocks until the child exits; returns its exit status or -1
int wait_process(pid_t pid);

// Resumes then terminates the processes named by leftover markers (except
// the system launcher) and recreates the runtime directory tree
bool reset_runtime(const Config& config, Supervisor& supervisor);
