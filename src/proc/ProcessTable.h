#pragma once

#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

enum class RunState {
    RUNNING,
    SLEEPING,
    WAITING_IO,
    ZOMBIE,
    TRACED,
    OTHER
};

RunState parse_run_state(char code);
const char* run_state_name(RunState state);

// Run-state groups
bool is_alive(RunState state);    // R S D
bool is_stopped(RunState state);  // T t
bool is_dead(RunState state);     // Z X

struct ProcessRecord {
    pid_t pid = 0;
    pid_t parent_pid = 0;
    pid_t session_id = 0;
    std::string command;       // comm, without parentheses
    std::string command_line;  // NUL separators replaced by spaces
    RunState state = RunState::OTHER;
};

// Parses the contents of /proc/<pid>/stat. The command name may contain
// spaces and parentheses; it ends at the last ')'.
std::optional<ProcessRecord> parse_stat(const std::string& stat);

// Source of process table snapshots. Every call re-reads the table.
class ProcessSource {
public:
    virtual ~ProcessSource() = default;
    virtual std::vector<ProcessRecord> snapshot() = 0;
};

class ProcFsSource : public ProcessSource {
private:
    std::string root;

public:
    explicit ProcFsSource(const std::string& root = "/proc");

    // Throws std::runtime_error when the root cannot be listed. Processes
    // that exit mid-scan are skipped.
    std::vector<ProcessRecord> snapshot() override;
};
