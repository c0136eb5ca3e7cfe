#pragma once

#include "proc/ProcessTable.h"
#include "proc/Supervisor.h"
#include <algorithm>
#include <functional>
#include <utility>
#include <vector>
#include <signal.h>

// Process table held in memory. Signals from RecordingSignalSink update it.
class FakeProcessSource : public ProcessSource {
public:
    std::vector<ProcessRecord> table;
    int snapshots = 0;
    // One-shot hook run at the start of the next snapshot
    std::function<void()> on_next_snapshot;

    void add(pid_t pid, pid_t parent, const std::string& command,
             RunState state = RunState::SLEEPING) {
        ProcessRecord record;
        record.pid = pid;
        record.parent_pid = parent;
        record.session_id = 1;
        record.command = command;
        record.command_line = "/usr/bin/" + command;
        record.state = state;
        table.push_back(record);
    }

    ProcessRecord* get(pid_t pid) {
        for (auto& record : table) {
            if (record.pid == pid) return &record;
        }
        return nullptr;
    }

    std::vector<ProcessRecord> snapshot() override {
        snapshots++;
        if (on_next_snapshot) {
            auto hook = std::move(on_next_snapshot);
            on_next_snapshot = nullptr;
            hook();
        }
        return table;
    }
};

class RecordingSignalSink : public SignalSink {
public:
    std::vector<std::pair<pid_t, int>> sent;
    FakeProcessSource* source = nullptr;

    bool send(pid_t pid, int signal) override {
        sent.emplace_back(pid, signal);
        if (!source) return true;

        ProcessRecord* record = source->get(pid);
        if (!record) return false;

        if (signal == SIGSTOP) record->state = RunState::TRACED;
        if (signal == SIGCONT) record->state = RunState::SLEEPING;
        if (signal == SIGKILL) {
            source->table.erase(std::remove_if(source->table.begin(), source->table.end(),
                                               [pid](const ProcessRecord& r) { return r.pid == pid; }),
                                source->table.end());
        }
        return true;
    }

    size_t index_of(pid_t pid, int signal) const {
        for (size_t i = 0; i < sent.size(); i++) {
            if (sent[i].first == pid && sent[i].second == signal) return i;
        }
        return sent.size();
    }
};
