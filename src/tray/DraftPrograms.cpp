#include "DraftPrograms.h"
#include <algorithm>
#include <iostream>

DraftPrograms::DraftPrograms(const std::vector<DraftProgram>& programs, Supervisor& supervisor,
                             const std::string& pids_dir, Launcher launcher)
    : supervisor(supervisor), markers(pids_dir), launcher(std::move(launcher)) {
    for (const auto& draft : programs) {
        if (!drafts.emplace(draft.name, draft).second) {
            std::cerr << "⚠️  Duplicate draft name " << draft.name << ", keeping the first" << std::endl;
        }
    }
}

std::optional<DraftProgram> DraftPrograms::find(const std::string& name) const {
    auto it = drafts.find(name);
    if (it == drafts.end()) return std::nullopt;
    return it->second;
}

void DraftPrograms::set_icon(const std::string& name, std::shared_ptr<const Image> icon) {
    std::lock_guard<std::mutex> lock(icons_mutex);
    icons[name] = std::move(icon);
}

IconMap DraftPrograms::get_icons() const {
    std::lock_guard<std::mutex> lock(icons_mutex);
    return icons;
}

std::vector<DraftProcess> DraftPrograms::draft_processes() {
    std::vector<DraftProcess> result;

    // Markers are written after their pid exists, so listing them before
    // the snapshot never mistakes a fresh launch for a stale record
    auto recorded = markers.list();
    auto table = supervisor.processes();

    for (const auto& [identity, pid] : recorded) {
        auto draft = drafts.find(identity);
        if (draft == drafts.end()) continue;

        auto process = std::find_if(table.begin(), table.end(),
                                    [pid = pid](const ProcessRecord& r) { return r.pid == pid; });
        if (process == table.end()) {
            std::cout << "⚠️  PID " << pid << " recorded for " << identity
                      << " is not running, deleting record" << std::endl;
            markers.remove(identity);
            continue;
        }

        result.emplace_back(draft->second, *process);
    }
    return result;
}

std::optional<ProcessRecord> DraftPrograms::find_process(const DraftProgram& draft) {
    std::optional<ProcessRecord> found;
    size_t matches = 0;

    // Bound through the marker's draft; the pid itself is not re-checked
    // against the process command
    for (const auto& [candidate, process] : draft_processes()) {
        if (candidate.file_name() != draft.file_name()) continue;
        if (!found) found = process;
        matches++;
    }

    if (matches > 1) {
        std::cout << "⚠️  " << matches << " instances of " << draft.name
                  << " are running, using pid " << found->pid << std::endl;
    }
    return found;
}

std::vector<DraftProgram> DraftPrograms::stop_draft_programs() {
    std::vector<DraftProcess> running;
    for (auto& entry : draft_processes()) {
        if (is_alive(entry.second.state)) running.push_back(std::move(entry));
    }

    if (running.size() > 1) {
        std::cout << "⚠️  More than one draft application is running" << std::endl;
    }

    std::vector<DraftProgram> stopped;
    for (const auto& [draft, process] : running) {
        supervisor.suspend(process.pid);
        stopped.push_back(draft);
    }
    return stopped;
}

RunType DraftPrograms::run_draft_program(const DraftProgram& draft) {
    for (const auto& [candidate, process] : draft_processes()) {
        if (candidate.name == draft.name && is_stopped(process.state)) {
            supervisor.resume(process.pid);
            return RunType::CONTINUE;
        }
    }

    std::cout << "▶ Launching " << draft.name << " (" << draft.call << ")" << std::endl;
    auto pid = launcher(draft.call);
    if (!pid) {
        std::cerr << "❌ Failed to launch " << draft.name << std::endl;
        return RunType::FAILED;
    }

    if (!markers.write(draft.name, *pid)) {
        std::cerr << "⚠️  " << draft.name << " is running untracked" << std::endl;
    }
    return RunType::LAUNCH;
}
