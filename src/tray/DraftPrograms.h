#pragma once

#include "Draft.h"
#include "../core/Types.h"
#include "../proc/Supervisor.h"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class RunType {
    CONTINUE,  // A suspended instance was resumed
    LAUNCH,    // A new process was started
    FAILED
};

using DraftProcess = std::pair<DraftProgram, ProcessRecord>;
using Launcher = std::function<std::optional<pid_t>(const std::string&)>;
using IconMap = std::map<std::string, std::shared_ptr<const Image>>;

// Registry of loaded drafts, their decoded icons and their processes.
// Icons are the only state shared across threads; everything else is read
// only or recomputed from the process table and the pid markers.
class DraftPrograms {
private:
    std::map<std::string, DraftProgram> drafts;
    Supervisor& supervisor;
    PidMarkers markers;
    Launcher launcher;

    mutable std::mutex icons_mutex;
    IconMap icons;

public:
    DraftPrograms(const std::vector<DraftProgram>& programs, Supervisor& supervisor,
                  const std::string& pids_dir, Launcher launcher = spawn_process);

    DraftPrograms(const DraftPrograms&) = delete;
    DraftPrograms& operator=(const DraftPrograms&) = delete;

    // Keyed and ordered by name
    const std::map<std::string, DraftProgram>& get_drafts() const { return drafts; }
    std::optional<DraftProgram> find(const std::string& name) const;

    void set_icon(const std::string& name, std::shared_ptr<const Image> icon);
    // Copy of the cache; the lock is released on return
    IconMap get_icons() const;

    // Live processes recorded by markers. Markers naming a dead pid are
    // deleted; markers for identities that are not drafts are ignored.
    std::vector<DraftProcess> draft_processes();

    // Live process of the draft, matched on launch target file name. Warns
    // and picks the first if several are found.
    std::optional<ProcessRecord> find_process(const DraftProgram& draft);

    // Suspends every alive draft process; returns their drafts
    std::vector<DraftProgram> stop_draft_programs();

    // Resumes a suspended instance of the draft or launches a new one
    RunType run_draft_program(const DraftProgram& draft);

    Supervisor& get_supervisor() { return supervisor; }
};
