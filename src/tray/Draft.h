#pragma once

#include <optional>
#include <string>
#include <vector>

// Launchable application described by a .draft file
struct DraftProgram {
    std::string name;
    std::string desc;
    std::string call;                  // Launch path
    std::optional<std::string> which;  // Invocation hint
    std::optional<std::string> term;   // Terminal hint
    std::optional<std::string> icon;   // Resolved icon png path

    // File name of the launch target, used to key screenshots
    std::string file_name() const;
};

// Parses one descriptor. On rejection returns nullopt and sets error.
// imgFile values resolve to <draft_dir>/icons/<value>.png.
std::optional<DraftProgram> parse_draft(const std::string& text,
                                        const std::string& draft_dir,
                                        std::string& error);

// Every valid *.draft in draft_dir, sorted by name. Rejected files are
// logged and skipped.
std::vector<DraftProgram> load_drafts(const std::string& draft_dir);
