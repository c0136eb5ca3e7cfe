#include "Draft.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

static constexpr const char* ICONS_DIR = "icons";
static constexpr const char* DRAFT_EXTENSION = ".draft";

std::string DraftProgram::file_name() const {
    return fs::path(call).filename().string();
}

std::optional<DraftProgram> parse_draft(const std::string& text,
                                        const std::string& draft_dir,
                                        std::string& error) {
    DraftProgram draft;

    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        size_t split = line.find('=');
        if (split == std::string::npos) continue;

        std::string key = line.substr(0, split);
        std::string value = line.substr(split + 1);

        if (key == "name") {
            draft.name = value;
        } else if (key == "desc") {
            draft.desc = value;
        } else if (key == "call") {
            draft.call = value;
        } else if (key == "which") {
            draft.which = value;
        } else if (key == "term") {
            draft.term = value;
        } else if (key == "imgFile") {
            draft.icon = (fs::path(draft_dir) / ICONS_DIR / (value + ".png")).string();
        }
    }

    if (draft.name.empty()) {
        error = "Draft has no name";
        return std::nullopt;
    }
    if (draft.desc.empty()) {
        error = "Draft has no description";
        return std::nullopt;
    }

    std::error_code ec;
    if (draft.call.empty() || !fs::exists(draft.call, ec)) {
        error = "Draft launch target does not exist: " + draft.call;
        return std::nullopt;
    }

    return draft;
}

std::vector<DraftProgram> load_drafts(const std::string& draft_dir) {
    std::vector<DraftProgram> drafts;

    std::error_code ec;
    fs::directory_iterator it(draft_dir, ec);
    if (ec) {
        std::cerr << "❌ Cannot read draft directory " << draft_dir << ": " << ec.message() << std::endl;
        return drafts;
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file() || entry.path().extension() != DRAFT_EXTENSION) continue;

        std::ifstream file(entry.path());
        if (!file.is_open()) {
            std::cerr << "⚠️  Cannot open " << entry.path() << std::endl;
            continue;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();

        std::string error;
        if (auto draft = parse_draft(buffer.str(), draft_dir, error)) {
            drafts.push_back(std::move(*draft));
        } else {
            std::cerr << "⚠️  Rejected " << entry.path() << ": " << error << std::endl;
        }
    }

    std::sort(drafts.begin(), drafts.end(),
              [](const DraftProgram& a, const DraftProgram& b) { return a.name < b.name; });

    std::cout << "✅ Loaded " << drafts.size() << " drafts from " << draft_dir << std::endl;
    return drafts;
}
