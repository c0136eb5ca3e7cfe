#pragma once

#include "DrawNode.h"
#include "../tray/DraftPrograms.h"
#include "../tray/MainEvent.h"
#include "../tray/TrayMetrics.h"
#include <memory>
#include <optional>

// What the tray widgets capture. Copied into every callback; drafts must
// outlive every plan built from it.
struct TrayContext {
    MainSender events;
    DraftPrograms& drafts;
    std::optional<DraftProgram> stopped_draft;
    TrayMetrics metrics;
};

// Queues the shutdown sequence, running draft in between if given
void dismiss_tray(const MainSender& events, const std::optional<DraftProgram>& draft);

// Icon tile with its name below. Tapping it runs the draft.
Draw draft_program(const TrayContext& tray, const DraftProgram& draft,
                   std::shared_ptr<const Image> icon);

// Cross in the tile corner, shown while the draft has a live process.
// Tapping it kills the process tree and redraws.
Draw close_button(const TrayContext& tray, const DraftProgram& draft);
