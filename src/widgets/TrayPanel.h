#pragma once

#include "Button.h"
#include "DrawNode.h"
#include <memory>

// Whole-screen plan: pressing above the panel dismisses the tray
Draw tray(const TrayContext& tray);

// Bordered bottom strip with the draft rows; dragging it down dismisses
Draw drafts_panel(const TrayContext& tray);

// Rows of draft tiles, built from the icon cache at draw time
Draw draft_icons(const TrayContext& tray);

// Icon centred in the tile, or a spinner while it is loading
Draw draft_icon(const TrayMetrics& metrics, std::shared_ptr<const Image> icon);

// Three dots centred in the cursor
Draw spinner(int32_t offset, uint32_t radius, const Color& color);
