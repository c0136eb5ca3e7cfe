#pragma once

#include "Draft.h"
#include "../core/Channel.h"
#include "../core/Types.h"
#include "../gesture/GestureRecognizer.h"
#include "../input/InputEvent.h"
#include "../widgets/DrawNode.h"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

// Events consumed by the orchestrator, in arrival order
struct LoadIcon {
    std::string name;
    std::shared_ptr<const Image> icon;
};

struct SetGestureRecognizer {
    std::optional<GestureRecognizer> recognizer;
};

// Replaces the active plan and renders it if present
struct SetDraw {
    std::optional<Draw> draw;
};

struct Redraw {};

struct InputReceived {
    InputEvent input;
};

struct Run {
    DraftProgram draft;
};

struct StopInput {};
struct StopRenderer {};
struct Exit {};

using MainEvent = std::variant<LoadIcon, SetGestureRecognizer, SetDraw, Redraw,
                               InputReceived, Run, StopInput, StopRenderer, Exit>;

// Commands consumed by the render thread
struct Execute {
    Draw draw;
    bool publish_recognizer;
};

struct RenderExit {};

using RenderEvent = std::variant<Execute, RenderExit>;

using MainSender = Sender<MainEvent>;

// Fatal if the orchestrator is gone
inline void post(const MainSender& events, MainEvent event) {
    if (!events.send(std::move(event))) {
        throw std::runtime_error("Event channel disconnected");
    }
}
