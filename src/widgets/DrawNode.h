#pragma once

#include "../core/Rect.h"
#include "../core/Surface.h"
#include "../core/Types.h"
#include "../gesture/GestureRecognizer.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

struct DrawNode;

// State threaded through a draw plan: the surface, the cursor rect and the
// recognizers registered so far
struct DrawContext {
    Surface& surface;
    DrawRect rect;
    GestureRecognizer gesture_recognizer;

    DrawContext(Surface& surface, const DrawRect& rect)
        : surface(surface), rect(rect) {}
};

// Shared, immutable handle to a draw plan. Cheap to copy and safe to hand
// to another thread.
class Draw {
private:
    std::shared_ptr<const DrawNode> node;

public:
    Draw();
    explicit Draw(DrawNode node);

    // Applies next against the cursor this one produced
    Draw then(const Draw& next) const;
    // Applies next, then restores the cursor this one produced
    Draw overlay(const Draw& next) const;

    void draw(DrawContext& ctx) const;

    const DrawNode& get_node() const { return *node; }
};

enum class Edge { TOP, LEFT, RIGHT, BOTTOM };
enum class Field { X, Y, WIDTH, HEIGHT };
enum class Axis { HORIZONTAL, VERTICAL };

// Node payloads
struct UnitOp {};
struct ThenOp { std::vector<Draw> steps; };
struct OverlayOp { Draw base; Draw top; };
struct MarginOp { Edge edge; int32_t amount; };
struct OffsetOp { int32_t dx, dy; };
struct OffsetFractionOp { float fx, fy; };
struct SetFieldOp { Field field; int64_t value; };
struct SetRectOp { DrawRect rect; };

// spacing is the gap after each child, or the stride when fixed
struct ListOp {
    Axis axis;
    bool fixed;
    int32_t spacing;
    std::vector<Draw> children;
};

struct ClearOp {};
struct RectFillOp { Color color; };
struct RectStrokeOp { uint32_t border_px; Color color; };
struct CircleFillOp { uint32_t radius; Color color; };
struct CircleStrokeOp { uint32_t radius; Color color; };
struct LineOp { Point start, end; uint32_t width; Color color; };

// Without an origin the text's top-left sits at the cursor
struct TextOp {
    std::string text;
    float size;
    Color color;
    bool aligned;
    Vec2 origin;
};

struct ImageOp { std::shared_ptr<const Image> image; };
struct DumpRegionOp { std::function<void(std::vector<uint8_t>)> callback; };
struct RestoreRegionOp { std::shared_ptr<const std::vector<uint8_t>> data; };
struct RefreshOp { bool full; RefreshProfile profile; };
struct RecognizeOp { Recognizer recognizer; };

// Subtree built from the cursor at evaluation time
struct DeferredOp { std::function<Draw(const DrawRect&)> builder; };

using DrawOp = std::variant<
    UnitOp, ThenOp, OverlayOp, MarginOp, OffsetOp, OffsetFractionOp, SetFieldOp, SetRectOp,
    ListOp, ClearOp, RectFillOp, RectStrokeOp, CircleFillOp, CircleStrokeOp, LineOp, TextOp,
    ImageOp, DumpRegionOp, RestoreRegionOp, RefreshOp, RecognizeOp, DeferredOp>;

struct DrawNode {
    DrawOp op;
};

// Evaluates a plan against a fresh context and returns the recognizers it
// registered, in draw order
GestureRecognizer render(const Draw& draw, Surface& surface, const DrawRect& rect);
