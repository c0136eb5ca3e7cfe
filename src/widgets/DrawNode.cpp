#include "DrawNode.h"
#include "../gesture/Recognizers.h"
#include <iostream>

Draw::Draw() : node(std::make_shared<const DrawNode>(DrawNode{UnitOp{}})) {}

Draw::Draw(DrawNode node) : node(std::make_shared<const DrawNode>(std::move(node))) {}

Draw Draw::then(const Draw& next) const {
    ThenOp sequence;
    if (auto* existing = std::get_if<ThenOp>(&node->op)) {
        sequence.steps = existing->steps;
    } else {
        sequence.steps.push_back(*this);
    }
    sequence.steps.push_back(next);
    return Draw(DrawNode{std::move(sequence)});
}

Draw Draw::overlay(const Draw& next) const {
    return Draw(DrawNode{OverlayOp{*this, next}});
}

namespace {

// Applies one node to the context in place
struct Interpreter {
    DrawContext& ctx;

    void operator()(const UnitOp&) {}

    void operator()(const ThenOp& op) {
        for (const auto& step : op.steps) {
            step.draw(ctx);
        }
    }

    void operator()(const OverlayOp& op) {
        op.base.draw(ctx);
        DrawRect cached = ctx.rect;
        op.top.draw(ctx);
        ctx.rect = cached;
    }

    void operator()(const MarginOp& op) {
        switch (op.edge) {
            case Edge::TOP: ctx.rect = ctx.rect.margin_top(op.amount); break;
            case Edge::LEFT: ctx.rect = ctx.rect.margin_left(op.amount); break;
            case Edge::RIGHT: ctx.rect = ctx.rect.margin_right(op.amount); break;
            case Edge::BOTTOM: ctx.rect = ctx.rect.margin_bottom(op.amount); break;
        }
    }

    void operator()(const OffsetOp& op) {
        ctx.rect = ctx.rect.offset(op.dx, op.dy);
    }

    void operator()(const OffsetFractionOp& op) {
        ctx.rect = ctx.rect.offset_fraction(op.fx, op.fy);
    }

    void operator()(const SetFieldOp& op) {
        switch (op.field) {
            case Field::X: ctx.rect.left = (int32_t)op.value; break;
            case Field::Y: ctx.rect.top = (int32_t)op.value; break;
            case Field::WIDTH: ctx.rect.width = (uint32_t)op.value; break;
            case Field::HEIGHT: ctx.rect.height = (uint32_t)op.value; break;
        }
    }

    void operator()(const SetRectOp& op) {
        ctx.rect = op.rect;
    }

    void operator()(const ListOp& op) {
        bool horizontal = op.axis == Axis::HORIZONTAL;

        for (const auto& child : op.children) {
            DrawRect cached = ctx.rect;
            child.draw(ctx);

            int32_t advance = op.spacing;
            if (!op.fixed) {
                advance += (int32_t)(horizontal ? ctx.rect.width : ctx.rect.height);
            }

            ctx.rect = horizontal ? cached.margin_left(advance) : cached.margin_top(advance);
            if (ctx.rect.empty()) {
                break;
            }
        }
    }

    void operator()(const ClearOp&) {
        ctx.surface.clear();
    }

    void operator()(const RectFillOp& op) {
        ctx.surface.fill_rect(ctx.rect, op.color);
    }

    void operator()(const RectStrokeOp& op) {
        ctx.surface.stroke_rect(ctx.rect, op.border_px, op.color);
    }

    void operator()(const CircleFillOp& op) {
        ctx.surface.fill_circle(ctx.rect.position(), op.radius, op.color);
    }

    void operator()(const CircleStrokeOp& op) {
        ctx.surface.stroke_circle(ctx.rect.position(), op.radius, op.color);
    }

    void operator()(const LineOp& op) {
        Point origin = ctx.rect.position();
        ctx.rect = ctx.surface.draw_line(
            Point(origin.x + op.start.x, origin.y + op.start.y),
            Point(origin.x + op.end.x, origin.y + op.end.y),
            op.width, op.color);
    }

    void operator()(const TextOp& op) {
        if (op.aligned) {
            DrawRect measured = ctx.surface.draw_text(ctx.rect.position(), op.text,
                                                      op.size, op.color, true);
            ctx.rect = ctx.rect.offset(-(int32_t)(measured.width * op.origin.x),
                                       -(int32_t)(measured.height * op.origin.y));
        }
        ctx.rect = ctx.surface.draw_text(ctx.rect.position(), op.text, op.size, op.color, false);
    }

    void operator()(const ImageOp& op) {
        if (!op.image) return;
        ctx.rect = ctx.surface.draw_image(*op.image, ctx.rect.position());
    }

    void operator()(const DumpRegionOp& op) {
        op.callback(ctx.surface.dump_region(ctx.rect));
    }

    void operator()(const RestoreRegionOp& op) {
        if (!op.data || !ctx.surface.restore_region(ctx.rect, *op.data)) {
            std::cerr << "⚠️  Region restore failed: " << ctx.rect << std::endl;
        }
    }

    void operator()(const RefreshOp& op) {
        if (op.full) {
            ctx.surface.full_refresh(op.profile);
        } else {
            ctx.surface.partial_refresh(ctx.rect, op.profile);
        }
    }

    void operator()(const RecognizeOp& op) {
        ctx.gesture_recognizer.add(recognize_starting_zone(ctx.rect, op.recognizer));
    }

    void operator()(const DeferredOp& op) {
        op.builder(ctx.rect).draw(ctx);
    }
};

}

void Draw::draw(DrawContext& ctx) const {
    std::visit(Interpreter{ctx}, node->op);
}

GestureRecognizer render(const Draw& draw, Surface& surface, const DrawRect& rect) {
    DrawContext ctx(surface, rect);
    draw.draw(ctx);
    return std::move(ctx.gesture_recognizer);
}
