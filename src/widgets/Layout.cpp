#include "Layout.h"

Draw unit() {
    return Draw();
}

Draw overlay(const Draw& draw) {
    return unit().overlay(draw);
}

Draw margin_top(int32_t margin) {
    return Draw(DrawNode{MarginOp{Edge::TOP, margin}});
}

Draw margin_left(int32_t margin) {
    return Draw(DrawNode{MarginOp{Edge::LEFT, margin}});
}

Draw margin_right(int32_t margin) {
    return Draw(DrawNode{MarginOp{Edge::RIGHT, margin}});
}

Draw margin_bottom(int32_t margin) {
    return Draw(DrawNode{MarginOp{Edge::BOTTOM, margin}});
}

Draw margin_horizontal(int32_t margin) {
    return margin_left(margin).then(margin_right(margin));
}

Draw margin_vertical(int32_t margin) {
    return margin_top(margin).then(margin_bottom(margin));
}

Draw margin(int32_t amount) {
    return margin_horizontal(amount).then(margin_vertical(amount));
}

Draw offset_relative(int32_t dx, int32_t dy) {
    return Draw(DrawNode{OffsetOp{dx, dy}});
}

Draw offset_absolute(float fx, float fy) {
    return Draw(DrawNode{OffsetFractionOp{fx, fy}});
}

Draw set_x(int32_t x) {
    return Draw(DrawNode{SetFieldOp{Field::X, x}});
}

Draw set_y(int32_t y) {
    return Draw(DrawNode{SetFieldOp{Field::Y, y}});
}

Draw set_position(int32_t x, int32_t y) {
    return set_x(x).then(set_y(y));
}

Draw set_width(uint32_t width) {
    return Draw(DrawNode{SetFieldOp{Field::WIDTH, width}});
}

Draw set_height(uint32_t height) {
    return Draw(DrawNode{SetFieldOp{Field::HEIGHT, height}});
}

Draw set_size(uint32_t width, uint32_t height) {
    return set_width(width).then(set_height(height));
}

Draw set_rect(const DrawRect& rect) {
    return Draw(DrawNode{SetRectOp{rect}});
}

Draw horizontal(int32_t spacing, std::vector<Draw> children) {
    return Draw(DrawNode{ListOp{Axis::HORIZONTAL, false, spacing, std::move(children)}});
}

Draw vertical(int32_t spacing, std::vector<Draw> children) {
    return Draw(DrawNode{ListOp{Axis::VERTICAL, false, spacing, std::move(children)}});
}

Draw horizontal_fixed(int32_t stride, std::vector<Draw> children) {
    return Draw(DrawNode{ListOp{Axis::HORIZONTAL, true, stride, std::move(children)}});
}

Draw vertical_fixed(int32_t stride, std::vector<Draw> children) {
    return Draw(DrawNode{ListOp{Axis::VERTICAL, true, stride, std::move(children)}});
}

Draw clear() {
    return Draw(DrawNode{ClearOp{}});
}

Draw rect_fill(const Color& color) {
    return Draw(DrawNode{RectFillOp{color}});
}

Draw rect_stroke(uint32_t border_px, const Color& color) {
    return Draw(DrawNode{RectStrokeOp{border_px, color}});
}

Draw rect_border(uint32_t border_px, const Color& fill_color, const Color& stroke_color) {
    return rect_fill(fill_color).then(rect_stroke(border_px, stroke_color));
}

Draw circle_fill(uint32_t radius, const Color& color) {
    return Draw(DrawNode{CircleFillOp{radius, color}});
}

Draw circle_stroke(uint32_t radius, const Color& color) {
    return Draw(DrawNode{CircleStrokeOp{radius, color}});
}

Draw circle_border(uint32_t radius, const Color& fill_color, const Color& stroke_color) {
    return circle_fill(radius, fill_color).then(circle_stroke(radius, stroke_color));
}

Draw line(const Point& start, const Point& end, uint32_t width, const Color& color) {
    return Draw(DrawNode{LineOp{start, end, width, color}});
}

Draw image(std::shared_ptr<const Image> image) {
    return Draw(DrawNode{ImageOp{std::move(image)}});
}

Draw dump_region(std::function<void(std::vector<uint8_t>)> callback) {
    return Draw(DrawNode{DumpRegionOp{std::move(callback)}});
}

Draw restore_region(std::vector<uint8_t> data) {
    auto shared = std::make_shared<const std::vector<uint8_t>>(std::move(data));
    return Draw(DrawNode{RestoreRegionOp{std::move(shared)}});
}

Draw partial_refresh(const RefreshProfile& profile) {
    return Draw(DrawNode{RefreshOp{false, profile}});
}

Draw full_refresh(const RefreshProfile& profile) {
    return Draw(DrawNode{RefreshOp{true, profile}});
}

Draw recognize_gesture(Recognizer recognizer) {
    return Draw(DrawNode{RecognizeOp{std::move(recognizer)}});
}

Draw deferred(std::function<Draw(const DrawRect&)> builder) {
    return Draw(DrawNode{DeferredOp{std::move(builder)}});
}
