#pragma once

#include "DrawNode.h"
#include <functional>
#include <memory>
#include <vector>

// Cursor-only builders
Draw unit();
Draw overlay(const Draw& draw);

Draw margin_top(int32_t margin);
Draw margin_left(int32_t margin);
Draw margin_right(int32_t margin);
Draw margin_bottom(int32_t margin);
Draw margin_horizontal(int32_t margin);
Draw margin_vertical(int32_t margin);
Draw margin(int32_t margin);

Draw offset_relative(int32_t dx, int32_t dy);
// Moves by a fraction of the cursor's own size
Draw offset_absolute(float fx, float fy);

Draw set_x(int32_t x);
Draw set_y(int32_t y);
Draw set_position(int32_t x, int32_t y);
Draw set_width(uint32_t width);
Draw set_height(uint32_t height);
Draw set_size(uint32_t width, uint32_t height);
Draw set_rect(const DrawRect& rect);

// Lists. Each child starts from the current cursor; the cursor then shrinks
// by the child's extent plus spacing (or by the fixed stride). Stops once
// the cursor is empty.
Draw horizontal(int32_t spacing, std::vector<Draw> children);
Draw vertical(int32_t spacing, std::vector<Draw> children);
Draw horizontal_fixed(int32_t stride, std::vector<Draw> children);
Draw vertical_fixed(int32_t stride, std::vector<Draw> children);

// Leaves
Draw clear();
Draw rect_fill(const Color& color);
Draw rect_stroke(uint32_t border_px, const Color& color);
Draw rect_border(uint32_t border_px, const Color& fill_color, const Color& stroke_color);
Draw circle_fill(uint32_t radius, const Color& color);
Draw circle_stroke(uint32_t radius, const Color& color);
Draw circle_border(uint32_t radius, const Color& fill_color, const Color& stroke_color);

// Endpoints relative to the cursor origin; the cursor becomes the line bounds
Draw line(const Point& start, const Point& end, uint32_t width, const Color& color);

// Anchored top-left; the cursor becomes the image box
Draw image(std::shared_ptr<const Image> image);

Draw dump_region(std::function<void(std::vector<uint8_t>)> callback);
Draw restore_region(std::vector<uint8_t> data);

Draw partial_refresh(const RefreshProfile& profile = RefreshProfile());
Draw full_refresh(const RefreshProfile& profile = RefreshProfile());

// Registers recognizer, gated on touches starting inside the cursor
Draw recognize_gesture(Recognizer recognizer);

Draw deferred(std::function<Draw(const DrawRect&)> builder);
