#pragma once

#include "Rect.h"
#include "Types.h"
#include <cstdint>
#include <string>
#include <vector>

// Drawing capability handed to the draw interpreter. Owned by the render
// thread; every call happens on that thread.
class Surface {
public:
    virtual ~Surface() = default;

    virtual uint32_t get_width() const = 0;
    virtual uint32_t get_height() const = 0;

    DrawRect bounds() const { return DrawRect(0, 0, get_width(), get_height()); }

    virtual void clear() = 0;
    virtual void fill_rect(const DrawRect& rect, const Color& color) = 0;
    virtual void stroke_rect(const DrawRect& rect, uint32_t border_px, const Color& color) = 0;
    virtual void fill_circle(const Point& center, uint32_t radius, const Color& color) = 0;
    virtual void stroke_circle(const Point& center, uint32_t radius, const Color& color) = 0;

    // Returns the bounding rect of the drawn line
    virtual DrawRect draw_line(const Point& start, const Point& end,
                               uint32_t width, const Color& color) = 0;

    // Draws with the glyph box's top-left at position; returns the box.
    // A dry run only measures.
    virtual DrawRect draw_text(const Point& position, const std::string& text,
                               float size, const Color& color, bool dry_run) = 0;

    virtual DrawRect draw_image(const Image& image, const Point& position) = 0;

    // Raw surface bytes for a region, rows top to bottom
    virtual std::vector<uint8_t> dump_region(const DrawRect& rect) = 0;
    virtual bool restore_region(const DrawRect& rect, const std::vector<uint8_t>& data) = 0;

    virtual void partial_refresh(const DrawRect& rect, const RefreshProfile& profile) = 0;
    virtual void full_refresh(const RefreshProfile& profile) = 0;
};
