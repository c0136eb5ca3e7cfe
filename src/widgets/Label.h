#pragma once

#include "DrawNode.h"
#include "../core/Types.h"
#include <string>
#include <vector>

// Text with its glyph box's top-left at the cursor; the cursor becomes the box
Draw text(const std::string& text, float size, const Color& color = COLOR_BLACK);

// Text positioned so that origin (fractions of the measured box) sits at the
// cursor. (0.5, 0) centres the text horizontally below the cursor.
Draw text_aligned(const std::string& text, float size, const Vec2& origin,
                  const Color& color = COLOR_BLACK);

// One aligned text per whitespace-separated word, in order
std::vector<Draw> words_aligned(const std::string& text, float size, const Vec2& origin,
                                const Color& color = COLOR_BLACK);
