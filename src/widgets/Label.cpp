#include "Label.h"
#include <sstream>

Draw text(const std::string& text, float size, const Color& color) {
    return Draw(DrawNode{TextOp{text, size, color, false, Vec2()}});
}

Draw text_aligned(const std::string& text, float size, const Vec2& origin, const Color& color) {
    return Draw(DrawNode{TextOp{text, size, color, true, origin}});
}

std::vector<Draw> words_aligned(const std::string& text, float size, const Vec2& origin,
                                const Color& color) {
    std::vector<Draw> words;
    std::istringstream stream(text);
    for (std::string word; stream >> word; ) {
        words.push_back(text_aligned(word, size, origin, color));
    }
    return words;
}
