#pragma once

#include <string>
#include <vector>

namespace pdf_layout {

enum class FontWeight {
    NORMAL,
    BOLD
};

struct Font {
    std::string name;
    double size = 0.0;
    FontWeight weight = FontWeight::NORMAL;
    bool italic = false;
    bool underline = false;
    std::string color = "#000000";

    static Font undefined();

    bool is_undefined() const { return name.empty() && size == 0.0; }

    bool operator==(const Font& other) const;
    bool operator!=(const Font& other) const { return !(*this == other); }
};

// Representative font of a run of glyphs: the largest group of equal fonts.
// Ties go to the group seen first. Empty input yields Font::undefined().
Font most_common_font(const std::vector<Font>& fonts);

} // namespace pdf_layout
