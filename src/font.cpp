#include "pdf_layout/font.h"
#include <algorithm>

namespace pdf_layout {

Font Font::undefined() {
    Font font;
    font.color.clear();
    return font;
}

bool Font::operator==(const Font& other) const {
    return name == other.name && size == other.size && weight == other.weight &&
           italic == other.italic && underline == other.underline && color == other.color;
}

Font most_common_font(const std::vector<Font>& fonts) {
    struct Group {
        const Font* representative;
        size_t count;
    };

    std::vector<Group> groups;
    for (const auto& font : fonts) {
        auto it = std::find_if(groups.begin(), groups.end(), [&font](const Group& g) {
            return *g.representative == font;
        });
        if (it != groups.end()) {
            it->count++;
        } else {
            groups.push_back({&font, 1});
        }
    }

    if (groups.empty()) {
        return Font::undefined();
    }

    std::stable_sort(groups.begin(), groups.end(), [](const Group& a, const Group& b) {
        return a.count > b.count;
    });
    return *groups.front().representative;
}

} // namespace pdf_layout
