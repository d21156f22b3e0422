#include "pdf_layout/document.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace pdf_layout {

namespace {

template<typename T>
std::vector<const Element*> as_children(const std::vector<std::unique_ptr<T>>& items) {
    std::vector<const Element*> result;
    result.reserve(items.size());
    for (const auto& item : items) {
        result.push_back(item.get());
    }
    return result;
}

template<typename T>
std::string join_text(const std::vector<std::unique_ptr<T>>& items, const std::string& separator) {
    std::string result;
    for (const auto& item : items) {
        std::string text = item->to_string();
        if (text.empty()) {
            continue;
        }
        if (!result.empty()) {
            result += separator;
        }
        result += text;
    }
    return result;
}

template<typename T>
std::vector<BoundingBox> boxes_of(const std::vector<std::unique_ptr<T>>& items) {
    std::vector<BoundingBox> boxes;
    boxes.reserve(items.size());
    for (const auto& item : items) {
        boxes.push_back(item->box());
    }
    return boxes;
}

BoundingBox merged_or_throw(const std::vector<BoundingBox>& boxes, const char* what) {
    if (boxes.empty()) {
        throw std::invalid_argument(std::string(what) + " needs at least one child");
    }
    return BoundingBox::merge(boxes);
}

} // namespace

const char* to_string(ElementKind kind) {
    switch (kind) {
        case ElementKind::CHARACTER: return "character";
        case ElementKind::WORD: return "word";
        case ElementKind::PARAGRAPH: return "paragraph";
        case ElementKind::IMAGE: return "image";
        case ElementKind::TABLE_CELL: return "table-cell";
        case ElementKind::TABLE_ROW: return "table-row";
        case ElementKind::TABLE: return "table";
    }
    return "unknown";
}

Character::Character(const BoundingBox& box, std::string text, Font font)
    : Element(ElementKind::CHARACTER, box), text_(std::move(text)), font_(std::move(font)) {}

Word::Word(std::vector<std::unique_ptr<Character>> characters)
    : Element(ElementKind::WORD, merged_or_throw(boxes_of(characters), "Word")),
      characters_(std::move(characters)) {
    std::vector<Font> fonts;
    fonts.reserve(characters_.size());
    for (const auto& ch : characters_) {
        fonts.push_back(ch->font());
    }
    font_ = most_common_font(fonts);
}

Word::Word(const BoundingBox& box, std::string text, Font font)
    : Element(ElementKind::WORD, box), text_(std::move(text)), font_(std::move(font)) {}

std::string Word::to_string() const {
    if (characters_.empty()) {
        return text_;
    }
    std::string result;
    for (const auto& ch : characters_) {
        result += ch->text();
    }
    return result;
}

std::vector<const Element*> Word::children() const {
    return as_children(characters_);
}

Paragraph::Paragraph(std::vector<std::unique_ptr<Word>> words)
    : Element(ElementKind::PARAGRAPH, merged_or_throw(boxes_of(words), "Paragraph")),
      words_(std::move(words)) {}

std::string Paragraph::to_string() const {
    return join_text(words_, " ");
}

std::vector<const Element*> Paragraph::children() const {
    return as_children(words_);
}

Image::Image(const BoundingBox& box, std::string file)
    : Element(ElementKind::IMAGE, box), file_(std::move(file)) {}

TableCell::TableCell(const BoundingBox& box, int colspan, int rowspan,
                     std::vector<ElementPtr> content)
    : Element(ElementKind::TABLE_CELL, box),
      colspan_(colspan),
      rowspan_(rowspan),
      content_(std::move(content)) {
    if (colspan < 1 || rowspan < 1) {
        throw std::invalid_argument("TableCell spans must be at least 1, got colspan=" +
                                    std::to_string(colspan) + " rowspan=" +
                                    std::to_string(rowspan));
    }
}

std::string TableCell::to_string() const {
    return join_text(content_, " ");
}

std::vector<const Element*> TableCell::children() const {
    return as_children(content_);
}

TableRow::TableRow(const BoundingBox& box, std::vector<std::unique_ptr<TableCell>> cells)
    : Element(ElementKind::TABLE_ROW, box), cells_(std::move(cells)) {}

std::string TableRow::to_string() const {
    return join_text(cells_, " | ");
}

std::vector<const Element*> TableRow::children() const {
    return as_children(cells_);
}

Table::Table(const BoundingBox& box, std::vector<std::unique_ptr<TableRow>> rows, int column_count)
    : Element(ElementKind::TABLE, box), rows_(std::move(rows)), column_count_(column_count) {
    if (column_count < 0) {
        throw std::invalid_argument("Table column count cannot be negative");
    }
}

const TableCell* Table::cell_at(int row, int column) const {
    if (row < 0 || row >= row_count() || column < 0 || column >= column_count_) {
        throw std::out_of_range("Table slot (" + std::to_string(row) + ", " +
                                std::to_string(column) + ") is outside the grid");
    }

    // Replay the layout up to the requested row.
    std::vector<std::vector<const TableCell*>> grid(
        rows_.size(), std::vector<const TableCell*>(column_count_, nullptr));

    for (int r = 0; r <= row; ++r) {
        int c = 0;
        for (const auto& cell : rows_[r]->cells()) {
            while (c < column_count_ && grid[r][c] != nullptr) {
                c++;
            }
            int last_row = std::min(row_count(), r + cell->rowspan());
            int last_col = std::min(column_count_, c + cell->colspan());
            for (int rr = r; rr < last_row; ++rr) {
                for (int cc = c; cc < last_col; ++cc) {
                    if (grid[rr][cc] == nullptr) {
                        grid[rr][cc] = cell.get();
                    }
                }
            }
            c = last_col;
        }
    }

    return grid[row][column];
}

std::string Table::to_string() const {
    return join_text(rows_, "\n");
}

std::vector<const Element*> Table::children() const {
    return as_children(rows_);
}

Page::Page(int page_number, const BoundingBox& box, std::vector<ElementPtr> elements)
    : page_number_(page_number), box_(box), elements_(std::move(elements)) {
    if (page_number < 1) {
        throw std::invalid_argument("Page numbers start at 1, got " + std::to_string(page_number));
    }
}

size_t Page::splice(const std::vector<size_t>& indices, size_t fallback_index,
                    const SpliceBuilder& build) {
    std::vector<size_t> sorted = indices;
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
    if (!sorted.empty() && sorted.back() >= elements_.size()) {
        throw std::out_of_range("Splice index " + std::to_string(sorted.back()) +
                                " past end of page " + std::to_string(page_number_));
    }

    size_t insert_at = sorted.empty() ? std::min(fallback_index, elements_.size()) : sorted.front();
    if (sorted.empty()) {
        elements_.reserve(elements_.size() + 1);
    }

    std::vector<ElementPtr> removed;
    removed.reserve(sorted.size());
    for (size_t i : sorted) {
        removed.push_back(std::move(elements_[i]));
    }

    // Puts back whatever the builder did not take.
    auto restore = [this, &sorted, &removed]() {
        for (size_t i = 0; i < sorted.size() && i < removed.size(); ++i) {
            if (removed[i]) {
                elements_[sorted[i]] = std::move(removed[i]);
            }
        }
        elements_.erase(std::remove(elements_.begin(), elements_.end(), nullptr), elements_.end());
    };

    ElementPtr replacement;
    try {
        replacement = build(removed);
    } catch (...) {
        restore();
        throw;
    }
    if (!replacement) {
        restore();
        throw std::invalid_argument("Splice builder returned no element for page " +
                                    std::to_string(page_number_));
    }

    // Capacity is already there, so nothing below can throw.
    elements_.erase(std::remove(elements_.begin(), elements_.end(), nullptr), elements_.end());
    elements_.insert(elements_.begin() + static_cast<std::ptrdiff_t>(insert_at), std::move(replacement));
    return insert_at;
}

Document::Document(std::vector<Page> pages, std::string input_file)
    : pages_(std::move(pages)), input_file_(std::move(input_file)) {}

const Page& Document::page(int page_number) const {
    for (const auto& page : pages_) {
        if (page.page_number() == page_number) {
            return page;
        }
    }
    throw std::out_of_range("No page " + std::to_string(page_number) + " in document");
}

} // namespace pdf_layout
