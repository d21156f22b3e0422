#pragma once

#include "pdf_layout/bounding_box.h"
#include "pdf_layout/font.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace pdf_layout {

enum class ElementKind {
    CHARACTER,
    WORD,
    PARAGRAPH,
    IMAGE,
    TABLE_CELL,
    TABLE_ROW,
    TABLE
};

const char* to_string(ElementKind kind);

class Element {
public:
    virtual ~Element() = default;

    Element(const Element&) = delete;
    Element& operator=(const Element&) = delete;

    const BoundingBox& box() const { return box_; }
    ElementKind kind() const { return kind_; }

    virtual std::string to_string() const = 0;

    // Direct children in document order.
    virtual std::vector<const Element*> children() const { return {}; }

protected:
    Element(ElementKind kind, const BoundingBox& box) : box_(box), kind_(kind) {}

private:
    BoundingBox box_;
    ElementKind kind_;
};

using ElementPtr = std::unique_ptr<Element>;

class Character : public Element {
public:
    Character(const BoundingBox& box, std::string text, Font font);

    const std::string& text() const { return text_; }
    const Font& font() const { return font_; }

    std::string to_string() const override { return text_; }

private:
    std::string text_;
    Font font_;
};

class Word : public Element {
public:
    // Box is the merge of the character boxes, font the most common one.
    // Throws std::invalid_argument when characters is empty.
    explicit Word(std::vector<std::unique_ptr<Character>> characters);

    // For sources that only report word-level geometry.
    Word(const BoundingBox& box, std::string text, Font font);

    const std::vector<std::unique_ptr<Character>>& characters() const { return characters_; }
    const Font& font() const { return font_; }

    std::string to_string() const override;
    std::vector<const Element*> children() const override;

private:
    std::vector<std::unique_ptr<Character>> characters_;
    std::string text_;
    Font font_;
};

class Paragraph : public Element {
public:
    // Throws std::invalid_argument when words is empty.
    explicit Paragraph(std::vector<std::unique_ptr<Word>> words);

    const std::vector<std::unique_ptr<Word>>& words() const { return words_; }

    std::string to_string() const override;
    std::vector<const Element*> children() const override;

private:
    std::vector<std::unique_ptr<Word>> words_;
};

class Image : public Element {
public:
    Image(const BoundingBox& box, std::string file);

    const std::string& file() const { return file_; }

    std::string to_string() const override { return std::string(); }

private:
    std::string file_;
};

class TableCell : public Element {
public:
    // Throws std::invalid_argument when a span is below 1.
    TableCell(const BoundingBox& box, int colspan, int rowspan, std::vector<ElementPtr> content);

    int colspan() const { return colspan_; }
    int rowspan() const { return rowspan_; }
    const std::vector<ElementPtr>& content() const { return content_; }

    std::string to_string() const override;
    std::vector<const Element*> children() const override;

private:
    int colspan_;
    int rowspan_;
    std::vector<ElementPtr> content_;
};

// Cells covered by a rowspan from an earlier row are not repeated here.
class TableRow : public Element {
public:
    TableRow(const BoundingBox& box, std::vector<std::unique_ptr<TableCell>> cells);

    const std::vector<std::unique_ptr<TableCell>>& cells() const { return cells_; }

    std::string to_string() const override;
    std::vector<const Element*> children() const override;

private:
    std::vector<std::unique_ptr<TableCell>> cells_;
};

class Table : public Element {
public:
    Table(const BoundingBox& box, std::vector<std::unique_ptr<TableRow>> rows, int column_count);

    const std::vector<std::unique_ptr<TableRow>>& rows() const { return rows_; }
    int column_count() const { return column_count_; }
    int row_count() const { return static_cast<int>(rows_.size()); }

    // Cell occupying a grid slot, following colspan and rowspan. nullptr for an
    // unoccupied slot. Throws std::out_of_range outside the grid.
    const TableCell* cell_at(int row, int column) const;

    std::string to_string() const override;
    std::vector<const Element*> children() const override;

private:
    std::vector<std::unique_ptr<TableRow>> rows_;
    int column_count_;
};

namespace detail {

template<typename T>
void collect_of_type(const Element& element, bool deep, std::vector<const T*>& out) {
    if (auto typed = dynamic_cast<const T*>(&element)) {
        out.push_back(typed);
    }
    if (!deep) {
        return;
    }
    for (const Element* child : element.children()) {
        collect_of_type<T>(*child, deep, out);
    }
}

} // namespace detail

class Page {
public:
    Page(int page_number, const BoundingBox& box, std::vector<ElementPtr> elements = {});

    Page(Page&&) = default;
    Page& operator=(Page&&) = default;

    int page_number() const { return page_number_; }
    const BoundingBox& box() const { return box_; }
    const std::vector<ElementPtr>& elements() const { return elements_; }

    // Pre-order walk of the element tree; with deep = false only top-level
    // elements are considered.
    template<typename T>
    std::vector<const T*> elements_of_type(bool deep = true) const {
        std::vector<const T*> result;
        for (const auto& element : elements_) {
            detail::collect_of_type<T>(*element, deep, result);
        }
        return result;
    }

    using SpliceBuilder = std::function<ElementPtr(std::vector<ElementPtr>& removed)>;

    // Removes the elements at `indices`, hands them to `build` in page order
    // and puts the built element where the first removed one was, or at
    // `fallback_index` when nothing is removed. Returns the index of the
    // inserted element.
    //
    // If `build` throws or returns null, the page keeps every element the
    // builder left in `removed`, in its old place, and the error propagates.
    size_t splice(const std::vector<size_t>& indices, size_t fallback_index,
                  const SpliceBuilder& build);

private:
    int page_number_;
    BoundingBox box_;
    std::vector<ElementPtr> elements_;
};

class Document {
public:
    explicit Document(std::vector<Page> pages = {}, std::string input_file = std::string());

    Document(Document&&) = default;
    Document& operator=(Document&&) = default;

    const std::vector<Page>& pages() const { return pages_; }
    std::vector<Page>& pages() { return pages_; }

    // Throws std::out_of_range for an unknown page number.
    const Page& page(int page_number) const;

    const std::string& input_file() const { return input_file_; }

    template<typename T>
    std::vector<const T*> elements_of_type(bool deep = true) const {
        std::vector<const T*> result;
        for (const auto& page : pages_) {
            auto found = page.elements_of_type<T>(deep);
            result.insert(result.end(), found.begin(), found.end());
        }
        return result;
    }

private:
    std::vector<Page> pages_;
    std::string input_file_;
};

} // namespace pdf_layout
