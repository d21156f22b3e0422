#include <gtest/gtest.h>
#include <pdf_layout/document.h>
#include <pdf_layout/font.h>
#include <stdexcept>

using namespace pdf_layout;

namespace {

Font make_font(const std::string& name, double size, FontWeight weight = FontWeight::NORMAL) {
    Font font;
    font.name = name;
    font.size = size;
    font.weight = weight;
    return font;
}

std::unique_ptr<Word> make_word(double left, double top, const std::string& text) {
    return std::make_unique<Word>(BoundingBox(left, top, 10.0 * text.size(), 10), text,
                                  make_font("Helvetica", 10));
}

std::unique_ptr<TableCell> make_cell(int colspan, int rowspan, const std::string& text = "") {
    std::vector<ElementPtr> content;
    if (!text.empty()) {
        content.push_back(make_word(0, 0, text));
    }
    return std::make_unique<TableCell>(BoundingBox(0, 0, 10, 10), colspan, rowspan,
                                       std::move(content));
}

Page make_page(std::vector<std::string> texts) {
    std::vector<ElementPtr> elements;
    double top = 0;
    for (const auto& text : texts) {
        elements.push_back(make_word(0, top, text));
        top += 20;
    }
    return Page(1, BoundingBox(0, 0, 600, 800), std::move(elements));
}

std::vector<std::string> texts_of(const Page& page) {
    std::vector<std::string> result;
    for (const auto& element : page.elements()) {
        result.push_back(element->to_string());
    }
    return result;
}

} // namespace

TEST(FontTest, MostCommonWins) {
    Font regular = make_font("Times", 11);
    Font bold = make_font("Times", 11, FontWeight::BOLD);

    EXPECT_EQ(most_common_font({bold, regular, regular}), regular);
}

TEST(FontTest, TieGoesToFirstSeen) {
    Font a = make_font("A", 9);
    Font b = make_font("B", 9);

    EXPECT_EQ(most_common_font({b, a, a, b}), b);
}

TEST(FontTest, EmptyInputIsUndefined) {
    EXPECT_TRUE(most_common_font({}).is_undefined());
    EXPECT_FALSE(make_font("A", 9).is_undefined());
}

TEST(DocumentTest, WordFromCharacters) {
    Font regular = make_font("Times", 11);
    Font italic = regular;
    italic.italic = true;

    std::vector<std::unique_ptr<Character>> chars;
    chars.push_back(std::make_unique<Character>(BoundingBox(0, 0, 5, 10), "a", italic));
    chars.push_back(std::make_unique<Character>(BoundingBox(5, 1, 5, 10), "b", regular));
    chars.push_back(std::make_unique<Character>(BoundingBox(10, 0, 5, 10), "c", regular));

    Word word(std::move(chars));
    EXPECT_EQ(word.to_string(), "abc");
    EXPECT_EQ(word.box(), BoundingBox(0, 0, 15, 11));
    EXPECT_EQ(word.font(), regular);
    EXPECT_EQ(word.children().size(), 3u);
}

TEST(DocumentTest, WordNeedsCharacters) {
    EXPECT_THROW(Word(std::vector<std::unique_ptr<Character>>{}), std::invalid_argument);
}

TEST(DocumentTest, ParagraphJoinsWords) {
    std::vector<std::unique_ptr<Word>> words;
    words.push_back(make_word(0, 0, "hello"));
    words.push_back(make_word(60, 0, "world"));

    Paragraph paragraph(std::move(words));
    EXPECT_EQ(paragraph.to_string(), "hello world");
    EXPECT_EQ(paragraph.box(), BoundingBox(0, 0, 110, 10));
}

TEST(DocumentTest, CellSpansMustBePositive) {
    EXPECT_THROW(make_cell(0, 1), std::invalid_argument);
    EXPECT_THROW(make_cell(1, 0), std::invalid_argument);
    EXPECT_NO_THROW(make_cell(2, 3));
}

TEST(DocumentTest, KindNames) {
    EXPECT_STREQ(to_string(ElementKind::TABLE_CELL), "table-cell");
    EXPECT_STREQ(to_string(ElementKind::TABLE_ROW), "table-row");
    EXPECT_STREQ(to_string(ElementKind::WORD), "word");
}

TEST(DocumentTest, CellAtFollowsSpans) {
    // A | B B
    // A | C D
    std::vector<std::unique_ptr<TableRow>> rows;

    std::vector<std::unique_ptr<TableCell>> first;
    first.push_back(make_cell(1, 2, "A"));
    first.push_back(make_cell(2, 1, "B"));
    rows.push_back(std::make_unique<TableRow>(BoundingBox(0, 0, 30, 10), std::move(first)));

    std::vector<std::unique_ptr<TableCell>> second;
    second.push_back(make_cell(1, 1, "C"));
    second.push_back(make_cell(1, 1, "D"));
    rows.push_back(std::make_unique<TableRow>(BoundingBox(0, 10, 30, 10), std::move(second)));

    Table table(BoundingBox(0, 0, 30, 20), std::move(rows), 3);

    EXPECT_EQ(table.row_count(), 2);
    EXPECT_EQ(table.cell_at(0, 0)->to_string(), "A");
    EXPECT_EQ(table.cell_at(1, 0)->to_string(), "A");
    EXPECT_EQ(table.cell_at(0, 2)->to_string(), "B");
    EXPECT_EQ(table.cell_at(1, 1)->to_string(), "C");
    EXPECT_EQ(table.cell_at(1, 2)->to_string(), "D");
    EXPECT_THROW(table.cell_at(2, 0), std::out_of_range);
    EXPECT_THROW(table.cell_at(0, 3), std::out_of_range);
}

TEST(DocumentTest, ElementsOfTypeWalksTheTree) {
    std::vector<ElementPtr> elements;
    elements.push_back(make_word(0, 0, "before"));

    std::vector<std::unique_ptr<TableCell>> cells;
    cells.push_back(make_cell(1, 1, "inside"));
    std::vector<std::unique_ptr<TableRow>> rows;
    rows.push_back(std::make_unique<TableRow>(BoundingBox(0, 20, 100, 10), std::move(cells)));
    elements.push_back(std::make_unique<Table>(BoundingBox(0, 20, 100, 10), std::move(rows), 1));

    Page page(1, BoundingBox(0, 0, 600, 800), std::move(elements));

    EXPECT_EQ(page.elements_of_type<Word>().size(), 2u);
    EXPECT_EQ(page.elements_of_type<Word>(false).size(), 1u);
    EXPECT_EQ(page.elements_of_type<TableCell>().size(), 1u);
    EXPECT_EQ(page.elements_of_type<Table>().size(), 1u);
    EXPECT_EQ(page.elements_of_type<Element>(false).size(), 2u);
}

TEST(DocumentTest, PageNumbersStartAtOne) {
    EXPECT_THROW(Page(0, BoundingBox(0, 0, 10, 10)), std::invalid_argument);
}

TEST(DocumentTest, SpliceReplacesAtFirstRemovedIndex) {
    Page page = make_page({"a", "b", "c", "d", "e"});

    std::vector<std::string> seen;
    size_t index = page.splice({3, 1}, 0, [&seen](std::vector<ElementPtr>& removed) -> ElementPtr {
        for (const auto& e : removed) {
            seen.push_back(e->to_string());
        }
        return std::make_unique<Word>(BoundingBox(0, 0, 10, 10), "X", Font::undefined());
    });

    EXPECT_EQ(index, 1u);
    EXPECT_EQ(seen, (std::vector<std::string>{"b", "d"}));
    EXPECT_EQ(texts_of(page), (std::vector<std::string>{"a", "X", "c", "e"}));
}

TEST(DocumentTest, SpliceWithNothingRemovedUsesFallback) {
    Page page = make_page({"a", "b"});

    size_t index = page.splice({}, 1, [](std::vector<ElementPtr>& removed) -> ElementPtr {
        EXPECT_TRUE(removed.empty());
        return std::make_unique<Word>(BoundingBox(0, 0, 10, 10), "X", Font::undefined());
    });

    EXPECT_EQ(index, 1u);
    EXPECT_EQ(texts_of(page), (std::vector<std::string>{"a", "X", "b"}));
}

TEST(DocumentTest, SpliceRejectsBadIndex) {
    Page page = make_page({"a", "b"});

    EXPECT_THROW(page.splice({5}, 0, [](std::vector<ElementPtr>&) -> ElementPtr { return nullptr; }),
                 std::out_of_range);
    EXPECT_EQ(page.elements().size(), 2u);
}

TEST(DocumentTest, FailedSpliceLeavesPageIntact) {
    Page page = make_page({"a", "b", "c"});

    EXPECT_THROW(page.splice({0, 2}, 0, [](std::vector<ElementPtr>&) -> ElementPtr {
                     throw std::runtime_error("builder failed");
                 }),
                 std::runtime_error);
    for (const auto& element : page.elements()) {
        ASSERT_NE(element.get(), nullptr);
    }
    EXPECT_EQ(texts_of(page), (std::vector<std::string>{"a", "b", "c"}));

    EXPECT_THROW(page.splice({1}, 0, [](std::vector<ElementPtr>&) -> ElementPtr { return nullptr; }),
                 std::invalid_argument);
    EXPECT_EQ(texts_of(page), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(DocumentTest, FailedSpliceDropsOnlyTakenElements) {
    Page page = make_page({"a", "b", "c"});

    EXPECT_THROW(page.splice({0, 2}, 0, [](std::vector<ElementPtr>& removed) -> ElementPtr {
                     ElementPtr taken = std::move(removed[0]);
                     throw std::runtime_error("builder failed");
                 }),
                 std::runtime_error);
    for (const auto& element : page.elements()) {
        ASSERT_NE(element.get(), nullptr);
    }
    EXPECT_EQ(texts_of(page), (std::vector<std::string>{"b", "c"}));
}

TEST(DocumentTest, PageLookup) {
    std::vector<Page> pages;
    pages.push_back(make_page({"a"}));
    pages.emplace_back(2, BoundingBox(0, 0, 600, 800));
    Document document(std::move(pages), "in.pdf");

    EXPECT_EQ(document.page(2).page_number(), 2);
    EXPECT_EQ(document.input_file(), "in.pdf");
    EXPECT_THROW(document.page(3), std::out_of_range);
    EXPECT_EQ(document.elements_of_type<Word>().size(), 1u);
}
