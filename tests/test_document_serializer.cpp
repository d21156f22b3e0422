#include <gtest/gtest.h>
#include <pdf_layout/document_serializer.h>
#include <filesystem>

using namespace pdf_layout;

namespace fs = std::filesystem;

class DocumentSerializerTest : public ::testing::Test {
protected:
    Document CreateDocument() {
        Font bold;
        bold.name = "Helvetica-Bold";
        bold.size = 12;
        bold.weight = FontWeight::BOLD;

        std::vector<std::unique_ptr<Character>> chars;
        chars.push_back(std::make_unique<Character>(BoundingBox(10, 10, 6, 12), "H", bold));
        chars.push_back(std::make_unique<Character>(BoundingBox(16, 10, 6, 12), "i", bold));

        std::vector<std::unique_ptr<Word>> words;
        words.push_back(std::make_unique<Word>(std::move(chars)));
        words.push_back(std::make_unique<Word>(BoundingBox(30, 10, 20, 12), "there", Font::undefined()));

        std::vector<ElementPtr> cell_content;
        cell_content.push_back(std::make_unique<Word>(BoundingBox(102, 102, 20, 10), "42", Font::undefined()));
        std::vector<std::unique_ptr<TableCell>> cells;
        cells.push_back(std::make_unique<TableCell>(BoundingBox(100, 100, 100, 20), 2, 1,
                                                    std::move(cell_content)));
        std::vector<std::unique_ptr<TableRow>> rows;
        rows.push_back(std::make_unique<TableRow>(BoundingBox(100, 100, 100, 20), std::move(cells)));

        std::vector<ElementPtr> elements;
        elements.push_back(std::make_unique<Paragraph>(std::move(words)));
        elements.push_back(std::make_unique<Table>(BoundingBox(100, 100, 100, 20), std::move(rows), 2));
        elements.push_back(std::make_unique<Image>(BoundingBox(0, 300, 200, 100), "figure1.png"));

        std::vector<Page> pages;
        pages.emplace_back(1, BoundingBox(0, 0, 612, 792), std::move(elements));
        return Document(std::move(pages), "sample.pdf");
    }
};

TEST_F(DocumentSerializerTest, WritesExpectedShape) {
    auto json = nlohmann::json::parse(DocumentSerializer::to_string(CreateDocument()));

    EXPECT_EQ(json["input_file"], "sample.pdf");
    ASSERT_EQ(json["pages"].size(), 1u);
    const auto& page = json["pages"][0];
    EXPECT_EQ(page["page_number"], 1);
    EXPECT_EQ(page["box"]["width"], 612.0);

    const auto& elements = page["elements"];
    ASSERT_EQ(elements.size(), 3u);
    EXPECT_EQ(elements[0]["type"], "paragraph");
    EXPECT_EQ(elements[0]["words"][0]["content"], "Hi");
    EXPECT_EQ(elements[0]["words"][0]["font"]["weight"], "bold");
    EXPECT_EQ(elements[0]["words"][0]["characters"].size(), 2u);
    EXPECT_TRUE(elements[0]["words"][1]["font"].is_null());
    EXPECT_FALSE(elements[0]["words"][1].contains("characters"));

    const auto& table = elements[1];
    EXPECT_EQ(table["type"], "table");
    EXPECT_EQ(table["column_count"], 2);
    EXPECT_EQ(table["rows"][0]["type"], "table-row");
    EXPECT_EQ(table["rows"][0]["cells"][0]["type"], "table-cell");
    EXPECT_EQ(table["rows"][0]["cells"][0]["colspan"], 2);
    EXPECT_EQ(table["rows"][0]["cells"][0]["content"][0]["content"], "42");

    EXPECT_EQ(elements[2]["type"], "image");
    EXPECT_EQ(elements[2]["file"], "figure1.png");
}

TEST_F(DocumentSerializerTest, ReadBackGivesSameDocument) {
    const std::string written = DocumentSerializer::to_string(CreateDocument());
    Document read = DocumentSerializer::from_string(written);

    EXPECT_EQ(DocumentSerializer::to_string(read), written);
    ASSERT_EQ(read.elements_of_type<Table>().size(), 1u);
    EXPECT_EQ(read.elements_of_type<Table>()[0]->cell_at(0, 1)->to_string(), "42");
    EXPECT_EQ(read.elements_of_type<Character>().size(), 2u);
}

TEST_F(DocumentSerializerTest, FileRoundTrip) {
    fs::path path = fs::temp_directory_path() / "pdf_layout_serializer_test.json";
    DocumentSerializer::write_file(CreateDocument(), path.string());

    Document read = DocumentSerializer::read_file(path.string());
    EXPECT_EQ(read.input_file(), "sample.pdf");
    EXPECT_EQ(read.page(1).elements().size(), 3u);

    fs::remove(path);
}

TEST_F(DocumentSerializerTest, PrettyOutputParsesTheSame) {
    Document document = CreateDocument();
    auto compact = nlohmann::json::parse(DocumentSerializer::to_string(document, false));
    auto pretty = nlohmann::json::parse(DocumentSerializer::to_string(document, true));
    EXPECT_EQ(compact, pretty);
}

TEST_F(DocumentSerializerTest, MalformedInputThrows) {
    EXPECT_THROW(DocumentSerializer::from_string("{"), std::invalid_argument);
    EXPECT_THROW(DocumentSerializer::from_string(R"({"input_file": "x"})"), std::invalid_argument);
    EXPECT_THROW(DocumentSerializer::from_string(
                     R"({"pages": [{"page_number": 1, "box": {"left": 0, "top": 0, "width": 1, "height": 1},
                                    "elements": [{"type": "hologram"}]}]})"),
                 std::invalid_argument);
    EXPECT_THROW(DocumentSerializer::from_string(R"({"pages": [{"page_number": 1}]})"),
                 std::invalid_argument);
    EXPECT_THROW(DocumentSerializer::read_file("/nonexistent/doc.json"), std::runtime_error);
}
