#include "pdf_layout/document_serializer.h"
#include <fstream>
#include <stdexcept>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace pdf_layout {

namespace {

// ---- reading ----

BoundingBox read_box(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("Element box must be an object");
    }
    return BoundingBox(json.at("left").get<double>(), json.at("top").get<double>(),
                       json.at("width").get<double>(), json.at("height").get<double>());
}

Font read_font(const nlohmann::json& json) {
    if (json.is_null()) {
        return Font::undefined();
    }
    Font font;
    font.name = json.value("name", std::string());
    font.size = json.value("size", 0.0);
    font.weight = json.value("weight", std::string("normal")) == "bold" ? FontWeight::BOLD
                                                                      : FontWeight::NORMAL;
    font.italic = json.value("italic", false);
    font.underline = json.value("underline", false);
    font.color = json.value("color", std::string());
    return font;
}

std::unique_ptr<Character> read_character(const nlohmann::json& json) {
    return std::make_unique<Character>(read_box(json.at("box")),
                                       json.value("content", std::string()),
                                       read_font(json.value("font", nlohmann::json())));
}

std::unique_ptr<Word> read_word(const nlohmann::json& json) {
    if (json.contains("characters") && !json["characters"].empty()) {
        std::vector<std::unique_ptr<Character>> characters;
        for (const auto& ch : json["characters"]) {
            characters.push_back(read_character(ch));
        }
        return std::make_unique<Word>(std::move(characters));
    }
    return std::make_unique<Word>(read_box(json.at("box")),
                                  json.value("content", std::string()),
                                  read_font(json.value("font", nlohmann::json())));
}

ElementPtr read_element(const nlohmann::json& json);

std::vector<ElementPtr> read_elements(const nlohmann::json& json) {
    std::vector<ElementPtr> elements;
    if (json.is_null()) {
        return elements;
    }
    if (!json.is_array()) {
        throw std::invalid_argument("Element list must be an array");
    }
    for (const auto& item : json) {
        elements.push_back(read_element(item));
    }
    return elements;
}

std::unique_ptr<Table> read_table(const nlohmann::json& json) {
    std::vector<std::unique_ptr<TableRow>> rows;
    for (const auto& row : json.at("rows")) {
        std::vector<std::unique_ptr<TableCell>> cells;
        for (const auto& cell : row.at("cells")) {
            cells.push_back(std::make_unique<TableCell>(
                read_box(cell.at("box")),
                cell.value("colspan", 1),
                cell.value("rowspan", 1),
                read_elements(cell.value("content", nlohmann::json::array()))));
        }
        rows.push_back(std::make_unique<TableRow>(read_box(row.at("box")), std::move(cells)));
    }
    return std::make_unique<Table>(read_box(json.at("box")), std::move(rows),
                                   json.at("column_count").get<int>());
}

ElementPtr read_element(const nlohmann::json& json) {
    const std::string type = json.at("type").get<std::string>();

    if (type == "character") {
        return read_character(json);
    }
    if (type == "word") {
        return read_word(json);
    }
    if (type == "paragraph") {
        std::vector<std::unique_ptr<Word>> words;
        for (const auto& word : json.at("words")) {
            words.push_back(read_word(word));
        }
        return std::make_unique<Paragraph>(std::move(words));
    }
    if (type == "image") {
        return std::make_unique<Image>(read_box(json.at("box")), json.value("file", std::string()));
    }
    if (type == "table") {
        return read_table(json);
    }
    throw std::invalid_argument("Unknown element type: " + type);
}

// ---- writing ----

template<typename Writer>
void write_string(Writer& writer, const std::string& value) {
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

template<typename Writer>
void write_box(Writer& writer, const BoundingBox& box) {
    writer.Key("box");
    writer.StartObject();
    writer.Key("left");
    writer.Double(box.left());
    writer.Key("top");
    writer.Double(box.top());
    writer.Key("width");
    writer.Double(box.width());
    writer.Key("height");
    writer.Double(box.height());
    writer.EndObject();
}

template<typename Writer>
void write_font(Writer& writer, const Font& font) {
    writer.Key("font");
    if (font.is_undefined()) {
        writer.Null();
        return;
    }
    writer.StartObject();
    writer.Key("name");
    write_string(writer, font.name);
    writer.Key("size");
    writer.Double(font.size);
    writer.Key("weight");
    writer.String(font.weight == FontWeight::BOLD ? "bold" : "normal");
    writer.Key("italic");
    writer.Bool(font.italic);
    writer.Key("underline");
    writer.Bool(font.underline);
    writer.Key("color");
    write_string(writer, font.color);
    writer.EndObject();
}

template<typename Writer>
void write_element(Writer& writer, const Element& element);

template<typename Writer>
void write_word(Writer& writer, const Word& word) {
    writer.StartObject();
    writer.Key("type");
    writer.String("word");
    write_box(writer, word.box());
    writer.Key("content");
    write_string(writer, word.to_string());
    write_font(writer, word.font());
    if (!word.characters().empty()) {
        writer.Key("characters");
        writer.StartArray();
        for (const auto& ch : word.characters()) {
            write_element(writer, *ch);
        }
        writer.EndArray();
    }
    writer.EndObject();
}

template<typename Writer>
void write_table(Writer& writer, const Table& table) {
    writer.StartObject();
    writer.Key("type");
    writer.String("table");
    write_box(writer, table.box());
    writer.Key("column_count");
    writer.Int(table.column_count());
    writer.Key("rows");
    writer.StartArray();
    for (const auto& row : table.rows()) {
        writer.StartObject();
        writer.Key("type");
        writer.String("table-row");
        write_box(writer, row->box());
        writer.Key("cells");
        writer.StartArray();
        for (const auto& cell : row->cells()) {
            writer.StartObject();
            writer.Key("type");
            writer.String("table-cell");
            write_box(writer, cell->box());
            writer.Key("colspan");
            writer.Int(cell->colspan());
            writer.Key("rowspan");
            writer.Int(cell->rowspan());
            writer.Key("content");
            writer.StartArray();
            for (const auto& item : cell->content()) {
                write_element(writer, *item);
            }
            writer.EndArray();
            writer.EndObject();
        }
        writer.EndArray();
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();
}

template<typename Writer>
void write_element(Writer& writer, const Element& element) {
    switch (element.kind()) {
        case ElementKind::CHARACTER: {
            const auto& ch = static_cast<const Character&>(element);
            writer.StartObject();
            writer.Key("type");
            writer.String("character");
            write_box(writer, ch.box());
            writer.Key("content");
            write_string(writer, ch.text());
            write_font(writer, ch.font());
            writer.EndObject();
            break;
        }
        case ElementKind::WORD:
            write_word(writer, static_cast<const Word&>(element));
            break;
        case ElementKind::PARAGRAPH: {
            const auto& paragraph = static_cast<const Paragraph&>(element);
            writer.StartObject();
            writer.Key("type");
            writer.String("paragraph");
            write_box(writer, paragraph.box());
            writer.Key("words");
            writer.StartArray();
            for (const auto& word : paragraph.words()) {
                write_word(writer, *word);
            }
            writer.EndArray();
            writer.EndObject();
            break;
        }
        case ElementKind::IMAGE: {
            const auto& image = static_cast<const Image&>(element);
            writer.StartObject();
            writer.Key("type");
            writer.String("image");
            write_box(writer, image.box());
            writer.Key("file");
            write_string(writer, image.file());
            writer.EndObject();
            break;
        }
        case ElementKind::TABLE:
            write_table(writer, static_cast<const Table&>(element));
            break;
        case ElementKind::TABLE_ROW:
        case ElementKind::TABLE_CELL:
            throw std::invalid_argument(std::string("Cannot write a detached ") +
                                        pdf_layout::to_string(element.kind()));
    }
}

template<typename Writer>
void write_document(Writer& writer, const Document& document) {
    writer.StartObject();
    writer.Key("input_file");
    write_string(writer, document.input_file());
    writer.Key("pages");
    writer.StartArray();
    for (const auto& page : document.pages()) {
        writer.StartObject();
        writer.Key("page_number");
        writer.Int(page.page_number());
        write_box(writer, page.box());
        writer.Key("elements");
        writer.StartArray();
        for (const auto& element : page.elements()) {
            write_element(writer, *element);
        }
        writer.EndArray();
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();
}

} // namespace

Document DocumentSerializer::from_json(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("pages") || !json["pages"].is_array()) {
        throw std::invalid_argument("Document JSON must be an object with a pages array");
    }

    try {
        std::vector<Page> pages;
        for (const auto& page : json["pages"]) {
            pages.emplace_back(page.at("page_number").get<int>(), read_box(page.at("box")),
                               read_elements(page.value("elements", nlohmann::json::array())));
        }
        return Document(std::move(pages), json.value("input_file", std::string()));
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Malformed document JSON: ") + e.what());
    }
}

Document DocumentSerializer::from_string(const std::string& text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::string("Document is not valid JSON: ") + e.what());
    }
    return from_json(json);
}

Document DocumentSerializer::read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open document file: " + path);
    }
    nlohmann::json json;
    try {
        in >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Document file " + path + " is not valid JSON: " + e.what());
    }
    return from_json(json);
}

std::string DocumentSerializer::to_string(const Document& document, bool pretty) {
    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        write_document(writer, document);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        write_document(writer, document);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

void DocumentSerializer::write_file(const Document& document, const std::string& path, bool pretty) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write document file: " + path);
    }
    out << to_string(document, pretty);
    if (!out) {
        throw std::runtime_error("Failed writing document file: " + path);
    }
}

} // namespace pdf_layout
