#include "pdf_layout/raw_table.h"
#include "pdf_layout/table_extractor.h"
#include <algorithm>
#include <cctype>

namespace pdf_layout {

namespace {

double flip(double y, double page_height, CoordinateOrigin origin) {
    return origin == CoordinateOrigin::BOTTOM_LEFT ? page_height - y : y;
}

RawCell parse_cell(const nlohmann::json& cell, double page_height, CoordinateOrigin origin) {
    if (!cell.is_object() || !cell.contains("bbox")) {
        throw ExtractorError("Table cell must be an object with a bbox");
    }
    const auto& bbox = cell["bbox"];
    if (!bbox.is_array() || bbox.size() != 4) {
        throw ExtractorError("Cell bbox must be [x0, y0, x1, y1]");
    }
    for (const auto& v : bbox) {
        if (!v.is_number()) {
            throw ExtractorError("Cell bbox values must be numbers");
        }
    }

    double x0 = bbox[0].get<double>();
    double y0 = flip(bbox[1].get<double>(), page_height, origin);
    double x1 = bbox[2].get<double>();
    double y1 = flip(bbox[3].get<double>(), page_height, origin);

    RawCell result;
    try {
        result.box = BoundingBox::from_corners(x0, y0, x1, y1);
    } catch (const std::invalid_argument& e) {
        throw ExtractorError(std::string("Invalid cell bbox: ") + e.what());
    }

    if (cell.contains("text") && !cell["text"].is_null()) {
        if (!cell["text"].is_string()) {
            throw ExtractorError("Cell text must be a string");
        }
        result.text = cell["text"].get<std::string>();
    }
    return result;
}

std::vector<std::pair<double, double>> parse_hints(const nlohmann::json& hints, bool vertical,
                                                   double page_height, CoordinateOrigin origin) {
    std::vector<std::pair<double, double>> result;
    if (!hints.is_array()) {
        throw ExtractorError("Grid hints must be an array of [lo, hi] pairs");
    }
    for (const auto& pair : hints) {
        if (!pair.is_array() || pair.size() != 2 || !pair[0].is_number() || !pair[1].is_number()) {
            throw ExtractorError("Grid hint must be a [lo, hi] pair of numbers");
        }
        double a = pair[0].get<double>();
        double b = pair[1].get<double>();
        if (vertical) {
            a = flip(a, page_height, origin);
            b = flip(b, page_height, origin);
        }
        result.emplace_back(std::min(a, b), std::max(a, b));
    }
    return result;
}

RawTableGrid parse_table(const nlohmann::json& table, double page_height, CoordinateOrigin origin) {
    RawTableGrid grid;
    const nlohmann::json* rows = &table;

    if (table.is_object()) {
        if (!table.contains("cells")) {
            throw ExtractorError("Table object must carry a cells array");
        }
        rows = &table["cells"];
        if (table.contains("cols")) {
            grid.column_hints = parse_hints(table["cols"], false, page_height, origin);
        }
        if (table.contains("rows")) {
            grid.row_hints = parse_hints(table["rows"], true, page_height, origin);
        }
    }

    if (!rows->is_array()) {
        throw ExtractorError("Table must be an array of rows");
    }

    for (const auto& row : *rows) {
        if (!row.is_array()) {
            throw ExtractorError("Table row must be an array of cells");
        }
        std::vector<RawCell> cells;
        cells.reserve(row.size());
        for (const auto& cell : row) {
            cells.push_back(parse_cell(cell, page_height, origin));
        }
        grid.rows.push_back(std::move(cells));
    }
    return grid;
}

} // namespace

size_t RawTableGrid::cell_count() const {
    size_t count = 0;
    for (const auto& row : rows) {
        count += row.size();
    }
    return count;
}

CoordinateOrigin parse_coordinate_origin(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    std::replace(lower.begin(), lower.end(), '_', '-');

    if (lower == "top-left") return CoordinateOrigin::TOP_LEFT;
    if (lower == "bottom-left") return CoordinateOrigin::BOTTOM_LEFT;

    throw std::invalid_argument("Unknown coordinate origin: " + name);
}

const char* to_string(CoordinateOrigin origin) {
    return origin == CoordinateOrigin::BOTTOM_LEFT ? "bottom-left" : "top-left";
}

std::vector<RawTableGrid> parse_table_payload(const nlohmann::json& payload,
                                              double page_height,
                                              CoordinateOrigin origin) {
    if (!payload.is_array()) {
        throw ExtractorError("Table payload must be an array of tables");
    }

    std::vector<RawTableGrid> tables;
    tables.reserve(payload.size());
    for (const auto& table : payload) {
        tables.push_back(parse_table(table, page_height, origin));
    }
    return tables;
}

std::vector<RawTableGrid> parse_table_payload(const std::string& payload,
                                              double page_height,
                                              CoordinateOrigin origin) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        throw ExtractorError(std::string("Table payload is not valid JSON: ") + e.what());
    }
    return parse_table_payload(json, page_height, origin);
}

} // namespace pdf_layout
