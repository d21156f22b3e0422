#pragma once

#include "pdf_layout/bounding_box.h"
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace pdf_layout {

struct RawCell {
    BoundingBox box;
    std::string text;
};

// Table as reported by an extractor, before any span inference.
struct RawTableGrid {
    std::vector<std::vector<RawCell>> rows;

    // Optional ruling-grid boundaries ([lo, hi] pairs) when the extractor knows them.
    std::vector<std::pair<double, double>> column_hints;
    std::vector<std::pair<double, double>> row_hints;

    size_t cell_count() const;
};

// Where the extractor puts y = 0.
enum class CoordinateOrigin {
    TOP_LEFT,
    BOTTOM_LEFT
};

// Throws std::invalid_argument for an unknown name.
CoordinateOrigin parse_coordinate_origin(const std::string& name);
const char* to_string(CoordinateOrigin origin);

// Decodes one page's extractor payload into raw grids with top-down
// coordinates. `page_height` is used to flip BOTTOM_LEFT payloads.
// Throws ExtractorError on a malformed payload.
std::vector<RawTableGrid> parse_table_payload(const nlohmann::json& payload,
                                              double page_height,
                                              CoordinateOrigin origin);

std::vector<RawTableGrid> parse_table_payload(const std::string& payload,
                                              double page_height,
                                              CoordinateOrigin origin);

} // namespace pdf_layout
