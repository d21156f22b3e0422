#pragma once

#include "pdf_layout/document.h"
#include <string>
#include <nlohmann/json.hpp>

namespace pdf_layout {

// JSON form of the document tree. Reading goes through nlohmann::json,
// writing streams through rapidjson so large documents never build a DOM.
class DocumentSerializer {
public:
    // Throws std::invalid_argument on a malformed document.
    static Document from_json(const nlohmann::json& json);
    static Document from_string(const std::string& text);
    static Document read_file(const std::string& path);

    static std::string to_string(const Document& document, bool pretty = false);

    // Throws std::runtime_error when the file cannot be written.
    static void write_file(const Document& document, const std::string& path, bool pretty = true);
};

} // namespace pdf_layout
