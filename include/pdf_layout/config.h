#pragma once

#include "pdf_layout/processing_context.h"
#include "pdf_layout/raw_table.h"
#include "pdf_layout/table_detection_stage.h"
#include "pdf_layout/text_extractor.h"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace pdf_layout {

// Settings for one pdf_layout run, read from a JSON file:
//
//   {
//     "log_level": "info",
//     "extract": {"images": true, "group_paragraphs": false, "page_limit": 0},
//     "table_detection": {
//       "origin": "bottom-left",
//       "command": "extract-tables {file} {page}",
//       "payload_file": "tables.json",
//       "extractor_concurrency": 4,
//       "boundary_tolerance": 2.0,
//       "coverage_threshold": 0.5,
//       "subsumption_threshold": 0.5,
//       "refine_with_all_rows": false
//     }
//   }
struct PipelineConfig {
    LogLevel log_level = LogLevel::INFO;
    ExtractOptions extract;

    // Unset: each extractor uses its own default.
    std::optional<CoordinateOrigin> origin;
    std::string extractor_command;
    std::string payload_file;
    TableDetectionOptions table_detection;
};

// Missing keys keep their defaults. Throws std::invalid_argument on values of
// the wrong type or out of range.
PipelineConfig config_from_json(const nlohmann::json& json);

// Throws std::runtime_error when the file cannot be read.
PipelineConfig load_config(const std::string& path);

} // namespace pdf_layout
