#include "pdf_layout/config.h"
#include <fstream>
#include <stdexcept>

namespace pdf_layout {

namespace {

template<typename T>
void read_value(const nlohmann::json& section, const char* key, T& target) {
    if (!section.contains(key)) {
        return;
    }
    try {
        target = section.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Config key '") + key + "' has the wrong type: " + e.what());
    }
}

void check_fraction(double value, const char* key) {
    if (value < 0.0 || value >= 1.0) {
        throw std::invalid_argument(std::string("Config key '") + key + "' must be in [0, 1)");
    }
}

} // namespace

PipelineConfig config_from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("Config must be a JSON object");
    }

    PipelineConfig config;

    std::string log_level = to_string(config.log_level);
    read_value(json, "log_level", log_level);
    config.log_level = parse_log_level(log_level);

    if (json.contains("extract")) {
        const auto& extract = json["extract"];
        read_value(extract, "images", config.extract.extract_images);
        read_value(extract, "preserve_ligatures", config.extract.preserve_ligatures);
        read_value(extract, "group_paragraphs", config.extract.group_paragraphs);
        read_value(extract, "page_limit", config.extract.page_limit);
        if (config.extract.page_limit < 0) {
            throw std::invalid_argument("page_limit cannot be negative");
        }
    }

    if (json.contains("table_detection")) {
        const auto& section = json["table_detection"];
        auto& reconstruction = config.table_detection.reconstruction;

        if (section.contains("origin")) {
            std::string origin;
            read_value(section, "origin", origin);
            config.origin = parse_coordinate_origin(origin);
        }

        read_value(section, "command", config.extractor_command);
        read_value(section, "payload_file", config.payload_file);

        int concurrency = static_cast<int>(config.table_detection.extractor_concurrency);
        read_value(section, "extractor_concurrency", concurrency);
        if (concurrency < 1) {
            throw std::invalid_argument("extractor_concurrency must be at least 1");
        }
        config.table_detection.extractor_concurrency = static_cast<size_t>(concurrency);

        read_value(section, "boundary_tolerance", reconstruction.boundary_tolerance);
        read_value(section, "coverage_threshold", reconstruction.coverage_threshold);
        read_value(section, "subsumption_threshold", reconstruction.subsumption_threshold);
        read_value(section, "refine_with_all_rows", reconstruction.refine_with_all_rows);

        if (reconstruction.boundary_tolerance < 0.0) {
            throw std::invalid_argument("boundary_tolerance cannot be negative");
        }
        check_fraction(reconstruction.coverage_threshold, "coverage_threshold");
        check_fraction(reconstruction.subsumption_threshold, "subsumption_threshold");
    }

    return config;
}

PipelineConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json json;
    try {
        in >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Config file " + path + " is not valid JSON: " + e.what());
    }
    return config_from_json(json);
}

} // namespace pdf_layout
