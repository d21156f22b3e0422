#pragma once

#include "pdf_layout/bounding_box.h"
#include "pdf_layout/raw_table.h"
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace pdf_layout {

// Collaborator failure: process error, timeout or malformed payload.
class ExtractorError : public std::runtime_error {
public:
    explicit ExtractorError(const std::string& message) : std::runtime_error(message) {}
};

struct PageContext {
    std::string input_file;
    int page_number = 1;
    BoundingBox page_box;
};

// Finds tables on one page. Implementations may be called concurrently for
// different pages of the same document.
class TableExtractor {
public:
    virtual ~TableExtractor() = default;

    // Empty result means no tables. Throws ExtractorError on failure.
    virtual std::vector<RawTableGrid> detect_tables(const PageContext& page) = 0;
};

// Serves payloads computed ahead of time, keyed by page number. Pages without
// an entry have no tables.
class PayloadTableExtractor : public TableExtractor {
public:
    explicit PayloadTableExtractor(CoordinateOrigin origin = CoordinateOrigin::TOP_LEFT);

    // Reads {"pages": {"<number>": <payload>, ...}}. Throws ExtractorError.
    static PayloadTableExtractor from_file(const std::string& path,
                                           CoordinateOrigin origin = CoordinateOrigin::TOP_LEFT);

    void set_page_payload(int page_number, nlohmann::json payload);

    std::vector<RawTableGrid> detect_tables(const PageContext& page) override;

private:
    CoordinateOrigin origin_;
    std::map<int, nlohmann::json> payloads_;
};

struct CommandResult {
    int status = 0;
    std::string stdout_text;
    std::string stderr_text;
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Throws ExtractorError when the command cannot be started.
    virtual CommandResult run(const std::string& command) = 0;
};

// popen(3) based runner. stderr is captured through a temporary file.
class PopenCommandRunner : public CommandRunner {
public:
    CommandResult run(const std::string& command) override;
};

// Runs an external table tool per page and parses its stdout as the payload.
// The template may use {file} and {page} placeholders.
class CommandTableExtractor : public TableExtractor {
public:
    CommandTableExtractor(std::string command_template,
                          CoordinateOrigin origin = CoordinateOrigin::BOTTOM_LEFT,
                          std::shared_ptr<CommandRunner> runner = nullptr);

    std::string build_command(const PageContext& page) const;

    std::vector<RawTableGrid> detect_tables(const PageContext& page) override;

private:
    std::string command_template_;
    CoordinateOrigin origin_;
    std::shared_ptr<CommandRunner> runner_;
};

} // namespace pdf_layout
