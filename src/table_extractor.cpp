#include "pdf_layout/table_extractor.h"
#include <cstdio>
#include <fstream>
#include <iterator>
#include <stdlib.h>
#include <unistd.h>
#include <sys/wait.h>

namespace pdf_layout {

namespace {

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

PayloadTableExtractor::PayloadTableExtractor(CoordinateOrigin origin) : origin_(origin) {}

PayloadTableExtractor PayloadTableExtractor::from_file(const std::string& path,
                                                       CoordinateOrigin origin) {
    std::ifstream in(path);
    if (!in) {
        throw ExtractorError("Cannot open table payload file: " + path);
    }

    nlohmann::json json;
    try {
        in >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw ExtractorError("Table payload file " + path + " is not valid JSON: " + e.what());
    }

    if (!json.is_object() || !json.contains("pages") || !json["pages"].is_object()) {
        throw ExtractorError("Table payload file " + path + " must hold a \"pages\" object");
    }

    PayloadTableExtractor extractor(origin);
    for (const auto& [key, payload] : json["pages"].items()) {
        int page_number = 0;
        try {
            page_number = std::stoi(key);
        } catch (const std::exception&) {
            throw ExtractorError("Page key is not a number: " + key);
        }
        extractor.set_page_payload(page_number, payload);
    }
    return extractor;
}

void PayloadTableExtractor::set_page_payload(int page_number, nlohmann::json payload) {
    payloads_[page_number] = std::move(payload);
}

std::vector<RawTableGrid> PayloadTableExtractor::detect_tables(const PageContext& page) {
    auto it = payloads_.find(page.page_number);
    if (it == payloads_.end()) {
        return {};
    }
    return parse_table_payload(it->second, page.page_box.height(), origin_);
}

CommandResult PopenCommandRunner::run(const std::string& command) {
    // stderr goes to a temporary file, read back once the command is done.
    char stderr_path[] = "/tmp/pdf_layout_stderr_XXXXXX";
    int fd = mkstemp(stderr_path);
    if (fd == -1) {
        throw ExtractorError("Failed to create a stderr file for: " + command);
    }
    close(fd);

    std::string wrapped = "(" + command + "\n) 2>" + shell_quote(stderr_path);
    FILE* pipe = popen(wrapped.c_str(), "r");
    if (!pipe) {
        unlink(stderr_path);
        throw ExtractorError("Failed to start command: " + command);
    }

    CommandResult result;
    char buf[8192];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
        result.stdout_text.append(buf, n);
    }

    int rc = pclose(pipe);

    std::ifstream err(stderr_path);
    result.stderr_text.assign(std::istreambuf_iterator<char>(err), std::istreambuf_iterator<char>());
    err.close();
    unlink(stderr_path);

    if (rc == -1) {
        throw ExtractorError("Failed to wait for command: " + command);
    }
    result.status = WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
    return result;
}

CommandTableExtractor::CommandTableExtractor(std::string command_template,
                                             CoordinateOrigin origin,
                                             std::shared_ptr<CommandRunner> runner)
    : command_template_(std::move(command_template)),
      origin_(origin),
      runner_(runner ? std::move(runner) : std::make_shared<PopenCommandRunner>()) {
    if (command_template_.empty()) {
        throw std::invalid_argument("Table extractor command cannot be empty");
    }
}

std::string CommandTableExtractor::build_command(const PageContext& page) const {
    std::string command = command_template_;
    replace_all(command, "{file}", shell_quote(page.input_file));
    replace_all(command, "{page}", std::to_string(page.page_number));
    return command;
}

std::vector<RawTableGrid> CommandTableExtractor::detect_tables(const PageContext& page) {
    std::string command = build_command(page);
    CommandResult result = runner_->run(command);

    if (result.status != 0) {
        std::string message = "Table extractor exited with status " + std::to_string(result.status);
        if (!result.stderr_text.empty()) {
            message += ": " + result.stderr_text;
        }
        throw ExtractorError(message);
    }

    if (is_blank(result.stdout_text)) {
        return {};
    }
    return parse_table_payload(result.stdout_text, page.page_box.height(), origin_);
}

} // namespace pdf_layout
