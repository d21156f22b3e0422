#include <pdf_layout/config.h>
#include <pdf_layout/document_serializer.h>
#include <pdf_layout/pipeline.h>
#include <pdf_layout/table_detection_stage.h>
#include <pdf_layout/text_extractor.h>
#include <iostream>
#include <filesystem>
#include <chrono>
#include <memory>
#include <string>
#include <getopt.h>

namespace fs = std::filesystem;
using namespace pdf_layout;

struct CLIOptions {
    std::string input_file;
    std::string output_file;
    std::string config_file;
    std::string payload_file;
    std::string command;
    std::string origin;
    int concurrency = 0;  // 0 = from config
    int page_limit = -1;  // -1 = from config
    bool paragraphs = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
    bool version = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n";
    std::cout << "\nRequired:\n";
    std::cout << "  -i, --input FILE           Input PDF, or a document JSON written by this tool\n";
    std::cout << "\nOptional:\n";
    std::cout << "  -o, --output FILE          Output JSON file path (default: <input>_layout.json)\n";
    std::cout << "  -t, --tables FILE          Precomputed table payloads, {\"pages\": {\"N\": ...}}\n";
    std::cout << "  -c, --command CMD          Table extractor command, {file} and {page} are substituted\n";
    std::cout << "  --config FILE              JSON configuration file\n";
    std::cout << "  --origin ORIGIN            Payload coordinates: top-left or bottom-left\n";
    std::cout << "                             (default: top-left for --tables, bottom-left for --command)\n";
    std::cout << "  --concurrency N            Extractor calls in flight per document (default: 4)\n";
    std::cout << "  --page-limit N             Extract only the first N pages of a PDF (default: all)\n";
    std::cout << "  --paragraphs               Group words of a text block into paragraphs\n";
    std::cout << "  -v, --verbose              Debug logging\n";
    std::cout << "  -q, --quiet                Errors only\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  --version                  Show version information\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " -i report.pdf -t report_tables.json\n";
    std::cout << "  " << program_name << " -i report.pdf -c \"detect-tables {file} {page}\" --origin bottom-left\n";
    std::cout << "  " << program_name << " -i report_layout.json -t fixed_tables.json -o out.json\n";
}

void print_version() {
    std::cout << "pdf_layout cli version 1.0.0\n";
    std::cout << "Built with C++17, MuPDF, nlohmann::json and RapidJSON\n";
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;

    const char* short_opts = "i:o:t:c:vqh";
    const struct option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"tables", required_argument, nullptr, 't'},
        {"command", required_argument, nullptr, 'c'},
        {"config", required_argument, nullptr, 1001},
        {"origin", required_argument, nullptr, 1002},
        {"concurrency", required_argument, nullptr, 1003},
        {"page-limit", required_argument, nullptr, 1004},
        {"paragraphs", no_argument, nullptr, 1005},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 1006},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, &option_index)) != -1) {
        switch (opt) {
            case 'i':
                options.input_file = optarg;
                break;
            case 'o':
                options.output_file = optarg;
                break;
            case 't':
                options.payload_file = optarg;
                break;
            case 'c':
                options.command = optarg;
                break;
            case 1001:  // config
                options.config_file = optarg;
                break;
            case 1002:  // origin
                options.origin = optarg;
                break;
            case 1003:  // concurrency
                options.concurrency = std::stoi(optarg);
                if (options.concurrency <= 0) {
                    throw std::invalid_argument("concurrency must be positive");
                }
                break;
            case 1004:  // page-limit
                options.page_limit = std::stoi(optarg);
                if (options.page_limit < 0) {
                    throw std::invalid_argument("page-limit cannot be negative");
                }
                break;
            case 1005:  // paragraphs
                options.paragraphs = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'h':
                options.help = true;
                return options;
            case 1006:  // version
                options.version = true;
                return options;
            default:
                throw std::invalid_argument("Unknown option");
        }
    }

    if (options.input_file.empty()) {
        throw std::invalid_argument("Input file is required");
    }

    if (!options.payload_file.empty() && !options.command.empty()) {
        throw std::invalid_argument("Use either --tables or --command, not both");
    }

    if (options.verbose && options.quiet) {
        throw std::invalid_argument("Cannot use both --verbose and --quiet");
    }

    if (options.output_file.empty()) {
        fs::path input_path(options.input_file);
        fs::path output_dir = input_path.parent_path();
        if (output_dir.empty()) {
            output_dir = ".";
        }
        options.output_file = (output_dir / (input_path.stem().string() + "_layout.json")).string();
    }

    return options;
}

// Command-line flags win over the config file.
PipelineConfig resolve_config(const CLIOptions& options) {
    PipelineConfig config;
    if (!options.config_file.empty()) {
        config = load_config(options.config_file);
    }

    if (!options.payload_file.empty()) {
        config.payload_file = options.payload_file;
        config.extractor_command.clear();
    }
    if (!options.command.empty()) {
        config.extractor_command = options.command;
        config.payload_file.clear();
    }
    if (!options.origin.empty()) {
        config.origin = parse_coordinate_origin(options.origin);
    }
    if (options.concurrency > 0) {
        config.table_detection.extractor_concurrency = static_cast<size_t>(options.concurrency);
    }
    if (options.page_limit >= 0) {
        config.extract.page_limit = options.page_limit;
    }
    if (options.paragraphs) {
        config.extract.group_paragraphs = true;
    }
    if (options.verbose) {
        config.log_level = LogLevel::DEBUG;
    } else if (options.quiet) {
        config.log_level = LogLevel::ERROR;
    }
    return config;
}

std::shared_ptr<TableExtractor> make_extractor(const PipelineConfig& config) {
    if (!config.payload_file.empty()) {
        return std::make_shared<PayloadTableExtractor>(
            PayloadTableExtractor::from_file(config.payload_file,
                                             config.origin.value_or(CoordinateOrigin::TOP_LEFT)));
    }
    if (!config.extractor_command.empty()) {
        return std::make_shared<CommandTableExtractor>(
            config.extractor_command, config.origin.value_or(CoordinateOrigin::BOTTOM_LEFT));
    }
    return nullptr;
}

Document load_input(const std::string& path, const ExtractOptions& extract) {
    if (fs::path(path).extension() == ".json") {
        return DocumentSerializer::read_file(path);
    }
    TextExtractor extractor;
    return extractor.extract_document(path, extract);
}

int main(int argc, char* argv[]) {
    try {
        CLIOptions options = parse_arguments(argc, argv);

        if (options.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (options.version) {
            print_version();
            return 0;
        }

        if (!fs::exists(options.input_file)) {
            throw std::runtime_error("Input file not found: " + options.input_file);
        }

        PipelineConfig config = resolve_config(options);
        Logger logger(std::cerr, config.log_level);
        ProcessingContext context(logger);

        auto start = std::chrono::high_resolution_clock::now();

        Document document = load_input(options.input_file, config.extract);
        logger.info("cli", "Loaded " + std::to_string(document.pages().size()) + " pages from " +
                               options.input_file);

        Pipeline pipeline;
        if (auto extractor = make_extractor(config)) {
            pipeline.add_stage(std::make_shared<TableDetectionStage>(extractor, config.table_detection));
        } else {
            logger.warn("cli", "No table source given, writing the extracted layout unchanged");
        }

        Document result = pipeline.run(std::move(document), context);

        fs::path output_dir = fs::path(options.output_file).parent_path();
        if (!output_dir.empty() && !fs::exists(output_dir)) {
            fs::create_directories(output_dir);
        }
        DocumentSerializer::write_file(result, options.output_file);

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        if (!options.quiet) {
            std::cout << "Pages: " << result.pages().size() << "\n";
            std::cout << "Tables: " << result.elements_of_type<Table>().size() << "\n";
            std::cout << "Total time: " << duration.count() << "ms\n";
            std::cout << "Output saved to: " << options.output_file << "\n";
        }

        return 0;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid argument - " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
