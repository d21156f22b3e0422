#include "pdf_layout/table_detection_stage.h"
#include "pdf_layout/thread_pool.h"
#include <algorithm>
#include <future>
#include <vector>

namespace pdf_layout {

TableDetectionStage::TableDetectionStage(std::shared_ptr<TableExtractor> extractor,
                                         const TableDetectionOptions& options)
    : extractor_(std::move(extractor)),
      options_(options),
      reconstructor_(options.reconstruction) {
    if (!extractor_) {
        throw std::invalid_argument("TableDetectionStage needs an extractor");
    }
    if (options_.extractor_concurrency == 0) {
        throw std::invalid_argument("extractor_concurrency must be at least 1");
    }
}

Document TableDetectionStage::run(Document document, ProcessingContext& context) {
    auto& pages = document.pages();
    if (pages.empty()) {
        return document;
    }

    // Extractor calls overlap; splicing stays on this thread, page by page.
    ThreadPool pool(std::min(options_.extractor_concurrency, pages.size()));
    std::vector<std::future<std::vector<RawTableGrid>>> futures;
    futures.reserve(pages.size());

    for (const auto& page : pages) {
        PageContext page_context;
        page_context.input_file = document.input_file();
        page_context.page_number = page.page_number();
        page_context.page_box = page.box();

        futures.push_back(pool.enqueue([extractor = extractor_, page_context]() {
            return extractor->detect_tables(page_context);
        }));
    }

    size_t tables_found = 0;
    size_t tables_built = 0;
    for (size_t i = 0; i < pages.size(); ++i) {
        Page& page = pages[i];
        std::vector<RawTableGrid> grids;
        try {
            grids = futures[i].get();
        } catch (const std::exception& e) {
            context.logger.warn("TableDetectionStage::run",
                                "Table extraction failed on page " + std::to_string(page.page_number()) +
                                ", keeping it as text: " + e.what());
            continue;
        }

        tables_found += grids.size();
        for (const auto& grid : grids) {
            if (reconstructor_.reconstruct(page, grid, context.logger)) {
                tables_built++;
            }
        }
    }

    context.logger.info("TableDetectionStage::run",
                        "Reconstructed " + std::to_string(tables_built) + " of " +
                        std::to_string(tables_found) + " detected tables on " +
                        std::to_string(pages.size()) + " pages");
    return document;
}

} // namespace pdf_layout
