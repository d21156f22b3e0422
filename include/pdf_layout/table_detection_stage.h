#pragma once

#include "pdf_layout/pipeline.h"
#include "pdf_layout/table_extractor.h"
#include "pdf_layout/table_reconstructor.h"
#include <memory>
#include <string>

namespace pdf_layout {

struct TableDetectionOptions {
    // Extractor calls in flight at once for one document.
    size_t extractor_concurrency = 4;
    ReconstructionOptions reconstruction;
};

// Asks the extractor for each page's tables and splices the reconstructed
// tables into the pages. Extractor failures leave the page as it was.
class TableDetectionStage : public Stage {
public:
    explicit TableDetectionStage(std::shared_ptr<TableExtractor> extractor,
                                 const TableDetectionOptions& options = TableDetectionOptions{});

    std::string name() const override { return "table-detection"; }

    Document run(Document document, ProcessingContext& context) override;

private:
    std::shared_ptr<TableExtractor> extractor_;
    TableDetectionOptions options_;
    TableReconstructor reconstructor_;
};

} // namespace pdf_layout
