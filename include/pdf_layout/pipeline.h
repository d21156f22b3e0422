#pragma once

#include "pdf_layout/document.h"
#include "pdf_layout/processing_context.h"
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pdf_layout {

// One document-transforming step.
class Stage {
public:
    virtual ~Stage() = default;

    virtual std::string name() const = 0;

    // May block on external collaborators. Throws on failure.
    virtual Document run(Document document, ProcessingContext& context) = 0;
};

class StageError : public std::runtime_error {
public:
    StageError(std::string stage_name, const std::string& message)
        : std::runtime_error("Stage '" + stage_name + "' failed: " + message),
          stage_name_(std::move(stage_name)) {}

    const std::string& stage_name() const { return stage_name_; }

private:
    std::string stage_name_;
};

struct PipelineResult {
    std::optional<Document> document;
    std::string error;
    std::string failed_stage;

    bool success() const { return document.has_value(); }
};

class Pipeline {
public:
    Pipeline() = default;
    explicit Pipeline(std::vector<std::shared_ptr<Stage>> stages);

    Pipeline& add_stage(std::shared_ptr<Stage> stage);
    const std::vector<std::shared_ptr<Stage>>& stages() const { return stages_; }

    // Applies the stages in order. A failing stage stops the run and is
    // reported as StageError; no partial document is returned.
    Document run(Document document, ProcessingContext& context) const;

    // Independent runs for several documents, at most `thread_count` at once.
    // Results keep the input order.
    std::vector<PipelineResult> run_batch(std::vector<Document> documents,
                                          ProcessingContext& context,
                                          size_t thread_count) const;

private:
    std::vector<std::shared_ptr<Stage>> stages_;
};

} // namespace pdf_layout
