#include "pdf_layout/pipeline.h"
#include "pdf_layout/thread_pool.h"
#include <algorithm>
#include <chrono>
#include <future>

namespace pdf_layout {

Pipeline::Pipeline(std::vector<std::shared_ptr<Stage>> stages) {
    for (auto& stage : stages) {
        add_stage(std::move(stage));
    }
}

Pipeline& Pipeline::add_stage(std::shared_ptr<Stage> stage) {
    if (!stage) {
        throw std::invalid_argument("Pipeline stage cannot be null");
    }
    stages_.push_back(std::move(stage));
    return *this;
}

Document Pipeline::run(Document document, ProcessingContext& context) const {
    for (const auto& stage : stages_) {
        const std::string stage_name = stage->name();
        auto start = std::chrono::high_resolution_clock::now();
        context.logger.debug("Pipeline::run", "Running stage " + stage_name);

        try {
            document = stage->run(std::move(document), context);
        } catch (const StageError&) {
            throw;
        } catch (const std::exception& e) {
            context.logger.error("Pipeline::run", "Stage " + stage_name + " failed: " + e.what());
            throw StageError(stage_name, e.what());
        } catch (...) {
            context.logger.error("Pipeline::run", "Stage " + stage_name + " failed with a non-standard exception");
            throw StageError(stage_name, "unknown error");
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
        context.logger.info("Pipeline::run", "Stage " + stage_name + " done in " +
                            std::to_string(duration.count()) + "ms");
    }
    return document;
}

std::vector<PipelineResult> Pipeline::run_batch(std::vector<Document> documents,
                                                ProcessingContext& context,
                                                size_t thread_count) const {
    ThreadPool pool(std::max<size_t>(1, std::min(thread_count, documents.size())));
    std::vector<std::future<PipelineResult>> futures;
    futures.reserve(documents.size());

    for (auto& document : documents) {
        futures.push_back(pool.enqueue([this, &context](Document doc) {
            PipelineResult result;
            try {
                result.document = run(std::move(doc), context);
            } catch (const StageError& e) {
                result.error = e.what();
                result.failed_stage = e.stage_name();
            }
            return result;
        }, std::move(document)));
    }

    std::vector<PipelineResult> results;
    results.reserve(futures.size());
    for (auto& future : futures) {
        results.push_back(future.get());
    }
    return results;
}

} // namespace pdf_layout
