#include <gtest/gtest.h>
#include <pdf_layout/pipeline.h>
#include <sstream>

using namespace pdf_layout;

namespace {

// Appends a word named after the stage to the first page.
class TaggingStage : public Stage {
public:
    explicit TaggingStage(std::string tag) : tag_(std::move(tag)) {}

    std::string name() const override { return tag_; }

    Document run(Document document, ProcessingContext&) override {
        auto& page = document.pages().front();
        page.splice({}, page.elements().size(), [this](std::vector<ElementPtr>&) -> ElementPtr {
            return std::make_unique<Word>(BoundingBox(0, 0, 10, 10), tag_, Font::undefined());
        });
        return document;
    }

private:
    std::string tag_;
};

class ThrowingStage : public Stage {
public:
    std::string name() const override { return "broken"; }

    Document run(Document document, ProcessingContext&) override {
        if (document.input_file() == "bad.pdf") {
            throw std::runtime_error("cannot handle this");
        }
        return document;
    }
};

class OddThrowingStage : public Stage {
public:
    std::string name() const override { return "odd"; }

    Document run(Document, ProcessingContext&) override {
        throw 42;
    }
};

Document make_document(const std::string& input_file = "in.pdf") {
    std::vector<Page> pages;
    pages.emplace_back(1, BoundingBox(0, 0, 612, 792));
    return Document(std::move(pages), input_file);
}

std::vector<std::string> texts_of(const Document& document) {
    std::vector<std::string> texts;
    for (const auto& element : document.pages().front().elements()) {
        texts.push_back(element->to_string());
    }
    return texts;
}

} // namespace

class PipelineTest : public ::testing::Test {
protected:
    PipelineTest() : logger(log, LogLevel::DEBUG), context(logger) {}

    std::ostringstream log;
    Logger logger;
    ProcessingContext context;
};

TEST_F(PipelineTest, StagesRunInOrder) {
    Pipeline pipeline;
    pipeline.add_stage(std::make_shared<TaggingStage>("first"))
            .add_stage(std::make_shared<TaggingStage>("second"));

    Document result = pipeline.run(make_document(), context);
    EXPECT_EQ(texts_of(result), (std::vector<std::string>{"first", "second"}));
    EXPECT_NE(log.str().find("[Pipeline::run] Running stage second"), std::string::npos);
}

TEST_F(PipelineTest, EmptyPipelinePassesThrough) {
    Pipeline pipeline;
    Document result = pipeline.run(make_document("x.pdf"), context);
    EXPECT_EQ(result.input_file(), "x.pdf");
}

TEST_F(PipelineTest, NullStageRejected) {
    Pipeline pipeline;
    EXPECT_THROW(pipeline.add_stage(nullptr), std::invalid_argument);
}

TEST_F(PipelineTest, FailureNamesTheStage) {
    Pipeline pipeline(std::vector<std::shared_ptr<Stage>>{std::make_shared<TaggingStage>("ok"),
                                                          std::make_shared<ThrowingStage>()});

    try {
        pipeline.run(make_document("bad.pdf"), context);
        FAIL() << "Expected StageError";
    } catch (const StageError& e) {
        EXPECT_EQ(e.stage_name(), "broken");
        EXPECT_EQ(std::string(e.what()), "Stage 'broken' failed: cannot handle this");
    }
    EXPECT_NE(log.str().find("error: Stage broken failed"), std::string::npos);
}

TEST_F(PipelineTest, NonStandardExceptionStillNamesTheStage) {
    Pipeline pipeline(std::vector<std::shared_ptr<Stage>>{std::make_shared<OddThrowingStage>()});

    try {
        pipeline.run(make_document(), context);
        FAIL() << "Expected StageError";
    } catch (const StageError& e) {
        EXPECT_EQ(e.stage_name(), "odd");
        EXPECT_EQ(std::string(e.what()), "Stage 'odd' failed: unknown error");
    }
}

TEST_F(PipelineTest, BatchKeepsInputOrderAndIsolatesFailures) {
    Pipeline pipeline(std::vector<std::shared_ptr<Stage>>{std::make_shared<TaggingStage>("tag"),
                                                          std::make_shared<ThrowingStage>()});

    std::vector<Document> documents;
    documents.push_back(make_document("one.pdf"));
    documents.push_back(make_document("bad.pdf"));
    documents.push_back(make_document("three.pdf"));

    auto results = pipeline.run_batch(std::move(documents), context, 2);
    ASSERT_EQ(results.size(), 3u);

    ASSERT_TRUE(results[0].success());
    EXPECT_EQ(results[0].document->input_file(), "one.pdf");
    EXPECT_EQ(texts_of(*results[0].document), (std::vector<std::string>{"tag"}));

    EXPECT_FALSE(results[1].success());
    EXPECT_EQ(results[1].failed_stage, "broken");
    EXPECT_NE(results[1].error.find("cannot handle this"), std::string::npos);

    ASSERT_TRUE(results[2].success());
    EXPECT_EQ(results[2].document->input_file(), "three.pdf");
}

TEST_F(PipelineTest, BatchOfNothing) {
    Pipeline pipeline;
    EXPECT_TRUE(pipeline.run_batch({}, context, 4).empty());
}

TEST(LoggerTest, LevelsAndFormat) {
    std::ostringstream out;
    Logger logger(out, LogLevel::INFO);

    logger.debug("Test::debug", "hidden");
    logger.info("Test::info", "shown");
    logger.warn("Test::warn", "careful");

    EXPECT_EQ(out.str(), "[Test::info] shown\n[Test::warn] warn: careful\n");
}

TEST(LoggerTest, NoneSilencesEverything) {
    std::ostringstream out;
    Logger logger(out, LogLevel::NONE);
    logger.error("Test", "boom");
    EXPECT_TRUE(out.str().empty());
}

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("off"), LogLevel::NONE);
    EXPECT_THROW(parse_log_level("loud"), std::invalid_argument);
    EXPECT_THROW(parse_log_level("d\xC3\xA9" "bug"), std::invalid_argument);
}
