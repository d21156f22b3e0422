#include <benchmark/benchmark.h>
#include <pdf_layout/document_serializer.h>
#include <pdf_layout/table_reconstructor.h>
#include <sstream>

using namespace pdf_layout;

namespace {

// rows x cols grid of 40x12 cells; every third row merges its first two cells.
RawTableGrid make_grid(int rows, int cols) {
    RawTableGrid grid;
    for (int r = 0; r < rows; ++r) {
        std::vector<RawCell> cells;
        int c = 0;
        while (c < cols) {
            int span = (r % 3 == 0 && c == 0 && cols > 1) ? 2 : 1;
            RawCell cell;
            cell.box = BoundingBox(50 + c * 40.0, 50 + r * 12.0, span * 40.0, 12.0);
            cell.text = std::to_string(r) + ":" + std::to_string(c);
            cells.push_back(cell);
            c += span;
        }
        grid.rows.push_back(std::move(cells));
    }
    return grid;
}

Page make_page(int rows, int cols) {
    std::vector<ElementPtr> elements;
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            elements.push_back(std::make_unique<Word>(
                BoundingBox(52 + c * 40.0, 51 + r * 12.0, 20.0, 10.0),
                std::to_string(r * cols + c), Font::undefined()));
        }
    }
    return Page(1, BoundingBox(0, 0, 2000, 2000), std::move(elements));
}

} // namespace

static void BM_BuildLayout(benchmark::State& state) {
    const int rows = static_cast<int>(state.range(0));
    RawTableGrid grid = make_grid(rows, 8);
    std::ostringstream sink;
    Logger logger(sink, LogLevel::NONE);
    TableReconstructor reconstructor;

    for (auto _ : state) {
        auto layout = reconstructor.build_layout(grid, logger);
        benchmark::DoNotOptimize(layout);
    }

    state.counters["cells"] = static_cast<double>(grid.cell_count());
}
BENCHMARK(BM_BuildLayout)->RangeMultiplier(4)->Range(4, 256);

static void BM_ReconstructOnPage(benchmark::State& state) {
    const int rows = static_cast<int>(state.range(0));
    RawTableGrid grid = make_grid(rows, 8);
    std::ostringstream sink;
    Logger logger(sink, LogLevel::NONE);
    TableReconstructor reconstructor;

    for (auto _ : state) {
        state.PauseTiming();
        Page page = make_page(rows, 8);
        state.ResumeTiming();

        const Table* table = reconstructor.reconstruct(page, grid, logger);
        benchmark::DoNotOptimize(table);
    }
}
BENCHMARK(BM_ReconstructOnPage)->RangeMultiplier(4)->Range(4, 256);

static void BM_WriteDocument(benchmark::State& state) {
    const int page_count = static_cast<int>(state.range(0));
    std::ostringstream sink;
    Logger logger(sink, LogLevel::NONE);
    TableReconstructor reconstructor;

    std::vector<Page> pages;
    for (int i = 0; i < page_count; ++i) {
        Page page = make_page(32, 8);
        reconstructor.reconstruct(page, make_grid(16, 8), logger);
        pages.push_back(std::move(page));
    }
    Document document(std::move(pages), "benchmark.pdf");

    size_t bytes = 0;
    for (auto _ : state) {
        std::string json = DocumentSerializer::to_string(document);
        bytes = json.size();
        benchmark::DoNotOptimize(json);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * bytes));
}
BENCHMARK(BM_WriteDocument)->Range(1, 64);

BENCHMARK_MAIN();
