#pragma once

#include "pdf_layout/bounding_box.h"
#include "pdf_layout/document.h"
#include "pdf_layout/processing_context.h"
#include "pdf_layout/raw_table.h"
#include <optional>
#include <string>
#include <vector>

namespace pdf_layout {

struct ReconstructionOptions {
    // Edges closer than this (in points) are the same grid line.
    double boundary_tolerance = 2.0;
    // Fraction of a grid interval a cell must cover to span it.
    double coverage_threshold = 0.5;
    // Fraction of an element's area inside the table for it to be replaced.
    double subsumption_threshold = 0.5;
    // Also split a reference column where another row puts an edge near its
    // middle (at least 1 - coverage_threshold of its width from both ends).
    bool refine_with_all_rows = false;
};

struct PlacedCell {
    BoundingBox box;
    std::string text;
    int row = 0;
    int column = 0;
    int colspan = 1;
    int rowspan = 1;
};

// Canonical grid of one raw table. rows[r] holds the cells that begin in
// canonical row r, left to right.
struct TableLayout {
    std::vector<double> column_boundaries;
    std::vector<double> row_boundaries;
    std::vector<std::vector<PlacedCell>> rows;
    std::vector<int> degraded_rows;
    BoundingBox box;

    int column_count() const { return static_cast<int>(column_boundaries.size()) - 1; }
    int row_count() const { return static_cast<int>(row_boundaries.size()) - 1; }
    bool is_degraded(int row) const;
};

struct CellRef {
    int row = 0;
    int index = 0;
};

// Everything needed to splice one table into a page.
struct TablePlan {
    TableLayout layout;
    std::vector<size_t> subsumed;  // page element indices, ascending
    std::vector<CellRef> targets;  // cell receiving each subsumed element
    size_t fallback_index = 0;     // insertion point when nothing is subsumed
};

class TableReconstructor {
public:
    explicit TableReconstructor(const ReconstructionOptions& options = ReconstructionOptions{});

    const ReconstructionOptions& options() const { return options_; }

    // Infers the canonical grid and spans. nullopt when the grid holds no
    // usable table (no rows, no columns, degenerate cells).
    std::optional<TableLayout> build_layout(const RawTableGrid& grid, Logger& logger) const;

    // Pure: decides the layout and which page elements the table replaces.
    std::optional<TablePlan> plan(const RawTableGrid& grid, const Page& page, Logger& logger) const;

    // Indices of non-table elements mostly inside `table_box`.
    std::vector<size_t> find_subsumed(const Page& page, const BoundingBox& table_box) const;

    // Builds the Table and splices it into the page. Returns the inserted table.
    const Table* apply(Page& page, TablePlan plan) const;

    // plan() followed by apply(); nullptr when the table is discarded.
    const Table* reconstruct(Page& page, const RawTableGrid& grid, Logger& logger) const;

private:
    ReconstructionOptions options_;
};

} // namespace pdf_layout
