#include "pdf_layout/table_reconstructor.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

namespace pdf_layout {

namespace {

// Sorted grid lines, one per group of values closer than `tolerance` to the
// group's first value.
std::vector<double> cluster(std::vector<double> values, double tolerance) {
    std::sort(values.begin(), values.end());
    std::vector<double> lines;
    for (double v : values) {
        if (lines.empty() || v - lines.back() > tolerance) {
            lines.push_back(v);
        }
    }
    return lines;
}

// Adds candidate edges that split one existing interval well away from both
// of its ends, so edge jitter never opens a sliver column.
void refine(std::vector<double>& lines, const std::vector<double>& candidates,
            double tolerance, double margin_fraction) {
    const std::vector<double> reference = lines;
    for (double v : cluster(candidates, tolerance)) {
        for (size_t i = 0; i + 1 < reference.size(); ++i) {
            double lo = reference[i];
            double hi = reference[i + 1];
            double margin = std::max((hi - lo) * margin_fraction, tolerance);
            if (v - lo >= margin && hi - v >= margin) {
                lines.push_back(v);
                break;
            }
        }
    }
    std::sort(lines.begin(), lines.end());
    lines.erase(std::unique(lines.begin(), lines.end(), [tolerance](double a, double b) {
        return b - a <= tolerance;
    }), lines.end());
}

// First covered interval and number of covered intervals.
std::pair<int, int> span_of(const BoundingBox& box, const std::vector<double>& lines,
                            bool horizontal, double threshold) {
    int first = -1;
    int count = 0;
    for (size_t i = 0; i + 1 < lines.size(); ++i) {
        double lo = lines[i];
        double hi = lines[i + 1];
        double covered = horizontal ? box.horizontal_overlap(lo, hi) : box.vertical_overlap(lo, hi);
        if (covered / (hi - lo) > threshold) {
            if (first < 0) {
                first = static_cast<int>(i);
            }
            count++;
        }
    }
    return {std::max(first, 0), count};
}

int nearest_interval(const std::vector<double>& lines, double value) {
    int last = static_cast<int>(lines.size()) - 2;
    for (int i = 0; i < last; ++i) {
        if (value < lines[i + 1]) {
            return i;
        }
    }
    return std::max(last, 0);
}

bool has_text(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") != std::string::npos;
}

struct Candidate {
    PlacedCell cell;
    bool owns_slots = false;
    // Repeat of an earlier cell's merged region.
    bool absorbed = false;
};

void claim(std::vector<std::vector<bool>>& claimed, const PlacedCell& cell) {
    for (int r = cell.row; r < cell.row + cell.rowspan; ++r) {
        for (int c = cell.column; c < cell.column + cell.colspan; ++c) {
            claimed[r][c] = true;
        }
    }
}

// Cells emitted for a given set of degraded rows, in candidate order. A cell
// starting in a degraded row is cut to 1x1; a later repeat of its merged
// region then takes back the rows the cut cell no longer covers.
std::vector<PlacedCell> place_cells(const std::vector<Candidate>& candidates,
                                    const std::set<int>& degraded, int rows, int columns) {
    std::vector<std::vector<bool>> claimed(rows, std::vector<bool>(columns, false));
    auto row_free = [&claimed](int r, const PlacedCell& cell) {
        for (int c = cell.column; c < cell.column + cell.colspan; ++c) {
            if (claimed[r][c]) {
                return false;
            }
        }
        return true;
    };

    std::vector<PlacedCell> placed;
    for (const auto& candidate : candidates) {
        PlacedCell cell = candidate.cell;
        if (candidate.absorbed) {
            const int end = cell.row + cell.rowspan;
            int first = cell.row;
            while (first < end && !row_free(first, cell)) {
                first++;
            }
            if (first == end) {
                continue;
            }
            int last = first;
            while (last < end && row_free(last, cell)) {
                last++;
            }
            cell.row = first;
            cell.rowspan = last - first;
        } else if (!candidate.owns_slots && !degraded.count(cell.row)) {
            continue;
        }

        if (degraded.count(cell.row)) {
            cell.colspan = 1;
            cell.rowspan = 1;
        }
        claim(claimed, cell);
        placed.push_back(std::move(cell));
    }
    return placed;
}

CellRef target_cell(const TableLayout& layout, const BoundingBox& box) {
    CellRef best;
    double best_overlap = 0.0;
    bool found = false;

    for (size_t r = 0; r < layout.rows.size(); ++r) {
        for (size_t k = 0; k < layout.rows[r].size(); ++k) {
            const BoundingBox& cell_box = layout.rows[r][k].box;
            double score = 0.0;
            if (auto ov = BoundingBox::overlap(box, cell_box)) {
                score = ov->box1_overlap_proportion;
            } else if (box.area() == 0.0 && cell_box.contains(box)) {
                score = 1.0;
            }
            if (score > best_overlap) {
                best_overlap = score;
                best = {static_cast<int>(r), static_cast<int>(k)};
                found = true;
            }
        }
    }
    if (found) {
        return best;
    }

    // Between cells: hand it to the closest one.
    double best_distance = std::numeric_limits<double>::max();
    for (size_t r = 0; r < layout.rows.size(); ++r) {
        for (size_t k = 0; k < layout.rows[r].size(); ++k) {
            const BoundingBox& cell_box = layout.rows[r][k].box;
            double dx = cell_box.center_x() - box.center_x();
            double dy = cell_box.center_y() - box.center_y();
            double distance = dx * dx + dy * dy;
            if (distance < best_distance) {
                best_distance = distance;
                best = {static_cast<int>(r), static_cast<int>(k)};
            }
        }
    }
    return best;
}

} // namespace

bool TableLayout::is_degraded(int row) const {
    return std::find(degraded_rows.begin(), degraded_rows.end(), row) != degraded_rows.end();
}

TableReconstructor::TableReconstructor(const ReconstructionOptions& options) : options_(options) {
    if (options_.boundary_tolerance < 0.0) {
        throw std::invalid_argument("boundary_tolerance cannot be negative");
    }
    if (options_.coverage_threshold < 0.0 || options_.coverage_threshold >= 1.0) {
        throw std::invalid_argument("coverage_threshold must be in [0, 1)");
    }
    if (options_.subsumption_threshold < 0.0 || options_.subsumption_threshold >= 1.0) {
        throw std::invalid_argument("subsumption_threshold must be in [0, 1)");
    }
}

std::optional<TableLayout> TableReconstructor::build_layout(const RawTableGrid& grid,
                                                            Logger& logger) const {
    const std::string component = "TableReconstructor::build_layout";
    const double tolerance = options_.boundary_tolerance;

    if (grid.cell_count() == 0) {
        logger.warn(component, "Raw table has no cells, discarding");
        return std::nullopt;
    }

    std::vector<BoundingBox> all_boxes;
    all_boxes.reserve(grid.cell_count());
    for (const auto& row : grid.rows) {
        for (const auto& cell : row) {
            if (cell.box.width() <= 0.0 || cell.box.height() <= 0.0) {
                logger.warn(component, "Raw table has a degenerate cell at (" +
                            std::to_string(cell.box.left()) + ", " +
                            std::to_string(cell.box.top()) + "), discarding");
                return std::nullopt;
            }
            all_boxes.push_back(cell.box);
        }
    }

    TableLayout layout;
    layout.box = BoundingBox::merge(all_boxes);

    // Columns: the finest row sets the grid.
    size_t reference = 0;
    for (size_t i = 1; i < grid.rows.size(); ++i) {
        if (grid.rows[i].size() > grid.rows[reference].size()) {
            reference = i;
        }
    }

    std::vector<double> column_seed;
    for (const auto& cell : grid.rows[reference]) {
        column_seed.push_back(cell.box.left());
        column_seed.push_back(cell.box.right());
    }
    for (const auto& [lo, hi] : grid.column_hints) {
        column_seed.push_back(lo);
        column_seed.push_back(hi);
    }
    layout.column_boundaries = cluster(column_seed, tolerance);

    if (options_.refine_with_all_rows) {
        std::vector<double> others;
        for (size_t i = 0; i < grid.rows.size(); ++i) {
            if (i == reference) {
                continue;
            }
            for (const auto& cell : grid.rows[i]) {
                others.push_back(cell.box.left());
                others.push_back(cell.box.right());
            }
        }
        refine(layout.column_boundaries, others, tolerance, 1.0 - options_.coverage_threshold);
    }

    std::vector<double> row_seed;
    for (const auto& box : all_boxes) {
        row_seed.push_back(box.top());
        row_seed.push_back(box.bottom());
    }
    for (const auto& [lo, hi] : grid.row_hints) {
        row_seed.push_back(lo);
        row_seed.push_back(hi);
    }
    layout.row_boundaries = cluster(row_seed, tolerance);

    const int columns = layout.column_count();
    const int rows = layout.row_count();
    if (columns < 1 || rows < 1) {
        logger.warn(component, "No canonical grid (" + std::to_string(rows) + " rows, " +
                    std::to_string(columns) + " columns), discarding");
        return std::nullopt;
    }

    // Raw rows top to bottom, cells left to right.
    std::vector<size_t> row_order(grid.rows.size());
    for (size_t i = 0; i < row_order.size(); ++i) {
        row_order[i] = i;
    }
    auto row_top = [&grid](size_t i) {
        double top = std::numeric_limits<double>::max();
        for (const auto& cell : grid.rows[i]) {
            top = std::min(top, cell.box.top());
        }
        return top;
    };
    std::stable_sort(row_order.begin(), row_order.end(), [&row_top](size_t a, size_t b) {
        return row_top(a) < row_top(b);
    });

    std::vector<Candidate> candidates;
    std::vector<std::vector<int>> owner(rows, std::vector<int>(columns, -1));
    std::set<int> malformed;

    for (size_t raw_row : row_order) {
        std::vector<const RawCell*> cells;
        for (const auto& cell : grid.rows[raw_row]) {
            cells.push_back(&cell);
        }
        std::stable_sort(cells.begin(), cells.end(), [](const RawCell* a, const RawCell* b) {
            return a->box.left() < b->box.left();
        });

        for (const RawCell* raw : cells) {
            auto [c0, colspan] = span_of(raw->box, layout.column_boundaries, true,
                                         options_.coverage_threshold);
            auto [r0, rowspan] = span_of(raw->box, layout.row_boundaries, false,
                                         options_.coverage_threshold);

            Candidate candidate;
            candidate.cell = {raw->box, raw->text, r0, c0, colspan, rowspan};

            if (colspan == 0 || rowspan == 0) {
                candidate.cell.row = rowspan == 0
                    ? nearest_interval(layout.row_boundaries, raw->box.center_y()) : r0;
                candidate.cell.column = colspan == 0
                    ? nearest_interval(layout.column_boundaries, raw->box.center_x()) : c0;
                candidate.cell.colspan = 1;
                candidate.cell.rowspan = 1;
                malformed.insert(candidate.cell.row);
                logger.debug(component, "Cell \"" + raw->text + "\" covers no full grid interval");
                candidates.push_back(std::move(candidate));
                continue;
            }

            std::set<int> owners;
            bool any_free = false;
            for (int r = r0; r < r0 + rowspan; ++r) {
                for (int c = c0; c < c0 + colspan; ++c) {
                    if (owner[r][c] < 0) {
                        any_free = true;
                    } else {
                        owners.insert(owner[r][c]);
                    }
                }
            }

            if (owners.empty()) {
                int index = static_cast<int>(candidates.size());
                for (int r = r0; r < r0 + rowspan; ++r) {
                    for (int c = c0; c < c0 + colspan; ++c) {
                        owner[r][c] = index;
                    }
                }
                candidate.owns_slots = true;
                candidates.push_back(std::move(candidate));
            } else if (!any_free && owners.size() == 1) {
                // Same merged region reported again.
                PlacedCell& kept = candidates[*owners.begin()].cell;
                if (!has_text(kept.text) && has_text(raw->text)) {
                    kept.text = raw->text;
                }
                candidate.absorbed = true;
                candidates.push_back(std::move(candidate));
            } else {
                malformed.insert(r0);
                logger.debug(component, "Cell \"" + raw->text + "\" partly overlaps a claimed region in row " +
                             std::to_string(r0));
                candidates.push_back(std::move(candidate));
            }
        }
    }

    // A row is kept only when the cells of kept rows tile it completely.
    std::set<int> degraded = malformed;
    std::vector<PlacedCell> placed;
    while (true) {
        placed = place_cells(candidates, degraded, rows, columns);

        std::vector<std::vector<bool>> covered(rows, std::vector<bool>(columns, false));
        for (const auto& cell : placed) {
            if (!degraded.count(cell.row)) {
                claim(covered, cell);
            }
        }
        bool changed = false;
        for (int r = 0; r < rows; ++r) {
            if (!degraded.count(r) &&
                std::find(covered[r].begin(), covered[r].end(), false) != covered[r].end()) {
                degraded.insert(r);
                changed = true;
            }
        }
        if (!changed) {
            break;
        }
    }

    layout.rows.resize(rows);
    for (auto& cell : placed) {
        layout.rows[cell.row].push_back(std::move(cell));
    }

    for (int r = 0; r < rows; ++r) {
        auto& row = layout.rows[r];
        if (degraded.count(r)) {
            std::stable_sort(row.begin(), row.end(), [](const PlacedCell& a, const PlacedCell& b) {
                return a.box.left() < b.box.left();
            });
            logger.warn(component, "Row " + std::to_string(r) + " does not tile " +
                        std::to_string(columns) + " columns, keeping its raw cells");
        } else {
            std::sort(row.begin(), row.end(), [](const PlacedCell& a, const PlacedCell& b) {
                return a.column < b.column;
            });
        }
    }
    layout.degraded_rows.assign(degraded.begin(), degraded.end());

    logger.debug(component, "Grid of " + std::to_string(rows) + "x" + std::to_string(columns) +
                 " from " + std::to_string(grid.cell_count()) + " raw cells");
    return layout;
}

std::vector<size_t> TableReconstructor::find_subsumed(const Page& page,
                                                      const BoundingBox& table_box) const {
    std::vector<size_t> subsumed;
    const auto& elements = page.elements();

    for (size_t i = 0; i < elements.size(); ++i) {
        const Element& element = *elements[i];
        if (element.kind() == ElementKind::TABLE) {
            continue;
        }
        const BoundingBox& box = element.box();
        if (box.area() == 0.0) {
            if (table_box.contains(box)) {
                subsumed.push_back(i);
            }
            continue;
        }
        auto ov = BoundingBox::overlap(box, table_box);
        if (ov && ov->box1_overlap_proportion > options_.subsumption_threshold) {
            subsumed.push_back(i);
        }
    }
    return subsumed;
}

std::optional<TablePlan> TableReconstructor::plan(const RawTableGrid& grid, const Page& page,
                                                  Logger& logger) const {
    auto layout = build_layout(grid, logger);
    if (!layout) {
        return std::nullopt;
    }

    TablePlan result;
    result.layout = std::move(*layout);
    result.subsumed = find_subsumed(page, result.layout.box);

    const auto& elements = page.elements();
    for (size_t index : result.subsumed) {
        result.targets.push_back(target_cell(result.layout, elements[index]->box()));
    }

    result.fallback_index = elements.size();
    for (size_t i = 0; i < elements.size(); ++i) {
        if (elements[i]->box().top() > result.layout.box.top()) {
            result.fallback_index = i;
            break;
        }
    }
    return result;
}

const Table* TableReconstructor::apply(Page& page, TablePlan plan) const {
    const TableLayout& layout = plan.layout;
    if (plan.targets.size() != plan.subsumed.size()) {
        throw std::invalid_argument("TablePlan needs one target cell per subsumed element");
    }
    if (layout.column_count() < 1 || layout.row_count() < 1 ||
        layout.rows.size() != static_cast<size_t>(layout.row_count())) {
        throw std::invalid_argument("TablePlan has no usable grid");
    }
    for (const CellRef& target : plan.targets) {
        if (target.row < 0 || static_cast<size_t>(target.row) >= layout.rows.size() ||
            target.index < 0 || static_cast<size_t>(target.index) >= layout.rows[target.row].size()) {
            throw std::out_of_range("TablePlan target (" + std::to_string(target.row) + ", " +
                                    std::to_string(target.index) + ") is not a cell");
        }
    }

    size_t index = page.splice(plan.subsumed, plan.fallback_index,
        [&layout, &plan](std::vector<ElementPtr>& removed) -> ElementPtr {
            std::vector<std::vector<std::vector<ElementPtr>>> contents(layout.rows.size());
            for (size_t r = 0; r < layout.rows.size(); ++r) {
                contents[r].resize(layout.rows[r].size());
            }
            for (size_t i = 0; i < removed.size(); ++i) {
                const CellRef& target = plan.targets[i];
                contents[target.row][target.index].push_back(std::move(removed[i]));
            }

            const double left = layout.column_boundaries.front();
            const double width = layout.column_boundaries.back() - left;

            std::vector<std::unique_ptr<TableRow>> rows;
            rows.reserve(layout.rows.size());
            for (size_t r = 0; r < layout.rows.size(); ++r) {
                std::vector<std::unique_ptr<TableCell>> cells;
                for (size_t k = 0; k < layout.rows[r].size(); ++k) {
                    const PlacedCell& placed = layout.rows[r][k];
                    std::vector<ElementPtr> content = std::move(contents[r][k]);
                    if (content.empty() && has_text(placed.text)) {
                        content.push_back(std::make_unique<Word>(placed.box, placed.text, Font::undefined()));
                    }
                    cells.push_back(std::make_unique<TableCell>(placed.box, placed.colspan,
                                                                placed.rowspan, std::move(content)));
                }
                BoundingBox row_box(left, layout.row_boundaries[r], width,
                                    layout.row_boundaries[r + 1] - layout.row_boundaries[r]);
                rows.push_back(std::make_unique<TableRow>(row_box, std::move(cells)));
            }
            return std::make_unique<Table>(layout.box, std::move(rows), layout.column_count());
        });

    return static_cast<const Table*>(page.elements()[index].get());
}

const Table* TableReconstructor::reconstruct(Page& page, const RawTableGrid& grid,
                                             Logger& logger) const {
    auto table_plan = plan(grid, page, logger);
    if (!table_plan) {
        return nullptr;
    }
    size_t subsumed = table_plan->subsumed.size();
    const Table* table = apply(page, std::move(*table_plan));
    logger.debug("TableReconstructor::reconstruct",
                 "Page " + std::to_string(page.page_number()) + ": table of " +
                 std::to_string(table->row_count()) + " rows replaced " +
                 std::to_string(subsumed) + " elements");
    return table;
}

} // namespace pdf_layout
