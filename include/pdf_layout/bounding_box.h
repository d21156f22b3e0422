#pragma once

#include <optional>
#include <vector>

namespace pdf_layout {

struct Overlap;

// Axis-aligned rectangle, top grows downward. Immutable once built.
class BoundingBox {
public:
    BoundingBox() = default;

    // Throws std::invalid_argument on negative or non-finite dimensions.
    BoundingBox(double left, double top, double width, double height);

    // Corners may be given in any order.
    static BoundingBox from_corners(double x0, double y0, double x1, double y1);

    // Intersection of a and b, or nullopt when they share no area.
    static std::optional<Overlap> overlap(const BoundingBox& a, const BoundingBox& b);

    // Smallest box enclosing all inputs. Throws std::invalid_argument when empty.
    static BoundingBox merge(const std::vector<BoundingBox>& boxes);

    double left() const { return left_; }
    double top() const { return top_; }
    double width() const { return width_; }
    double height() const { return height_; }
    double right() const { return left_ + width_; }
    double bottom() const { return top_ + height_; }
    double area() const { return width_ * height_; }
    double center_x() const { return left_ + width_ / 2.0; }
    double center_y() const { return top_ + height_ / 2.0; }

    bool contains(const BoundingBox& other, double tolerance = 0.0) const;

    // Length of [lo, hi] shared with this box along each axis.
    double horizontal_overlap(double lo, double hi) const;
    double vertical_overlap(double lo, double hi) const;

    bool near(const BoundingBox& other, double tolerance) const;

    bool operator==(const BoundingBox& other) const;
    bool operator!=(const BoundingBox& other) const { return !(*this == other); }

private:
    double left_ = 0.0;
    double top_ = 0.0;
    double width_ = 0.0;
    double height_ = 0.0;
};

struct Overlap {
    BoundingBox box;
    double box1_overlap_proportion = 0.0;
    double box2_overlap_proportion = 0.0;
};

} // namespace pdf_layout
