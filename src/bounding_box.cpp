#include "pdf_layout/bounding_box.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace pdf_layout {

namespace {

double proportion_of(double part, double whole) {
    if (whole <= 0.0) {
        return 0.0;
    }
    return std::clamp(part / whole, 0.0, 1.0);
}

} // namespace

BoundingBox::BoundingBox(double left, double top, double width, double height)
    : left_(left), top_(top), width_(width), height_(height) {
    if (!std::isfinite(left) || !std::isfinite(top) ||
        !std::isfinite(width) || !std::isfinite(height)) {
        throw std::invalid_argument("BoundingBox coordinates must be finite");
    }
    if (width < 0.0 || height < 0.0) {
        throw std::invalid_argument("BoundingBox has negative size: " +
                                    std::to_string(width) + "x" + std::to_string(height));
    }
}

BoundingBox BoundingBox::from_corners(double x0, double y0, double x1, double y1) {
    return BoundingBox(std::min(x0, x1), std::min(y0, y1),
                       std::abs(x1 - x0), std::abs(y1 - y0));
}

std::optional<Overlap> BoundingBox::overlap(const BoundingBox& a, const BoundingBox& b) {
    double left = std::max(a.left(), b.left());
    double top = std::max(a.top(), b.top());
    double right = std::min(a.right(), b.right());
    double bottom = std::min(a.bottom(), b.bottom());

    if (right <= left || bottom <= top) {
        return std::nullopt;
    }

    Overlap result;
    result.box = BoundingBox(left, top, right - left, bottom - top);
    result.box1_overlap_proportion = proportion_of(result.box.area(), a.area());
    result.box2_overlap_proportion = proportion_of(result.box.area(), b.area());
    return result;
}

BoundingBox BoundingBox::merge(const std::vector<BoundingBox>& boxes) {
    if (boxes.empty()) {
        throw std::invalid_argument("Cannot merge an empty set of bounding boxes");
    }

    double left = boxes.front().left();
    double top = boxes.front().top();
    double right = boxes.front().right();
    double bottom = boxes.front().bottom();

    for (const auto& box : boxes) {
        left = std::min(left, box.left());
        top = std::min(top, box.top());
        right = std::max(right, box.right());
        bottom = std::max(bottom, box.bottom());
    }

    return BoundingBox(left, top, right - left, bottom - top);
}

bool BoundingBox::contains(const BoundingBox& other, double tolerance) const {
    return other.left() >= left_ - tolerance &&
           other.top() >= top_ - tolerance &&
           other.right() <= right() + tolerance &&
           other.bottom() <= bottom() + tolerance;
}

double BoundingBox::horizontal_overlap(double lo, double hi) const {
    return std::max(0.0, std::min(right(), hi) - std::max(left_, lo));
}

double BoundingBox::vertical_overlap(double lo, double hi) const {
    return std::max(0.0, std::min(bottom(), hi) - std::max(top_, lo));
}

bool BoundingBox::near(const BoundingBox& other, double tolerance) const {
    return std::abs(left_ - other.left_) <= tolerance &&
           std::abs(top_ - other.top_) <= tolerance &&
           std::abs(right() - other.right()) <= tolerance &&
           std::abs(bottom() - other.bottom()) <= tolerance;
}

bool BoundingBox::operator==(const BoundingBox& other) const {
    return left_ == other.left_ && top_ == other.top_ &&
           width_ == other.width_ && height_ == other.height_;
}

} // namespace pdf_layout
