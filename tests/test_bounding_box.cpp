#include <gtest/gtest.h>
#include <pdf_layout/bounding_box.h>
#include <cmath>
#include <limits>
#include <stdexcept>

using pdf_layout::BoundingBox;

TEST(BoundingBoxTest, DerivedEdges) {
    BoundingBox box(10, 20, 30, 40);

    EXPECT_DOUBLE_EQ(box.right(), 40);
    EXPECT_DOUBLE_EQ(box.bottom(), 60);
    EXPECT_DOUBLE_EQ(box.area(), 1200);
    EXPECT_DOUBLE_EQ(box.center_x(), 25);
    EXPECT_DOUBLE_EQ(box.center_y(), 40);
}

TEST(BoundingBoxTest, RejectsNegativeOrNonFinite) {
    EXPECT_THROW(BoundingBox(0, 0, -1, 5), std::invalid_argument);
    EXPECT_THROW(BoundingBox(0, 0, 5, -1), std::invalid_argument);
    EXPECT_THROW(BoundingBox(std::nan(""), 0, 5, 5), std::invalid_argument);
    EXPECT_THROW(BoundingBox(0, std::numeric_limits<double>::infinity(), 5, 5),
                 std::invalid_argument);
}

TEST(BoundingBoxTest, ZeroSizeIsAllowed) {
    BoundingBox box(5, 5, 0, 0);
    EXPECT_DOUBLE_EQ(box.area(), 0);
}

TEST(BoundingBoxTest, FromCornersNormalizesOrder) {
    auto box = BoundingBox::from_corners(50, 80, 10, 20);
    EXPECT_EQ(box, BoundingBox(10, 20, 40, 60));
}

TEST(BoundingBoxTest, OverlapProportions) {
    BoundingBox a(0, 0, 10, 10);
    BoundingBox b(5, 0, 20, 10);

    auto overlap = BoundingBox::overlap(a, b);
    ASSERT_TRUE(overlap.has_value());
    EXPECT_EQ(overlap->box, BoundingBox(5, 0, 5, 10));
    EXPECT_DOUBLE_EQ(overlap->box1_overlap_proportion, 0.5);
    EXPECT_DOUBLE_EQ(overlap->box2_overlap_proportion, 0.25);
}

TEST(BoundingBoxTest, OverlapIsSymmetric) {
    BoundingBox a(0, 0, 10, 10);
    BoundingBox b(2, 3, 4, 20);

    auto ab = BoundingBox::overlap(a, b);
    auto ba = BoundingBox::overlap(b, a);
    ASSERT_TRUE(ab && ba);
    EXPECT_EQ(ab->box, ba->box);
    EXPECT_DOUBLE_EQ(ab->box1_overlap_proportion, ba->box2_overlap_proportion);
    EXPECT_DOUBLE_EQ(ab->box2_overlap_proportion, ba->box1_overlap_proportion);
}

TEST(BoundingBoxTest, TouchingBoxesDoNotOverlap) {
    BoundingBox a(0, 0, 10, 10);
    BoundingBox b(10, 0, 10, 10);
    BoundingBox c(30, 30, 5, 5);

    EXPECT_FALSE(BoundingBox::overlap(a, b).has_value());
    EXPECT_FALSE(BoundingBox::overlap(a, c).has_value());
}

TEST(BoundingBoxTest, MergeEnclosesAll) {
    auto merged = BoundingBox::merge({BoundingBox(10, 10, 5, 5), BoundingBox(0, 20, 2, 2),
                                      BoundingBox(30, 0, 1, 1)});
    EXPECT_EQ(merged, BoundingBox(0, 0, 31, 22));
}

TEST(BoundingBoxTest, MergeOfEmptyThrows) {
    EXPECT_THROW(BoundingBox::merge({}), std::invalid_argument);
}

TEST(BoundingBoxTest, ContainsWithTolerance) {
    BoundingBox outer(0, 0, 100, 100);

    EXPECT_TRUE(outer.contains(BoundingBox(10, 10, 20, 20)));
    EXPECT_TRUE(outer.contains(outer));
    EXPECT_FALSE(outer.contains(BoundingBox(-1, 0, 10, 10)));
    EXPECT_TRUE(outer.contains(BoundingBox(-1, 0, 10, 10), 1.5));
}

TEST(BoundingBoxTest, AxisOverlap) {
    BoundingBox box(10, 20, 30, 10);

    EXPECT_DOUBLE_EQ(box.horizontal_overlap(0, 20), 10);
    EXPECT_DOUBLE_EQ(box.horizontal_overlap(50, 60), 0);
    EXPECT_DOUBLE_EQ(box.vertical_overlap(25, 100), 5);
}

TEST(BoundingBoxTest, Near) {
    BoundingBox a(0, 0, 10, 10);
    EXPECT_TRUE(a.near(BoundingBox(1, 1, 10, 10), 1.0));
    EXPECT_FALSE(a.near(BoundingBox(3, 0, 10, 10), 1.0));
}
