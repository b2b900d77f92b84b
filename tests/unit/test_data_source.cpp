#include <gtest/gtest.h>
#include "core/data_source.hpp"
#include <stdexcept>

using ingen::DataSource;

TEST(DataSourceTest, RawPointsPreserveOrder) {
    DataSource ds({{3.0, 1.0}, {1.0, 2.0}});
    auto pts = ds.points(false);
    ASSERT_EQ(pts.size(), 2u);
    EXPECT_DOUBLE_EQ(pts[0][0], 3.0);
    EXPECT_DOUBLE_EQ(pts[1][1], 2.0);
    EXPECT_EQ(ds.dimensions(), 2);
}

TEST(DataSourceTest, NormalizedIntoUnitRange) {
    DataSource ds({{0.0, 100.0}, {10.0, 300.0}, {5.0, 200.0}});
    auto pts = ds.points(true);
    EXPECT_DOUBLE_EQ(pts[0][0], 0.0);
    EXPECT_DOUBLE_EQ(pts[1][0], 1.0);
    EXPECT_DOUBLE_EQ(pts[2][0], 0.5);
    EXPECT_DOUBLE_EQ(pts[0][1], 0.0);
    EXPECT_DOUBLE_EQ(pts[1][1], 1.0);
    EXPECT_DOUBLE_EQ(pts[2][1], 0.5);
}

TEST(DataSourceTest, ZeroExtentDimensionMapsToZero) {
    DataSource ds({{4.0, 1.0}, {4.0, 3.0}});
    auto pts = ds.points(true);
    EXPECT_DOUBLE_EQ(pts[0][0], 0.0);
    EXPECT_DOUBLE_EQ(pts[1][0], 0.0);
    EXPECT_DOUBLE_EQ(pts[1][1], 1.0);
}

TEST(DataSourceTest, HistogramCountsAndDropsOutside) {
    ingen::Binning b({{0.0, 5.0, 10.0}});
    DataSource ds({{1.0}, {2.0}, {3.0}, {7.0}, {10.0}, {11.0}});
    auto h = ds.get_histogram(b);
    ASSERT_EQ(h.size(), 2u);
    EXPECT_DOUBLE_EQ(h.values()[0], 3.0);
    EXPECT_DOUBLE_EQ(h.values()[1], 2.0);
}

TEST(DataSourceTest, RejectsRaggedPoints) {
    ingen::PointSet ragged = {{1.0, 2.0}, {1.0}};
    EXPECT_THROW((void)DataSource(ragged), std::invalid_argument);
}

TEST(DataSourceTest, EmptySourceKeepsDimensions) {
    DataSource ds({}, 3);
    EXPECT_TRUE(ds.empty());
    EXPECT_EQ(ds.dimensions(), 3);
    EXPECT_TRUE(ds.points(true).empty());
}
