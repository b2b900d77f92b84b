#include <gtest/gtest.h>
#include "io/binning_io.hpp"
#include <fstream>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

TEST(BinningIO, ParsesEdgesPerDimension) {
    ingen::Binning b = ingen::parse_binning_edges("0,5,10:0,1,2,4");
    EXPECT_EQ(b.dimensions(), 2);
    EXPECT_EQ(b.bins_per_dimension(0), 2);
    EXPECT_EQ(b.bins_per_dimension(1), 3);
}

TEST(BinningIO, SortsAndDeduplicates) {
    ingen::Binning b = ingen::parse_binning_edges("10, 0, 5, 5");
    ASSERT_EQ(b.edges(0).size(), 3u);
    EXPECT_DOUBLE_EQ(b.edges(0)[0], 0.0);
    EXPECT_DOUBLE_EQ(b.edges(0)[2], 10.0);
}

TEST(BinningIO, RejectsNegativeOrGarbage) {
    EXPECT_THROW(ingen::parse_binning_edges("-1,0,1"), std::invalid_argument);
    EXPECT_THROW(ingen::parse_binning_edges("0,a,1"), std::invalid_argument);
    EXPECT_THROW(ingen::parse_binning_edges("3"), std::invalid_argument);
}

TEST(BinningIO, LoadsFromIniFile) {
    const fs::path tmp_path = fs::temp_directory_path() / "ingen_binning_test.ini";
    {
        std::ofstream out(tmp_path);
        ASSERT_TRUE(out.is_open());
        out << "[binning]\n";
        out << "edges = 0,1,2:0,10\n";
    }

    ingen::Binning b = ingen::resolve_binning(tmp_path.string());
    EXPECT_EQ(b.dimensions(), 2);
    EXPECT_EQ(b.total_bins(), 2u);

    fs::remove(tmp_path);
}

TEST(BinningIO, MalformedFileThrows) {
    const fs::path tmp_path = fs::temp_directory_path() / "ingen_binning_bad.ini";
    {
        std::ofstream out(tmp_path);
        out << "[other]\n";
        out << "key = 1\n";
    }
    EXPECT_THROW(ingen::load_binning(tmp_path.string()), std::runtime_error);
    fs::remove(tmp_path);
}

TEST(BinningIO, NonFileArgumentIsTreatedAsEdges) {
    ingen::Binning b = ingen::resolve_binning("0,2,4");
    EXPECT_EQ(b.total_bins(), 2u);
}

TEST(BinningIO, RejectsNonFiniteEdges) {
    EXPECT_THROW(ingen::parse_binning_edges("0,inf"), std::invalid_argument);
    EXPECT_THROW(ingen::parse_binning_edges("0,nan,1"), std::invalid_argument);
    EXPECT_THROW(ingen::parse_binning_edges("0,1:0,1e400"), std::invalid_argument);
}
