#pragma once
#include "core/binning.hpp"
#include "core/histogram.hpp"
#include <vector>
#include <cstddef>

namespace ingen {

using Point = std::vector<double>;
using PointSet = std::vector<Point>;

// Immutable, ordered point set.
class DataSource {
public:
    explicit DataSource(PointSet points);
    // Explicit dimensionality, needed to describe an empty source.
    DataSource(PointSet points, int dimensions);

    int dimensions() const { return dimensions_; }
    std::size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }

    // Raw coordinates, or each dimension rescaled into [0,1] by this source's
    // own observed extent. Zero-extent dimensions map to 0.
    PointSet points(bool normalized = false) const;

    const std::vector<double>& lower_bounds() const { return lower_; }
    const std::vector<double>& upper_bounds() const { return upper_; }

    // Point counts per cell of `binning`; points outside the binning are dropped.
    Histogram get_histogram(const Binning& binning) const;

private:
    void compute_bounds();

    PointSet points_;
    int dimensions_ = 0;
    std::vector<double> lower_;
    std::vector<double> upper_;
};

} // namespace ingen
