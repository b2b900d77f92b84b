#include "core/data_source.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace ingen {

DataSource::DataSource(PointSet points)
    : DataSource(points, points.empty() ? 0 : static_cast<int>(points.front().size()))
{
}

DataSource::DataSource(PointSet points, int dimensions)
    : points_(std::move(points)), dimensions_(dimensions)
{
    if (dimensions_ < 0) {
        throw std::invalid_argument("DataSource: dimensions cannot be negative");
    }
    for (std::size_t i = 0; i < points_.size(); ++i) {
        if (static_cast<int>(points_[i].size()) != dimensions_) {
            throw std::invalid_argument("DataSource: point " + std::to_string(i) + " has " +
                                        std::to_string(points_[i].size()) +
                                        " coordinates, expected " + std::to_string(dimensions_));
        }
    }
    compute_bounds();
}

void DataSource::compute_bounds() {
    lower_.assign(dimensions_, 0.0);
    upper_.assign(dimensions_, 0.0);
    if (points_.empty()) return;

    lower_ = points_.front();
    upper_ = points_.front();
    for (const auto& p : points_) {
        for (int d = 0; d < dimensions_; ++d) {
            lower_[d] = std::min(lower_[d], p[d]);
            upper_[d] = std::max(upper_[d], p[d]);
        }
    }
}

PointSet DataSource::points(bool normalized) const {
    if (!normalized) {
        return points_;
    }

    PointSet out(points_);
    for (auto& p : out) {
        for (int d = 0; d < dimensions_; ++d) {
            double extent = upper_[d] - lower_[d];
            p[d] = (extent > 0.0) ? (p[d] - lower_[d]) / extent : 0.0;
        }
    }
    return out;
}

Histogram DataSource::get_histogram(const Binning& binning) const {
    std::vector<double> counts(binning.total_bins(), 0.0);
    for (const auto& p : points_) {
        long idx = binning.flat_index(p);
        if (idx >= 0) {
            counts[static_cast<std::size_t>(idx)] += 1.0;
        }
    }
    return Histogram(binning, std::move(counts));
}

} // namespace ingen
