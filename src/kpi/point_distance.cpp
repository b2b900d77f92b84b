#include "kpi/point_distance.hpp"
#include "kpi/kpi_errors.hpp"
#include "utils/logger.hpp"
#include <cmath>
#include <stdexcept>

namespace ingen {

double euclidean_distance(const Point& a, const Point& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("euclidean_distance: points differ in dimensionality");
    }
    double sum_sq = 0.0;
    for (std::size_t d = 0; d < a.size(); ++d) {
        double diff = a[d] - b[d];
        sum_sq += diff * diff;
    }
    return std::sqrt(sum_sq);
}

double mean_distance(const Point& point, const PointSet& set) {
    if (set.empty()) {
        throw DegenerateInputError("distance", "mean distance to an empty point set");
    }
    double sum = 0.0;
    for (const auto& other : set) {
        sum += euclidean_distance(point, other);
    }
    return sum / static_cast<double>(set.size());
}

double cross_distance(const PointSet& x, const PointSet& y, const ChunkedReducer& reducer) {
    return reducer.reduce(x.size(), [&x, &y](const ChunkRange& chunk) {
        double partial = 0.0;
        for (std::size_t i = chunk.begin; i < chunk.end; ++i) {
            partial += mean_distance(x[i], y);
        }
        return partial;
    });
}

double set_to_set_distance(const PointSet& s1, const PointSet& s2, const ChunkedReducer& reducer) {
    if (s1.empty() || s2.empty()) {
        throw DegenerateInputError("distance",
            "point sets must be non-empty (real: " + std::to_string(s1.size()) +
            ", generated: " + std::to_string(s2.size()) + ")");
    }

    Logger& log = Logger::get();
    log.debug("distance: %zu x %zu points in %zu chunks", s1.size(), s2.size(), reducer.n_chunks());

    double forward = cross_distance(s1, s2, reducer);
    double backward = cross_distance(s2, s1, reducer);

    log.debug("distance: cross terms %.6g / %.6g", forward, backward);
    return (forward + backward) / static_cast<double>(s1.size() + s2.size());
}

} // namespace ingen
