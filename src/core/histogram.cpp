#include "core/histogram.hpp"
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace ingen {

Histogram::Histogram(const Binning& binning, std::vector<double> values)
    : binning_(&binning), values_(std::move(values))
{
    if (values_.size() != binning.total_bins()) {
        throw std::invalid_argument("Histogram: " + std::to_string(values_.size()) +
                                    " values for a binning of " +
                                    std::to_string(binning.total_bins()) + " cells");
    }
    for (double v : values_) {
        if (!(v >= 0.0)) {
            throw std::invalid_argument("Histogram: bin values must be non-negative");
        }
    }
}

double Histogram::total() const {
    return std::accumulate(values_.begin(), values_.end(), 0.0);
}

} // namespace ingen
