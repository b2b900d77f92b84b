#include "core/binning.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace ingen {

Binning::Binning(std::vector<std::vector<double>> edges)
    : edges_(std::move(edges))
{
    if (edges_.empty()) {
        throw std::invalid_argument("Binning: at least one dimension is required");
    }

    for (std::size_t d = 0; d < edges_.size(); ++d) {
        const auto& e = edges_[d];
        if (e.size() < 2) {
            throw std::invalid_argument("Binning: dimension " + std::to_string(d) +
                                        " needs at least two edges");
        }
        for (double edge : e) {
            if (!std::isfinite(edge)) {
                throw std::invalid_argument("Binning: edges of dimension " + std::to_string(d) +
                                            " must be finite");
            }
        }
        for (std::size_t i = 1; i < e.size(); ++i) {
            if (!(e[i] > e[i - 1])) {
                throw std::invalid_argument("Binning: edges of dimension " + std::to_string(d) +
                                            " must be strictly increasing");
            }
        }
    }

    // Row-major strides, last dimension fastest
    const std::size_t n_dims = edges_.size();
    strides_.assign(n_dims, 1);
    for (std::size_t d = n_dims - 1; d > 0; --d) {
        strides_[d - 1] = strides_[d] * (edges_[d].size() - 1);
    }
    total_bins_ = strides_[0] * (edges_[0].size() - 1);

    volumes_.assign(total_bins_, 1.0);
    for (std::size_t cell = 0; cell < total_bins_; ++cell) {
        std::size_t rem = cell;
        double vol = 1.0;
        for (std::size_t d = 0; d < n_dims; ++d) {
            std::size_t idx = rem / strides_[d];
            rem %= strides_[d];
            vol *= edges_[d][idx + 1] - edges_[d][idx];
        }
        if (!std::isfinite(vol)) {
            throw std::invalid_argument("Binning: volume of cell " + std::to_string(cell) +
                                        " is not finite");
        }
        volumes_[cell] = vol;
    }
}

int Binning::bins_per_dimension(int dim) const {
    return static_cast<int>(edges(dim).size()) - 1;
}

const std::vector<double>& Binning::edges(int dim) const {
    if (dim < 0 || dim >= dimensions()) {
        throw std::out_of_range("Binning: dimension " + std::to_string(dim) + " out of range");
    }
    return edges_[dim];
}

int Binning::find_bin(int dim, double x) const {
    const auto& e = edges(dim);
    const int n_bins = static_cast<int>(e.size()) - 1;

    if (!(x >= e[0]) || x > e[n_bins]) return -1;
    if (x == e[n_bins]) return n_bins - 1;

    int lo = 0, hi = n_bins;
    while (lo < hi) {
        int mid = (lo + hi) / 2;
        if (e[mid + 1] <= x) {
            lo = mid + 1;
        } else {
            hi = mid;
        }
    }
    return lo;
}

long Binning::flat_index(const std::vector<double>& point) const {
    if (static_cast<int>(point.size()) != dimensions()) {
        throw std::invalid_argument("Binning: point has " + std::to_string(point.size()) +
                                    " coordinates, binning has " + std::to_string(dimensions()));
    }

    std::size_t index = 0;
    for (int d = 0; d < dimensions(); ++d) {
        int bin = find_bin(d, point[d]);
        if (bin < 0) return -1;
        index += static_cast<std::size_t>(bin) * strides_[d];
    }
    return static_cast<long>(index);
}

} // namespace ingen
