#pragma once
#include <vector>
#include <cstddef>

namespace ingen {

// Rectilinear partition of the data domain.
// Cells are flattened row-major: the last dimension varies fastest.
class Binning {
public:
    // One strictly increasing edge list per dimension, at least two edges each.
    explicit Binning(std::vector<std::vector<double>> edges);

    int dimensions() const { return static_cast<int>(edges_.size()); }
    int bins_per_dimension(int dim) const;
    std::size_t total_bins() const { return total_bins_; }
    const std::vector<double>& edges(int dim) const;

    // Bin on axis `dim` holding x; the last bin includes its upper edge.
    // Returns -1 outside [edges.front(), edges.back()].
    int find_bin(int dim, double x) const;

    // Flattened cell index of a point, -1 if any coordinate lies outside.
    long flat_index(const std::vector<double>& point) const;

    // Per-cell hyper-volume, same ordering as flat_index.
    const std::vector<double>& volumes() const { return volumes_; }

private:
    std::vector<std::vector<double>> edges_;
    std::vector<std::size_t> strides_;
    std::vector<double> volumes_;
    std::size_t total_bins_ = 0;
};

} // namespace ingen
