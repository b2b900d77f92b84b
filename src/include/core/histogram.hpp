#pragma once
#include "core/binning.hpp"
#include <vector>
#include <cstddef>

namespace ingen {

// Per-cell counts over a Binning, flattened in the Binning's cell order.
// Holds a non-owning reference to the Binning, which must outlive it.
class Histogram {
public:
    Histogram(const Binning& binning, std::vector<double> values);

    const std::vector<double>& values() const { return values_; }
    const Binning& binning() const { return *binning_; }
    std::size_t size() const { return values_.size(); }
    double total() const;

private:
    const Binning* binning_;
    std::vector<double> values_;
};

} // namespace ingen
