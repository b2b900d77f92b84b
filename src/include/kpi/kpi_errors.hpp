#pragma once
#include <stdexcept>
#include <string>

namespace ingen {

class Binning;
class DataSource;

// A metric's denominator is zero for valid but degenerate inputs.
class DegenerateInputError : public std::runtime_error {
public:
    DegenerateInputError(const std::string& metric, const std::string& what)
        : std::runtime_error(metric + ": " + what), metric_(metric) {}

    const std::string& metric() const { return metric_; }

private:
    std::string metric_;
};

// Real, generated and binning dimensionality disagree.
class DimensionMismatchError : public std::runtime_error {
public:
    explicit DimensionMismatchError(const std::string& what)
        : std::runtime_error(what) {}
};

// Run by the caller before a ComparisonEngine is built; the engine itself
// assumes dimension-compatible inputs.
void check_compare_dimensions(const DataSource& real,
                              const DataSource& generated,
                              const Binning& binning);

} // namespace ingen
