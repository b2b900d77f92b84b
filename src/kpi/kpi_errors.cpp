#include "kpi/kpi_errors.hpp"
#include "core/binning.hpp"
#include "core/data_source.hpp"

namespace ingen {

void check_compare_dimensions(const DataSource& real,
                              const DataSource& generated,
                              const Binning& binning) {
    if (real.dimensions() != generated.dimensions()) {
        throw DimensionMismatchError(
            "Dimensions of real data (" + std::to_string(real.dimensions()) +
            ") and generated data (" + std::to_string(generated.dimensions()) + ") mismatch.");
    }
    if (binning.dimensions() != real.dimensions()) {
        throw DimensionMismatchError(
            "Dimensions of binning (" + std::to_string(binning.dimensions()) +
            ") and data sources (" + std::to_string(real.dimensions()) + ") mismatch.");
    }
}

} // namespace ingen
