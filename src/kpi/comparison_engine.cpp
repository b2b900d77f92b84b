#include "kpi/comparison_engine.hpp"
#include "kpi/kpi_errors.hpp"
#include "kpi/point_distance.hpp"
#include "utils/logger.hpp"
#include <cmath>
#include <numeric>
#include <string>

namespace ingen {

double bin_quality(double r, double delta) {
    if (r == 0.0 && delta == 0.0) {
        return 1.0;
    }
    if (r == 0.0 || std::abs(delta) > r) {
        return 0.0;
    }
    return 1.0 - std::abs(delta) / r;
}

ComparisonEngine::ComparisonEngine(const DataSource& real,
                                   const DataSource& generated,
                                   const Binning& binning,
                                   KpiOptions options)
    : real_(real),
      generated_(generated),
      options_(options),
      h1_(real.get_histogram(binning)),
      h2_(generated.get_histogram(binning))
{
    const auto& h1f = h1_.values();
    const auto& h2f = h2_.values();
    diff_.resize(h1f.size());
    for (std::size_t i = 0; i < h1f.size(); ++i) {
        diff_[i] = h2f[i] - h1f[i];
    }

    Logger::get().debug("engine: %zu bins, real mass %.6g, generated mass %.6g",
                        diff_.size(), h1_.total(), h2_.total());
}

double ComparisonEngine::error() const {
    double generated_mass = h2_.total();
    if (generated_mass == 0.0) {
        throw DegenerateInputError("error", "generated histogram carries no mass in the binning");
    }

    double over = 0.0;
    for (double d : diff_) {
        if (d > 0.0) over += d;
    }
    return over / generated_mass;
}

PartitionQuality ComparisonEngine::partition_quality(const std::vector<std::size_t>& index) const {
    PartitionQuality result;
    if (index.empty()) {
        return result;
    }

    const auto& h1f = h1_.values();
    const auto& volumes = h2_.binning().volumes();

    double weighted = 0.0;
    double total_volume = 0.0;
    for (std::size_t i : index) {
        weighted += bin_quality(h1f[i], diff_[i]) * volumes[i];
        total_volume += volumes[i];
    }

    if (total_volume == 0.0) {
        throw DegenerateInputError("quality", "bin partition of " + std::to_string(index.size()) +
                                              " bins has zero total volume");
    }

    result.applicable = true;
    result.score = weighted / total_volume;
    return result;
}

QualityScores ComparisonEngine::quality() const {
    const auto& h1f = h1_.values();

    std::vector<std::size_t> all(h1f.size());
    std::iota(all.begin(), all.end(), std::size_t{0});

    std::vector<std::size_t> nonempty;
    std::vector<std::size_t> empty;
    for (std::size_t i = 0; i < h1f.size(); ++i) {
        if (h1f[i] > 0.0) {
            nonempty.push_back(i);
        } else {
            empty.push_back(i);
        }
    }

    QualityScores scores;
    scores.all_bins = partition_quality(all);
    scores.nonempty_bins = partition_quality(nonempty);
    scores.empty_bins = partition_quality(empty);
    return scores;
}

double ComparisonEngine::distance() const {
    ChunkedReducer reducer(options_.n_chunks);
    return set_to_set_distance(real_.points(options_.normalized_distance),
                               generated_.points(options_.normalized_distance),
                               reducer);
}

} // namespace ingen
