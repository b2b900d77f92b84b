#pragma once
#include "core/binning.hpp"
#include "core/data_source.hpp"
#include "core/histogram.hpp"
#include "kpi/chunked_reducer.hpp"
#include <vector>

namespace ingen {

// Value reported for a partition that selects no bins.
constexpr double kNotApplicableQuality = 2.0;

struct KpiOptions {
    std::size_t n_chunks = kDefaultChunks;
    bool normalized_distance = true;
};

// Volume-weighted quality of one bin partition.
// `applicable` is false when the partition selects no bins.
struct PartitionQuality {
    bool applicable = false;
    double score = 0.0;

    double value_or_sentinel() const { return applicable ? score : kNotApplicableQuality; }
};

struct QualityScores {
    PartitionQuality all_bins;
    PartitionQuality nonempty_bins;   // real count > 0
    PartitionQuality empty_bins;      // real count == 0
};

// Per-bin score for real count r and difference delta = generated - real:
// 1 when both are empty, 0 when generated mass appears in an empty real bin
// or |delta| > r, else 1 - |delta| / r.
double bin_quality(double r, double delta);

/**
 * @brief Fidelity metrics of a generated dataset against a real one
 *
 * Histograms of both sources over the shared binning are built once at
 * construction; the engine is read-only afterward, so the queries may be
 * called repeatedly and from several threads. The sources and the binning
 * are not owned and must outlive the engine.
 */
class ComparisonEngine {
public:
    ComparisonEngine(const DataSource& real,
                     const DataSource& generated,
                     const Binning& binning,
                     KpiOptions options = KpiOptions());

    // Fraction of generated mass in over-generated bins
    double error() const;

    QualityScores quality() const;

    // Two-sample cross-distance between the two point clouds
    double distance() const;

    const Histogram& real_histogram() const { return h1_; }
    const Histogram& generated_histogram() const { return h2_; }
    const std::vector<double>& difference() const { return diff_; }
    const KpiOptions& options() const { return options_; }

private:
    PartitionQuality partition_quality(const std::vector<std::size_t>& index) const;

    const DataSource& real_;
    const DataSource& generated_;
    KpiOptions options_;
    Histogram h1_;
    Histogram h2_;
    std::vector<double> diff_;
};

} // namespace ingen
