#include "kpi/kpi_report.hpp"
#include "kpi/kpi_errors.hpp"
#include "utils/logger.hpp"
#include <iomanip>
#include <ostream>
#include <sstream>

namespace ingen {

namespace {

template <typename Query>
MetricOutcome run_metric(const char* name, Query query) {
    MetricOutcome outcome;
    try {
        outcome.value = query();
        outcome.ok = true;
    } catch (const DegenerateInputError& e) {
        outcome.failure = std::string("DegenerateInputError: ") + e.what();
        Logger::get().error("metric '%s' failed: %s", name, outcome.failure.c_str());
    }
    return outcome;
}

} // namespace

KpiResults evaluate_kpis(const ComparisonEngine& engine) {
    KpiResults results;

    results.error = run_metric("error", [&engine]() { return engine.error(); });

    results.quality = run_metric("quality", [&engine, &results]() {
        results.quality_scores = engine.quality();
        return results.quality_scores.all_bins.value_or_sentinel();
    });

    results.distance = run_metric("distance", [&engine]() { return engine.distance(); });

    return results;
}

bool all_metrics_ok(const KpiResults& results) {
    return results.error.ok && results.quality.ok && results.distance.ok;
}

void generate_kpi_report(std::ostream& out, const KpiResults& results, int precision) {
    // Formatted locally so the caller's stream flags are left untouched
    std::ostringstream os;

    os << "=================================================================================\n";
    os << "                        DATASET FIDELITY REPORT                                 \n";
    os << "=================================================================================\n\n";

    auto print_value = [&os, precision](const char* label, const MetricOutcome& m, double value) {
        os << label << "\t";
        if (m.ok) {
            os << std::fixed << std::setprecision(precision) << value << "\n";
        } else {
            os << "FAILED (" << m.failure << ")\n";
        }
    };

    // Over-generation
    os << "OVER-GENERATION ERROR\n";
    os << "---------------------\n";
    print_value("Error:", results.error, results.error.value);
    os << "\n";

    // Quality partitions
    os << "BIN QUALITY (volume weighted, " << std::fixed << std::setprecision(1)
       << kNotApplicableQuality << " = no bins)\n";
    os << "--------------------------------------------\n";
    const auto& q = results.quality_scores;
    print_value("Q:", results.quality, q.all_bins.value_or_sentinel());
    print_value("QNEB:", results.quality, q.nonempty_bins.value_or_sentinel());
    print_value("QEB:", results.quality, q.empty_bins.value_or_sentinel());
    os << "\n";

    // Point cloud distance
    os << "POINT CLOUD DISTANCE\n";
    os << "--------------------\n";
    print_value("Point Distance:", results.distance, results.distance.value);
    os << "\n";

    os << "=================================================================================\n";
    os << "OVERALL RESULT: ";
    if (all_metrics_ok(results)) {
        os << "ALL METRICS COMPUTED\n";
    } else {
        os << "METRIC FAILURES REPORTED\n";
    }
    os << "=================================================================================\n";

    out << os.str();
}

} // namespace ingen
