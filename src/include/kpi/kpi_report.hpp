#pragma once
#include "kpi/comparison_engine.hpp"
#include <iosfwd>
#include <string>

namespace ingen {

struct MetricOutcome {
    bool ok = false;
    double value = 0.0;
    std::string failure;   // "<kind>: <message>" when !ok
};

struct KpiResults {
    MetricOutcome error;
    MetricOutcome quality;     // ok/failure only; scores below
    QualityScores quality_scores;
    MetricOutcome distance;
};

// Runs the three metrics independently. DegenerateInputError is recorded
// against its metric; other exceptions propagate.
KpiResults evaluate_kpis(const ComparisonEngine& engine);

bool all_metrics_ok(const KpiResults& results);

void generate_kpi_report(std::ostream& os, const KpiResults& results, int precision = 6);

} // namespace ingen
