#include "core/config_loader.hpp"
#include "io/binning_io.hpp"
#include "io/data_source_io.hpp"
#include "kpi/comparison_engine.hpp"
#include "kpi/kpi_errors.hpp"
#include "kpi/kpi_report.hpp"
#include "utils/logger.hpp"
#include <iostream>

using namespace ingen;

namespace {

enum ExitCode {
    kExitOk = 0,
    kExitInputFailure = 1,
    kExitDimensionMismatch = 2,
    kExitMetricFailure = 3
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " REAL GENERATED BINNING [CONFIG]\n"
              << "  REAL, GENERATED  point files, one point per line\n"
              << "  BINNING          binning INI file, or edges 'e0,e1,...:e0,e1,...'\n"
              << "  CONFIG           optional compare INI file\n";
}

DataSource read_source_or_throw(const std::string& path) {
    try {
        return read_data_source(path);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": does not exist or is not readable. (" + e.what() + ")");
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 4 || argc > 5) {
        print_usage(argv[0]);
        return kExitInputFailure;
    }

    const std::string real_path = argv[1];
    const std::string generated_path = argv[2];
    const std::string binning_arg = argv[3];

    Logger& log = Logger::get();

    try {
        CompareConfig config;
        if (argc == 5) {
            config = load_compare_config(argv[4]);
        }
        config.validate();

        log.set_level(log_level_from_int(config.log_level));
        log.set_colors(config.log_colors);
        if (log.get_level() <= LogLevel::DEBUG) {
            print_config_summary(std::cerr, config);
        }

        DataSource real = read_source_or_throw(real_path);
        DataSource generated = read_source_or_throw(generated_path);
        Binning binning = resolve_binning(binning_arg);

        log.info("real: %zu points, generated: %zu points, binning: %zu bins in %d dimensions",
                 real.size(), generated.size(), binning.total_bins(), binning.dimensions());

        check_compare_dimensions(real, generated, binning);

        KpiOptions options;
        options.n_chunks = static_cast<std::size_t>(config.n_chunks);
        options.normalized_distance = config.normalized_distance;

        ComparisonEngine engine(real, generated, binning, options);
        KpiResults results = evaluate_kpis(engine);

        generate_kpi_report(std::cout, results, config.precision);
        log.flush();

        return all_metrics_ok(results) ? kExitOk : kExitMetricFailure;

    } catch (const DimensionMismatchError& e) {
        log.error("%s", e.what());
        return kExitDimensionMismatch;
    } catch (const std::exception& e) {
        log.error("%s", e.what());
        return kExitInputFailure;
    }
}
