#pragma once
#include "kpi/chunked_reducer.hpp"
#include <string>
#include <stdexcept>

namespace ingen {

/**
 * @brief Settings of a compare run
 */
struct CompareConfig {
    // [compare]
    int n_chunks = static_cast<int>(kDefaultChunks);
    bool normalized_distance = true;

    // [logging]
    int log_level = 2;          // 0=TRACE .. 4=ERROR
    bool log_colors = true;

    // [report]
    int precision = 6;

    void validate() const;
};

inline void CompareConfig::validate() const {
    if (n_chunks <= 0) {
        throw std::invalid_argument("CompareConfig: compare.n_chunks must be positive");
    }
    if (log_level < 0 || log_level > 4) {
        throw std::invalid_argument("CompareConfig: logging.level must be in [0,4]");
    }
    if (precision < 0 || precision > 17) {
        throw std::invalid_argument("CompareConfig: report.precision must be in [0,17]");
    }
}

} // namespace ingen
