// include/backfolio/core/run_id_generator.hpp
// Utility for generating backtest run IDs
#pragma once

#include <string>
#include <vector>
#include "backfolio/core/types.hpp"

namespace backfolio {

/**
 * @brief Generates identifiers for backtest runs
 *
 * Single strategy run IDs: "VALUE_PORTFOLIO_20251217_195130_366"
 * Batch run IDs combine the sorted strategy names: "MA_CROSS&VALUE_PORTFOLIO_20251217_195130_366"
 */
class RunIdGenerator {
public:
    /**
     * @brief Generate a run ID for one strategy
     * @param strategy_name Strategy name, upper-cased and sanitized in the ID
     * @param timestamp Wall-clock time of the run
     */
    static std::string generate_run_id(const std::string& strategy_name,
                                       const Timestamp& timestamp);

    /**
     * @brief Generate a run ID for a batch of strategies
     */
    static std::string generate_batch_run_id(const std::vector<std::string>& strategy_names,
                                             const Timestamp& timestamp);

    /**
     * @brief Timestamp string in the format "YYYYMMDD_HHMMSS_MMM" (UTC)
     */
    static std::string generate_timestamp_string(const Timestamp& timestamp);

private:
    static std::string sanitize(const std::string& name);
};

}  // namespace backfolio
