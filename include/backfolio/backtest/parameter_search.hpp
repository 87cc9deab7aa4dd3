// include/backfolio/backtest/parameter_search.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>
#include "backfolio/backtest/parallel_runner.hpp"

namespace backfolio {
namespace backtest {

/**
 * @brief Result statistic used to order the runs of a parameter search
 */
enum class RankingMetric {
    SHARPE_RATIO,
    TOTAL_RETURN,
    MAX_DRAWDOWN,  // lower is better
    CALMAR_RATIO
};

std::string ranking_metric_to_string(RankingMetric metric);

/**
 * @brief Parse "sharpe_ratio", "total_return", "mdd" or "calmar_ratio"
 */
Result<RankingMetric> ranking_metric_from_string(const std::string& name);

/**
 * @brief Value of @p metric for a finished run
 */
double metric_value(const BacktestResult& result, RankingMetric metric);

/**
 * @brief Cartesian grid of strategy parameter values
 *
 * Built from an object mapping each parameter name to a non-empty array of
 * candidate values, e.g. {"short_window": [5, 10], "long_window": [20, 60]}.
 * Axes are taken in key order and the last axis varies fastest. A grid
 * without axes has exactly one, empty, combination.
 */
class ParameterGrid {
public:
    ParameterGrid() = default;

    /**
     * @brief Validate and build a grid
     * @return INVALID_ARGUMENT if @p axes is not an object or an axis is not
     *         a non-empty array
     */
    static Result<ParameterGrid> from_json(const nlohmann::json& axes);

    nlohmann::json to_json() const;

    /**
     * @brief Number of combinations, the product of the axis lengths
     */
    size_t size() const;

    bool empty() const {
        return axes_.empty();
    }

    /**
     * @brief Every combination as a {name: value} object
     */
    std::vector<nlohmann::json> combinations() const;

    /**
     * @brief One job per combination
     *
     * Each job copies @p base and sets the combination's values in its
     * strategy_params; parameters outside the grid keep their base values.
     */
    std::vector<BacktestJob> make_jobs(const BacktestConfig& base,
                                       const StrategyBuilder& builder = nullptr) const;

private:
    std::vector<std::pair<std::string, std::vector<nlohmann::json>>> axes_;
};

/**
 * @brief Position of one successful run in a ranking
 */
struct RankedResult {
    size_t job_index{0};
    nlohmann::json parameters = nlohmann::json::object();
    double score{0.0};
};

/**
 * @brief Best runs of a batch by @p metric
 *
 * Failed runs are skipped. MAX_DRAWDOWN ranks ascending, the other metrics
 * descending; ties keep job order and NaN scores rank last.
 * @param top_n Maximum entries returned, 0 for all
 */
std::vector<RankedResult> rank_results(const std::vector<Result<BacktestResult>>& results,
                                       RankingMetric metric, size_t top_n = 10);

/**
 * @brief Spread of headline statistics over the successful runs of a batch
 */
struct SearchStatistics {
    size_t total_runs{0};
    size_t successful_runs{0};
    size_t failed_runs{0};

    double avg_return{0.0};
    double max_return{0.0};
    double min_return{0.0};
    double avg_mdd{0.0};
    double max_mdd{0.0};
    double min_mdd{0.0};
    double avg_sharpe{0.0};
    double max_sharpe{0.0};
    double min_sharpe{0.0};
};

SearchStatistics summarize_results(const std::vector<Result<BacktestResult>>& results);

}  // namespace backtest
}  // namespace backfolio
