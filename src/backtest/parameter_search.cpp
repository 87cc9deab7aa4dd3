// src/backtest/parameter_search.cpp
#include "backfolio/backtest/parameter_search.hpp"
#include <algorithm>
#include <cmath>
#include "backfolio/core/logger.hpp"

namespace backfolio {
namespace backtest {

std::string ranking_metric_to_string(RankingMetric metric) {
    switch (metric) {
        case RankingMetric::SHARPE_RATIO:
            return "sharpe_ratio";
        case RankingMetric::TOTAL_RETURN:
            return "total_return";
        case RankingMetric::MAX_DRAWDOWN:
            return "mdd";
        case RankingMetric::CALMAR_RATIO:
            return "calmar_ratio";
        default:
            return "unknown";
    }
}

Result<RankingMetric> ranking_metric_from_string(const std::string& name) {
    if (name == "sharpe_ratio")
        return RankingMetric::SHARPE_RATIO;
    if (name == "total_return")
        return RankingMetric::TOTAL_RETURN;
    if (name == "mdd")
        return RankingMetric::MAX_DRAWDOWN;
    if (name == "calmar_ratio")
        return RankingMetric::CALMAR_RATIO;
    return make_error<RankingMetric>(ErrorCode::INVALID_ARGUMENT,
                                     "Unknown ranking metric: " + name, "ParameterSearch");
}

double metric_value(const BacktestResult& result, RankingMetric metric) {
    switch (metric) {
        case RankingMetric::SHARPE_RATIO:
            return result.sharpe_ratio;
        case RankingMetric::TOTAL_RETURN:
            return result.total_return;
        case RankingMetric::MAX_DRAWDOWN:
            return result.mdd;
        case RankingMetric::CALMAR_RATIO:
            return result.calmar_ratio;
        default:
            return 0.0;
    }
}

Result<ParameterGrid> ParameterGrid::from_json(const nlohmann::json& axes) {
    if (!axes.is_object()) {
        return make_error<ParameterGrid>(ErrorCode::INVALID_ARGUMENT,
                                         "Parameter grid must be an object of value arrays",
                                         "ParameterGrid");
    }

    ParameterGrid grid;
    for (const auto& axis : axes.items()) {
        const auto& values = axis.value();
        if (!values.is_array() || values.empty()) {
            return make_error<ParameterGrid>(
                ErrorCode::INVALID_ARGUMENT,
                "Grid axis " + axis.key() + " must be a non-empty array of values",
                "ParameterGrid");
        }
        grid.axes_.emplace_back(axis.key(),
                                std::vector<nlohmann::json>(values.begin(), values.end()));
    }
    return grid;
}

nlohmann::json ParameterGrid::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [name, values] : axes_) {
        j[name] = values;
    }
    return j;
}

size_t ParameterGrid::size() const {
    size_t count = 1;
    for (const auto& axis : axes_) {
        count *= axis.second.size();
    }
    return count;
}

std::vector<nlohmann::json> ParameterGrid::combinations() const {
    std::vector<nlohmann::json> out;
    out.reserve(size());

    // Odometer over axis positions, last axis fastest
    std::vector<size_t> position(axes_.size(), 0);
    while (true) {
        nlohmann::json combination = nlohmann::json::object();
        for (size_t a = 0; a < axes_.size(); ++a) {
            combination[axes_[a].first] = axes_[a].second[position[a]];
        }
        out.push_back(std::move(combination));

        size_t a = axes_.size();
        while (a > 0) {
            --a;
            if (++position[a] < axes_[a].second.size()) {
                break;
            }
            position[a] = 0;
            if (a == 0) {
                return out;
            }
        }
        if (axes_.empty()) {
            return out;
        }
    }
}

std::vector<BacktestJob> ParameterGrid::make_jobs(const BacktestConfig& base,
                                                  const StrategyBuilder& builder) const {
    std::vector<BacktestJob> jobs;
    for (const auto& combination : combinations()) {
        BacktestConfig config = base;
        if (!config.strategy_params.is_object()) {
            config.strategy_params = nlohmann::json::object();
        }
        for (const auto& value : combination.items()) {
            config.strategy_params[value.key()] = value.value();
        }
        jobs.push_back(BacktestJob{std::move(config), builder});
    }
    return jobs;
}

std::vector<RankedResult> rank_results(const std::vector<Result<BacktestResult>>& results,
                                       RankingMetric metric, size_t top_n) {
    std::vector<RankedResult> ranked;
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].is_error()) {
            continue;
        }
        const BacktestResult& result = results[i].value();
        ranked.push_back(RankedResult{i, result.parameters, metric_value(result, metric)});
    }

    bool ascending = metric == RankingMetric::MAX_DRAWDOWN;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [ascending](const RankedResult& a, const RankedResult& b) {
                         if (std::isnan(a.score))
                             return false;
                         if (std::isnan(b.score))
                             return true;
                         return ascending ? a.score < b.score : a.score > b.score;
                     });

    if (top_n > 0 && ranked.size() > top_n) {
        ranked.resize(top_n);
    }

    if (!ranked.empty()) {
        DEBUG("Best run by " << ranking_metric_to_string(metric) << " is job "
                             << ranked.front().job_index << " with " << ranked.front().score);
    }
    return ranked;
}

SearchStatistics summarize_results(const std::vector<Result<BacktestResult>>& results) {
    SearchStatistics stats;
    stats.total_runs = results.size();

    std::vector<const BacktestResult*> ok;
    for (const auto& result : results) {
        if (result.is_ok()) {
            ok.push_back(&result.value());
        }
    }
    stats.successful_runs = ok.size();
    stats.failed_runs = stats.total_runs - stats.successful_runs;
    if (ok.empty()) {
        return stats;
    }

    stats.max_return = stats.min_return = ok.front()->total_return;
    stats.max_mdd = stats.min_mdd = ok.front()->mdd;
    stats.max_sharpe = stats.min_sharpe = ok.front()->sharpe_ratio;
    for (const auto* r : ok) {
        stats.avg_return += r->total_return;
        stats.avg_mdd += r->mdd;
        stats.avg_sharpe += r->sharpe_ratio;
        stats.max_return = std::max(stats.max_return, r->total_return);
        stats.min_return = std::min(stats.min_return, r->total_return);
        stats.max_mdd = std::max(stats.max_mdd, r->mdd);
        stats.min_mdd = std::min(stats.min_mdd, r->mdd);
        stats.max_sharpe = std::max(stats.max_sharpe, r->sharpe_ratio);
        stats.min_sharpe = std::min(stats.min_sharpe, r->sharpe_ratio);
    }
    double n = static_cast<double>(ok.size());
    stats.avg_return /= n;
    stats.avg_mdd /= n;
    stats.avg_sharpe /= n;
    return stats;
}

}  // namespace backtest
}  // namespace backfolio
