// src/strategy/value_portfolio.cpp
#include "backfolio/strategy/value_portfolio.hpp"
#include <algorithm>
#include "backfolio/core/time_utils.hpp"

namespace backfolio {
namespace strategy {

nlohmann::json ValuePortfolioConfig::to_json() const {
    return nlohmann::json{{"per_max", per_max},       {"pbr_max", pbr_max},
                          {"roe_min", roe_min},       {"max_stocks", max_stocks},
                          {"rebalance_days", rebalance_days}};
}

ValuePortfolioStrategy::ValuePortfolioStrategy(nlohmann::json parameters)
    : BaseStrategy("VALUE_PORTFOLIO", std::move(parameters)) {
    Logger::register_component("ValuePortfolio");

    config_.per_max = get_param<double>("per_max", config_.per_max);
    config_.pbr_max = get_param<double>("pbr_max", config_.pbr_max);
    config_.roe_min = get_param<double>("roe_min", config_.roe_min);
    config_.max_stocks = get_param<int>("max_stocks", config_.max_stocks);
    config_.rebalance_days = get_param<int>("rebalance_days", config_.rebalance_days);
    parameters_ = config_.to_json();
}

Result<void> ValuePortfolioStrategy::validate_config() const {
    if (config_.max_stocks < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "max_stocks must be at least 1",
                                "ValuePortfolioStrategy");
    }
    if (config_.rebalance_days < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "rebalance_days must be at least 1", "ValuePortfolioStrategy");
    }
    if (config_.per_max <= 0.0 || config_.pbr_max <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "PER and PBR ceilings must be positive", "ValuePortfolioStrategy");
    }
    return Result<void>();
}

bool ValuePortfolioStrategy::passes_screen(const data::SnapshotRow& row) const {
    // NaN compares false, so missing fundamentals are screened out
    return row.per > 0.0 && row.per < config_.per_max && row.pbr > 0.0 &&
           row.pbr < config_.pbr_max && row.roe > config_.roe_min;
}

Result<std::vector<std::string>> ValuePortfolioStrategy::select_universe(
    const Timestamp& date, const data::MarketSnapshot& snapshot) {
    std::vector<const data::SnapshotRow*> candidates;
    for (const auto& row : snapshot.rows) {
        if (passes_screen(row)) {
            candidates.push_back(&row);
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const data::SnapshotRow* a, const data::SnapshotRow* b) {
                         return a->volume_amount > b->volume_amount;
                     });

    size_t limit = static_cast<size_t>(config_.max_stocks);
    if (candidates.size() > limit) {
        candidates.resize(limit);
    }

    std::vector<std::string> universe;
    universe.reserve(candidates.size());
    for (const auto* row : candidates) {
        universe.push_back(row->symbol);
    }

    DEBUG("Value screen on " << core::format_date(date) << " kept " << universe.size() << " of "
                             << snapshot.rows.size() << " instruments");
    return universe;
}

Result<std::vector<TargetWeight>> ValuePortfolioStrategy::get_target_weights(
    const std::vector<std::string>& universe, const data::MarketSnapshot& /*snapshot*/,
    const portfolio::Account& /*account*/) {
    std::vector<TargetWeight> weights;
    if (universe.empty()) {
        return weights;
    }

    double weight = 1.0 / static_cast<double>(universe.size());
    weights.reserve(universe.size());
    for (const auto& symbol : universe) {
        weights.push_back(TargetWeight{symbol, weight});
    }
    return weights;
}

}  // namespace strategy
}  // namespace backfolio
