// include/backfolio/portfolio/position_tracker.hpp
#pragma once

#include <map>
#include <string>
#include <vector>
#include "backfolio/core/error.hpp"
#include "backfolio/core/types.hpp"
#include "backfolio/portfolio/account.hpp"

namespace backfolio {
namespace portfolio {

/**
 * @brief Order sizing and admission limits applied during rebalancing
 */
struct RebalancePolicy {
    double min_rebalance_cost{0.0};  // Orders with smaller notional are dropped
    size_t max_positions{0};         // 0 = unlimited
    double min_cash_balance{0.0};    // Buys may not push cash below this
};

/**
 * @brief One signed order produced by a rebalance
 */
struct RebalanceOrder {
    std::string symbol;
    Quantity quantity{0.0};  // positive = buy, negative = sell
    Price reference_price{0.0};

    Side side() const {
        return quantity > 0 ? Side::BUY : Side::SELL;
    }
};

/**
 * @brief Orders for one session, sells first and then buys in target order
 */
struct RebalancePlan {
    std::vector<RebalanceOrder> orders;
    std::vector<std::string> dropped;   // below min_rebalance_cost
    std::vector<std::string> unpriced;  // no usable price this session
};

/**
 * @brief Target weights after clamping, with the warnings raised on the way
 */
struct SanitizedWeights {
    std::vector<TargetWeight> weights;
    std::vector<std::string> warnings;
    double total{0.0};
};

/**
 * @brief Translates target allocations into order deltas
 */
class PositionTracker {
public:
    explicit PositionTracker(RebalancePolicy policy = RebalancePolicy{});

    /**
     * @brief Current weight of every held instrument as a fraction of equity
     * @param account Account holding the positions
     * @param prices Prices to value holdings at; falls back to the account's last price
     */
    std::map<std::string, double> compute_weights(
        const Account& account, const std::map<std::string, Price>& prices) const;

    /**
     * @brief Clamp weights into [0, 1] and flag sums above 1
     *
     * Non-finite weights become 0. Duplicate instruments keep the first entry.
     * Weights are never renormalized.
     */
    SanitizedWeights sanitize_weights(const std::vector<TargetWeight>& targets) const;

    /**
     * @brief Order deltas moving current holdings toward the targets
     *
     * target_shares = floor(weight * total_equity / price). Holdings absent from
     * the targets are driven to zero.
     */
    RebalancePlan compute_rebalance_orders(const std::vector<TargetWeight>& targets,
                                           const std::map<std::string, Price>& current_prices,
                                           double total_equity,
                                           const std::map<std::string, Quantity>& holdings) const;

    /**
     * @brief Check whether a buy may execute against the account right now
     * @return POSITION_LIMIT_EXCEEDED or INSUFFICIENT_FUNDS on rejection
     */
    Result<void> admit_buy(const Account& account, const std::string& symbol, double notional,
                           double commission) const;

    const RebalancePolicy& policy() const {
        return policy_;
    }

private:
    RebalancePolicy policy_;
};

/**
 * @brief Signed holdings of an account keyed by instrument
 */
std::map<std::string, Quantity> holdings_of(const Account& account);

}  // namespace portfolio
}  // namespace backfolio
