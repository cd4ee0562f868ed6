// include/gold_rotation/strategy/rotation_engine.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "gold_rotation/core/error.hpp"
#include "gold_rotation/core/types.hpp"
#include "gold_rotation/strategy/rotation_config.hpp"

namespace gold_rotation {
namespace strategy {

/**
 * @brief What the portfolio holds on a given day
 */
enum class Holding {
    GOLD,
    EQUITY,
    CASH
};

/**
 * @brief "GOLD", "EQUITY", or the configured cash symbol
 */
std::string holding_label(Holding holding, const std::string& cash_symbol);

/**
 * @brief Closes of both assets on a common calendar, no gaps
 */
struct AlignedPriceTable {
    std::vector<Timestamp> dates;
    std::vector<double> gold;
    std::vector<double> equity;

    size_t size() const {
        return dates.size();
    }

    bool empty() const {
        return dates.empty();
    }
};

/**
 * @brief One row of the backtest, one per aligned trading day
 */
struct SignalRecord {
    Timestamp date;
    Holding raw_signal{Holding::CASH};         // decision as of this day's close
    Holding executed_position{Holding::CASH};  // what was actually held this day
    double gold_ret{0.0};
    double equity_ret{0.0};
    double fee{0.0};
    double portfolio_ret{0.0};
};

/**
 * @brief Two-asset momentum rotation between gold and an equity index
 *
 * At each rebalance date the asset with the higher trailing return over
 * lookback_days is selected, or cash when neither is positive. Decisions use
 * the close of the decision day and are executed on the next day, so no row
 * ever depends on a price later than its own date.
 */
class RotationEngine {
public:
    /**
     * @throws EngineError(CONFIG_ERROR) if the config does not validate
     */
    explicit RotationEngine(RotationConfig config);

    /**
     * @brief Put both close series on a common calendar per config().alignment
     *
     * Rows where either asset has no price yet (before its first bar) are
     * dropped.
     */
    AlignedPriceTable align_prices(const PriceSeries& gold, const PriceSeries& equity) const;

    /**
     * @brief Simple returns p[t]/p[t-1] - 1, with 0 on the first day
     */
    static std::vector<double> daily_returns(const std::vector<double>& prices);

    /**
     * @brief Trailing return p[t]/p[t-L] - 1; empty for the first L entries
     */
    std::vector<std::optional<double>> momentum(const std::vector<double>& prices) const;

    /**
     * @brief Dates at which a new selection is made
     *
     * The last date of every schedule period qualifies, including a trailing
     * incomplete period.
     */
    std::vector<Timestamp> rebalance_dates(const std::vector<Timestamp>& dates) const;

    /**
     * @brief Highest strictly positive momentum wins; ties go to GOLD
     */
    static Holding select_holding(double gold_momentum, double equity_momentum);

    /**
     * @brief Run the full pipeline over two price series
     */
    std::vector<SignalRecord> generate_signals(const PriceSeries& gold,
                                               const PriceSeries& equity) const;

    const RotationConfig& config() const {
        return config_;
    }

private:
    std::vector<bool> decision_flags(const std::vector<Timestamp>& dates) const;

    const RotationConfig config_;
};

/**
 * @brief Validate config and run a RotationEngine
 * @return CONFIG_ERROR instead of throwing on an invalid config
 */
Result<std::vector<SignalRecord>> generate_signals(const PriceSeries& gold,
                                                   const PriceSeries& equity,
                                                   const RotationConfig& config);

}  // namespace strategy
}  // namespace gold_rotation
