// include/gold_rotation/strategy/rotation_config.hpp
#pragma once

#include <string>
#include "gold_rotation/core/config_base.hpp"
#include "gold_rotation/core/error.hpp"

namespace gold_rotation {
namespace strategy {

/**
 * @brief How often the engine is allowed to change its mind
 */
enum class RebalanceMode {
    DAILY,
    WEEKLY,   // last observation of each Saturday-Friday week
    MONTHLY   // last observation of each calendar month
};

/**
 * @brief How the two close series are put on a common calendar
 */
enum class AlignmentPolicy {
    FORWARD_FILL,  // union of dates, laggard carried forward
    INNER_JOIN     // dates present in both series
};

std::string rebalance_mode_to_string(RebalanceMode mode);

/**
 * @brief Parse "daily", "weekly" or "monthly" (case-insensitive)
 * @return CONFIG_ERROR for anything else
 */
Result<RebalanceMode> parse_rebalance_mode(const std::string& text);

std::string alignment_policy_to_string(AlignmentPolicy policy);

/**
 * @brief Parse "forward_fill" or "inner_join" (case-insensitive)
 */
Result<AlignmentPolicy> parse_alignment_policy(const std::string& text);

/**
 * @brief Parameters of the momentum rotation
 */
struct RotationConfig : public ConfigBase {
    int lookback_days{60};
    RebalanceMode rebalance{RebalanceMode::WEEKLY};
    double fee_bps{5.0};  // one-way, charged on each position change
    std::string cash_symbol{"CASH"};
    AlignmentPolicy alignment{AlignmentPolicy::FORWARD_FILL};

    /**
     * @brief Check ranges
     * @return CONFIG_ERROR naming the first offending field
     */
    Result<void> validate() const override;

    /**
     * @brief Fee as a fraction of capital
     */
    double fee_rate() const {
        return fee_bps / 10000.0;
    }

    nlohmann::json to_json() const override;

    /**
     * @throws EngineError(CONFIG_ERROR) on an unknown rebalance or alignment string
     */
    void from_json(const nlohmann::json& j) override;
};

}  // namespace strategy
}  // namespace gold_rotation
