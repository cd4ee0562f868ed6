// src/strategy/rotation_engine.cpp
#include "gold_rotation/strategy/rotation_engine.hpp"
#include <map>
#include <utility>
#include "gold_rotation/core/logger.hpp"
#include "gold_rotation/core/time_utils.hpp"

namespace gold_rotation {
namespace strategy {

namespace {

// Saturday-to-Friday week number. Day 0 (1970-01-01) is a Thursday, so
// day 2 is the first Saturday.
int64_t week_key(Timestamp date) {
    const int64_t shifted = core::days_since_epoch(date) - 2;
    return shifted >= 0 ? shifted / 7 : -((-shifted + 6) / 7);
}

int64_t month_key(Timestamp date) {
    const core::CivilDate civil = core::to_civil(date);
    return static_cast<int64_t>(civil.year) * 12 + static_cast<int64_t>(civil.month) - 1;
}

}  // namespace

std::string holding_label(Holding holding, const std::string& cash_symbol) {
    switch (holding) {
        case Holding::GOLD:
            return "GOLD";
        case Holding::EQUITY:
            return "EQUITY";
        case Holding::CASH:
        default:
            return cash_symbol;
    }
}

RotationEngine::RotationEngine(RotationConfig config) : config_(std::move(config)) {
    auto valid = config_.validate();
    if (valid.is_error()) {
        throw *valid.error();
    }
    Logger::register_component("RotationEngine");
}

AlignedPriceTable RotationEngine::align_prices(const PriceSeries& gold,
                                               const PriceSeries& equity) const {
    std::map<Timestamp, std::pair<std::optional<double>, std::optional<double>>> calendar;
    for (const auto& bar : gold) {
        calendar[bar.date].first = bar.close;
    }
    for (const auto& bar : equity) {
        calendar[bar.date].second = bar.close;
    }

    AlignedPriceTable table;
    std::optional<double> last_gold;
    std::optional<double> last_equity;
    size_t dropped = 0;

    for (const auto& entry : calendar) {
        const auto& closes = entry.second;
        if (config_.alignment == AlignmentPolicy::INNER_JOIN) {
            if (!closes.first || !closes.second) {
                ++dropped;
                continue;
            }
            last_gold = closes.first;
            last_equity = closes.second;
        } else {
            if (closes.first) {
                last_gold = closes.first;
            }
            if (closes.second) {
                last_equity = closes.second;
            }
            if (!last_gold || !last_equity) {
                ++dropped;
                continue;
            }
        }
        table.dates.push_back(entry.first);
        table.gold.push_back(*last_gold);
        table.equity.push_back(*last_equity);
    }

    DEBUG("Aligned " << gold.size() << " gold and " << equity.size() << " equity bars into "
                     << table.size() << " rows (" << alignment_policy_to_string(config_.alignment)
                     << ", " << dropped << " dropped)");
    return table;
}

std::vector<double> RotationEngine::daily_returns(const std::vector<double>& prices) {
    std::vector<double> returns(prices.size(), 0.0);
    for (size_t t = 1; t < prices.size(); ++t) {
        returns[t] = prices[t] / prices[t - 1] - 1.0;
    }
    return returns;
}

std::vector<std::optional<double>> RotationEngine::momentum(
    const std::vector<double>& prices) const {
    const size_t lookback = static_cast<size_t>(config_.lookback_days);
    std::vector<std::optional<double>> result(prices.size());
    for (size_t t = lookback; t < prices.size(); ++t) {
        result[t] = prices[t] / prices[t - lookback] - 1.0;
    }
    return result;
}

std::vector<bool> RotationEngine::decision_flags(const std::vector<Timestamp>& dates) const {
    std::vector<bool> flags(dates.size(), false);
    if (dates.empty()) {
        return flags;
    }

    if (config_.rebalance == RebalanceMode::DAILY) {
        flags.assign(dates.size(), true);
        return flags;
    }

    auto key = [this](Timestamp date) {
        return config_.rebalance == RebalanceMode::WEEKLY ? week_key(date) : month_key(date);
    };

    for (size_t t = 0; t + 1 < dates.size(); ++t) {
        flags[t] = key(dates[t]) != key(dates[t + 1]);
    }
    flags.back() = true;
    return flags;
}

std::vector<Timestamp> RotationEngine::rebalance_dates(const std::vector<Timestamp>& dates) const {
    const std::vector<bool> flags = decision_flags(dates);
    std::vector<Timestamp> result;
    for (size_t t = 0; t < dates.size(); ++t) {
        if (flags[t]) {
            result.push_back(dates[t]);
        }
    }
    return result;
}

Holding RotationEngine::select_holding(double gold_momentum, double equity_momentum) {
    if (gold_momentum >= equity_momentum) {
        return gold_momentum > 0.0 ? Holding::GOLD : Holding::CASH;
    }
    return equity_momentum > 0.0 ? Holding::EQUITY : Holding::CASH;
}

std::vector<SignalRecord> RotationEngine::generate_signals(const PriceSeries& gold,
                                                           const PriceSeries& equity) const {
    const AlignedPriceTable table = align_prices(gold, equity);
    const size_t n = table.size();
    std::vector<SignalRecord> records;
    if (n == 0) {
        WARN("No overlapping dates between " << gold.symbol() << " and " << equity.symbol());
        return records;
    }

    const std::vector<double> gold_ret = daily_returns(table.gold);
    const std::vector<double> equity_ret = daily_returns(table.equity);
    const auto gold_mom = momentum(table.gold);
    const auto equity_mom = momentum(table.equity);
    const std::vector<bool> decisions = decision_flags(table.dates);

    std::vector<Holding> raw(n, Holding::CASH);
    Holding current = Holding::CASH;
    size_t decision_count = 0;
    for (size_t t = 0; t < n; ++t) {
        if (decisions[t] && gold_mom[t] && equity_mom[t]) {
            current = select_holding(*gold_mom[t], *equity_mom[t]);
            ++decision_count;
        }
        raw[t] = current;
    }

    const double fee_rate = config_.fee_rate();
    records.reserve(n);
    Holding previous = Holding::CASH;
    size_t switches = 0;
    for (size_t t = 0; t < n; ++t) {
        SignalRecord record;
        record.date = table.dates[t];
        record.raw_signal = raw[t];
        record.executed_position = t == 0 ? Holding::CASH : raw[t - 1];
        record.gold_ret = gold_ret[t];
        record.equity_ret = equity_ret[t];
        if (record.executed_position != previous) {
            record.fee = fee_rate;
            ++switches;
        }

        double gross = 0.0;
        if (record.executed_position == Holding::GOLD) {
            gross = record.gold_ret;
        } else if (record.executed_position == Holding::EQUITY) {
            gross = record.equity_ret;
        }
        record.portfolio_ret = gross - record.fee;

        previous = record.executed_position;
        records.push_back(record);
    }

    INFO("Generated " << n << " signal rows with " << decision_count << " decisions and "
                      << switches << " position changes (" << rebalance_mode_to_string(config_.rebalance)
                      << ", lookback " << config_.lookback_days << ")");
    return records;
}

Result<std::vector<SignalRecord>> generate_signals(const PriceSeries& gold,
                                                   const PriceSeries& equity,
                                                   const RotationConfig& config) {
    auto valid = config.validate();
    if (valid.is_error()) {
        return forward_error<std::vector<SignalRecord>>(*valid.error(), "RotationEngine");
    }
    RotationEngine engine(config);
    return engine.generate_signals(gold, equity);
}

}  // namespace strategy
}  // namespace gold_rotation
