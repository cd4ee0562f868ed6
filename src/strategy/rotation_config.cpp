// src/strategy/rotation_config.cpp
#include "gold_rotation/strategy/rotation_config.hpp"
#include "gold_rotation/strategy/rotation_engine.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace gold_rotation {
namespace strategy {

namespace {

std::string normalize_key(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (!std::isspace(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

}  // namespace

std::string rebalance_mode_to_string(RebalanceMode mode) {
    switch (mode) {
        case RebalanceMode::DAILY:
            return "daily";
        case RebalanceMode::WEEKLY:
            return "weekly";
        case RebalanceMode::MONTHLY:
            return "monthly";
        default:
            return "unknown";
    }
}

Result<RebalanceMode> parse_rebalance_mode(const std::string& text) {
    const std::string key = normalize_key(text);
    if (key == "daily") {
        return RebalanceMode::DAILY;
    }
    if (key == "weekly") {
        return RebalanceMode::WEEKLY;
    }
    if (key == "monthly") {
        return RebalanceMode::MONTHLY;
    }
    return make_error<RebalanceMode>(ErrorCode::CONFIG_ERROR,
                                     "Unsupported rebalance mode: '" + text +
                                         "' (expected daily, weekly or monthly)",
                                     "RotationConfig");
}

std::string alignment_policy_to_string(AlignmentPolicy policy) {
    return policy == AlignmentPolicy::INNER_JOIN ? "inner_join" : "forward_fill";
}

Result<AlignmentPolicy> parse_alignment_policy(const std::string& text) {
    const std::string key = normalize_key(text);
    if (key == "forward_fill" || key == "ffill") {
        return AlignmentPolicy::FORWARD_FILL;
    }
    if (key == "inner_join" || key == "inner") {
        return AlignmentPolicy::INNER_JOIN;
    }
    return make_error<AlignmentPolicy>(ErrorCode::CONFIG_ERROR,
                                       "Unsupported alignment policy: '" + text +
                                           "' (expected forward_fill or inner_join)",
                                       "RotationConfig");
}

Result<void> RotationConfig::validate() const {
    if (lookback_days <= 0) {
        return make_error<void>(ErrorCode::CONFIG_ERROR,
                                "lookback_days must be positive, got " +
                                    std::to_string(lookback_days),
                                "RotationConfig");
    }
    if (!std::isfinite(fee_bps) || fee_bps < 0.0) {
        return make_error<void>(ErrorCode::CONFIG_ERROR,
                                "fee_bps must be a finite non-negative number",
                                "RotationConfig");
    }
    if (cash_symbol.empty()) {
        return make_error<void>(ErrorCode::CONFIG_ERROR, "cash_symbol must not be empty",
                                "RotationConfig");
    }
    // The cash label shares a column with the asset labels
    if (cash_symbol == holding_label(Holding::GOLD, cash_symbol) ||
        cash_symbol == holding_label(Holding::EQUITY, cash_symbol)) {
        return make_error<void>(ErrorCode::CONFIG_ERROR,
                                "cash_symbol '" + cash_symbol + "' collides with an asset label",
                                "RotationConfig");
    }
    return Result<void>();
}

nlohmann::json RotationConfig::to_json() const {
    nlohmann::json j;
    j["lookback_days"] = lookback_days;
    j["rebalance"] = rebalance_mode_to_string(rebalance);
    j["fee_bps"] = fee_bps;
    j["cash_symbol"] = cash_symbol;
    j["alignment"] = alignment_policy_to_string(alignment);
    return j;
}

void RotationConfig::from_json(const nlohmann::json& j) {
    if (j.contains("lookback_days"))
        lookback_days = j.at("lookback_days").get<int>();
    if (j.contains("rebalance")) {
        auto mode = parse_rebalance_mode(j.at("rebalance").get<std::string>());
        if (mode.is_error()) {
            throw *mode.error();
        }
        rebalance = mode.value();
    }
    if (j.contains("fee_bps"))
        fee_bps = j.at("fee_bps").get<double>();
    if (j.contains("cash_symbol"))
        cash_symbol = j.at("cash_symbol").get<std::string>();
    if (j.contains("alignment")) {
        auto policy = parse_alignment_policy(j.at("alignment").get<std::string>());
        if (policy.is_error()) {
            throw *policy.error();
        }
        alignment = policy.value();
    }
}

}  // namespace strategy
}  // namespace gold_rotation
