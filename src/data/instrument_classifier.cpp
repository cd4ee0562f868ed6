// src/data/instrument_classifier.cpp
#include "gold_rotation/data/instrument_classifier.hpp"
#include <algorithm>
#include <cctype>

namespace gold_rotation {

namespace {

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::optional<Exchange> suffix_exchange(const std::string& symbol) {
    if (symbol.size() < 3) {
        return std::nullopt;
    }
    const std::string suffix = upper(symbol.substr(symbol.size() - 3));
    if (suffix == ".SH") {
        return Exchange::SHANGHAI;
    }
    if (suffix == ".SZ") {
        return Exchange::SHENZHEN;
    }
    return std::nullopt;
}

}  // namespace

const std::vector<ClassificationRule>& InstrumentClassifier::default_rules() {
    static const std::vector<ClassificationRule> kRules = {
        {"51", InstrumentKind::ETF, Exchange::SHANGHAI},
        {"56", InstrumentKind::ETF, Exchange::SHANGHAI},
        {"58", InstrumentKind::ETF, Exchange::SHANGHAI},
        {"15", InstrumentKind::ETF, Exchange::SHENZHEN},
        {"16", InstrumentKind::ETF, Exchange::SHENZHEN},
        {"000", InstrumentKind::INDEX, Exchange::SHANGHAI},
        {"399", InstrumentKind::INDEX, Exchange::SHENZHEN},
        {"5", InstrumentKind::ETF, Exchange::SHANGHAI},
        {"1", InstrumentKind::ETF, Exchange::SHENZHEN},
        {"", InstrumentKind::INDEX, Exchange::SHANGHAI},
    };
    return kRules;
}

InstrumentClassifier::InstrumentClassifier() : rules_(default_rules()) {}

InstrumentClassifier::InstrumentClassifier(std::vector<ClassificationRule> rules)
    : rules_(std::move(rules)) {}

std::string InstrumentClassifier::strip_suffix(const std::string& symbol) {
    if (suffix_exchange(symbol)) {
        return symbol.substr(0, symbol.size() - 3);
    }
    return symbol;
}

Result<InstrumentInfo> InstrumentClassifier::classify(const std::string& symbol,
                                                      std::optional<bool> is_etf) const {
    InstrumentInfo info;
    info.code = strip_suffix(symbol);
    if (info.code.empty()) {
        return make_error<InstrumentInfo>(ErrorCode::INVALID_ARGUMENT, "Empty equity symbol",
                                          "InstrumentClassifier");
    }
    if (!std::all_of(info.code.begin(), info.code.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return make_error<InstrumentInfo>(ErrorCode::INVALID_ARGUMENT,
                                          "Not an A-share code: " + symbol,
                                          "InstrumentClassifier");
    }

    const std::optional<Exchange> explicit_exchange = suffix_exchange(symbol);

    const ClassificationRule* matched = nullptr;
    for (const auto& rule : rules_) {
        if (info.code.compare(0, rule.prefix.size(), rule.prefix) == 0) {
            matched = &rule;
            break;
        }
    }

    if (is_etf.has_value()) {
        info.kind = *is_etf ? InstrumentKind::ETF : InstrumentKind::INDEX;
    } else if (matched) {
        info.kind = matched->kind;
    } else {
        return make_error<InstrumentInfo>(
            ErrorCode::INVALID_ARGUMENT,
            "Cannot tell whether " + symbol + " is an ETF or an index; pass is_etf explicitly",
            "InstrumentClassifier");
    }

    if (explicit_exchange) {
        info.exchange = *explicit_exchange;
    } else if (matched) {
        info.exchange = matched->exchange;
    } else {
        return make_error<InstrumentInfo>(
            ErrorCode::INVALID_ARGUMENT,
            "Cannot tell the exchange of " + symbol + "; add a .SH or .SZ suffix",
            "InstrumentClassifier");
    }

    return info;
}

}  // namespace gold_rotation
