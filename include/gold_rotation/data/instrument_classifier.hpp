// include/gold_rotation/data/instrument_classifier.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "gold_rotation/core/error.hpp"

namespace gold_rotation {

enum class InstrumentKind {
    ETF,
    INDEX
};

enum class Exchange {
    SHANGHAI,
    SHENZHEN
};

inline std::string instrument_kind_to_string(InstrumentKind kind) {
    return kind == InstrumentKind::ETF ? "ETF" : "INDEX";
}

/**
 * @brief Resolved A-share instrument
 */
struct InstrumentInfo {
    std::string code;  // six-digit code without exchange suffix
    InstrumentKind kind{InstrumentKind::ETF};
    Exchange exchange{Exchange::SHANGHAI};

    /**
     * @brief EastMoney secid, "1.<code>" for Shanghai, "0.<code>" for Shenzhen
     */
    std::string secid() const {
        return (exchange == Exchange::SHANGHAI ? "1." : "0.") + code;
    }
};

/**
 * @brief Code-prefix rule: codes starting with prefix are kind on exchange
 */
struct ClassificationRule {
    std::string prefix;
    InstrumentKind kind;
    Exchange exchange;
};

/**
 * @brief Decides whether an equity symbol is an ETF or an index, and where it trades
 */
class InstrumentClassifier {
public:
    /**
     * @brief Classifier with the default A-share rule table
     *
     * Specific prefixes first, then "5" (ETF, Shanghai), "1" (ETF, Shenzhen)
     * and an empty prefix that treats everything else as a Shanghai index.
     */
    InstrumentClassifier();

    explicit InstrumentClassifier(std::vector<ClassificationRule> rules);

    /**
     * @brief Classify a symbol such as "510300", "510300.SH" or "399001.sz"
     *
     * An exchange suffix fixes the exchange; is_etf, when given, fixes the
     * kind. Otherwise the first matching rule decides.
     *
     * @return INVALID_ARGUMENT when the code is empty or not all digits, or
     *         matches no rule and no override covers the gap (only possible
     *         with a custom rule table; the defaults end in a catch-all)
     */
    Result<InstrumentInfo> classify(const std::string& symbol,
                                    std::optional<bool> is_etf = std::nullopt) const;

    /**
     * @brief Strip an optional .SH/.SZ suffix (any case)
     */
    static std::string strip_suffix(const std::string& symbol);

    static const std::vector<ClassificationRule>& default_rules();

private:
    std::vector<ClassificationRule> rules_;
};

}  // namespace gold_rotation
