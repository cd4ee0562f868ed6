// include/gold_rotation/data/data_acquisition.hpp
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "gold_rotation/core/config_base.hpp"
#include "gold_rotation/core/error.hpp"
#include "gold_rotation/core/types.hpp"
#include "gold_rotation/data/instrument_classifier.hpp"
#include "gold_rotation/data/price_cache.hpp"
#include "gold_rotation/data/price_provider.hpp"

namespace gold_rotation {

/**
 * @brief Per-call knobs for a fetch
 */
struct FetchOptions {
    int retries{3};               // attempts against the retrying provider
    double backoff_seconds{2.0};  // wait before attempt k+1 is backoff_seconds * k
    bool use_cache{true};         // serve from the cache file when it covers the range
    std::optional<bool> is_etf;   // equity only; overrides code-prefix detection

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Explicit configuration of the acquisition layer for one backtest run
 */
struct DataConfig : public ConfigBase {
    std::string cache_directory{"data/cache"};
    std::string gold_symbol{"GC=F"};

    // Futures board candidates, tried in order
    std::vector<std::string> futures_candidates{"101.GC00Y", "101.GCM"};
    // Gold ETF proxying the same underlying
    std::string proxy_identifier{"1.518880"};
    // Ticker for the retrying provider
    std::string fallback_identifier{"GC=F"};

    std::string eastmoney_base_url{"https://push2his.eastmoney.com"};
    std::string yahoo_base_url{"https://query1.finance.yahoo.com"};
    long request_timeout_seconds{30};

    FetchOptions default_options;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief The providers the acquisition layer can draw on
 *
 * Any slot may be null; a missing provider is skipped like a failing one.
 */
struct ProviderSet {
    std::shared_ptr<PriceProvider> gold_futures;   // provider A, tried per candidate
    std::shared_ptr<PriceProvider> gold_proxy;     // provider B
    std::shared_ptr<PriceProvider> gold_fallback;  // provider C, retried with backoff
    std::shared_ptr<PriceProvider> equity_etf;
    std::shared_ptr<PriceProvider> equity_index;
};

/**
 * @brief Fault-tolerant daily price acquisition for the gold and equity legs
 *
 * Gold goes through cache -> futures candidates -> proxy -> retried fallback
 * -> stale cache. Equity goes to a single provider picked by
 * InstrumentClassifier. Individual provider failures are recorded as
 * ProviderAttempts and logged; only exhaustion is reported, as a
 * DataUnavailableError holding every attempt.
 */
class DataAcquisition {
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    /**
     * @param config Cache location, identifiers and defaults
     * @param providers Upstream sources
     * @param sleep Used for retry backoff; defaults to std::this_thread::sleep_for
     */
    DataAcquisition(DataConfig config, ProviderSet providers, SleepFunction sleep = nullptr);

    /**
     * @brief Build the production provider set (EastMoney + Yahoo over libcurl)
     */
    static std::shared_ptr<DataAcquisition> create_default(const DataConfig& config);

    /**
     * @brief Fetch [start, end] for any symbol
     *
     * The configured gold symbol goes through the gold chain, anything else
     * is treated as an A-share ETF or index.
     */
    Result<PriceSeries> fetch(const std::string& symbol, Timestamp start, Timestamp end,
                              const FetchOptions& options);

    Result<PriceSeries> fetch(const std::string& symbol, Timestamp start, Timestamp end) {
        return fetch(symbol, start, end, config_.default_options);
    }

    Result<PriceSeries> fetch_gold(Timestamp start, Timestamp end, const FetchOptions& options);

    Result<PriceSeries> fetch_equity(const std::string& symbol, Timestamp start, Timestamp end,
                                     const FetchOptions& options);

    /**
     * @brief Failures recorded by the most recent fetch call
     */
    const std::vector<ProviderAttempt>& last_attempts() const {
        return attempts_;
    }

    const DataConfig& config() const {
        return config_;
    }

    const PriceCache& cache() const {
        return cache_;
    }

private:
    /**
     * @brief One provider call: fetch, normalize, slice
     * @return Non-empty slice; EMPTY_DATA when nothing falls inside the range
     */
    Result<PriceSeries> attempt_source(PriceProvider& provider, const std::string& identifier,
                                       const std::string& symbol, Timestamp start,
                                       Timestamp end, bool persist);

    void record_attempt(const std::string& provider, const std::string& identifier,
                        int attempt, const EngineError& error);

    Result<PriceSeries> unavailable(const std::string& symbol, Timestamp start, Timestamp end);

    DataConfig config_;
    ProviderSet providers_;
    SleepFunction sleep_;
    PriceCache cache_;
    InstrumentClassifier classifier_;
    std::vector<ProviderAttempt> attempts_;
};

}  // namespace gold_rotation
