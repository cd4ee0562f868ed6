// src/data/data_acquisition.cpp
#include "gold_rotation/data/data_acquisition.hpp"
#include <algorithm>
#include <thread>
#include "gold_rotation/core/logger.hpp"
#include "gold_rotation/core/time_utils.hpp"
#include "gold_rotation/data/api_client.hpp"
#include "gold_rotation/data/eastmoney_provider.hpp"
#include "gold_rotation/data/price_normalizer.hpp"
#include "gold_rotation/data/yahoo_provider.hpp"

namespace gold_rotation {

nlohmann::json FetchOptions::to_json() const {
    nlohmann::json j;
    j["retries"] = retries;
    j["backoff_seconds"] = backoff_seconds;
    j["use_cache"] = use_cache;
    if (is_etf.has_value()) {
        j["is_etf"] = *is_etf;
    } else {
        j["is_etf"] = nullptr;
    }
    return j;
}

void FetchOptions::from_json(const nlohmann::json& j) {
    if (j.contains("retries"))
        retries = j.at("retries").get<int>();
    if (j.contains("backoff_seconds"))
        backoff_seconds = j.at("backoff_seconds").get<double>();
    if (j.contains("use_cache"))
        use_cache = j.at("use_cache").get<bool>();
    if (j.contains("is_etf")) {
        if (j.at("is_etf").is_null())
            is_etf.reset();
        else
            is_etf = j.at("is_etf").get<bool>();
    }
}

nlohmann::json DataConfig::to_json() const {
    nlohmann::json j;
    j["cache_directory"] = cache_directory;
    j["gold_symbol"] = gold_symbol;
    j["futures_candidates"] = futures_candidates;
    j["proxy_identifier"] = proxy_identifier;
    j["fallback_identifier"] = fallback_identifier;
    j["eastmoney_base_url"] = eastmoney_base_url;
    j["yahoo_base_url"] = yahoo_base_url;
    j["request_timeout_seconds"] = request_timeout_seconds;
    j["fetch"] = default_options.to_json();
    return j;
}

void DataConfig::from_json(const nlohmann::json& j) {
    if (j.contains("cache_directory"))
        cache_directory = j.at("cache_directory").get<std::string>();
    if (j.contains("gold_symbol"))
        gold_symbol = j.at("gold_symbol").get<std::string>();
    if (j.contains("futures_candidates"))
        futures_candidates = j.at("futures_candidates").get<std::vector<std::string>>();
    if (j.contains("proxy_identifier"))
        proxy_identifier = j.at("proxy_identifier").get<std::string>();
    if (j.contains("fallback_identifier"))
        fallback_identifier = j.at("fallback_identifier").get<std::string>();
    if (j.contains("eastmoney_base_url"))
        eastmoney_base_url = j.at("eastmoney_base_url").get<std::string>();
    if (j.contains("yahoo_base_url"))
        yahoo_base_url = j.at("yahoo_base_url").get<std::string>();
    if (j.contains("request_timeout_seconds"))
        request_timeout_seconds = j.at("request_timeout_seconds").get<long>();
    if (j.contains("fetch"))
        default_options.from_json(j.at("fetch"));
}

DataAcquisition::DataAcquisition(DataConfig config, ProviderSet providers, SleepFunction sleep)
    : config_(std::move(config)),
      providers_(std::move(providers)),
      sleep_(std::move(sleep)),
      cache_(config_.cache_directory) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
    }
    Logger::register_component("DataAcquisition");
}

std::shared_ptr<DataAcquisition> DataAcquisition::create_default(const DataConfig& config) {
    auto eastmoney =
        std::make_shared<ApiClient>(config.eastmoney_base_url, config.request_timeout_seconds);
    eastmoney->add_header("Referer: https://quote.eastmoney.com/");
    auto yahoo = std::make_shared<ApiClient>(config.yahoo_base_url, config.request_timeout_seconds);

    ProviderSet providers;
    providers.gold_futures =
        std::make_shared<EastMoneyProvider>("eastmoney_futures", eastmoney, PriceAdjustment::NONE);
    providers.gold_proxy = std::make_shared<EastMoneyProvider>("eastmoney_gold_etf", eastmoney,
                                                               PriceAdjustment::FORWARD);
    providers.gold_fallback = std::make_shared<YahooChartProvider>("yahoo_chart", yahoo);
    providers.equity_etf =
        std::make_shared<EastMoneyProvider>("eastmoney_etf", eastmoney, PriceAdjustment::FORWARD);
    providers.equity_index =
        std::make_shared<EastMoneyProvider>("eastmoney_index", eastmoney, PriceAdjustment::NONE);

    return std::make_shared<DataAcquisition>(config, std::move(providers));
}

Result<PriceSeries> DataAcquisition::fetch(const std::string& symbol, Timestamp start,
                                           Timestamp end, const FetchOptions& options) {
    if (start > end) {
        attempts_.clear();
        return make_error<PriceSeries>(ErrorCode::INVALID_ARGUMENT,
                                       "Start date " + core::format_date(start) +
                                           " is after end date " + core::format_date(end),
                                       "DataAcquisition");
    }
    if (symbol == config_.gold_symbol) {
        return fetch_gold(start, end, options);
    }
    return fetch_equity(symbol, start, end, options);
}

Result<PriceSeries> DataAcquisition::fetch_gold(Timestamp start, Timestamp end,
                                                const FetchOptions& options) {
    attempts_.clear();
    const std::string& symbol = config_.gold_symbol;

    if (options.use_cache && cache_.exists(symbol)) {
        auto cached = cache_.load(symbol);
        if (cached.is_ok()) {
            PriceSeries slice = cached.value().slice(start, end);
            if (!slice.empty()) {
                INFO("Serving " << slice.size() << " cached bars for " << symbol);
                return slice;
            }
            DEBUG("Cache for " << symbol << " does not cover the requested range");
        } else {
            WARN("Ignoring unreadable cache for " << symbol << ": " << cached.error()->what());
        }
    }

    if (providers_.gold_futures) {
        for (const auto& candidate : config_.futures_candidates) {
            auto result =
                attempt_source(*providers_.gold_futures, candidate, symbol, start, end, true);
            if (result.is_ok()) {
                return result;
            }
            record_attempt(providers_.gold_futures->name(), candidate, 1, *result.error());
        }
    }

    if (providers_.gold_proxy) {
        auto result = attempt_source(*providers_.gold_proxy, config_.proxy_identifier, symbol,
                                     start, end, true);
        if (result.is_ok()) {
            return result;
        }
        record_attempt(providers_.gold_proxy->name(), config_.proxy_identifier, 1,
                       *result.error());
    }

    if (providers_.gold_fallback) {
        const int max_attempts = std::max(1, options.retries);
        for (int attempt = 1; attempt <= max_attempts; ++attempt) {
            auto result = attempt_source(*providers_.gold_fallback, config_.fallback_identifier,
                                         symbol, start, end, true);
            if (result.is_ok()) {
                return result;
            }
            record_attempt(providers_.gold_fallback->name(), config_.fallback_identifier,
                           attempt, *result.error());
            if (!is_transient(result.error()->code())) {
                break;
            }
            if (attempt < max_attempts) {
                const auto wait = std::chrono::milliseconds(
                    static_cast<long long>(options.backoff_seconds * attempt * 1000.0));
                DEBUG("Retrying " << providers_.gold_fallback->name() << " in " << wait.count()
                                  << " ms");
                sleep_(wait);
            }
        }
    }

    if (cache_.exists(symbol)) {
        auto cached = cache_.load(symbol);
        if (cached.is_ok()) {
            PriceSeries slice = cached.value().slice(start, end);
            if (!slice.empty()) {
                WARN("All providers failed for " << symbol << "; falling back to stale cache ("
                                                 << slice.size() << " bars)");
                return slice;
            }
        }
    }

    return unavailable(symbol, start, end);
}

Result<PriceSeries> DataAcquisition::fetch_equity(const std::string& symbol, Timestamp start,
                                                  Timestamp end, const FetchOptions& options) {
    attempts_.clear();

    auto classified = classifier_.classify(symbol, options.is_etf);
    if (classified.is_error()) {
        return forward_error<PriceSeries>(*classified.error(), "DataAcquisition");
    }
    const InstrumentInfo& info = classified.value();

    const auto& provider =
        info.kind == InstrumentKind::ETF ? providers_.equity_etf : providers_.equity_index;
    if (!provider) {
        return make_error<PriceSeries>(
            ErrorCode::DATA_UNAVAILABLE,
            "No provider configured for " + instrument_kind_to_string(info.kind) + " " + symbol,
            "DataAcquisition");
    }

    INFO("Fetching " << instrument_kind_to_string(info.kind) << " " << info.code << " as "
                     << info.secid() << " from " << provider->name());

    auto result = attempt_source(*provider, info.secid(), info.code, start, end, false);
    if (result.is_ok()) {
        return result;
    }
    record_attempt(provider->name(), info.secid(), 1, *result.error());
    return unavailable(info.code, start, end);
}

Result<PriceSeries> DataAcquisition::attempt_source(PriceProvider& provider,
                                                    const std::string& identifier,
                                                    const std::string& symbol, Timestamp start,
                                                    Timestamp end, bool persist) {
    auto raw = provider.fetch_raw(identifier, start, end);
    if (raw.is_error()) {
        return forward_error<PriceSeries>(*raw.error(), provider.name());
    }

    auto normalized = PriceNormalizer::normalize(raw.value(), symbol);
    if (normalized.is_error()) {
        return forward_error<PriceSeries>(*normalized.error(), provider.name());
    }

    PriceSeries slice = normalized.value().slice(start, end);
    if (slice.empty()) {
        return make_error<PriceSeries>(
            ErrorCode::EMPTY_DATA,
            "No bars between " + core::format_date(start) + " and " + core::format_date(end),
            provider.name());
    }

    if (persist) {
        auto stored = cache_.store(normalized.value());
        if (stored.is_error()) {
            WARN("Failed to update cache for " << symbol << ": " << stored.error()->what());
        }
    }

    INFO("Fetched " << slice.size() << " bars for " << symbol << " from " << provider.name()
                    << " [" << identifier << "]");
    return slice;
}

void DataAcquisition::record_attempt(const std::string& provider, const std::string& identifier,
                                     int attempt, const EngineError& error) {
    ProviderAttempt record;
    record.provider = provider;
    record.identifier = identifier;
    record.attempt = attempt;
    record.code = error.code();
    record.message = error.what();
    WARN("Provider attempt failed: " << record.to_string());
    attempts_.push_back(std::move(record));
}

Result<PriceSeries> DataAcquisition::unavailable(const std::string& symbol, Timestamp start,
                                                 Timestamp end) {
    std::string message = "No data for " + symbol + " between " + core::format_date(start) +
                          " and " + core::format_date(end) + " after " +
                          std::to_string(attempts_.size()) + " failed attempt(s)";
    if (!attempts_.empty()) {
        message += "; last error: " + attempts_.back().to_string();
    }
    ERROR(message);

    std::unique_ptr<EngineError> error =
        std::make_unique<DataUnavailableError>(message, attempts_);
    return Result<PriceSeries>(std::move(error));
}

}  // namespace gold_rotation
