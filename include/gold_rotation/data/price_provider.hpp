// include/gold_rotation/data/price_provider.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "gold_rotation/core/error.hpp"
#include "gold_rotation/core/types.hpp"

namespace gold_rotation {

/**
 * @brief Source of raw daily price tables
 *
 * Implementations return the payload as an Arrow table with whatever column
 * names the upstream uses; PriceNormalizer reconciles them. Calls are
 * idempotent reads.
 */
class PriceProvider {
public:
    virtual ~PriceProvider() = default;

    /**
     * @brief Short provider name used in logs and diagnostics
     */
    virtual std::string name() const = 0;

    /**
     * @brief Fetch daily history for one instrument
     * @param identifier Provider-specific instrument id (contract, secid, ticker)
     * @param start First calendar date wanted
     * @param end Last calendar date wanted
     * @return Raw table, or the provider's transport/parse error
     */
    virtual Result<std::shared_ptr<arrow::Table>> fetch_raw(const std::string& identifier,
                                                            Timestamp start,
                                                            Timestamp end) = 0;
};

/**
 * @brief One failed attempt inside a fallback chain
 */
struct ProviderAttempt {
    std::string provider;
    std::string identifier;
    int attempt{1};
    ErrorCode code{ErrorCode::NONE};
    std::string message;

    std::string to_string() const {
        return provider + "[" + identifier + "] attempt " + std::to_string(attempt) + ": " +
               error_code_to_string(code) + " " + message;
    }
};

/**
 * @brief Raised when every source for an asset has been exhausted
 *
 * Keeps each intermediate failure so callers can tell a network outage from
 * a malformed payload.
 */
class DataUnavailableError : public EngineError {
public:
    DataUnavailableError(const std::string& message, std::vector<ProviderAttempt> attempts,
                         const std::string& component = "DataAcquisition")
        : EngineError(ErrorCode::DATA_UNAVAILABLE, message, component),
          attempts_(std::move(attempts)) {}

    const std::vector<ProviderAttempt>& attempts() const {
        return attempts_;
    }

    /**
     * @brief The last provider failure observed before giving up, if any
     */
    const ProviderAttempt* last_error() const {
        return attempts_.empty() ? nullptr : &attempts_.back();
    }

private:
    std::vector<ProviderAttempt> attempts_;
};

}  // namespace gold_rotation
