// include/gold_rotation/data/price_normalizer.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "gold_rotation/core/error.hpp"
#include "gold_rotation/core/types.hpp"

namespace gold_rotation {

/**
 * @brief Canonical fields of a daily price table
 */
enum class PriceField {
    DATE,
    OPEN,
    HIGH,
    LOW,
    CLOSE,
    VOLUME
};

std::string price_field_to_string(PriceField field);

/**
 * @brief Maps heterogeneous upstream price tables onto PriceSeries
 *
 * Upstream feeds disagree on column names (English vs. Chinese headers,
 * "Adj Close" vs. "Close", futures settlement prices), on the presence of a
 * volume column and on how dates are encoded. normalize() reconciles all of
 * them into one canonical, date-sorted, date-unique series.
 *
 * Normalization is idempotent: feeding series_to_table() of a normalized
 * series back in yields the same series.
 */
class PriceNormalizer {
public:
    /**
     * @brief Normalize a raw provider table
     * @param raw Table as returned by a provider or read from the cache
     * @param symbol Symbol every output bar is tagged with
     * @return The series, EMPTY_DATA for a null or zero-row table, or
     *         SCHEMA_ERROR if date/open/high/low/close cannot be resolved
     */
    static Result<PriceSeries> normalize(const std::shared_ptr<arrow::Table>& raw,
                                         const std::string& symbol);

    /**
     * @brief Canonical field a raw column name maps to, if any
     *
     * Matching ignores ASCII case and surrounding whitespace.
     */
    static std::optional<PriceField> resolve_column(const std::string& column_name);

    /**
     * @brief Alias priority of a column name within its field (lower wins)
     */
    static int alias_rank(const std::string& column_name);
};

}  // namespace gold_rotation
