// include/gold_rotation/data/conversion_utils.hpp
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
 * @brief Raw text cell; std::nullopt becomes an Arrow null
 */
using TextCell = std::optional<std::string>;

class DataConversionUtils {
public:
    /**
     * @brief Build an all-utf8 Arrow table from text rows
     *
     * Short rows are padded with nulls and long rows truncated, so a torn
     * line from a partially written file still yields a well-formed table.
     *
     * @param column_names Header, one entry per column
     * @param rows Row-major cell values
     * @return Result containing the table
     */
    static Result<std::shared_ptr<arrow::Table>> make_string_table(
        const std::vector<std::string>& column_names,
        const std::vector<std::vector<TextCell>>& rows);

    /**
     * @brief Convert a normalized series back to an Arrow table
     *
     * Columns: Date (date32), Open, High, Low, Close, Volume (float64), Symbol (utf8).
     */
    static Result<std::shared_ptr<arrow::Table>> series_to_table(const PriceSeries& series);

    /**
     * @brief Flatten one column to optional doubles
     *
     * Numeric columns are widened, string columns parsed (',' thousands
     * separators removed). Nulls, unparseable text, non-finite and negative
     * numbers come back as std::nullopt.
     */
    static Result<std::vector<std::optional<double>>> column_to_doubles(
        const std::shared_ptr<arrow::ChunkedArray>& column);

    /**
     * @brief Flatten one column to optional calendar dates
     *
     * Handles date32, date64, timestamp and string columns. Timestamps with a
     * timezone are converted to that zone's wall clock first, zone-less ones
     * are taken as wall clock already. Time-of-day is truncated.
     */
    static Result<std::vector<std::optional<Timestamp>>> column_to_dates(
        const std::shared_ptr<arrow::ChunkedArray>& column);

    /**
     * @brief Parse a price/volume cell
     */
    static std::optional<double> parse_number(const std::string& text);
};

}  // namespace gold_rotation
