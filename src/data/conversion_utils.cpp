//src/data/conversion_utils.cpp
#include "gold_rotation/data/conversion_utils.hpp"
#include <arrow/compute/api.h>
#include <arrow/util/config.h>
#include <cmath>
#include <cstdlib>
#include "gold_rotation/core/time_utils.hpp"

namespace gold_rotation {

namespace {

int64_t floor_div(int64_t value, int64_t divisor) {
    int64_t q = value / divisor;
    if ((value % divisor) < 0) {
        --q;
    }
    return q;
}

int64_t timestamp_to_days(int64_t value, arrow::TimeUnit::type unit) {
    int64_t per_day = 86400;
    switch (unit) {
        case arrow::TimeUnit::SECOND:
            break;
        case arrow::TimeUnit::MILLI:
            per_day *= 1000LL;
            break;
        case arrow::TimeUnit::MICRO:
            per_day *= 1000000LL;
            break;
        case arrow::TimeUnit::NANO:
            per_day *= 1000000000LL;
            break;
    }
    return floor_div(value, per_day);
}

// Zone-aware timestamps hold UTC instants; the trading date is the exchange's
// wall-clock date, so shift into local time before truncating
Result<std::shared_ptr<arrow::Array>> to_wall_clock(const std::shared_ptr<arrow::Array>& chunk) {
    if (chunk->type_id() != arrow::Type::TIMESTAMP) {
        return chunk;
    }
    const auto& ts_type = static_cast<const arrow::TimestampType&>(*chunk->type());
    if (ts_type.timezone().empty()) {
        return chunk;
    }

#if ARROW_VERSION_MAJOR >= 21
    // Compute kernels live in their own library and register on demand
    static const arrow::Status registered = arrow::compute::Initialize();
    if (!registered.ok()) {
        return make_error<std::shared_ptr<arrow::Array>>(
            ErrorCode::CONVERSION_ERROR,
            "Arrow compute is unavailable: " + registered.ToString(), "DataConversionUtils");
    }
#endif
    const std::vector<arrow::Datum> args = {arrow::Datum(chunk)};
    arrow::Result<arrow::Datum> local = arrow::compute::CallFunction("local_timestamp", args);
    if (!local.ok()) {
        return make_error<std::shared_ptr<arrow::Array>>(
            ErrorCode::CONVERSION_ERROR,
            "Cannot convert timestamps in zone '" + ts_type.timezone() +
                "' to local time: " + local.status().ToString(),
            "DataConversionUtils");
    }
    return local.ValueOrDie().make_array();
}

std::optional<double> checked_number(double value) {
    if (!std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::optional<double> DataConversionUtils::parse_number(const std::string& text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char c : text) {
        if (c == ',' || c == ' ' || c == '\t' || c == '"' || c == '\r' || c == '\n') {
            continue;
        }
        cleaned.push_back(c);
    }
    if (cleaned.empty() || cleaned == "-" || cleaned == "--") {
        return std::nullopt;
    }

    char* end = nullptr;
    double value = std::strtod(cleaned.c_str(), &end);
    if (end == cleaned.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return checked_number(value);
}

Result<std::shared_ptr<arrow::Table>> DataConversionUtils::make_string_table(
    const std::vector<std::string>& column_names,
    const std::vector<std::vector<TextCell>>& rows) {
    if (column_names.empty()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::INVALID_ARGUMENT, "Cannot build a table without columns",
            "DataConversionUtils");
    }

    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    fields.reserve(column_names.size());
    arrays.reserve(column_names.size());

    for (size_t col = 0; col < column_names.size(); ++col) {
        arrow::StringBuilder builder;
        for (const auto& row : rows) {
            arrow::Status status;
            if (col < row.size() && row[col].has_value()) {
                status = builder.Append(*row[col]);
            } else {
                status = builder.AppendNull();
            }
            if (!status.ok()) {
                return make_error<std::shared_ptr<arrow::Table>>(
                    ErrorCode::CONVERSION_ERROR,
                    "Failed to append to column " + column_names[col] + ": " + status.ToString(),
                    "DataConversionUtils");
            }
        }

        std::shared_ptr<arrow::Array> array;
        arrow::Status status = builder.Finish(&array);
        if (!status.ok()) {
            return make_error<std::shared_ptr<arrow::Table>>(
                ErrorCode::CONVERSION_ERROR,
                "Failed to finish column " + column_names[col] + ": " + status.ToString(),
                "DataConversionUtils");
        }
        fields.push_back(arrow::field(column_names[col], arrow::utf8()));
        arrays.push_back(array);
    }

    return arrow::Table::Make(arrow::schema(fields), arrays);
}

Result<std::shared_ptr<arrow::Table>> DataConversionUtils::series_to_table(
    const PriceSeries& series) {
    arrow::Date32Builder date_builder;
    arrow::DoubleBuilder open_builder, high_builder, low_builder, close_builder, volume_builder;
    arrow::StringBuilder symbol_builder;

    for (const auto& bar : series) {
        arrow::Status status = date_builder.Append(
            static_cast<int32_t>(core::days_since_epoch(bar.date)));
        if (status.ok())
            status = open_builder.Append(bar.open);
        if (status.ok())
            status = high_builder.Append(bar.high);
        if (status.ok())
            status = low_builder.Append(bar.low);
        if (status.ok())
            status = close_builder.Append(bar.close);
        if (status.ok())
            status = volume_builder.Append(bar.volume);
        if (status.ok())
            status = symbol_builder.Append(bar.symbol);
        if (!status.ok()) {
            return make_error<std::shared_ptr<arrow::Table>>(
                ErrorCode::CONVERSION_ERROR, "Failed to append bar: " + status.ToString(),
                "DataConversionUtils");
        }
    }

    std::shared_ptr<arrow::Array> dates, opens, highs, lows, closes, volumes, symbols;
    arrow::Status status = date_builder.Finish(&dates);
    if (status.ok())
        status = open_builder.Finish(&opens);
    if (status.ok())
        status = high_builder.Finish(&highs);
    if (status.ok())
        status = low_builder.Finish(&lows);
    if (status.ok())
        status = close_builder.Finish(&closes);
    if (status.ok())
        status = volume_builder.Finish(&volumes);
    if (status.ok())
        status = symbol_builder.Finish(&symbols);
    if (!status.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR, "Failed to finish series table: " + status.ToString(),
            "DataConversionUtils");
    }

    std::vector<std::shared_ptr<arrow::Field>> fields = {
        arrow::field("Date", arrow::date32()),    arrow::field("Open", arrow::float64()),
        arrow::field("High", arrow::float64()),   arrow::field("Low", arrow::float64()),
        arrow::field("Close", arrow::float64()),  arrow::field("Volume", arrow::float64()),
        arrow::field("Symbol", arrow::utf8())};
    std::vector<std::shared_ptr<arrow::Array>> arrays = {dates,  opens,   highs,  lows,
                                                         closes, volumes, symbols};
    return arrow::Table::Make(arrow::schema(fields), arrays);
}

Result<std::vector<std::optional<double>>> DataConversionUtils::column_to_doubles(
    const std::shared_ptr<arrow::ChunkedArray>& column) {
    std::vector<std::optional<double>> values;
    if (!column) {
        return make_error<std::vector<std::optional<double>>>(
            ErrorCode::INVALID_ARGUMENT, "Column pointer is null", "DataConversionUtils");
    }
    values.reserve(static_cast<size_t>(column->length()));

    for (const auto& chunk : column->chunks()) {
        const arrow::Type::type type_id = chunk->type_id();
        for (int64_t i = 0; i < chunk->length(); ++i) {
            if (chunk->IsNull(i)) {
                values.emplace_back(std::nullopt);
                continue;
            }
            switch (type_id) {
                case arrow::Type::DOUBLE:
                    values.push_back(checked_number(
                        std::static_pointer_cast<arrow::DoubleArray>(chunk)->Value(i)));
                    break;
                case arrow::Type::FLOAT:
                    values.push_back(checked_number(
                        std::static_pointer_cast<arrow::FloatArray>(chunk)->Value(i)));
                    break;
                case arrow::Type::INT64:
                    values.push_back(checked_number(static_cast<double>(
                        std::static_pointer_cast<arrow::Int64Array>(chunk)->Value(i))));
                    break;
                case arrow::Type::INT32:
                    values.push_back(checked_number(static_cast<double>(
                        std::static_pointer_cast<arrow::Int32Array>(chunk)->Value(i))));
                    break;
                case arrow::Type::STRING:
                    values.push_back(parse_number(
                        std::static_pointer_cast<arrow::StringArray>(chunk)->GetString(i)));
                    break;
                case arrow::Type::LARGE_STRING:
                    values.push_back(parse_number(
                        std::static_pointer_cast<arrow::LargeStringArray>(chunk)->GetString(i)));
                    break;
                default:
                    return make_error<std::vector<std::optional<double>>>(
                        ErrorCode::CONVERSION_ERROR,
                        "Unsupported numeric column type: " + chunk->type()->ToString(),
                        "DataConversionUtils");
            }
        }
    }
    return values;
}

Result<std::vector<std::optional<Timestamp>>> DataConversionUtils::column_to_dates(
    const std::shared_ptr<arrow::ChunkedArray>& column) {
    std::vector<std::optional<Timestamp>> values;
    if (!column) {
        return make_error<std::vector<std::optional<Timestamp>>>(
            ErrorCode::INVALID_ARGUMENT, "Column pointer is null", "DataConversionUtils");
    }
    values.reserve(static_cast<size_t>(column->length()));

    for (const auto& raw_chunk : column->chunks()) {
        auto converted = to_wall_clock(raw_chunk);
        if (converted.is_error()) {
            return make_error<std::vector<std::optional<Timestamp>>>(
                converted.error()->code(), converted.error()->what(), "DataConversionUtils");
        }
        const std::shared_ptr<arrow::Array> chunk = converted.value();
        const arrow::Type::type type_id = chunk->type_id();
        for (int64_t i = 0; i < chunk->length(); ++i) {
            if (chunk->IsNull(i)) {
                values.emplace_back(std::nullopt);
                continue;
            }
            switch (type_id) {
                case arrow::Type::DATE32:
                    values.push_back(core::date_from_days(
                        std::static_pointer_cast<arrow::Date32Array>(chunk)->Value(i)));
                    break;
                case arrow::Type::DATE64:
                    values.push_back(core::date_from_days(floor_div(
                        std::static_pointer_cast<arrow::Date64Array>(chunk)->Value(i),
                        86400000LL)));
                    break;
                case arrow::Type::TIMESTAMP: {
                    auto ts_type = std::static_pointer_cast<arrow::TimestampType>(chunk->type());
                    values.push_back(core::date_from_days(timestamp_to_days(
                        std::static_pointer_cast<arrow::TimestampArray>(chunk)->Value(i),
                        ts_type->unit())));
                    break;
                }
                case arrow::Type::STRING:
                case arrow::Type::LARGE_STRING: {
                    std::string text =
                        type_id == arrow::Type::STRING
                            ? std::static_pointer_cast<arrow::StringArray>(chunk)->GetString(i)
                            : std::static_pointer_cast<arrow::LargeStringArray>(chunk)->GetString(
                                  i);
                    auto parsed = core::parse_date(text);
                    if (parsed.is_ok()) {
                        values.push_back(parsed.value());
                    } else {
                        values.emplace_back(std::nullopt);
                    }
                    break;
                }
                default:
                    return make_error<std::vector<std::optional<Timestamp>>>(
                        ErrorCode::CONVERSION_ERROR,
                        "Unsupported date column type: " + chunk->type()->ToString(),
                        "DataConversionUtils");
            }
        }
    }
    return values;
}

}  // namespace gold_rotation
