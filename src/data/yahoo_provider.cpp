// src/data/yahoo_provider.cpp
#include "gold_rotation/data/yahoo_provider.hpp"
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include "gold_rotation/core/logger.hpp"
#include "gold_rotation/core/time_utils.hpp"

namespace gold_rotation {

namespace {

using TableResult = Result<std::shared_ptr<arrow::Table>>;

std::string escape_ticker(const std::string& ticker) {
    std::string escaped;
    for (char c : ticker) {
        if (c == '=') {
            escaped += "%3D";
        } else if (c == '^') {
            escaped += "%5E";
        } else {
            escaped += c;
        }
    }
    return escaped;
}

int64_t epoch_seconds(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

// Exchange-local wall time with offset, e.g. 2024-01-02T00:00:00-05:00
std::string format_local_time(int64_t epoch, int64_t gmtoffset) {
    int64_t local = epoch + gmtoffset;
    int64_t days = local / 86400;
    int64_t secs = local % 86400;
    if (secs < 0) {
        secs += 86400;
        --days;
    }
    int64_t offset_minutes = std::llabs(gmtoffset) / 60;
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "T%02d:%02d:%02d%c%02d:%02d",
                  static_cast<int>(secs / 3600), static_cast<int>((secs % 3600) / 60),
                  static_cast<int>(secs % 60), gmtoffset < 0 ? '-' : '+',
                  static_cast<int>(offset_minutes / 60), static_cast<int>(offset_minutes % 60));
    return core::format_date(core::date_from_days(days)) + buffer;
}

std::optional<double> number_at(const nlohmann::json& values, size_t index) {
    if (!values.is_array() || index >= values.size() || !values[index].is_number()) {
        return std::nullopt;
    }
    return values[index].get<double>();
}

}  // namespace

YahooChartProvider::YahooChartProvider(std::string name, std::shared_ptr<ApiClient> client)
    : name_(std::move(name)), client_(std::move(client)) {}

TableResult YahooChartProvider::fetch_raw(const std::string& identifier, Timestamp start,
                                          Timestamp end) {
    if (!client_) {
        return make_error<std::shared_ptr<arrow::Table>>(ErrorCode::INVALID_ARGUMENT,
                                                         "No HTTP client configured", name_);
    }

    // period2 is exclusive upstream; push it past the last wanted day
    std::map<std::string, std::string> query = {
        {"period1", std::to_string(epoch_seconds(start))},
        {"period2", std::to_string(epoch_seconds(end) + 86400)},
        {"interval", "1d"},
        {"events", "history"},
        {"includeAdjustedClose", "true"},
    };

    auto body = client_->get("/v8/finance/chart/" + escape_ticker(identifier), query);
    if (body.is_error()) {
        return forward_error<std::shared_ptr<arrow::Table>>(*body.error(), name_, identifier);
    }

    auto table = parse_chart(body.value());
    if (table.is_error()) {
        return forward_error<std::shared_ptr<arrow::Table>>(*table.error(), name_, identifier);
    }
    DEBUG(name_ << " returned " << table.value()->num_rows() << " rows for " << identifier);
    return table;
}

TableResult YahooChartProvider::parse_chart(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::JSON_PARSE_ERROR, std::string("Malformed chart payload: ") + e.what(),
            "YahooChartProvider");
    }

    if (!j.is_object() || !j.contains("chart")) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::JSON_PARSE_ERROR, "Chart payload has no chart section",
            "YahooChartProvider");
    }
    const auto& chart = j.at("chart");

    if (chart.contains("error") && !chart.at("error").is_null()) {
        std::string description = chart.at("error").value("description", std::string("unknown"));
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::EMPTY_DATA, "Chart API error: " + description, "YahooChartProvider");
    }
    if (!chart.contains("result") || !chart.at("result").is_array() ||
        chart.at("result").empty()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::EMPTY_DATA, "Chart payload has no result", "YahooChartProvider");
    }

    const auto& result = chart.at("result").at(0);
    if (!result.contains("timestamp") || !result.at("timestamp").is_array() ||
        result.at("timestamp").empty()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::EMPTY_DATA, "Chart payload has no bars", "YahooChartProvider");
    }

    int64_t gmtoffset = 0;
    if (result.contains("meta") && result.at("meta").contains("gmtoffset") &&
        result.at("meta").at("gmtoffset").is_number_integer()) {
        gmtoffset = result.at("meta").at("gmtoffset").get<int64_t>();
    }

    const nlohmann::json empty = nlohmann::json::array();
    const nlohmann::json* quote = &empty;
    const nlohmann::json* adjclose = &empty;
    if (result.contains("indicators")) {
        const auto& indicators = result.at("indicators");
        if (indicators.contains("quote") && indicators.at("quote").is_array() &&
            !indicators.at("quote").empty()) {
            quote = &indicators.at("quote").at(0);
        }
        if (indicators.contains("adjclose") && indicators.at("adjclose").is_array() &&
            !indicators.at("adjclose").empty() &&
            indicators.at("adjclose").at(0).contains("adjclose")) {
            adjclose = &indicators.at("adjclose").at(0).at("adjclose");
        }
    }

    auto series_of = [&](const char* key) -> const nlohmann::json& {
        if (quote->is_object() && quote->contains(key)) {
            return quote->at(key);
        }
        return empty;
    };

    const auto& timestamps = result.at("timestamp");
    arrow::StringBuilder date_builder;
    std::vector<std::string> numeric_names = {"Open", "High", "Low", "Close", "Volume"};
    std::vector<const nlohmann::json*> numeric_sources = {
        &series_of("open"), &series_of("high"), &series_of("low"), &series_of("close"),
        &series_of("volume")};
    // Adj Close outranks Close in normalization, so only emit it when present
    if (adjclose != &empty) {
        numeric_names.push_back("Adj Close");
        numeric_sources.push_back(adjclose);
    }
    std::vector<std::unique_ptr<arrow::DoubleBuilder>> numeric_builders;
    for (size_t k = 0; k < numeric_names.size(); ++k) {
        numeric_builders.push_back(std::make_unique<arrow::DoubleBuilder>());
    }

    arrow::Status status;
    for (size_t i = 0; i < timestamps.size() && status.ok(); ++i) {
        if (timestamps[i].is_number_integer()) {
            status = date_builder.Append(format_local_time(timestamps[i].get<int64_t>(), gmtoffset));
        } else {
            status = date_builder.AppendNull();
        }
        for (size_t k = 0; k < numeric_builders.size() && status.ok(); ++k) {
            auto value = number_at(*numeric_sources[k], i);
            status = value ? numeric_builders[k]->Append(*value) : numeric_builders[k]->AppendNull();
        }
    }

    std::vector<std::shared_ptr<arrow::Field>> fields = {arrow::field("Date", arrow::utf8())};
    std::vector<std::shared_ptr<arrow::Array>> arrays(1);
    if (status.ok()) {
        status = date_builder.Finish(&arrays[0]);
    }
    for (size_t k = 0; k < numeric_builders.size() && status.ok(); ++k) {
        std::shared_ptr<arrow::Array> array;
        status = numeric_builders[k]->Finish(&array);
        fields.push_back(arrow::field(numeric_names[k], arrow::float64()));
        arrays.push_back(array);
    }
    if (!status.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR, "Failed to build chart table: " + status.ToString(),
            "YahooChartProvider");
    }

    return arrow::Table::Make(arrow::schema(fields), arrays);
}

}  // namespace gold_rotation
