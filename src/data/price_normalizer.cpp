// src/data/price_normalizer.cpp
#include "gold_rotation/data/price_normalizer.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <map>
#include "gold_rotation/core/logger.hpp"
#include "gold_rotation/data/conversion_utils.hpp"

namespace gold_rotation {

namespace {

struct ColumnAlias {
    PriceField field;
    const char* name;
};

// Listed in priority order within each field
const std::vector<ColumnAlias>& alias_table() {
    static const std::vector<ColumnAlias> kAliases = {
        {PriceField::DATE, "date"},
        {PriceField::DATE, "datetime"},
        {PriceField::DATE, "trade_date"},
        {PriceField::DATE, "time"},
        {PriceField::DATE, "timestamp"},
        {PriceField::DATE, "日期"},
        {PriceField::DATE, "交易日期"},
        {PriceField::DATE, "时间"},

        {PriceField::OPEN, "open"},
        {PriceField::OPEN, "开盘"},
        {PriceField::OPEN, "开盘价"},
        {PriceField::OPEN, "今开"},

        {PriceField::HIGH, "high"},
        {PriceField::HIGH, "最高"},
        {PriceField::HIGH, "最高价"},

        {PriceField::LOW, "low"},
        {PriceField::LOW, "最低"},
        {PriceField::LOW, "最低价"},

        {PriceField::CLOSE, "adj close"},
        {PriceField::CLOSE, "adj_close"},
        {PriceField::CLOSE, "adjclose"},
        {PriceField::CLOSE, "close"},
        {PriceField::CLOSE, "收盘"},
        {PriceField::CLOSE, "收盘价"},
        {PriceField::CLOSE, "settle"},
        {PriceField::CLOSE, "settlement"},
        {PriceField::CLOSE, "settlement price"},
        {PriceField::CLOSE, "结算价"},

        {PriceField::VOLUME, "volume"},
        {PriceField::VOLUME, "vol"},
        {PriceField::VOLUME, "成交量"},
        {PriceField::VOLUME, "成交量(手)"},
    };
    return kAliases;
}

std::string canonical_name(const std::string& name) {
    size_t first = name.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = name.find_last_not_of(" \t\r\n");
    std::string trimmed = name.substr(first, last - first + 1);
    // Only ASCII letters are folded; multi-byte UTF-8 headers pass through untouched
    std::transform(trimmed.begin(), trimmed.end(), trimmed.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return trimmed;
}

const ColumnAlias* find_alias(const std::string& column_name, int* rank) {
    const std::string key = canonical_name(column_name);
    const auto& aliases = alias_table();
    int position = 0;
    for (size_t i = 0; i < aliases.size(); ++i) {
        if (i > 0 && aliases[i].field != aliases[i - 1].field) {
            position = 0;
        }
        if (key == aliases[i].name) {
            if (rank) {
                *rank = position;
            }
            return &aliases[i];
        }
        ++position;
    }
    return nullptr;
}

}  // namespace

std::string price_field_to_string(PriceField field) {
    switch (field) {
        case PriceField::DATE:
            return "date";
        case PriceField::OPEN:
            return "open";
        case PriceField::HIGH:
            return "high";
        case PriceField::LOW:
            return "low";
        case PriceField::CLOSE:
            return "close";
        case PriceField::VOLUME:
            return "volume";
        default:
            return "unknown";
    }
}

std::optional<PriceField> PriceNormalizer::resolve_column(const std::string& column_name) {
    const ColumnAlias* alias = find_alias(column_name, nullptr);
    if (!alias) {
        return std::nullopt;
    }
    return alias->field;
}

int PriceNormalizer::alias_rank(const std::string& column_name) {
    int rank = -1;
    find_alias(column_name, &rank);
    return rank;
}

Result<PriceSeries> PriceNormalizer::normalize(const std::shared_ptr<arrow::Table>& raw,
                                               const std::string& symbol) {
    if (!raw || raw->num_rows() == 0) {
        return make_error<PriceSeries>(ErrorCode::EMPTY_DATA,
                                       "No data returned for symbol " + symbol,
                                       "PriceNormalizer");
    }

    // Pick the best-ranked raw column for every canonical field
    std::map<PriceField, std::pair<int, int>> chosen;  // field -> (rank, column index)
    const auto& fields = raw->schema()->fields();
    for (int i = 0; i < static_cast<int>(fields.size()); ++i) {
        int rank = -1;
        const ColumnAlias* alias = find_alias(fields[i]->name(), &rank);
        if (!alias) {
            continue;
        }
        auto it = chosen.find(alias->field);
        if (it == chosen.end() || rank < it->second.first) {
            chosen[alias->field] = {rank, i};
        }
    }

    std::string missing;
    for (PriceField required : {PriceField::DATE, PriceField::OPEN, PriceField::HIGH,
                                PriceField::LOW, PriceField::CLOSE}) {
        if (chosen.find(required) == chosen.end()) {
            missing += (missing.empty() ? "" : ", ") + price_field_to_string(required);
        }
    }
    if (!missing.empty()) {
        return make_error<PriceSeries>(
            ErrorCode::SCHEMA_ERROR,
            "Unresolvable columns for symbol " + symbol + ": " + missing, "PriceNormalizer");
    }

    auto dates_result = DataConversionUtils::column_to_dates(raw->column(chosen[PriceField::DATE].second));
    if (dates_result.is_error()) {
        return make_error<PriceSeries>(ErrorCode::SCHEMA_ERROR, dates_result.error()->what(),
                                       "PriceNormalizer");
    }
    const auto& dates = dates_result.value();

    std::array<std::vector<std::optional<double>>, 4> prices;
    const std::array<PriceField, 4> price_fields = {PriceField::OPEN, PriceField::HIGH,
                                                    PriceField::LOW, PriceField::CLOSE};
    for (size_t k = 0; k < price_fields.size(); ++k) {
        auto column_result =
            DataConversionUtils::column_to_doubles(raw->column(chosen[price_fields[k]].second));
        if (column_result.is_error()) {
            return make_error<PriceSeries>(ErrorCode::SCHEMA_ERROR,
                                           price_field_to_string(price_fields[k]) + " column: " +
                                               column_result.error()->what(),
                                           "PriceNormalizer");
        }
        prices[k] = column_result.take_value();
    }

    // A feed without volume is still usable; synthesize zeros
    std::vector<std::optional<double>> volumes;
    auto volume_it = chosen.find(PriceField::VOLUME);
    if (volume_it != chosen.end()) {
        auto volume_result =
            DataConversionUtils::column_to_doubles(raw->column(volume_it->second.second));
        if (volume_result.is_ok()) {
            volumes = volume_result.take_value();
        } else {
            WARN("Ignoring unreadable volume column for " << symbol << ": "
                                                         << volume_result.error()->what());
        }
    }

    const size_t num_rows = dates.size();
    std::vector<PriceBar> bars;
    bars.reserve(num_rows);
    size_t dropped = 0;

    for (size_t row = 0; row < num_rows; ++row) {
        if (!dates[row] || !prices[0][row] || !prices[1][row] || !prices[2][row] ||
            !prices[3][row]) {
            ++dropped;
            continue;
        }
        double volume = 0.0;
        if (row < volumes.size() && volumes[row]) {
            volume = *volumes[row];
        }
        bars.emplace_back(*dates[row], *prices[0][row], *prices[1][row], *prices[2][row],
                          *prices[3][row], volume, symbol);
    }

    std::stable_sort(bars.begin(), bars.end(),
                     [](const PriceBar& a, const PriceBar& b) { return a.date < b.date; });

    // Deduplicate by date; the row written last wins
    std::vector<PriceBar> unique_bars;
    unique_bars.reserve(bars.size());
    for (auto& bar : bars) {
        if (!unique_bars.empty() && unique_bars.back().date == bar.date) {
            unique_bars.back() = std::move(bar);
        } else {
            unique_bars.push_back(std::move(bar));
        }
    }

    if (dropped > 0 || unique_bars.size() + dropped != num_rows) {
        DEBUG("Normalized " << symbol << ": " << num_rows << " raw rows, " << dropped
                            << " dropped, " << (num_rows - dropped - unique_bars.size())
                            << " duplicate dates");
    }

    return PriceSeries(symbol, std::move(unique_bars));
}

}  // namespace gold_rotation
