// src/data/price_cache.cpp
#include "gold_rotation/data/price_cache.hpp"
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>
#include "gold_rotation/core/logger.hpp"
#include "gold_rotation/core/time_utils.hpp"
#include "gold_rotation/data/conversion_utils.hpp"
#include "gold_rotation/data/price_normalizer.hpp"

namespace gold_rotation {

namespace {

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> cells;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        if (!cell.empty() && cell.back() == '\r') {
            cell.pop_back();
        }
        cells.push_back(cell);
    }
    if (!line.empty() && line.back() == ',') {
        cells.emplace_back();
    }
    return cells;
}

}  // namespace

PriceCache::PriceCache(std::filesystem::path cache_directory)
    : cache_directory_(std::move(cache_directory)) {}

std::filesystem::path PriceCache::path_for(const std::string& symbol) const {
    std::string safe = symbol;
    for (char& c : safe) {
        const bool allowed = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                             (c >= '0' && c <= '9') || c == '_' || c == '.' || c == '-';
        if (!allowed) {
            c = '_';
        }
    }
    return cache_directory_ / (safe + "_daily.csv");
}

bool PriceCache::exists(const std::string& symbol) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path_for(symbol), ec);
}

std::string PriceCache::to_csv(const PriceSeries& series) {
    std::ostringstream out;
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    out << "Date,Open,High,Low,Close,Volume,Symbol\n";
    for (const auto& bar : series) {
        out << core::format_date(bar.date) << "," << bar.open << "," << bar.high << ","
            << bar.low << "," << bar.close << "," << bar.volume << "," << bar.symbol << "\n";
    }
    return out.str();
}

Result<PriceSeries> PriceCache::load(const std::string& symbol) const {
    const auto path = path_for(symbol);
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<PriceSeries>(ErrorCode::FILE_NOT_FOUND,
                                       "No cache file at " + path.string(), "PriceCache");
    }

    std::string line;
    if (!std::getline(file, line)) {
        return make_error<PriceSeries>(ErrorCode::EMPTY_DATA,
                                       "Cache file is empty: " + path.string(), "PriceCache");
    }
    const std::vector<std::string> header = split_csv_line(line);

    std::vector<std::vector<TextCell>> rows;
    while (std::getline(file, line)) {
        if (line.empty() || line == "\r") {
            continue;
        }
        std::vector<TextCell> row;
        for (auto& cell : split_csv_line(line)) {
            if (cell.empty()) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::move(cell));
            }
        }
        rows.push_back(std::move(row));
    }

    auto table = DataConversionUtils::make_string_table(header, rows);
    if (table.is_error()) {
        return forward_error<PriceSeries>(*table.error(), "PriceCache", path.string());
    }
    return PriceNormalizer::normalize(table.value(), symbol);
}

Result<void> PriceCache::store(const PriceSeries& series) const {
    try {
        std::filesystem::create_directories(cache_directory_);
        const auto path = path_for(series.symbol());
        auto temp_path = path;
        temp_path += ".tmp";

        {
            std::ofstream out(temp_path, std::ios::out | std::ios::trunc);
            if (!out.is_open()) {
                return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                        "Failed to open " + temp_path.string() + " for writing",
                                        "PriceCache");
            }
            out << to_csv(series);
            out.flush();
            if (!out) {
                return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                        "Failed to write " + temp_path.string(), "PriceCache");
            }
        }

        std::filesystem::rename(temp_path, path);
        DEBUG("Cached " << series.size() << " bars for " << series.symbol() << " at "
                        << path.string());
        return Result<void>();
    } catch (const std::filesystem::filesystem_error& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                std::string("Error writing cache: ") + e.what(), "PriceCache");
    }
}

}  // namespace gold_rotation
