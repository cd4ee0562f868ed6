// include/gold_rotation/data/price_cache.hpp
#pragma once

#include <filesystem>
#include <string>
#include "gold_rotation/core/error.hpp"
#include "gold_rotation/core/types.hpp"

namespace gold_rotation {

/**
 * @brief On-disk CSV cache holding one normalized series per symbol
 *
 * File layout: header "Date,Open,High,Low,Close,Volume,Symbol", ISO dates,
 * one row per bar. Every store() replaces the whole file through a
 * temp-file-then-rename, so a reader never observes a half-written cache.
 */
class PriceCache {
public:
    explicit PriceCache(std::filesystem::path cache_directory);

    /**
     * @brief Path of the cache file for a symbol
     * Characters outside [A-Za-z0-9_.-] are replaced by '_'.
     */
    std::filesystem::path path_for(const std::string& symbol) const;

    bool exists(const std::string& symbol) const;

    /**
     * @brief Read and normalize the cached series
     * @return FILE_NOT_FOUND if no cache exists, EMPTY_DATA / SCHEMA_ERROR if
     *         the file does not hold a usable table
     */
    Result<PriceSeries> load(const std::string& symbol) const;

    /**
     * @brief Overwrite the cache for series.symbol()
     */
    Result<void> store(const PriceSeries& series) const;

    /**
     * @brief CSV text of a series in the cache layout
     */
    static std::string to_csv(const PriceSeries& series);

    const std::filesystem::path& directory() const {
        return cache_directory_;
    }

private:
    std::filesystem::path cache_directory_;
};

}  // namespace gold_rotation
