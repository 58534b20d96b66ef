#pragma once
#include <crossbar/core/bar.hpp>
#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace crossbar::data {

// Source of ordered OHLCV bars per symbol
class BarDataProvider {
public:
    virtual ~BarDataProvider() = default;

    // @throws core::DataError when the symbol's data is missing or unusable
    virtual std::vector<core::Bar> load_bars(const std::string& symbol) const = 0;
};

struct DataGap {
    int64_t from = 0;
    int64_t to = 0;
    int64_t minutes = 0;
};

struct DataValidationReport {
    size_t invalid_ohlc = 0;      // high below low, or open/close outside the range
    size_t non_positive = 0;
    size_t out_of_order = 0;
    size_t duplicates = 0;
    std::vector<DataGap> gaps;

    bool clean() const { return invalid_ohlc == 0 && non_positive == 0 && out_of_order == 0 && duplicates == 0; }
};

struct CsvOptions {
    std::optional<int64_t> start;      // inclusive
    std::optional<int64_t> end;        // inclusive
    int64_t max_gap_minutes = 0;       // 0 disables gap reporting
};

/**
 * @brief Reads <directory>/<SYMBOL>.csv or an explicitly registered file.
 *
 * The header names the columns: time|timestamp|date|datetime, open, high,
 * low, close and optionally volume|tick_volume. Rows with non-positive
 * prices or inconsistent OHLC are dropped; out-of-order rows are sorted;
 * gaps are reported but kept.
 */
class CsvBarDataProvider : public BarDataProvider {
private:
    std::string directory_;
    std::map<std::string, std::string> files_;
    CsvOptions options_;

public:
    explicit CsvBarDataProvider(std::string directory, CsvOptions options = {});

    void register_file(const std::string& symbol, const std::string& path);
    std::string path_for(const std::string& symbol) const;

    std::vector<core::Bar> load_bars(const std::string& symbol) const override;

    // @throws core::DataError on a missing header column or an unparseable row
    static std::vector<core::Bar> parse_csv(std::istream& input, const std::string& source);

    static DataValidationReport validate(const std::vector<core::Bar>& bars, int64_t max_gap_minutes);

    // Drops invalid rows, sorts, removes duplicate timestamps
    static std::vector<core::Bar> clean(std::vector<core::Bar> bars);
};

} // namespace crossbar::data
