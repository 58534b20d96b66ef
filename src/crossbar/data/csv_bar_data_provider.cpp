#include <crossbar/data/bar_data_provider.hpp>
#include <crossbar/core/errors.hpp>
#include <crossbar/utils/logger.hpp>
#include <crossbar/utils/time_utils.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <stdexcept>

namespace crossbar::data {

using crossbar::utils::Logger;

namespace {

std::vector<std::string> split_row(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        field.erase(0, field.find_first_not_of(" \t\""));
        field.erase(field.find_last_not_of(" \t\r\"") + 1);
        fields.push_back(field);
    }
    return fields;
}

std::string lowered(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

int find_column(const std::vector<std::string>& header, std::initializer_list<const char*> names) {
    for (size_t i = 0; i < header.size(); ++i) {
        for (const char* name : names) {
            if (header[i] == name) {
                return static_cast<int>(i);
            }
        }
    }
    return -1;
}

bool parse_double(const std::string& text, double& out) {
    try {
        size_t consumed = 0;
        out = std::stod(text, &consumed);
        return consumed == text.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool has_valid_prices(const core::Bar& bar) {
    return bar.open > 0.0 && bar.high > 0.0 && bar.low > 0.0 && bar.close > 0.0;
}

bool has_consistent_range(const core::Bar& bar) {
    return bar.high >= bar.low &&
           bar.open <= bar.high && bar.open >= bar.low &&
           bar.close <= bar.high && bar.close >= bar.low;
}

} // namespace

CsvBarDataProvider::CsvBarDataProvider(std::string directory, CsvOptions options)
    : directory_(std::move(directory)), options_(options) {}

void CsvBarDataProvider::register_file(const std::string& symbol, const std::string& path) {
    files_[symbol] = path;
}

std::string CsvBarDataProvider::path_for(const std::string& symbol) const {
    auto it = files_.find(symbol);
    if (it != files_.end()) {
        return it->second;
    }
    return (std::filesystem::path(directory_) / (symbol + ".csv")).string();
}

std::vector<core::Bar> CsvBarDataProvider::parse_csv(std::istream& input, const std::string& source) {
    std::string line;
    if (!std::getline(input, line)) {
        throw core::DataError(source + ": file is empty");
    }

    std::vector<std::string> header = split_row(line);
    for (auto& column : header) {
        column = lowered(column);
    }

    const int time_col = find_column(header, {"time", "timestamp", "date", "datetime"});
    const int open_col = find_column(header, {"open"});
    const int high_col = find_column(header, {"high"});
    const int low_col = find_column(header, {"low"});
    const int close_col = find_column(header, {"close"});
    const int volume_col = find_column(header, {"volume", "tick_volume", "real_volume"});

    if (time_col < 0 || open_col < 0 || high_col < 0 || low_col < 0 || close_col < 0) {
        throw core::DataError(source + ": header must name time, open, high, low and close columns");
    }

    const int required = std::max({time_col, open_col, high_col, low_col, close_col});

    std::vector<core::Bar> bars;
    size_t line_number = 1;
    while (std::getline(input, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        auto fields = split_row(line);
        if (static_cast<int>(fields.size()) <= required) {
            throw core::DataError(source + ":" + std::to_string(line_number) + ": too few columns");
        }

        auto timestamp = utils::parse_timestamp(fields[time_col]);
        if (!timestamp) {
            throw core::DataError(source + ":" + std::to_string(line_number) +
                                  ": unparseable time '" + fields[time_col] + "'");
        }

        core::Bar bar;
        bar.timestamp = *timestamp;
        bool ok = parse_double(fields[open_col], bar.open) &&
                  parse_double(fields[high_col], bar.high) &&
                  parse_double(fields[low_col], bar.low) &&
                  parse_double(fields[close_col], bar.close);
        if (volume_col >= 0 && volume_col < static_cast<int>(fields.size()) && !fields[volume_col].empty()) {
            ok = ok && parse_double(fields[volume_col], bar.volume);
        }
        if (!ok) {
            throw core::DataError(source + ":" + std::to_string(line_number) + ": unparseable price field");
        }

        bars.push_back(bar);
    }

    return bars;
}

DataValidationReport CsvBarDataProvider::validate(const std::vector<core::Bar>& bars, int64_t max_gap_minutes) {
    DataValidationReport report;
    for (size_t i = 0; i < bars.size(); ++i) {
        const auto& bar = bars[i];
        if (!has_valid_prices(bar)) {
            report.non_positive++;
        } else if (!has_consistent_range(bar)) {
            report.invalid_ohlc++;
        }

        if (i == 0) {
            continue;
        }
        const int64_t delta = bar.timestamp - bars[i - 1].timestamp;
        if (delta < 0) {
            report.out_of_order++;
        } else if (delta == 0) {
            report.duplicates++;
        } else if (max_gap_minutes > 0 && delta > max_gap_minutes * 60) {
            report.gaps.push_back({bars[i - 1].timestamp, bar.timestamp, delta / 60});
        }
    }
    return report;
}

std::vector<core::Bar> CsvBarDataProvider::clean(std::vector<core::Bar> bars) {
    bars.erase(std::remove_if(bars.begin(), bars.end(), [](const core::Bar& bar) {
        return !has_valid_prices(bar) || !has_consistent_range(bar);
    }), bars.end());

    std::stable_sort(bars.begin(), bars.end(), [](const core::Bar& a, const core::Bar& b) {
        return a.timestamp < b.timestamp;
    });

    bars.erase(std::unique(bars.begin(), bars.end(), [](const core::Bar& a, const core::Bar& b) {
        return a.timestamp == b.timestamp;
    }), bars.end());

    return bars;
}

std::vector<core::Bar> CsvBarDataProvider::load_bars(const std::string& symbol) const {
    const std::string path = path_for(symbol);

    if (!std::filesystem::exists(path)) {
        throw core::DataError("CSV file does not exist: " + path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw core::DataError("failed to open CSV file: " + path);
    }

    std::vector<core::Bar> bars = parse_csv(file, path);

    DataValidationReport report = validate(bars, options_.max_gap_minutes);
    if (!report.clean()) {
        Logger::warn() << symbol << ": dropped or reordered rows (" << report.non_positive << " non-positive, "
                       << report.invalid_ohlc << " invalid OHLC, " << report.out_of_order << " out of order, "
                       << report.duplicates << " duplicate timestamps)" << Logger::endl;
        bars = clean(std::move(bars));
        report.gaps = validate(bars, options_.max_gap_minutes).gaps;
    }
    for (const auto& gap : report.gaps) {
        Logger::warn() << symbol << ": " << gap.minutes << " minute gap between "
                       << utils::format_timestamp(gap.from) << " and " << utils::format_timestamp(gap.to)
                       << Logger::endl;
    }

    if (options_.start || options_.end) {
        bars.erase(std::remove_if(bars.begin(), bars.end(), [this](const core::Bar& bar) {
            return (options_.start && bar.timestamp < *options_.start) ||
                   (options_.end && bar.timestamp > *options_.end);
        }), bars.end());
    }

    if (bars.empty()) {
        throw core::DataError(symbol + ": no usable bars in " + path);
    }

    Logger::info() << "Loaded " << bars.size() << " bars for " << symbol << " from " << path << Logger::endl;
    return bars;
}

} // namespace crossbar::data
