// src/data/csv_market_data_service.cpp

#include "quanttrade/data/csv_market_data_service.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <vector>
#include "quanttrade/core/logger.hpp"
#include "quanttrade/core/time_utils.hpp"

namespace quanttrade {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && (std::isspace(static_cast<unsigned char>(s[begin])) || s[begin] == '"')) {
        ++begin;
    }
    while (end > begin &&
           (std::isspace(static_cast<unsigned char>(s[end - 1])) || s[end - 1] == '"')) {
        --end;
    }
    return s.substr(begin, end - begin);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_line(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    return fields;
}

int find_column(const std::vector<std::string>& header, const std::string& name) {
    for (size_t i = 0; i < header.size(); ++i) {
        if (to_lower(header[i]) == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

}  // anonymous namespace

CsvMarketDataService::CsvMarketDataService(std::string directory)
    : directory_(std::move(directory)) {
    Logger::register_component("CsvMarketData");
}

Result<void> CsvMarketDataService::validate_symbol(const std::string& symbol) {
    // Tickers like BRK.B, ^GSPC or EURUSD=X; no path separators and no leading dot
    static const std::regex pattern("^[A-Za-z0-9^=_-][A-Za-z0-9.^=_-]*$");
    if (!std::regex_match(symbol, pattern) || symbol.find("..") != std::string::npos) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Invalid symbol: " + symbol,
                                "CsvMarketDataService");
    }
    return Result<void>();
}

Result<PriceSeries> CsvMarketDataService::get_historical_data(const std::string& symbol,
                                                              const Timestamp& start_date,
                                                              const Timestamp& end_date) {
    auto symbol_validation = validate_symbol(symbol);
    if (symbol_validation.is_error()) {
        return forward_error<PriceSeries>(*symbol_validation.error());
    }

    std::filesystem::path path = std::filesystem::path(directory_) / (symbol + ".csv");
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<PriceSeries>(ErrorCode::FILE_NOT_FOUND,
                                       "No price file for " + symbol + ": " + path.string(),
                                       "CsvMarketDataService");
    }

    std::string line;
    if (!std::getline(file, line)) {
        return make_error<PriceSeries>(ErrorCode::INVALID_DATA,
                                       "Empty price file: " + path.string(),
                                       "CsvMarketDataService");
    }

    std::vector<std::string> header = split_line(line);
    int date_col = find_column(header, "date");
    int price_col = find_column(header, "adj close");
    if (price_col < 0) {
        price_col = find_column(header, "close");
    }
    if (date_col < 0 || price_col < 0) {
        return make_error<PriceSeries>(ErrorCode::INVALID_DATA,
                                       "Missing Date or Close column in " + path.string(),
                                       "CsvMarketDataService");
    }

    PriceSeries series;
    size_t skipped = 0;
    while (std::getline(file, line)) {
        if (trim(line).empty()) {
            continue;
        }
        std::vector<std::string> fields = split_line(line);
        if (fields.size() <= static_cast<size_t>(std::max(date_col, price_col))) {
            ++skipped;
            continue;
        }

        auto date = core::parse_date(fields[static_cast<size_t>(date_col)]);
        if (date.is_error()) {
            ++skipped;
            continue;
        }
        if (date.value() < start_date || date.value() > end_date) {
            continue;
        }

        double price = 0.0;
        try {
            price = std::stod(fields[static_cast<size_t>(price_col)]);
        } catch (const std::exception&) {
            ++skipped;
            continue;
        }
        if (!std::isfinite(price)) {
            ++skipped;
            continue;
        }
        series.emplace_back(date.value(), price);
    }

    if (skipped > 0) {
        DEBUG("Skipped " << skipped << " unparseable rows in " << path.string());
    }

    std::stable_sort(series.begin(), series.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });
    return series;
}

}  // namespace quanttrade
