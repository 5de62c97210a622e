// src/data/price_panel.cpp

#include "quanttrade/data/price_panel.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_set>
#include "quanttrade/core/time_utils.hpp"

namespace quanttrade {

Result<PricePanel> PricePanel::create(std::vector<Timestamp> dates,
                                      std::vector<std::string> symbols, Eigen::MatrixXd values) {
    if (symbols.empty()) {
        return make_error<PricePanel>(ErrorCode::INVALID_ARGUMENT,
                                      "Price panel requires at least one symbol", "PricePanel");
    }

    std::unordered_set<std::string> seen;
    for (const auto& symbol : symbols) {
        if (symbol.empty() || !seen.insert(symbol).second) {
            return make_error<PricePanel>(ErrorCode::INVALID_ARGUMENT,
                                          "Duplicate or empty symbol in price panel: '" + symbol +
                                              "'",
                                          "PricePanel");
        }
    }

    if (values.rows() != static_cast<Eigen::Index>(dates.size()) ||
        values.cols() != static_cast<Eigen::Index>(symbols.size())) {
        return make_error<PricePanel>(
            ErrorCode::INVALID_ARGUMENT,
            "Price matrix shape " + std::to_string(values.rows()) + "x" +
                std::to_string(values.cols()) + " does not match index " +
                std::to_string(dates.size()) + "x" + std::to_string(symbols.size()),
            "PricePanel");
    }

    for (size_t i = 1; i < dates.size(); ++i) {
        if (dates[i] <= dates[i - 1]) {
            return make_error<PricePanel>(ErrorCode::INVALID_DATA,
                                          "Dates must be strictly ascending, violated at " +
                                              core::format_date(dates[i]),
                                          "PricePanel");
        }
    }

    for (Eigen::Index r = 0; r < values.rows(); ++r) {
        for (Eigen::Index c = 0; c < values.cols(); ++c) {
            double v = values(r, c);
            if (!std::isfinite(v) || v <= 0.0) {
                return make_error<PricePanel>(
                    ErrorCode::INVALID_DATA,
                    "Invalid price for " + symbols[static_cast<size_t>(c)] + " on " +
                        core::format_date(dates[static_cast<size_t>(r)]),
                    "PricePanel");
            }
        }
    }

    return PricePanel(std::move(dates), std::move(symbols), std::move(values));
}

std::vector<double> PricePanel::column(size_t col) const {
    std::vector<double> result(rows());
    for (size_t r = 0; r < rows(); ++r) {
        result[r] = at(r, col);
    }
    return result;
}

int PricePanel::symbol_index(const std::string& symbol) const {
    auto it = std::find(symbols_.begin(), symbols_.end(), symbol);
    if (it == symbols_.end()) {
        return -1;
    }
    return static_cast<int>(std::distance(symbols_.begin(), it));
}

PricePanel PricePanel::rows_between(size_t first, size_t count) const {
    std::vector<Timestamp> dates(dates_.begin() + first, dates_.begin() + first + count);
    Eigen::MatrixXd values = values_.middleRows(static_cast<Eigen::Index>(first),
                                                static_cast<Eigen::Index>(count));
    return PricePanel(std::move(dates), symbols_, std::move(values));
}

PricePanel PricePanel::slice(const Timestamp& start, const Timestamp& end) const {
    auto first = std::lower_bound(dates_.begin(), dates_.end(), start);
    auto last = std::upper_bound(dates_.begin(), dates_.end(), end);
    if (first >= last) {
        return rows_between(0, 0);
    }
    return rows_between(static_cast<size_t>(std::distance(dates_.begin(), first)),
                        static_cast<size_t>(std::distance(first, last)));
}

PricePanel PricePanel::head(size_t n) const {
    return rows_between(0, std::min(n, rows()));
}

Result<PricePanel> PricePanel::with_values(Eigen::MatrixXd values) const {
    return create(dates_, symbols_, std::move(values));
}

}  // namespace quanttrade
