// include/quanttrade/data/price_panel.hpp
#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>
#include "quanttrade/core/error.hpp"
#include "quanttrade/core/types.hpp"

namespace quanttrade {

/**
 * @brief Close prices of several symbols on a shared trading-date index
 *
 * Rows are dates (strictly ascending), columns are symbols. Every cell is a
 * finite positive price. Instances are immutable once built.
 */
class PricePanel {
public:
    PricePanel() = default;

    /**
     * @brief Validating factory
     * @param dates Trading dates, strictly ascending
     * @param symbols Column names, unique and non-empty
     * @param values Matrix of shape dates.size() x symbols.size()
     * @return The panel, or INVALID_ARGUMENT / INVALID_DATA
     */
    static Result<PricePanel> create(std::vector<Timestamp> dates,
                                     std::vector<std::string> symbols, Eigen::MatrixXd values);

    size_t rows() const {
        return dates_.size();
    }
    size_t cols() const {
        return symbols_.size();
    }
    bool empty() const {
        return dates_.empty();
    }

    const std::vector<Timestamp>& dates() const {
        return dates_;
    }
    const std::vector<std::string>& symbols() const {
        return symbols_;
    }
    const Eigen::MatrixXd& values() const {
        return values_;
    }

    double at(size_t row, size_t col) const {
        return values_(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(col));
    }

    /**
     * @brief Copy of one symbol's prices
     */
    std::vector<double> column(size_t col) const;

    /**
     * @brief Column index of a symbol, or -1 if absent
     */
    int symbol_index(const std::string& symbol) const;

    /**
     * @brief Rows whose date lies in [start, end] (both inclusive)
     */
    PricePanel slice(const Timestamp& start, const Timestamp& end) const;

    /**
     * @brief First n rows
     */
    PricePanel head(size_t n) const;

    /**
     * @brief Same index with new values (used by resamplers)
     */
    Result<PricePanel> with_values(Eigen::MatrixXd values) const;

private:
    PricePanel(std::vector<Timestamp> dates, std::vector<std::string> symbols,
               Eigen::MatrixXd values)
        : dates_(std::move(dates)), symbols_(std::move(symbols)), values_(std::move(values)) {}

    PricePanel rows_between(size_t first, size_t count) const;

    std::vector<Timestamp> dates_;
    std::vector<std::string> symbols_;
    Eigen::MatrixXd values_;
};

}  // namespace quanttrade
