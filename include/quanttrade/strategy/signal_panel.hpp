// include/quanttrade/strategy/signal_panel.hpp
#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>
#include "quanttrade/core/types.hpp"

namespace quanttrade {

/**
 * @brief Trading signals aligned with a price panel
 *
 * Each cell is -1 (sell / short), 0 (no action) or +1 (buy / long). The row
 * for date t only depends on prices up to and including t.
 */
struct SignalPanel {
    std::vector<Timestamp> dates;
    std::vector<std::string> symbols;
    Eigen::MatrixXi values;
    int warmup_period{0};  // Rows needed before the first defined signal

    size_t rows() const {
        return dates.size();
    }
    size_t cols() const {
        return symbols.size();
    }

    int at(size_t row, size_t col) const {
        return values(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(col));
    }

    /**
     * @brief Number of cells equal to the given signal value
     */
    long count(int signal) const {
        return static_cast<long>((values.array() == signal).count());
    }
};

}  // namespace quanttrade
