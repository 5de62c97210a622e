// src/statistics/descriptive.cpp

#include "quanttrade/statistics/descriptive.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace quanttrade {
namespace statistics {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

// Sum of (x - mean)^power
double central_moment_sum(const std::vector<double>& data, double mu, int power) {
    double sum = 0.0;
    for (double x : data) {
        sum += std::pow(x - mu, power);
    }
    return sum;
}

bool window_has_nan(const std::vector<double>& data, size_t end, int window) {
    for (size_t j = end + 1 - static_cast<size_t>(window); j <= end; ++j) {
        if (std::isnan(data[j])) {
            return true;
        }
    }
    return false;
}

}  // anonymous namespace

double mean(const std::vector<double>& data) {
    if (data.empty()) {
        return 0.0;
    }
    return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
}

double variance(const std::vector<double>& data, int ddof) {
    if (data.size() <= static_cast<size_t>(std::max(ddof, 0))) {
        return 0.0;
    }
    double mu = mean(data);
    return central_moment_sum(data, mu, 2) / static_cast<double>(data.size() - ddof);
}

double sample_std(const std::vector<double>& data) {
    return std::sqrt(variance(data, 1));
}

double population_std(const std::vector<double>& data) {
    return std::sqrt(variance(data, 0));
}

double quantile(std::vector<double> data, double q) {
    if (data.empty()) {
        return 0.0;
    }
    std::sort(data.begin(), data.end());
    q = std::min(std::max(q, 0.0), 1.0);

    double pos = q * static_cast<double>(data.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(pos));
    size_t upper = std::min(lower + 1, data.size() - 1);
    double frac = pos - static_cast<double>(lower);
    return data[lower] + (data[upper] - data[lower]) * frac;
}

double median(const std::vector<double>& data) {
    return quantile(data, 0.5);
}

double skewness(const std::vector<double>& data) {
    const double n = static_cast<double>(data.size());
    if (data.size() < 3) {
        return 0.0;
    }
    double mu = mean(data);
    double m2 = central_moment_sum(data, mu, 2) / n;
    double m3 = central_moment_sum(data, mu, 3) / n;
    if (m2 <= 1e-14 * std::max(1.0, mu * mu)) {
        return 0.0;
    }
    double g1 = m3 / std::pow(m2, 1.5);
    return std::sqrt(n * (n - 1.0)) / (n - 2.0) * g1;
}

double kurtosis(const std::vector<double>& data) {
    const double n = static_cast<double>(data.size());
    if (data.size() < 4) {
        return 0.0;
    }
    double mu = mean(data);
    double s2 = central_moment_sum(data, mu, 2);
    double s4 = central_moment_sum(data, mu, 4);
    if (s2 / n <= 1e-14 * std::max(1.0, mu * mu)) {
        return 0.0;
    }
    double numer = n * (n + 1.0) * (n - 1.0) * s4;
    double denom = (n - 2.0) * (n - 3.0) * s2 * s2;
    double adj = 3.0 * (n - 1.0) * (n - 1.0) / ((n - 2.0) * (n - 3.0));
    return numer / denom - adj;
}

double covariance(const std::vector<double>& x, const std::vector<double>& y) {
    size_t n = std::min(x.size(), y.size());
    if (n < 2) {
        return 0.0;
    }
    std::vector<double> xs(x.begin(), x.begin() + n);
    std::vector<double> ys(y.begin(), y.begin() + n);
    double mx = mean(xs);
    double my = mean(ys);
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sum += (xs[i] - mx) * (ys[i] - my);
    }
    return sum / static_cast<double>(n - 1);
}

double correlation(const std::vector<double>& x, const std::vector<double>& y) {
    size_t n = std::min(x.size(), y.size());
    if (n < 2) {
        return 0.0;
    }
    std::vector<double> xs(x.begin(), x.begin() + n);
    std::vector<double> ys(y.begin(), y.begin() + n);
    double sx = sample_std(xs);
    double sy = sample_std(ys);
    if (sx == 0.0 || sy == 0.0) {
        return 0.0;
    }
    return covariance(xs, ys) / (sx * sy);
}

std::vector<double> rolling_mean(const std::vector<double>& data, int window) {
    std::vector<double> result(data.size(), NaN);
    if (window <= 0) {
        return result;
    }
    for (size_t i = static_cast<size_t>(window) - 1; i < data.size(); ++i) {
        if (window_has_nan(data, i, window)) {
            continue;
        }
        double sum = 0.0;
        for (size_t j = i + 1 - static_cast<size_t>(window); j <= i; ++j) {
            sum += data[j];
        }
        result[i] = sum / window;
    }
    return result;
}

std::vector<double> rolling_std(const std::vector<double>& data, int window) {
    std::vector<double> result(data.size(), NaN);
    if (window <= 1) {
        return result;
    }
    for (size_t i = static_cast<size_t>(window) - 1; i < data.size(); ++i) {
        if (window_has_nan(data, i, window)) {
            continue;
        }
        std::vector<double> slice(data.begin() + (i + 1 - window), data.begin() + i + 1);
        result[i] = sample_std(slice);
    }
    return result;
}

std::vector<double> pct_change(const std::vector<double>& data, int periods) {
    std::vector<double> result(data.size(), NaN);
    if (periods <= 0) {
        return result;
    }
    for (size_t i = static_cast<size_t>(periods); i < data.size(); ++i) {
        double base = data[i - periods];
        if (std::isnan(base) || std::isnan(data[i]) || base == 0.0) {
            continue;
        }
        result[i] = data[i] / base - 1.0;
    }
    return result;
}

}  // namespace statistics
}  // namespace quanttrade
