#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace StatsUtils {
double runningMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double percentileSorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return 0.0;
    if (sorted.size() == 1) return sorted.front();

    const double qq = std::clamp(q, 0.0, 1.0);
    const double pos = qq * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = static_cast<size_t>(std::ceil(pos));
    const double t = pos - static_cast<double>(lo);
    return sorted[lo] * (1.0 - t) + sorted[hi] * t;
}

double variance(const std::vector<double>& values, int ddof) {
    const long n = static_cast<long>(values.size());
    if (ddof < 0 || n - ddof <= 0) return std::numeric_limits<double>::quiet_NaN();
    const double mean = runningMean(values);
    long double ss = 0.0L;
    for (double v : values) {
        const long double d = static_cast<long double>(v) - mean;
        ss += d * d;
    }
    return static_cast<double>(ss / static_cast<long double>(n - ddof));
}

double pearson(const std::vector<double>& x, const std::vector<double>& y) {
    const size_t n = std::min(x.size(), y.size());
    if (n < 2) return std::numeric_limits<double>::quiet_NaN();
    const double mx = std::accumulate(x.begin(), x.begin() + static_cast<long>(n), 0.0) / static_cast<double>(n);
    const double my = std::accumulate(y.begin(), y.begin() + static_cast<long>(n), 0.0) / static_cast<double>(n);
    long double sxy = 0.0L;
    long double sxx = 0.0L;
    long double syy = 0.0L;
    for (size_t i = 0; i < n; ++i) {
        const long double dx = x[i] - mx;
        const long double dy = y[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx <= 0.0L || syy <= 0.0L) return std::numeric_limits<double>::quiet_NaN();
    return static_cast<double>(sxy / std::sqrt(sxx * syy));
}
}
