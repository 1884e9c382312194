#pragma once

#include <vector>

namespace StatsUtils {
double runningMean(const std::vector<double>& values);
double percentileSorted(const std::vector<double>& sorted, double q);

/**
 * @brief Sample variance with `ddof` delta degrees of freedom; NaN when
 * fewer than ddof + 1 values are present.
 */
double variance(const std::vector<double>& values, int ddof);

/**
 * @brief Pearson correlation of paired values; NaN when either side is constant.
 */
double pearson(const std::vector<double>& x, const std::vector<double>& y);
}
