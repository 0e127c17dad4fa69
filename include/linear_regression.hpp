#ifndef LINEAR_REGRESSION_HPP
#define LINEAR_REGRESSION_HPP

#include <cstddef>
#include <vector>

namespace rate_order {

/**
 * @brief Ordinary least-squares fit y = intercept + slope * x.
 */
struct RegressionResult {
    double slope = 0.0;
    double intercept = 0.0;
    double r_squared = 0.0; ///< Squared Pearson correlation, in [0, 1].
    std::size_t n = 0;      ///< Number of points used.

    double predict(double x) const { return intercept + slope * x; }
};

/**
 * @brief Fits a straight line by ordinary least squares.
 *
 * slope = cov(x, y) / var(x), intercept = mean(y) - slope * mean(x),
 * r_squared = cov(x, y)^2 / (var(x) var(y)).
 *
 * Degenerate spread is not an error: if x has no variance the slope is 0 and
 * the intercept is mean(y); if either x or y has no variance r_squared is 0.
 *
 * Moments are formed on data divided by its largest magnitude, so values near
 * the limits of double range still give r_squared in [0, 1].
 *
 * @throws std::invalid_argument if the inputs differ in length, hold fewer than
 *         2 points or contain non-finite values.
 */
RegressionResult
ols_fit(const std::vector<double> &x, const std::vector<double> &y);

} // namespace rate_order

#endif // LINEAR_REGRESSION_HPP
