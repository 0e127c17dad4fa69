#include "linear_regression.hpp"
#include <Eigen/Core>
#include <algorithm> // For std::clamp
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace rate_order {

namespace {

// One regression variable, divided by its largest magnitude so that the
// moments neither overflow nor underflow for extreme data.
struct ScaledColumn {
    Eigen::ArrayXd centred; ///< (value - mean) / scale
    double scale = 1.0;
    double mean = 0.0;
    bool degenerate = false; ///< Spread lies within rounding noise of the data magnitude.
};

ScaledColumn
scale_column(const Eigen::Map<const Eigen::ArrayXd> &values) {
    ScaledColumn col;
    const double max_abs = values.abs().maxCoeff();
    if (max_abs > 0.0) { col.scale = max_abs; }

    const Eigen::ArrayXd unit = values / col.scale;
    const double unit_mean = unit.mean();
    col.centred = unit - unit_mean;
    col.mean = unit_mean * col.scale;

    const double noise = 4.0 * std::numeric_limits<double>::epsilon();
    col.degenerate = !(col.centred.square().sum() > static_cast<double>(values.size()) * noise * noise);
    return col;
}

} // namespace

RegressionResult
ols_fit(const std::vector<double> &x, const std::vector<double> &y) {
    if (x.size() != y.size()) {
        throw std::invalid_argument("ols_fit: x (" + std::to_string(x.size()) + ") and y (" +
                                    std::to_string(y.size()) + ") must have the same length.");
    }
    if (x.size() < 2) { throw std::invalid_argument("ols_fit: at least 2 points are required."); }

    const auto n = static_cast<Eigen::Index>(x.size());
    const Eigen::Map<const Eigen::ArrayXd> xs(x.data(), n);
    const Eigen::Map<const Eigen::ArrayXd> ys(y.data(), n);
    if (!xs.allFinite() || !ys.allFinite()) { throw std::invalid_argument("ols_fit: inputs must be finite."); }

    const ScaledColumn cx = scale_column(xs);
    const ScaledColumn cy = scale_column(ys);

    RegressionResult result;
    result.n = x.size();

    if (cx.degenerate) {
        result.slope = 0.0;
        result.intercept = cy.mean;
        result.r_squared = 0.0;
        return result;
    }

    // Moments in scaled units; the slope is rescaled afterwards.
    const double sxx = cx.centred.square().sum();
    const double syy = cy.centred.square().sum();
    const double sxy = (cx.centred * cy.centred).sum();

    result.slope = (sxy / sxx) * (cy.scale / cx.scale);
    result.intercept = cy.mean - result.slope * cx.mean;

    const double ratio = (sxy * sxy) / (sxx * syy);
    if (cy.degenerate || !std::isfinite(ratio)) {
        result.r_squared = 0.0;
    } else {
        result.r_squared = std::clamp(ratio, 0.0, 1.0);
    }
    return result;
}

} // namespace rate_order
