#ifndef KINETIC_EVALUATOR_HPP
#define KINETIC_EVALUATOR_HPP

#include "kinetics_errors.hpp"
#include "linear_regression.hpp"
#include "order_model.hpp"
#include "sample_set.hpp"
#include <array>
#include <cstddef>
#include <ostream>
#include <string>

namespace rate_order {

/**
 * @brief Options for evaluate().
 */
struct EvaluatorOptions {
    int equation_precision = 4; ///< Decimal places in the formatted equation.
    bool verbose = false;       ///< Print per-model diagnostics to stdout/stderr.
};

/**
 * @brief Fit of one reaction order to a sample set.
 *
 * When fewer than two samples pass the model's domain guard, or the fit is
 * numerically degenerate, r_squared is 0. In the first case valid is false and
 * slope, intercept and rate_constant are 0.
 */
struct KineticFitResult {
    ReactionOrder order = ReactionOrder::Zeroth;
    double rate_constant = 0.0;
    std::string equation;     ///< Integrated rate equation, e.g. "ln[A] = 0.0000 - 0.0100 t".
    double r_squared = 0.0;
    std::string linear_label; ///< e.g. "ln[A] vs t".

    double slope = 0.0;       ///< Slope of the transformed-variable line.
    double intercept = 0.0;   ///< Intercept of the transformed-variable line.
    std::size_t sample_count = 0; ///< Samples that passed the domain guard.
    bool valid = false;

    /// Regression line value of the transformed variable at time t.
    double line_at(double t) const { return intercept + slope * t; }
};

/**
 * @brief Fits of all three orders plus the selected best order.
 */
struct KineticAnalysis {
    std::array<KineticFitResult, kNumReactionOrders> fits;
    ReactionOrder best = ReactionOrder::Zeroth;

    const KineticFitResult &fit(ReactionOrder order) const { return fits[order_index(order)]; }
    const KineticFitResult &best_fit() const { return fit(best); }
};

/**
 * @brief Determines the kinetic order of a sample set.
 *
 * Fits the zeroth, first and second order linearisations by least squares and
 * selects the order with the largest R^2. Ties go to the lower order.
 *
 * @throws InsufficientDataError if samples holds fewer than 2 entries.
 */
KineticAnalysis
evaluate(const SampleSet &samples, const EvaluatorOptions &options = {});

/**
 * @brief Fits a single order model. Never throws for degenerate data.
 */
KineticFitResult
fit_order(const OrderModel &model, const SampleSet &samples, const EvaluatorOptions &options = {});

/**
 * @brief Index of the maximal R^2, first encountered wins.
 */
ReactionOrder
select_best(const std::array<KineticFitResult, kNumReactionOrders> &fits);

/**
 * @brief Formats "<axis> = <intercept> -/+ <|slope|> t".
 */
std::string
format_equation(const OrderModel &model, double intercept, double slope, int precision = 4);

/**
 * @brief Comparison table of the three fits followed by the verdict line.
 */
std::string
format_report(const KineticAnalysis &analysis, int precision = 4);

std::ostream &
operator<<(std::ostream &os, const KineticAnalysis &analysis);

} // namespace rate_order

#endif // KINETIC_EVALUATOR_HPP
