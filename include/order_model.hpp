#ifndef ORDER_MODEL_HPP
#define ORDER_MODEL_HPP

#include <array>
#include <cstddef>
#include <ostream>
#include <string>

namespace rate_order {

/**
 * @brief The three canonical integer reaction orders, in evaluation order.
 */
enum class ReactionOrder { Zeroth = 0, First = 1, Second = 2 };

constexpr std::size_t kNumReactionOrders = 3;

/**
 * @brief Linearisation of one integrated rate law.
 *
 * Each model maps concentration onto a dependent variable y = f([A]) that is
 * linear in time for a reaction of that order:
 *   Zeroth:  [A]    = [A]0 - k t
 *   First:   ln[A]  = ln[A]0 - k t
 *   Second:  1/[A]  = 1/[A]0 + k t
 * Samples outside the domain guard are excluded from this model's fit only.
 */
struct OrderModel {
    ReactionOrder order;
    int n;                    ///< Integer order (0, 1, 2).
    std::string name;         ///< "Zeroth Order", ...
    std::string axis_label;   ///< Label of the transformed dependent axis.
    std::string linear_label; ///< "<axis> vs t".
    std::string rate_units;   ///< Units of k for concentrations in M and time in s.
    double rate_sign;         ///< k = rate_sign * slope.
    bool requires_positive;   ///< True if the transform needs [A] > 0.

    /// Domain guard: finite, and positive where the transform requires it.
    bool accepts(double concentration) const;

    /// Applies f([A]); only meaningful when accepts() holds.
    double transform(double concentration) const;

    /// Rate constant from a regression slope, using this model's sign convention.
    double rate_constant(double slope) const { return rate_sign * slope; }
};

/**
 * @brief All models in evaluation order (Zeroth, First, Second).
 */
const std::array<OrderModel, kNumReactionOrders> &
order_models();

const OrderModel &
order_model(ReactionOrder order);

inline std::size_t
order_index(ReactionOrder order) {
    return static_cast<std::size_t>(order);
}

std::string
to_string(ReactionOrder order);

std::ostream &
operator<<(std::ostream &os, ReactionOrder order);

/**
 * @brief Rate constant from an initial and a final concentration.
 *
 * @param a0 Initial concentration [A]0 (> 0).
 * @param at Concentration after time t (>= 0; > 0 for first and second order).
 * @param t  Elapsed time (> 0).
 * @throws std::invalid_argument if the inputs lie outside the order's domain.
 */
double
two_point_rate_constant(ReactionOrder order, double a0, double at, double t);

/**
 * @brief Concentration predicted by the integrated rate law at time t.
 *
 * Zeroth-order concentration is clipped at zero once the reactant is used up.
 * A negative k describes growth; for second order it diverges at t = -1/(k a0).
 * @throws std::invalid_argument if a0 <= 0, t < 0, or the second-order
 *         solution has diverged by time t.
 */
double
integrated_concentration(ReactionOrder order, double a0, double k, double t);

} // namespace rate_order

#endif // ORDER_MODEL_HPP
