#include "order_model.hpp"
#include <algorithm> // For std::max
#include <cmath>
#include <stdexcept>
#include <string>

namespace rate_order {

bool
OrderModel::accepts(double concentration) const {
    if (!std::isfinite(concentration)) { return false; }
    return !requires_positive || concentration > 0.0;
}

double
OrderModel::transform(double concentration) const {
    switch (order) {
        case ReactionOrder::Zeroth:
            return concentration;
        case ReactionOrder::First:
            return std::log(concentration);
        case ReactionOrder::Second:
            return 1.0 / concentration;
    }
    throw std::logic_error("Unhandled reaction order in OrderModel::transform.");
}

const std::array<OrderModel, kNumReactionOrders> &
order_models() {
    static const std::array<OrderModel, kNumReactionOrders> models = { {
      { ReactionOrder::Zeroth, 0, "Zeroth Order", "[A]", "[A] vs t", "M/s", -1.0, false },
      { ReactionOrder::First, 1, "First Order", "ln[A]", "ln[A] vs t", "1/s", -1.0, true },
      { ReactionOrder::Second, 2, "Second Order", "1/[A]", "1/[A] vs t", "1/(M·s)", 1.0, true },
    } };
    return models;
}

const OrderModel &
order_model(ReactionOrder order) {
    return order_models().at(order_index(order));
}

std::string
to_string(ReactionOrder order) {
    return order_model(order).name;
}

std::ostream &
operator<<(std::ostream &os, ReactionOrder order) {
    os << to_string(order);
    return os;
}

double
two_point_rate_constant(ReactionOrder order, double a0, double at, double t) {
    if (!(t > 0.0)) { throw std::invalid_argument("Elapsed time must be > 0."); }
    if (!(a0 > 0.0)) { throw std::invalid_argument("Initial concentration must be > 0."); }
    if (!(at >= 0.0)) { throw std::invalid_argument("Final concentration must be >= 0."); }

    switch (order) {
        case ReactionOrder::Zeroth:
            return (a0 - at) / t;
        case ReactionOrder::First:
            if (at <= 0.0) {
                throw std::invalid_argument("Final concentration must be > 0 for logarithmic calculation.");
            }
            return std::log(a0 / at) / t;
        case ReactionOrder::Second:
            if (at <= 0.0) {
                throw std::invalid_argument("Final concentration must be > 0 for inverse calculation.");
            }
            return (1.0 / at - 1.0 / a0) / t;
    }
    throw std::logic_error("Unhandled reaction order in two_point_rate_constant.");
}

double
integrated_concentration(ReactionOrder order, double a0, double k, double t) {
    if (!(a0 > 0.0)) { throw std::invalid_argument("Initial concentration must be > 0."); }
    if (!(t >= 0.0)) { throw std::invalid_argument("Time must be >= 0."); }

    switch (order) {
        case ReactionOrder::Zeroth:
            return std::max(a0 - k * t, 0.0);
        case ReactionOrder::First:
            return a0 * std::exp(-k * t);
        case ReactionOrder::Second: {
            const double inverse = k * t + 1.0 / a0;
            if (!(inverse > 0.0)) {
                throw std::invalid_argument("Second-order concentration diverges at t = " + std::to_string(t) +
                                            " for k = " + std::to_string(k) + ".");
            }
            return 1.0 / inverse;
        }
    }
    throw std::logic_error("Unhandled reaction order in integrated_concentration.");
}

} // namespace rate_order
