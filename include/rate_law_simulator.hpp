#ifndef RATE_LAW_SIMULATOR_HPP
#define RATE_LAW_SIMULATOR_HPP

#include "order_model.hpp"
#include "sample_set.hpp"
#include <vector>

namespace rate_order {

/**
 * @brief Integration settings for simulate_rate_law().
 */
struct SimulationOptions {
    double abs_err = 1e-10;
    double rel_err = 1e-10;
    double dt_hint = 1e-3; ///< Initial step for the adaptive stepper.
    bool verbose = false;
};

/**
 * @brief Differential rate law d[A]/dt = -k [A]^n for use with odeint.
 *
 * The rate is zero once the reactant is exhausted ([A] <= 0).
 */
struct RateLaw {
    int n = 1;
    double k = 0.0;

    void operator()(const std::vector<double> &state, std::vector<double> &dadt, double /* t */) const;
};

/**
 * @brief Integrates the rate law from [A](0) = a0 and samples it at the given times.
 *
 * Uses an adaptive Dormand-Prince stepper. Returned concentrations are clipped
 * at zero.
 *
 * @param times Observation times (>= 0, any order, duplicates allowed).
 * @throws std::invalid_argument on a0 <= 0, non-finite k or invalid times.
 * @throws std::runtime_error if the integration fails or the concentration
 *         diverges (second order with k < 0 blows up at t = -1/(k a0)).
 */
SampleSet
simulate_rate_law(ReactionOrder order,
                  double a0,
                  double k,
                  const std::vector<double> &times,
                  const SimulationOptions &options = {});

} // namespace rate_order

#endif // RATE_LAW_SIMULATOR_HPP
