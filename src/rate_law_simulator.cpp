#include "rate_law_simulator.hpp"
#include <algorithm> // For std::sort, std::unique, std::lower_bound
#include <boost/numeric/odeint.hpp>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace rate_order {

namespace odeint = boost::numeric::odeint;

void
RateLaw::operator()(const std::vector<double> &state, std::vector<double> &dadt, double /* t */) const {
    const double a = state[0];
    dadt[0] = (a > 0.0) ? -k * std::pow(a, n) : 0.0;
}

SampleSet
simulate_rate_law(ReactionOrder order,
                  double a0,
                  double k,
                  const std::vector<double> &times,
                  const SimulationOptions &options) {
    if (!(a0 > 0.0) || !std::isfinite(a0)) { throw std::invalid_argument("Initial concentration must be > 0."); }
    if (!std::isfinite(k)) { throw std::invalid_argument("Rate constant must be finite."); }
    for (double t : times) {
        if (!std::isfinite(t) || t < 0.0) {
            throw std::invalid_argument("Observation times must be finite and >= 0, got " + std::to_string(t));
        }
    }

    // Observation grid starts at t = 0, where the initial condition is known.
    std::vector<double> grid = times;
    grid.push_back(0.0);
    std::sort(grid.begin(), grid.end());
    grid.erase(std::unique(grid.begin(), grid.end()), grid.end());

    const RateLaw rhs{ order_model(order).n, k };
    std::vector<double> state = { a0 };
    std::vector<double> observed;
    observed.reserve(grid.size());
    auto observer = [&observed](const std::vector<double> &x, double /* t */) { observed.push_back(x[0]); };

    using StateType = std::vector<double>;
    using ErrorStepperType = odeint::runge_kutta_dopri5<StateType>;
    auto stepper = odeint::make_controlled(options.abs_err, options.rel_err, ErrorStepperType());

    if (options.verbose) {
        std::cout << "[RateLawSimulator] Integrating " << order << " rate law, a0=" << a0 << ", k=" << k << " over "
                  << grid.size() << " observation time(s)." << std::endl;
    }

    try {
        odeint::integrate_times(stepper, rhs, state, grid.begin(), grid.end(), options.dt_hint, observer);
    } catch (const std::exception &e) {
        throw std::runtime_error(std::string("[RateLawSimulator] Integration failed: ") + e.what());
    }
    if (observed.size() != grid.size()) {
        throw std::runtime_error("[RateLawSimulator] Integration stopped before the last observation time.");
    }

    std::vector<Sample> samples;
    samples.reserve(times.size());
    for (double t : times) {
        const auto it = std::lower_bound(grid.begin(), grid.end(), t);
        const double a = observed[static_cast<std::size_t>(it - grid.begin())];
        if (!std::isfinite(a)) {
            throw std::runtime_error("[RateLawSimulator] Concentration diverged before t = " + std::to_string(t) +
                                     "; a negative rate constant describes growth, not decay.");
        }
        samples.push_back(Sample{ t, std::max(a, 0.0) });
    }
    return SampleSet(std::move(samples));
}

} // namespace rate_order
