#include "order_model.hpp"
#include "rate_law_simulator.hpp"
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <vector>

int
main() {
    std::cout << "--- Two-Point Rate Constant Example ---" << '\n';

    double const a0 = 1.0;  // [A]0 (M)
    double const at = 0.5;  // [A]t (M)
    double const t = 10.0;  // elapsed time (s)
    std::cout << "[A]0 = " << a0 << " M, [A]t = " << at << " M, t = " << t << " s" << '\n' << '\n';

    for (const auto &model : rate_order::order_models()) {
        try {
            double const k = rate_order::two_point_rate_constant(model.order, a0, at, t);
            std::cout << model.name << ": k = " << std::fixed << std::setprecision(5) << k << " " << model.rate_units
                      << '\n';

            // Decay curve from 0 to 1.5 t, integrated numerically and in closed form
            std::vector<double> times;
            for (int i = 0; i <= 6; ++i) { times.push_back(0.25 * t * i); }
            rate_order::SampleSet const curve = rate_order::simulate_rate_law(model.order, a0, k, times);

            std::cout << "  t\t[A] (ode)\t[A] (closed form)" << '\n';
            for (const auto &s : curve) {
                std::cout << "  " << s.time << "\t" << s.concentration << "\t"
                          << rate_order::integrated_concentration(model.order, a0, k, s.time) << '\n';
            }
            std::cout << std::defaultfloat;
        } catch (const std::exception &e) {
            std::cerr << model.name << ": " << e.what() << '\n';
            return 1;
        }
    }
    return 0;
}
