#include "kinetic_evaluator.hpp"
#include "rate_order/example_datasets.hpp"
#include <iostream>
#include <stdexcept>

int
main() {
    std::cout << "--- Kinetic Order Determination Example ---" << '\n';

    rate_order::SampleSet const data = rate_order::examples::first_order_decay();
    std::cout << "Time\tConcentration" << '\n';
    for (const auto &s : data) { std::cout << s.time << "\t" << s.concentration << '\n'; }
    std::cout << '\n';

    rate_order::EvaluatorOptions options;
    options.verbose = true;

    try {
        rate_order::KineticAnalysis const analysis = rate_order::evaluate(data, options);
        std::cout << '\n' << analysis << '\n';
    } catch (const std::exception &e) {
        std::cerr << "Error evaluating dataset: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
