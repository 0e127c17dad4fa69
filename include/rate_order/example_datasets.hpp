#ifndef EXAMPLE_DATASETS_HPP
#define EXAMPLE_DATASETS_HPP

#include "sample_set.hpp"

namespace rate_order {
namespace examples {

/**
 * @brief Tabulated first-order decay, k ~ 0.01 1/s.
 *
 * t = 0, 10, ..., 50 s; [A] = 1.000, 0.819, 0.670, 0.549, 0.449, 0.368 M.
 */
SampleSet
first_order_decay();

/**
 * @brief Exact zeroth-order data: [A] = 2.0 - 0.03 t, t = 0..50 s in steps of 5.
 */
SampleSet
zeroth_order_depletion();

/**
 * @brief Exact second-order data: 1/[A] = 1/0.5 + 0.2 t, t = 0..60 s in steps of 6.
 */
SampleSet
second_order_dimerization();

} // namespace examples
} // namespace rate_order

#endif // EXAMPLE_DATASETS_HPP
