#ifndef RATE_ORDER_HPP
#define RATE_ORDER_HPP

// Umbrella header: parsing, order models, regression, evaluation and simulation.
#include "dataset_normalizer.hpp"
#include "kinetic_evaluator.hpp"
#include "kinetics_errors.hpp"
#include "linear_regression.hpp"
#include "order_model.hpp"
#include "rate_law_simulator.hpp"
#include "sample_set.hpp"

#endif // RATE_ORDER_HPP
