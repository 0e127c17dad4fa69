#ifndef TEST_UTILS_HPP
#define TEST_UTILS_HPP

#include "order_model.hpp"
#include "sample_set.hpp"
#include <algorithm> // For std::shuffle
#include <cmath>
#include <gtest/gtest.h>
#include <random> // For std::mt19937
#include <utility>
#include <vector>

namespace rate_order {
namespace test_utils {

// Evenly spaced times 0, dt, ..., (n-1)*dt
inline std::vector<double>
uniform_times(int n, double dt) {
    std::vector<double> times;
    for (int i = 0; i < n; ++i) { times.push_back(dt * i); }
    return times;
}

// Exact integrated-rate-law data for the given order
inline SampleSet
exact_decay(ReactionOrder order, double a0, double k, const std::vector<double> &times) {
    std::vector<Sample> samples;
    for (double t : times) { samples.push_back({ t, integrated_concentration(order, a0, k, t) }); }
    return SampleSet(std::move(samples));
}

// Same samples in a reproducible random order
inline std::vector<Sample>
shuffled(const SampleSet &set, unsigned seed = 42) {
    std::vector<Sample> samples = set.samples();
    std::mt19937 gen(seed);
    std::shuffle(samples.begin(), samples.end(), gen);
    return samples;
}

// Multiplicative Gaussian noise on concentrations
inline SampleSet
with_noise(const SampleSet &set, double relative_stddev, unsigned seed = 7) {
    std::mt19937 gen(seed);
    std::normal_distribution<> noise(0.0, relative_stddev);
    std::vector<Sample> samples;
    for (const auto &s : set) { samples.push_back({ s.time, s.concentration * (1.0 + noise(gen)) }); }
    return SampleSet(std::move(samples));
}

} // namespace test_utils
} // namespace rate_order

#endif // TEST_UTILS_HPP
