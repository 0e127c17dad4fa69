#include "rate_order/example_datasets.hpp"
#include "order_model.hpp"
#include <utility>
#include <vector>

namespace rate_order {
namespace examples {

SampleSet
first_order_decay() {
    std::vector<Sample> samples = {
        { 0.0, 1.000 }, { 10.0, 0.819 }, { 20.0, 0.670 }, { 30.0, 0.549 }, { 40.0, 0.449 }, { 50.0, 0.368 }
    };
    return SampleSet(std::move(samples));
}

SampleSet
zeroth_order_depletion() {
    std::vector<Sample> samples;
    for (int i = 0; i <= 10; ++i) {
        const double t = 5.0 * i;
        samples.push_back({ t, integrated_concentration(ReactionOrder::Zeroth, 2.0, 0.03, t) });
    }
    return SampleSet(std::move(samples));
}

SampleSet
second_order_dimerization() {
    std::vector<Sample> samples;
    for (int i = 0; i <= 10; ++i) {
        const double t = 6.0 * i;
        samples.push_back({ t, integrated_concentration(ReactionOrder::Second, 0.5, 0.2, t) });
    }
    return SampleSet(std::move(samples));
}

} // namespace examples
} // namespace rate_order
