#include "sample_set.hpp"
#include <algorithm> // For std::stable_sort
#include <utility>

namespace rate_order {

SampleSet::SampleSet(std::vector<Sample> samples)
  : samples_(std::move(samples)) {
    std::stable_sort(
      samples_.begin(), samples_.end(), [](const Sample &a, const Sample &b) { return a.time < b.time; });
}

std::vector<double>
SampleSet::times() const {
    std::vector<double> out;
    out.reserve(samples_.size());
    for (const auto &s : samples_) { out.push_back(s.time); }
    return out;
}

std::vector<double>
SampleSet::concentrations() const {
    std::vector<double> out;
    out.reserve(samples_.size());
    for (const auto &s : samples_) { out.push_back(s.concentration); }
    return out;
}

} // namespace rate_order
