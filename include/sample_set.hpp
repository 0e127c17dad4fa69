#ifndef SAMPLE_SET_HPP
#define SAMPLE_SET_HPP

#include <cstddef>
#include <vector>

namespace rate_order {

/**
 * @brief A single (time, concentration) measurement.
 */
struct Sample {
    double time = 0.0;          ///< Time of measurement (>= 0).
    double concentration = 0.0; ///< Measured reactant concentration [A].
};

/**
 * @brief Time-ordered sequence of samples.
 *
 * The constructor stable-sorts by time, so repeated time values keep their
 * input order. Duplicate times are not removed.
 */
class SampleSet {
  public:
    using const_iterator = std::vector<Sample>::const_iterator;

    SampleSet() = default;
    explicit SampleSet(std::vector<Sample> samples);

    std::size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }

    const Sample &operator[](std::size_t i) const { return samples_[i]; }
    const_iterator begin() const { return samples_.begin(); }
    const_iterator end() const { return samples_.end(); }

    const std::vector<Sample> &samples() const { return samples_; }

    std::vector<double> times() const;
    std::vector<double> concentrations() const;

  private:
    std::vector<Sample> samples_;
};

} // namespace rate_order

#endif // SAMPLE_SET_HPP
