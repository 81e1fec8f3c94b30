#pragma once

#include <iostream>
#include <limits>

#include "optcb/actions/action.hpp"

namespace optcb::actions {

// Prints one table row per call with the iteration, the current value and the
// running extremes. A header is repeated every 50 rows.
//
//  eval   | current     | lowest      | highest
// _________________________________________________
//       5 |    0.460215 |    0.460215 |    0.460215
class LogProgress : public Action {
  public:
    static constexpr int kHeaderEvery = 50;

    explicit LogProgress(std::ostream& stream = std::cout);

    void apply(const OptimizationState& state, Scalar value, Iteration t, const Extra& extra) override;
    void reset() override;

    int count() const noexcept { return count_; }
    Scalar lowest() const noexcept { return lowest_; }
    Scalar highest() const noexcept { return highest_; }

  private:
    void write_header();

    std::ostream* stream_;
    int count_{0};
    Scalar lowest_{std::numeric_limits<Scalar>::infinity()};
    Scalar highest_{-std::numeric_limits<Scalar>::infinity()};
};

}  // namespace optcb::actions
