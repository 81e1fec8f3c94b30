#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "optcb/callbacks/callback.hpp"

namespace optcb::callbacks {

// Runs several callbacks as one. Every callback is invoked on every call, in
// insertion order, and the stop verdicts are OR-ed.
class CallbackRegistry {
  public:
    void add(Callback callback);

    bool operator()(const OptimizationState& state, Scalar value);
    void trigger(const std::string& event);
    CallbackRegistry& reset();

    std::size_t size() const noexcept { return callbacks_.size(); }
    bool empty() const noexcept { return callbacks_.empty(); }

    Callback& at(std::size_t index) { return callbacks_.at(index); }
    const Callback& at(std::size_t index) const { return callbacks_.at(index); }

  private:
    std::vector<Callback> callbacks_;
};

}  // namespace optcb::callbacks
