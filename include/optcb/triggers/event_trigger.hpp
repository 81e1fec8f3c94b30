#pragma once

#include <set>
#include <string>

#include "optcb/triggers/trigger.hpp"

namespace optcb::triggers {

// One-shot latch set by trigger(event) and consumed by the next fires().
//
// trigger() with an event outside the recognized set clears a pending latch
// instead of leaving it untouched.
class EventTrigger : public Trigger {
  public:
    explicit EventTrigger(std::set<std::string> events);

    bool fires(const OptimizationState& state, Scalar value, Iteration t, const Extra& extra) override;
    void reset() override;
    void trigger(const std::string& event) override;

    const std::set<std::string>& events() const noexcept { return events_; }
    bool latched() const noexcept { return latched_; }

  private:
    std::set<std::string> events_;
    bool latched_{false};
};

}  // namespace optcb::triggers
