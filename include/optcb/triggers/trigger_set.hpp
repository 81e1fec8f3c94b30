#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "optcb/triggers/trigger.hpp"

namespace optcb::triggers {

// Ordered, non-empty collection of triggers combined with logical OR.
//
// Every trigger is evaluated on every call, in order, even after one has
// already fired, so stateful triggers keep advancing together.
class TriggerSet {
  public:
    // A single trigger converts implicitly, so a Callback can be built from
    // either one trigger or a set.
    template <typename T, typename = std::enable_if_t<std::is_base_of_v<Trigger, T>>>
    TriggerSet(std::unique_ptr<T> trigger)
        : TriggerSet{single(std::unique_ptr<Trigger>{std::move(trigger)})} {}

    explicit TriggerSet(std::vector<std::unique_ptr<Trigger>> triggers);

    template <typename... Triggers>
    static TriggerSet of(std::unique_ptr<Triggers>... triggers) {
        std::vector<std::unique_ptr<Trigger>> items;
        items.reserve(sizeof...(Triggers));
        (items.push_back(std::move(triggers)), ...);
        return TriggerSet{std::move(items)};
    }

    bool fires(const OptimizationState& state, Scalar value, Iteration t, const Extra& extra);
    void reset();
    void trigger(const std::string& event);

    std::size_t size() const noexcept { return triggers_.size(); }
    Trigger& at(std::size_t index);
    const Trigger& at(std::size_t index) const;

  private:
    static std::vector<std::unique_ptr<Trigger>> single(std::unique_ptr<Trigger> trigger);

    std::vector<std::unique_ptr<Trigger>> triggers_;
};

}  // namespace optcb::triggers
