#include "optcb/triggers/trigger_set.hpp"

#include <stdexcept>
#include <utility>

namespace optcb::triggers {

std::vector<std::unique_ptr<Trigger>> TriggerSet::single(std::unique_ptr<Trigger> trigger) {
    std::vector<std::unique_ptr<Trigger>> triggers;
    triggers.push_back(std::move(trigger));
    return triggers;
}

TriggerSet::TriggerSet(std::vector<std::unique_ptr<Trigger>> triggers) : triggers_{std::move(triggers)} {
    if (triggers_.empty()) {
        throw std::invalid_argument{"Trigger set requires at least one trigger"};
    }
    for (const auto& trigger : triggers_) {
        if (!trigger) {
            throw std::invalid_argument{"Trigger set cannot hold a null trigger"};
        }
    }
}

bool TriggerSet::fires(const OptimizationState& state, Scalar value, Iteration t, const Extra& extra) {
    bool any = false;
    for (auto& trigger : triggers_) {
        const bool fired = trigger->fires(state, value, t, extra);
        any = any || fired;
    }
    return any;
}

void TriggerSet::reset() {
    for (auto& trigger : triggers_) {
        trigger->reset();
    }
}

void TriggerSet::trigger(const std::string& event) {
    for (auto& trigger : triggers_) {
        trigger->trigger(event);
    }
}

Trigger& TriggerSet::at(std::size_t index) {
    return *triggers_.at(index);
}

const Trigger& TriggerSet::at(std::size_t index) const {
    return *triggers_.at(index);
}

}  // namespace optcb::triggers
