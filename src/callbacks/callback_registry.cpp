#include "optcb/callbacks/callback_registry.hpp"

#include <utility>

namespace optcb::callbacks {

void CallbackRegistry::add(Callback callback) {
    callbacks_.push_back(std::move(callback));
}

bool CallbackRegistry::operator()(const OptimizationState& state, Scalar value) {
    bool stop = false;
    for (auto& cb : callbacks_) {
        const bool requested = cb(state, value);
        stop = stop || requested;
    }
    return stop;
}

void CallbackRegistry::trigger(const std::string& event) {
    for (auto& cb : callbacks_) {
        cb.trigger(event);
    }
}

CallbackRegistry& CallbackRegistry::reset() {
    for (auto& cb : callbacks_) {
        cb.reset();
    }
    return *this;
}

}  // namespace optcb::callbacks
