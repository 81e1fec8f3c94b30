#include "optcb/callbacks/callback.hpp"

#include <stdexcept>
#include <utility>

namespace optcb::callbacks {

Callback::Callback(triggers::TriggerSet triggers, std::unique_ptr<actions::Action> action, CallbackOptions options)
    : triggers_{std::move(triggers)},
      action_{std::move(action)},
      t_{options.t},
      extra_{std::move(options.extra)},
      stop_{std::move(options.stop)} {
    if (!action_) {
        throw std::invalid_argument{"Callback requires an action"};
    }
    if (!stop_) {
        throw std::invalid_argument{"Callback stop predicate must be callable"};
    }
}

bool Callback::operator()(const OptimizationState& state, Scalar value) {
    ++t_;
    if (triggers_.fires(state, value, t_, extra_)) {
        action_->apply(state, value, t_, extra_);
    }
    return stop_(state, value, t_, extra_);
}

Callback& Callback::reset() {
    triggers_.reset();
    action_->reset();
    t_ = 0;
    return *this;
}

void Callback::trigger(const std::string& event) {
    triggers_.trigger(event);
}

}  // namespace optcb::callbacks

namespace optcb {

callbacks::Callback& reset(callbacks::Callback& callback) {
    return callback.reset();
}

}  // namespace optcb
