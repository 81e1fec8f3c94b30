#pragma once

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "optcb/actions/action.hpp"
#include "optcb/triggers/trigger.hpp"
#include "optcb/triggers/trigger_set.hpp"
#include "optcb/types.hpp"

namespace optcb::callbacks {

using StopFn = std::function<bool(const OptimizationState&, Scalar, Iteration, const Extra&)>;

struct CallbackOptions {
    Iteration t{0};
    Extra extra{};
    StopFn stop{[](const OptimizationState&, Scalar, Iteration, const Extra&) { return false; }};
};

/**
 * Per-iteration hook handed to an optimization driver.
 *
 * Each call advances the iteration counter, evaluates every trigger, runs the
 * action if any trigger fired and returns the stop predicate's verdict. The
 * callback never ends the loop on its own; the driver acts on the returned
 * flag. Exceptions from triggers, the action or the stop predicate propagate
 * to the driver unchanged.
 *
 * A callback is not thread-safe. Invoking one instance from several threads
 * at once races on the counter and on trigger/action state.
 *
 *     callbacks::Callback callback{std::make_unique<triggers::IterationTrigger>(5),
 *                                  std::make_unique<actions::LogProgress>()};
 *     bool stop = callback(state, value);
 */
class Callback {
  public:
    Callback(triggers::TriggerSet triggers, std::unique_ptr<actions::Action> action, CallbackOptions options = {});

    bool operator()(const OptimizationState& state, Scalar value);

    // Counter back to zero, triggers and action to construction-time state.
    Callback& reset();

    // Forwards `event` to every trigger.
    void trigger(const std::string& event);

    Iteration t() const noexcept { return t_; }
    const Extra& extra() const noexcept { return extra_; }

    triggers::TriggerSet& triggers() noexcept { return triggers_; }
    const triggers::TriggerSet& triggers() const noexcept { return triggers_; }

    actions::Action& action() noexcept { return *action_; }
    const actions::Action& action() const noexcept { return *action_; }

  private:
    triggers::TriggerSet triggers_;
    std::unique_ptr<actions::Action> action_;
    Iteration t_;
    Extra extra_;
    StopFn stop_;
};

}  // namespace optcb::callbacks

namespace optcb {

namespace callbacks {
class CallbackRegistry;
}  // namespace callbacks

namespace detail {
// Kinds that take part in event delivery and reset.
template <typename T>
inline constexpr bool is_dispatch_target_v =
    std::is_base_of_v<triggers::Trigger, T> || std::is_base_of_v<actions::Action, T> ||
    std::is_same_v<T, triggers::TriggerSet> || std::is_same_v<T, callbacks::Callback> ||
    std::is_same_v<T, callbacks::CallbackRegistry>;

template <typename T, typename = void>
struct has_trigger : std::false_type {};

template <typename T>
struct has_trigger<T, std::void_t<decltype(std::declval<T&>().trigger(std::declval<const std::string&>()))>>
    : std::true_type {};
}  // namespace detail

// Delivers `event` to a callback, registry, trigger set or trigger. Actions
// and any other target accept the call and ignore it.
template <typename T>
void trigger(T& target, const std::string& event) {
    if constexpr (detail::is_dispatch_target_v<T> && detail::has_trigger<T>::value) {
        target.trigger(event);
    }
}

callbacks::Callback& reset(callbacks::Callback& callback);

// Resets a registry, trigger set, trigger or action; a no-op for any other
// target.
template <typename T>
void reset(T& target) {
    if constexpr (detail::is_dispatch_target_v<T>) {
        target.reset();
    }
}

}  // namespace optcb
