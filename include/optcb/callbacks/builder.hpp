#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "optcb/actions/action.hpp"
#include "optcb/callbacks/callback.hpp"
#include "optcb/callbacks/callback_registry.hpp"
#include "optcb/triggers/trigger.hpp"
#include "optcb/triggers/trigger_set.hpp"
#include "optcb/utils/config.hpp"

namespace optcb::callbacks {

enum class TriggerKind {
    kIteration,
    kTime,
    kEvent
};

enum class ActionKind {
    kLogProgress,
    kCheckpoint
};

TriggerKind trigger_kind_from_string(const std::string& name);
ActionKind action_kind_from_string(const std::string& name);

std::unique_ptr<triggers::Trigger> make_trigger(const utils::TriggerConfig& config);
triggers::TriggerSet make_triggers(const std::vector<utils::TriggerConfig>& configs);

// `stream` receives LogProgress output.
std::unique_ptr<actions::Action> make_action(const utils::ActionConfig& config, std::ostream& stream = std::cout);

Callback make_callback(const utils::CallbackConfig& config, CallbackOptions options = {}, std::ostream& stream = std::cout);
CallbackRegistry make_registry(const std::vector<utils::CallbackConfig>& configs, std::ostream& stream = std::cout);

}  // namespace optcb::callbacks
