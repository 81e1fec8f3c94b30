#include "optcb/callbacks/builder.hpp"

#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

#include "optcb/actions/checkpoint_saver.hpp"
#include "optcb/actions/log_progress.hpp"
#include "optcb/triggers/event_trigger.hpp"
#include "optcb/triggers/iteration_trigger.hpp"
#include "optcb/triggers/time_trigger.hpp"
#include "optcb/utils/logger.hpp"

namespace optcb::callbacks {

TriggerKind trigger_kind_from_string(const std::string& name) {
    const auto lower = utils::to_lower(name);
    if (lower == "iteration" || lower == "iterations") {
        return TriggerKind::kIteration;
    }
    if (lower == "time" || lower == "seconds") {
        return TriggerKind::kTime;
    }
    if (lower == "event" || lower == "events") {
        return TriggerKind::kEvent;
    }
    throw std::invalid_argument{"Unsupported trigger type: " + name};
}

ActionKind action_kind_from_string(const std::string& name) {
    const auto lower = utils::to_lower(name);
    if (lower == "log_progress" || lower == "log") {
        return ActionKind::kLogProgress;
    }
    if (lower == "checkpoint" || lower == "checkpoint_saver") {
        return ActionKind::kCheckpoint;
    }
    throw std::invalid_argument{"Unsupported action type: " + name};
}

std::unique_ptr<triggers::Trigger> make_trigger(const utils::TriggerConfig& config) {
    switch (trigger_kind_from_string(config.type)) {
        case TriggerKind::kIteration:
            return std::make_unique<triggers::IterationTrigger>(config.interval);
        case TriggerKind::kTime:
            return std::make_unique<triggers::TimeTrigger>(config.seconds);
        case TriggerKind::kEvent:
        default:
            return std::make_unique<triggers::EventTrigger>(std::set<std::string>(config.events.begin(), config.events.end()));
    }
}

triggers::TriggerSet make_triggers(const std::vector<utils::TriggerConfig>& configs) {
    std::vector<std::unique_ptr<triggers::Trigger>> items;
    items.reserve(configs.size());
    for (const auto& config : configs) {
        items.push_back(make_trigger(config));
    }
    return triggers::TriggerSet{std::move(items)};
}

std::unique_ptr<actions::Action> make_action(const utils::ActionConfig& config, std::ostream& stream) {
    switch (action_kind_from_string(config.type)) {
        case ActionKind::kCheckpoint: {
            actions::CheckpointOptions options;
            options.overwrite = config.overwrite;
            return std::make_unique<actions::CheckPointSaver>(config.file, std::move(options));
        }
        case ActionKind::kLogProgress:
        default:
            return std::make_unique<actions::LogProgress>(stream);
    }
}

Callback make_callback(const utils::CallbackConfig& config, CallbackOptions options, std::ostream& stream) {
    return Callback{make_triggers(config.triggers), make_action(config.action, stream), std::move(options)};
}

CallbackRegistry make_registry(const std::vector<utils::CallbackConfig>& configs, std::ostream& stream) {
    CallbackRegistry registry;
    for (const auto& config : configs) {
        registry.add(make_callback(config, {}, stream));
    }
    return registry;
}

}  // namespace optcb::callbacks
