#include "liteflow/actions/registry.h"
#include <algorithm>

namespace liteflow {

ActionTypeRegistry::ActionTypeRegistry() {
    register_default_actions();
}

void ActionTypeRegistry::register_default_actions() {
    // Cluster jobs: need both endpoints and accept shared configuration
    for (const char* type : {"map-reduce", "pig", "hive", "hive2", "sqoop", "shell", "java", "spark", "distcp"}) {
        register_action(type, ActionTypeInfo{true, true});
    }
    // Storage operations: only the storage endpoint is inherited, never required
    register_action(FS_ACTION, ActionTypeInfo{false, true});
    // Delegates to a child workflow that resolves its own defaults
    register_action(SUB_WORKFLOW_ACTION, ActionTypeInfo{false, false});
    register_action("email", ActionTypeInfo{false, false});
    register_action("ssh", ActionTypeInfo{false, false});
}

void ActionTypeRegistry::register_action(std::string type, ActionTypeInfo info) {
    actions_[std::move(type)] = info;
}

void ActionTypeRegistry::unregister_action(const std::string& type) {
    actions_.erase(type);
}

bool ActionTypeRegistry::is_supported(const std::string& type) const {
    return actions_.count(type) > 0;
}

std::optional<ActionTypeInfo> ActionTypeRegistry::find(const std::string& type) const {
    auto it = actions_.find(type);
    if (it == actions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> ActionTypeRegistry::list_actions() const {
    std::vector<std::string> names;
    names.reserve(actions_.size());
    for (const auto& [name, _] : actions_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace liteflow
