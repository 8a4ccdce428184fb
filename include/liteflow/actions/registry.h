#ifndef LITEFLOW_ACTIONS_REGISTRY_H
#define LITEFLOW_ACTIONS_REGISTRY_H

#include "common/types.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace liteflow {

// Action type tags with special defaults handling
inline constexpr const char* SUB_WORKFLOW_ACTION = "sub-workflow";
inline constexpr const char* FS_ACTION = "fs";

// What an action type needs from the defaults resolver
struct ActionTypeInfo {
    bool requires_endpoints = false;     // needs <name-node>/<job-tracker>
    bool supports_configuration = false; // takes <configuration> and <job-xml>
};

class ActionTypeRegistry {
public:
    ActionTypeRegistry(); // registers the built-in action types

    void register_action(std::string type, ActionTypeInfo info);
    void unregister_action(const std::string& type);

    bool is_supported(const std::string& type) const;
    std::optional<ActionTypeInfo> find(const std::string& type) const;
    std::vector<std::string> list_actions() const;

private:
    void register_default_actions();
    std::unordered_map<std::string, ActionTypeInfo> actions_;
};

} // namespace liteflow

#endif // LITEFLOW_ACTIONS_REGISTRY_H
