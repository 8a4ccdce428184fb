#include "liteflow/core/global_defaults.h"
#include "liteflow/core/errors.h"

namespace liteflow {

void to_json(nlohmann::json& j, const GlobalDefaults& defaults) {
    j = nlohmann::json::object();
    j["name_node"] = defaults.name_node.has_value() ? nlohmann::json(*defaults.name_node) : nlohmann::json(nullptr);
    j["job_tracker"] = defaults.job_tracker.has_value() ? nlohmann::json(*defaults.job_tracker) : nlohmann::json(nullptr);
    j["job_xmls"] = defaults.job_xmls;
    if (defaults.configuration.has_value()) {
        // Arrays of pairs keep the property order through a plain json object
        nlohmann::json props = nlohmann::json::array();
        for (const auto& [key, value] : defaults.configuration->items()) {
            props.push_back(nlohmann::json::array({key, value.get<std::string>()}));
        }
        j["configuration"] = std::move(props);
    } else {
        j["configuration"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, GlobalDefaults& defaults) {
    defaults = GlobalDefaults{};
    if (j.contains("name_node") && j["name_node"].is_string()) {
        defaults.name_node = j["name_node"].get<std::string>();
    }
    if (j.contains("job_tracker") && j["job_tracker"].is_string()) {
        defaults.job_tracker = j["job_tracker"].get<std::string>();
    }
    if (j.contains("job_xmls")) {
        defaults.job_xmls = j.at("job_xmls").get<std::vector<std::string>>();
    }
    if (j.contains("configuration") && j["configuration"].is_array()) {
        Properties props = Properties::object();
        for (const auto& pair : j["configuration"]) {
            props[pair.at(0).get<std::string>()] = pair.at(1).get<std::string>();
        }
        defaults.configuration = std::move(props);
    }
}

std::string encode_global_defaults(const std::optional<GlobalDefaults>& defaults) {
    nlohmann::json envelope = nlohmann::json::object();
    envelope["present"] = defaults.has_value();
    if (defaults.has_value()) {
        envelope["defaults"] = *defaults;
    }
    return envelope.dump();
}

std::optional<GlobalDefaults> decode_global_defaults(const std::string& encoded) {
    try {
        nlohmann::json envelope = nlohmann::json::parse(encoded);
        if (!envelope.is_object()) {
            throw WorkflowException(ErrorCode::GLOBAL_DEFAULTS_DECODE_FAILURE,
                                    "Error while processing global section conf: not an object");
        }
        if (!envelope.value("present", false)) {
            return std::nullopt;
        }
        return envelope.at("defaults").get<GlobalDefaults>();
    } catch (const nlohmann::json::exception& e) {
        throw WorkflowException(ErrorCode::GLOBAL_DEFAULTS_DECODE_FAILURE,
                                std::string("Error while processing global section conf: ") + e.what());
    }
}

} // namespace liteflow
