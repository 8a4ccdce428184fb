#include "liteflow/core/configuration.h"
#include "liteflow/core/errors.h"
#include "common/utils.h"
#include <iostream>
#include <yaml-cpp/yaml.h>

namespace liteflow {

namespace {

// Properties are strings; YAML may have typed them as numbers or booleans
std::string scalar_to_string(const Properties& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return {};
    return value.dump();
}

std::optional<std::string> endpoint_or_unset(const std::optional<std::string>& value) {
    if (!value.has_value()) return std::nullopt;
    std::string trimmed = trim(*value);
    if (trimmed.empty()) return std::nullopt;
    return trimmed;
}

size_t positive_size(const Properties& value, const char* key) {
    if (!value.is_number_integer() || value.get<long long>() <= 0) {
        throw WorkflowException(ErrorCode::MALFORMED_DEFINITION,
                                std::string("'") + key + "' must be a positive integer");
    }
    return value.get<size_t>();
}

} // namespace

// ————————————————————————
// Configuration
// ————————————————————————

Configuration::Configuration(Properties props) {
    if (!props.is_object()) {
        throw WorkflowException(ErrorCode::MALFORMED_DEFINITION, "Configuration must be an object of properties");
    }
    for (auto& [key, value] : props.items()) {
        props_[key] = scalar_to_string(value);
    }
}

bool Configuration::contains(const std::string& key) const {
    return props_.contains(key);
}

std::optional<std::string> Configuration::get(const std::string& key) const {
    auto it = props_.find(key);
    if (it == props_.end()) return std::nullopt;
    return it->get<std::string>();
}

std::string Configuration::get(const std::string& key, const std::string& fallback) const {
    return get(key).value_or(fallback);
}

bool Configuration::get_bool(const std::string& key, bool fallback) const {
    auto value = get(key);
    if (!value.has_value()) return fallback;
    std::string lowered = to_lower(trim(*value));
    if (lowered == "true") return true;
    if (lowered == "false") return false;
    return fallback;
}

void Configuration::set(const std::string& key, std::string value) {
    props_[key] = std::move(value);
}

void Configuration::unset(const std::string& key) {
    props_.erase(key);
}

// ————————————————————————
// SiteConfig
// ————————————————————————

void SiteConfig::normalize() {
    default_name_node = endpoint_or_unset(default_name_node);
    default_job_tracker = endpoint_or_unset(default_job_tracker);
}

SiteConfig site_config_from_json(const Properties& doc) {
    SiteConfig site;
    if (doc.is_null()) {
        return site;
    }
    if (!doc.is_object()) {
        throw WorkflowException(ErrorCode::MALFORMED_DEFINITION, "Site configuration must be a mapping");
    }

    if (doc.contains(SITE_DEFAULT_NAME_NODE)) {
        site.default_name_node = scalar_to_string(doc[SITE_DEFAULT_NAME_NODE]);
    }
    if (doc.contains(SITE_DEFAULT_JOB_TRACKER)) {
        site.default_job_tracker = scalar_to_string(doc[SITE_DEFAULT_JOB_TRACKER]);
    }
    if (doc.contains(SITE_VALIDATE_FORK_JOIN)) {
        const auto& flag = doc[SITE_VALIDATE_FORK_JOIN];
        if (flag.is_boolean()) {
            site.validate_fork_join = flag.get<bool>();
        } else {
            site.validate_fork_join = to_lower(scalar_to_string(flag)) != "false";
        }
    }
    if (doc.contains(SITE_MAX_DEPTH)) {
        site.max_traversal_depth = positive_size(doc[SITE_MAX_DEPTH], SITE_MAX_DEPTH);
    }
    if (doc.contains(SITE_MAX_VISITS)) {
        site.max_traversal_visits = positive_size(doc[SITE_MAX_VISITS], SITE_MAX_VISITS);
    }
    if (doc.contains(SITE_VERBOSE) && doc[SITE_VERBOSE].is_boolean()) {
        site.verbose = doc[SITE_VERBOSE].get<bool>();
    }
    if (doc.contains(SITE_DEFAULT_CONFIGURATION)) {
        const auto& conf = doc[SITE_DEFAULT_CONFIGURATION];
        if (!conf.is_object()) {
            throw WorkflowException(ErrorCode::MALFORMED_DEFINITION,
                                    std::string("'") + SITE_DEFAULT_CONFIGURATION + "' must be a mapping");
        }
        for (auto& [key, value] : conf.items()) {
            site.action_defaults[key] = scalar_to_string(value);
        }
    }

    site.normalize();
    return site;
}

SiteConfig load_site_config(const std::string& file_path) {
    std::string content = read_file(file_path);
    try {
        YAML::Node root = YAML::Load(content);
        SiteConfig site = site_config_from_json(yaml_to_json(root));
        if (site.verbose) {
            std::cerr << "[DEBUG] Loaded site configuration from " << file_path << std::endl;
        }
        return site;
    } catch (const YAML::Exception& e) {
        throw WorkflowException(ErrorCode::MALFORMED_DEFINITION,
                                "YAML parse error in site configuration '" + file_path + "': " + e.what());
    }
}

} // namespace liteflow
