#ifndef LITEFLOW_CORE_CONFIGURATION_H
#define LITEFLOW_CORE_CONFIGURATION_H

#include "common/types.h"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace liteflow {

// Job configuration: ordered string properties supplied with a submission
class Configuration {
public:
    Configuration() = default;
    explicit Configuration(Properties props);

    bool contains(const std::string& key) const;
    std::optional<std::string> get(const std::string& key) const;
    std::string get(const std::string& key, const std::string& fallback) const;
    // "true"/"false" (case-insensitive); anything else yields the fallback
    bool get_bool(const std::string& key, bool fallback) const;

    void set(const std::string& key, std::string value);
    void unset(const std::string& key);

    const Properties& properties() const { return props_; }
    size_t size() const { return props_.size(); }

private:
    Properties props_ = Properties::object();
};

// Process-wide defaults shared by every parse
struct SiteConfig {
    std::optional<std::string> default_name_node;
    std::optional<std::string> default_job_tracker;
    Properties action_defaults = Properties::object(); // lowest tier of action <configuration>
    bool validate_fork_join = true;
    size_t max_traversal_depth = 4096;
    size_t max_traversal_visits = 100000; // node visits per fork/join walk
    bool verbose = false;

    // Trims endpoint defaults; blank values become unset
    void normalize();
};

// Builds a SiteConfig from a flat JSON object keyed by SITE_* names
SiteConfig site_config_from_json(const Properties& doc);

// Reads a YAML site file; throws IO_ERROR or MALFORMED_DEFINITION
SiteConfig load_site_config(const std::string& file_path);

} // namespace liteflow

#endif // LITEFLOW_CORE_CONFIGURATION_H
