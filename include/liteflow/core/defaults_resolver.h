#ifndef LITEFLOW_CORE_DEFAULTS_RESOLVER_H
#define LITEFLOW_CORE_DEFAULTS_RESOLVER_H

#include "liteflow/actions/registry.h"
#include "liteflow/core/configuration.h"
#include "liteflow/core/global_defaults.h"
#include "liteflow/core/graph_builder.h"
#include <libxml++/libxml++.h>
#include <optional>
#include <string>

namespace liteflow {

// Fills endpoint and configuration gaps of action nodes from, in order of
// precedence: the node itself, the workflow <global> section (or defaults
// inherited from a parent workflow), and the site defaults.
class DefaultsResolver {
public:
    DefaultsResolver(const ActionTypeRegistry& registry, const SiteConfig& site);

    // Resolves <global> first, then every action in declaration order,
    // rewriting ActionNode::conf in place. May store the encoded defaults
    // in `job_conf` for a sub-workflow that propagates configuration.
    // Returns the effective global defaults.
    std::optional<GlobalDefaults> resolve(BuildResult& result, Configuration& job_conf) const;

    // Rewrites one action-type element, or a <global> element, in place.
    // `owner` names the node in error messages.
    void apply(xmlpp::Element* element,
               const std::string& owner,
               const std::optional<GlobalDefaults>& global,
               const Properties* config_defaults) const;

    static GlobalDefaults parse_global_section(const xmlpp::Element* global);

private:
    void apply_endpoints(xmlpp::Element* element, const std::string& owner, const std::optional<GlobalDefaults>& global) const;
    void apply_configuration(xmlpp::Element* element, const std::optional<GlobalDefaults>& global,
                             const Properties* config_defaults) const;

    const ActionTypeRegistry& registry_;
    const SiteConfig& site_;
};

} // namespace liteflow

#endif // LITEFLOW_CORE_DEFAULTS_RESOLVER_H
