#ifndef LITEFLOW_DSL_EXPRESSION_RESOLVER_H
#define LITEFLOW_DSL_EXPRESSION_RESOLVER_H

#include "liteflow/core/configuration.h"
#include <inja/inja.hpp>
#include <string>
#include <string_view>

namespace liteflow {

// Resolves ${...} expressions in attribute values against the job
// configuration. Dotted keys are reachable both as a whole ("${retries}")
// and as nested paths ("${wf.retries}" for key "wf.retries").
// Holds no per-call state; safe to share between threads.
class ExpressionResolver {
public:

    // Throws EXPRESSION_RESOLUTION_FAILURE
    std::string resolve(std::string_view expression, const Configuration& conf) const;

    static nlohmann::json to_context(const Configuration& conf);

private:
    static inja::Environment make_environment();
    static void configure_security(inja::Environment& env);
};

} // namespace liteflow

#endif // LITEFLOW_DSL_EXPRESSION_RESOLVER_H
