#include "liteflow/dsl/expression_resolver.h"
#include "liteflow/core/errors.h"
#include "common/utils.h"
#include <inja/inja.hpp>

namespace liteflow {

namespace {

std::string to_pointer(const std::string& key) {
    std::string pointer = "/";
    for (char c : key) {
        if (c == '~') pointer += "~0";
        else if (c == '/') pointer += "~1";
        else if (c == '.') pointer += '/';
        else pointer += c;
    }
    return pointer;
}

} // namespace

inja::Environment ExpressionResolver::make_environment() {
    inja::Environment env;
    env.set_expression("${", "}");
    env.set_statement("{%", "%}");
    env.set_comment("{#", "#}");
    env.set_line_statement("##");

    configure_security(env);
    return env;
}

void ExpressionResolver::configure_security(inja::Environment& env) {
    env.set_search_included_templates_in_files(false);
    env.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled in attribute expressions.", inja::SourceLocation{});
    });
}

nlohmann::json ExpressionResolver::to_context(const Configuration& conf) {
    nlohmann::json context = nlohmann::json::object();
    for (const auto& [key, value] : conf.properties().items()) {
        context[key] = value.get<std::string>();
    }
    // Nested view of dotted keys; a key that collides with a plain value is skipped
    for (const auto& [key, value] : conf.properties().items()) {
        if (key.find('.') == std::string::npos) continue;
        try {
            context[nlohmann::json::json_pointer(to_pointer(key))] = value.get<std::string>();
        } catch (const nlohmann::json::exception&) {
            continue;
        }
    }
    return context;
}

std::string ExpressionResolver::resolve(std::string_view expression, const Configuration& conf) const {
    try {
        inja::Environment env = make_environment();
        return trim(env.render(expression, to_context(conf)));
    } catch (const inja::InjaError& e) {
        throw WorkflowException(ErrorCode::EXPRESSION_RESOLUTION_FAILURE,
                                "Cannot resolve '" + std::string(expression) + "': " + e.message);
    }
}

} // namespace liteflow
