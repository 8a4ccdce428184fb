#include "liteflow/core/parameter_verifier.h"
#include "liteflow/core/errors.h"
#include "liteflow/core/graph_builder.h"
#include "liteflow/xml/xml_utils.h"
#include "common/utils.h"
#include <string>
#include <vector>

namespace liteflow {

void ParameterVerifier::verify(const xmlpp::Element* root, Configuration& job_conf) {
    const xmlpp::Element* parameters = first_child_element(root, tags::PARAMETERS);
    if (!parameters) {
        return;
    }

    std::vector<std::string> missing;
    for (const xmlpp::Element* property : child_elements(parameters, "property")) {
        const xmlpp::Element* name_element = first_child_element(property, "name");
        std::string name = name_element ? trim(element_text(name_element)) : std::string();
        if (name.empty()) {
            throw WorkflowException(ErrorCode::PARAMETER_VERIFICATION_FAILURE,
                                    "A parameter in <parameters> has no name");
        }
        if (job_conf.contains(name)) {
            continue;
        }
        if (const xmlpp::Element* value = first_child_element(property, "value")) {
            job_conf.set(name, element_text(value));
        } else {
            missing.push_back(name);
        }
    }

    if (!missing.empty()) {
        std::string names;
        for (const auto& name : missing) {
            if (!names.empty()) names += ", ";
            names += name;
        }
        throw WorkflowException(ErrorCode::PARAMETER_VERIFICATION_FAILURE,
                                "Missing value for parameter(s): " + names);
    }
}

} // namespace liteflow
