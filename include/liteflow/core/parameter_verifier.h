#ifndef LITEFLOW_CORE_PARAMETER_VERIFIER_H
#define LITEFLOW_CORE_PARAMETER_VERIFIER_H

#include "liteflow/core/configuration.h"
#include <libxml++/libxml++.h>

namespace liteflow {

// Checks the <parameters> section of a definition against the job
// configuration. Parameters with a <value> are copied into the job
// configuration when it lacks them; parameters without one must be
// supplied by the job.
class ParameterVerifier {
public:
    // Throws PARAMETER_VERIFICATION_FAILURE naming every missing parameter
    static void verify(const xmlpp::Element* root, Configuration& job_conf);
};

} // namespace liteflow

#endif // LITEFLOW_CORE_PARAMETER_VERIFIER_H
