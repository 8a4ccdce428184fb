#include "liteflow/core/errors.h"

namespace liteflow {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SCHEMA_VIOLATION: return "SCHEMA_VIOLATION";
        case ErrorCode::XML_PARSE_FAILURE: return "XML_PARSE_FAILURE";
        case ErrorCode::UNKNOWN_ELEMENT: return "UNKNOWN_ELEMENT";
        case ErrorCode::MALFORMED_DEFINITION: return "MALFORMED_DEFINITION";
        case ErrorCode::MISSING_START_NODE: return "MISSING_START_NODE";
        case ErrorCode::DUPLICATE_NODE: return "DUPLICATE_NODE";
        case ErrorCode::INVALID_IDENTIFIER: return "INVALID_IDENTIFIER";
        case ErrorCode::DANGLING_TRANSITION: return "DANGLING_TRANSITION";
        case ErrorCode::CYCLE_DETECTED: return "CYCLE_DETECTED";
        case ErrorCode::UNSUPPORTED_ACTION_TYPE: return "UNSUPPORTED_ACTION_TYPE";
        case ErrorCode::MISSING_REQUIRED_DEFAULT: return "MISSING_REQUIRED_DEFAULT";
        case ErrorCode::UNBALANCED_FORK_JOIN_COUNT: return "UNBALANCED_FORK_JOIN_COUNT";
        case ErrorCode::FORK_DUPLICATE_TARGET: return "FORK_DUPLICATE_TARGET";
        case ErrorCode::JOIN_WITHOUT_FORK: return "JOIN_WITHOUT_FORK";
        case ErrorCode::JOIN_FORK_MISMATCH: return "JOIN_FORK_MISMATCH";
        case ErrorCode::ILLEGAL_NODE_REVISIT: return "ILLEGAL_NODE_REVISIT";
        case ErrorCode::PARALLEL_BRANCH_UNJOINED_END: return "PARALLEL_BRANCH_UNJOINED_END";
        case ErrorCode::PARAMETER_VERIFICATION_FAILURE: return "PARAMETER_VERIFICATION_FAILURE";
        case ErrorCode::EXPRESSION_RESOLUTION_FAILURE: return "EXPRESSION_RESOLUTION_FAILURE";
        case ErrorCode::GLOBAL_DEFAULTS_DECODE_FAILURE: return "GLOBAL_DEFAULTS_DECODE_FAILURE";
        case ErrorCode::INVALID_NODE_TYPE: return "INVALID_NODE_TYPE";
        case ErrorCode::TRAVERSAL_TOO_DEEP: return "TRAVERSAL_TOO_DEEP";
        case ErrorCode::TRAVERSAL_BUDGET_EXCEEDED: return "TRAVERSAL_BUDGET_EXCEEDED";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
    }
    return "UNKNOWN";
}

WorkflowException::WorkflowException(ErrorCode code, std::string detail)
    : std::runtime_error(std::string(error_code_name(code)) + ": " + detail),
      code_(code),
      detail_(std::move(detail)) {}

} // namespace liteflow
