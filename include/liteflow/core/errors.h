#ifndef LITEFLOW_CORE_ERRORS_H
#define LITEFLOW_CORE_ERRORS_H

#include <stdexcept>
#include <string>
#include <cstdint>

namespace liteflow {

enum class ErrorCode : uint8_t {
    SCHEMA_VIOLATION,
    XML_PARSE_FAILURE,
    UNKNOWN_ELEMENT,
    MALFORMED_DEFINITION,
    MISSING_START_NODE,
    DUPLICATE_NODE,
    INVALID_IDENTIFIER,
    DANGLING_TRANSITION,
    CYCLE_DETECTED,
    UNSUPPORTED_ACTION_TYPE,
    MISSING_REQUIRED_DEFAULT,
    UNBALANCED_FORK_JOIN_COUNT,
    FORK_DUPLICATE_TARGET,
    JOIN_WITHOUT_FORK,
    JOIN_FORK_MISMATCH,
    ILLEGAL_NODE_REVISIT,
    PARALLEL_BRANCH_UNJOINED_END,
    PARAMETER_VERIFICATION_FAILURE,
    EXPRESSION_RESOLUTION_FAILURE,
    GLOBAL_DEFAULTS_DECODE_FAILURE,
    INVALID_NODE_TYPE,
    TRAVERSAL_TOO_DEEP,
    TRAVERSAL_BUDGET_EXCEEDED,
    IO_ERROR
};

// Stable upper-case name of a code, e.g. "CYCLE_DETECTED"
const char* error_code_name(ErrorCode code);

// The single error kind raised by parsing and validation.
// what() reads "<CODE>: <detail>".
class WorkflowException : public std::runtime_error {
public:
    WorkflowException(ErrorCode code, std::string detail);

    ErrorCode code() const noexcept { return code_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    ErrorCode code_;
    std::string detail_;
};

} // namespace liteflow

#endif // LITEFLOW_CORE_ERRORS_H
