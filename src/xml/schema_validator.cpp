#include "liteflow/xml/schema_validator.h"
#include "liteflow/core/errors.h"

namespace liteflow {

XsdSchemaValidator::XsdSchemaValidator(const std::string& xsd_path) {
    try {
        validator_ = std::make_unique<xmlpp::XsdValidator>(xsd_path);
    } catch (const xmlpp::exception& e) {
        throw WorkflowException(ErrorCode::IO_ERROR, "Cannot load schema '" + xsd_path + "': " + e.what());
    }
}

void XsdSchemaValidator::validate(const std::string& definition) const {
    xmlpp::DomParser parser;
    try {
        parser.parse_memory(definition);
    } catch (const xmlpp::exception& e) {
        throw WorkflowException(ErrorCode::XML_PARSE_FAILURE, e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        validator_->validate(parser.get_document());
    } catch (const xmlpp::exception& e) {
        throw WorkflowException(ErrorCode::SCHEMA_VIOLATION, e.what());
    }
}

} // namespace liteflow
