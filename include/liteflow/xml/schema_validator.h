#ifndef LITEFLOW_XML_SCHEMA_VALIDATOR_H
#define LITEFLOW_XML_SCHEMA_VALIDATOR_H

#include <libxml++/libxml++.h>
#include <memory>
#include <mutex>
#include <string>

namespace liteflow {

// Checks a raw definition before it is parsed into a graph.
// Implementations throw SCHEMA_VIOLATION.
class SchemaValidator {
public:
    virtual ~SchemaValidator() = default;
    virtual void validate(const std::string& definition) const = 0;
};

// XSD-backed validator
class XsdSchemaValidator : public SchemaValidator {
public:
    // Throws IO_ERROR if the schema cannot be loaded
    explicit XsdSchemaValidator(const std::string& xsd_path);

    void validate(const std::string& definition) const override;

private:
    std::unique_ptr<xmlpp::XsdValidator> validator_;
    mutable std::mutex mutex_; // libxml2 validation contexts are not reentrant
};

} // namespace liteflow

#endif // LITEFLOW_XML_SCHEMA_VALIDATOR_H
