#ifndef LITEFLOW_XML_XML_UTILS_H
#define LITEFLOW_XML_XML_UTILS_H

#include "common/types.h"
#include <libxml++/libxml++.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace liteflow {

// Owns a parsed DOM; elements handed out live as long as the document
class XmlDocument {
public:
    // Throws XML_PARSE_FAILURE
    static XmlDocument parse(const std::string& text);

    xmlpp::Element* root() const;

private:
    explicit XmlDocument(std::unique_ptr<xmlpp::DomParser> parser);
    std::unique_ptr<xmlpp::DomParser> parser_;
};

// Child lookups match the local name, so namespaced documents work unchanged
xmlpp::Element* first_child_element(xmlpp::Element* parent, const std::string& name);
const xmlpp::Element* first_child_element(const xmlpp::Element* parent, const std::string& name);

// All element children, or only those named `name` when it is non-empty
std::vector<xmlpp::Element*> child_elements(xmlpp::Element* parent, const std::string& name = {});
std::vector<const xmlpp::Element*> child_elements(const xmlpp::Element* parent, const std::string& name = {});

std::optional<std::string> attribute(const xmlpp::Element* element, const std::string& name);

// Concatenated text and CDATA content of the direct children
std::string element_text(const xmlpp::Element* element);

xmlpp::Element* append_text_element(xmlpp::Element* parent, const std::string& name, const std::string& text);

// Serializes an element subtree as a standalone, indented document
std::string to_xml_string(const xmlpp::Element* element);

// <configuration><property><name/><value/></property>...</configuration>
Properties read_properties(const xmlpp::Element* configuration);
// Replaces the content of `configuration` with one <property> per entry
void write_properties(xmlpp::Element* configuration, const Properties& props);

} // namespace liteflow

#endif // LITEFLOW_XML_XML_UTILS_H
