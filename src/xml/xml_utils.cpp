#include "liteflow/xml/xml_utils.h"
#include "liteflow/core/errors.h"
#include "common/utils.h"

namespace liteflow {

// ————————————————————————
// XmlDocument
// ————————————————————————

XmlDocument::XmlDocument(std::unique_ptr<xmlpp::DomParser> parser)
    : parser_(std::move(parser)) {}

XmlDocument XmlDocument::parse(const std::string& text) {
    auto parser = std::make_unique<xmlpp::DomParser>();
    try {
        parser->parse_memory(text);
    } catch (const xmlpp::exception& e) {
        throw WorkflowException(ErrorCode::XML_PARSE_FAILURE, e.what());
    }
    if (!parser->get_document() || !parser->get_document()->get_root_node()) {
        throw WorkflowException(ErrorCode::XML_PARSE_FAILURE, "Document has no root element");
    }
    return XmlDocument(std::move(parser));
}

xmlpp::Element* XmlDocument::root() const {
    return parser_->get_document()->get_root_node();
}

// ————————————————————————
// Element helpers
// ————————————————————————

xmlpp::Element* first_child_element(xmlpp::Element* parent, const std::string& name) {
    for (auto* child : parent->get_children(name)) {
        if (auto* element = dynamic_cast<xmlpp::Element*>(child)) {
            return element;
        }
    }
    return nullptr;
}

const xmlpp::Element* first_child_element(const xmlpp::Element* parent, const std::string& name) {
    for (const auto* child : parent->get_children(name)) {
        if (const auto* element = dynamic_cast<const xmlpp::Element*>(child)) {
            return element;
        }
    }
    return nullptr;
}

std::vector<xmlpp::Element*> child_elements(xmlpp::Element* parent, const std::string& name) {
    std::vector<xmlpp::Element*> elements;
    for (auto* child : parent->get_children(name)) {
        if (auto* element = dynamic_cast<xmlpp::Element*>(child)) {
            elements.push_back(element);
        }
    }
    return elements;
}

std::vector<const xmlpp::Element*> child_elements(const xmlpp::Element* parent, const std::string& name) {
    std::vector<const xmlpp::Element*> elements;
    for (const auto* child : parent->get_children(name)) {
        if (const auto* element = dynamic_cast<const xmlpp::Element*>(child)) {
            elements.push_back(element);
        }
    }
    return elements;
}

std::optional<std::string> attribute(const xmlpp::Element* element, const std::string& name) {
    const xmlpp::Attribute* attr = element->get_attribute(name);
    if (!attr) return std::nullopt;
    return std::string(attr->get_value());
}

std::string element_text(const xmlpp::Element* element) {
    std::string text;
    for (const auto* child : element->get_children()) {
        if (const auto* node = dynamic_cast<const xmlpp::TextNode*>(child)) {
            text += node->get_content();
        } else if (const auto* cdata = dynamic_cast<const xmlpp::CdataNode*>(child)) {
            text += cdata->get_content();
        }
    }
    return text;
}

xmlpp::Element* append_text_element(xmlpp::Element* parent, const std::string& name, const std::string& text) {
    xmlpp::Element* child = parent->add_child_element(name);
    child->add_child_text(text);
    return child;
}

std::string to_xml_string(const xmlpp::Element* element) {
    xmlpp::Document document;
    document.create_root_node_by_import(element, true);
    return document.write_to_string_formatted();
}

Properties read_properties(const xmlpp::Element* configuration) {
    Properties props = Properties::object();
    if (!configuration) return props;

    for (const auto* property : child_elements(configuration, "property")) {
        const xmlpp::Element* name = first_child_element(property, "name");
        if (!name) {
            throw WorkflowException(ErrorCode::MALFORMED_DEFINITION, "<property> without <name> in <configuration>");
        }
        std::string key = trim(element_text(name));
        if (key.empty()) {
            throw WorkflowException(ErrorCode::MALFORMED_DEFINITION, "<property> with empty <name> in <configuration>");
        }
        const xmlpp::Element* value = first_child_element(property, "value");
        props[key] = value ? element_text(value) : std::string();
    }
    return props;
}

void write_properties(xmlpp::Element* configuration, const Properties& props) {
    for (auto* child : configuration->get_children()) {
        xmlpp::Node::remove_node(child);
    }
    for (const auto& [key, value] : props.items()) {
        xmlpp::Element* property = configuration->add_child_element("property");
        append_text_element(property, "name", key);
        append_text_element(property, "value", value.get<std::string>());
    }
}

} // namespace liteflow
