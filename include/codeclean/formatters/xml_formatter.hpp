#pragma once

#include <string>
#include <vector>

namespace codeclean {

enum class XmlNodeKind {
    ELEMENT,
    TEXT,
    CDATA,
    PROCESSING_INSTRUCTION,
    DOCTYPE
};

struct XmlAttribute {
    std::string name;
    std::string value;                 // Raw, entities are not decoded
    char quote = '"';

    auto operator==(const XmlAttribute& other) const -> bool {
        return name == other.name && value == other.value;
    }
};

struct XmlNode {
    XmlNodeKind kind = XmlNodeKind::ELEMENT;
    std::string name;                  // Element name or PI target
    std::string text;                  // Trimmed text, CDATA body, PI data or DOCTYPE body
    std::vector<XmlAttribute> attributes;
    std::vector<XmlNode> children;

    auto operator==(const XmlNode& other) const -> bool = default;
};

// Comments and the <?xml ... ?> declaration are not part of the tree
struct XmlDocument {
    std::vector<XmlNode> prolog;       // PIs and DOCTYPE before the root
    XmlNode root;
    std::vector<XmlNode> epilog;       // PIs after the root

    auto operator==(const XmlDocument& other) const -> bool = default;
};

// Throws ParseError with the position of the first problem. Elements may nest
// at most 1000 deep.
auto parse_xml(const std::string& text) -> XmlDocument;

auto serialize_xml(const XmlDocument& document, size_t indent_width = 2) -> std::string;

// parse_xml + serialize_xml; keeps a trailing newline when the input had one
auto format_xml(const std::string& text) -> std::string;

} // namespace codeclean
