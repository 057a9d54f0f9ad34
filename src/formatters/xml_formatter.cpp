#include "codeclean/formatters/xml_formatter.hpp"
#include "codeclean/formatters/parse_error.hpp"
#include "codeclean/string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <string_view>

namespace codeclean {

namespace {

// Elements nested deeper than this are rejected before the recursion can exhaust the stack
constexpr size_t MAX_XML_DEPTH = 1000;

auto is_xml_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

auto is_name_start(char c) -> bool {
    auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || c == ':' || u >= 0x80;
}

auto is_name_char(char c) -> bool {
    return is_name_start(c) || std::isdigit(static_cast<unsigned char>(c)) || c == '-'
           || c == '.';
}

class XmlReader {
public:
    explicit XmlReader(const std::string& text) : text_(text) {}

    auto read_document() -> XmlDocument {
        XmlDocument document;
        if (at("\xEF\xBB\xBF")) {
            pos_ += 3;
        }

        bool have_root = false;
        while (true) {
            skip_space();
            if (eof()) {
                break;
            }
            if (at("<?")) {
                if (auto node = read_processing_instruction()) {
                    (have_root ? document.epilog : document.prolog).push_back(std::move(*node));
                }
            } else if (at("<!--")) {
                skip_comment();
            } else if (at("<!DOCTYPE") || at("<!doctype")) {
                if (have_root) {
                    fail("DOCTYPE after the root element");
                }
                document.prolog.push_back(read_doctype());
            } else if (at("<")) {
                if (have_root) {
                    fail("multiple root elements");
                }
                document.root = read_element();
                have_root = true;
            } else {
                fail(have_root ? "text after the root element" : "text before the root element");
            }
        }

        if (!have_root) {
            fail("no root element");
        }
        return document;
    }

private:
    const std::string& text_;
    size_t pos_{};
    size_t depth_{};                   // Elements currently open

    [[noreturn]] auto fail(const std::string& detail) const -> void {
        auto location = locate_offset(text_, pos_);
        throw ParseError("XML", location.line, location.column, detail);
    }

    auto eof() const -> bool { return pos_ >= text_.size(); }

    auto at(std::string_view marker) const -> bool {
        return StringUtils::starts_with_at(text_, pos_, marker);
    }

    auto skip_space() -> void {
        while (!eof() && is_xml_space(text_[pos_])) {
            ++pos_;
        }
    }

    auto expect(char c) -> void {
        if (eof() || text_[pos_] != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    // Returns the text up to `terminator` and moves past it
    auto read_until(std::string_view terminator, const std::string& what) -> std::string {
        auto end = text_.find(terminator, pos_);
        if (end == std::string::npos) {
            fail("unterminated " + what);
        }
        auto body = text_.substr(pos_, end - pos_);
        pos_ = end + terminator.size();
        return body;
    }

    auto read_name() -> std::string {
        if (eof() || !is_name_start(text_[pos_])) {
            fail("expected a name");
        }
        size_t start = pos_;
        while (!eof() && is_name_char(text_[pos_])) {
            ++pos_;
        }
        return text_.substr(start, pos_ - start);
    }

    auto skip_comment() -> void {
        pos_ += 4;
        read_until("-->", "comment");
    }

    // The XML declaration is dropped; other PIs become nodes
    auto read_processing_instruction() -> std::optional<XmlNode> {
        size_t start = pos_;
        pos_ += 2;
        auto target = read_name();
        auto body = read_until("?>", "processing instruction");

        if (StringUtils::to_lowercase(target) == "xml") {
            if (start != 0 && !(start == 3 && text_.starts_with("\xEF\xBB\xBF"))) {
                pos_ = start;
                fail("XML declaration is only allowed at the start of the document");
            }
            return std::nullopt;
        }
        return XmlNode{.kind = XmlNodeKind::PROCESSING_INSTRUCTION,
                       .name = target,
                       .text = StringUtils::trim(body)};
    }

    auto read_doctype() -> XmlNode {
        pos_ += 2;  // "<!"
        size_t start = pos_;
        int bracket_depth = 0;
        char quote = 0;

        while (!eof()) {
            char c = text_[pos_];
            if (quote) {
                if (c == quote) {
                    quote = 0;
                }
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '[') {
                ++bracket_depth;
            } else if (c == ']') {
                --bracket_depth;
            } else if (c == '>' && bracket_depth <= 0) {
                auto body = text_.substr(start, pos_ - start);
                ++pos_;
                return XmlNode{.kind = XmlNodeKind::DOCTYPE, .text = body};
            }
            ++pos_;
        }
        fail("unterminated DOCTYPE");
    }

    auto read_attribute(XmlNode& element) -> void {
        auto name = read_name();
        skip_space();
        expect('=');
        skip_space();

        if (eof() || (text_[pos_] != '"' && text_[pos_] != '\'')) {
            fail("attribute value for '" + name + "' must be quoted");
        }
        char quote = text_[pos_++];
        size_t start = pos_;
        while (!eof() && text_[pos_] != quote) {
            if (text_[pos_] == '<') {
                fail("'<' in the value of attribute '" + name + "'");
            }
            ++pos_;
        }
        if (eof()) {
            fail("unterminated value of attribute '" + name + "'");
        }
        auto value = text_.substr(start, pos_ - start);
        ++pos_;

        auto duplicate = std::find_if(element.attributes.begin(), element.attributes.end(),
                                      [&name](const XmlAttribute& a) { return a.name == name; });
        if (duplicate != element.attributes.end()) {
            fail("duplicate attribute '" + name + "'");
        }
        element.attributes.push_back(XmlAttribute{.name = name, .value = value, .quote = quote});
    }

    auto read_element() -> XmlNode {
        if (depth_ >= MAX_XML_DEPTH) {
            fail("nesting too deep");
        }
        size_t open_pos = pos_;
        expect('<');
        XmlNode element{.kind = XmlNodeKind::ELEMENT, .name = read_name()};

        while (true) {
            bool had_space = !eof() && is_xml_space(text_[pos_]);
            skip_space();
            if (eof()) {
                fail("unterminated start tag <" + element.name + ">");
            }
            if (at("/>")) {
                pos_ += 2;
                return element;
            }
            if (text_[pos_] == '>') {
                ++pos_;
                break;
            }
            if (!had_space) {
                fail("expected whitespace before attribute");
            }
            read_attribute(element);
        }

        ++depth_;
        read_content(element, open_pos);
        --depth_;
        return element;
    }

    auto flush_text(XmlNode& element, std::string& pending) -> void {
        auto trimmed = StringUtils::trim(pending);
        if (!trimmed.empty()) {
            element.children.push_back(XmlNode{.kind = XmlNodeKind::TEXT, .text = trimmed});
        }
        pending.clear();
    }

    auto read_content(XmlNode& element, size_t open_pos) -> void {
        std::string pending_text;

        while (true) {
            if (eof()) {
                pos_ = open_pos;
                fail("element <" + element.name + "> is never closed");
            }

            if (at("</")) {
                flush_text(element, pending_text);
                pos_ += 2;
                auto name = read_name();
                if (name != element.name) {
                    fail("closing tag </" + name + "> does not match <" + element.name + ">");
                }
                skip_space();
                expect('>');
                return;
            }

            if (at("<!--")) {
                // Text on both sides of a comment joins up
                skip_comment();
            } else if (at("<![CDATA[")) {
                flush_text(element, pending_text);
                pos_ += 9;
                element.children.push_back(
                    XmlNode{.kind = XmlNodeKind::CDATA, .text = read_until("]]>", "CDATA section")});
            } else if (at("<?")) {
                flush_text(element, pending_text);
                if (auto node = read_processing_instruction()) {
                    element.children.push_back(std::move(*node));
                }
            } else if (at("<")) {
                flush_text(element, pending_text);
                element.children.push_back(read_element());
            } else {
                auto next = text_.find('<', pos_);
                if (next == std::string::npos) {
                    next = text_.size();
                }
                pending_text.append(text_, pos_, next - pos_);
                pos_ = next;
            }
        }
    }
};

class XmlWriter {
public:
    explicit XmlWriter(size_t indent_width) : indent_width_(indent_width) {}

    auto write(const XmlDocument& document) -> std::string {
        for (const auto& node : document.prolog) {
            write_node(node, 0);
        }
        write_node(document.root, 0);
        for (const auto& node : document.epilog) {
            write_node(node, 0);
        }
        if (!out_.empty()) {
            out_.pop_back();  // No newline after the last line
        }
        return std::move(out_);
    }

private:
    size_t indent_width_;
    std::string out_;

    auto indent(size_t depth) -> void { out_.append(depth * indent_width_, ' '); }

    auto write_inline(const XmlNode& node) -> void {
        switch (node.kind) {
        case XmlNodeKind::TEXT:
            out_ += node.text;
            break;
        case XmlNodeKind::CDATA:
            out_ += "<![CDATA[" + node.text + "]]>";
            break;
        case XmlNodeKind::PROCESSING_INSTRUCTION:
            out_ += "<?" + node.name + (node.text.empty() ? "" : " " + node.text) + "?>";
            break;
        case XmlNodeKind::DOCTYPE:
            out_ += "<!" + node.text + ">";
            break;
        case XmlNodeKind::ELEMENT:
            break;
        }
    }

    auto write_start_tag(const XmlNode& element) -> void {
        out_ += "<" + element.name;
        for (const auto& attribute : element.attributes) {
            out_ += " " + attribute.name + "=" + attribute.quote + attribute.value
                    + attribute.quote;
        }
    }

    auto write_node(const XmlNode& node, size_t depth) -> void {
        indent(depth);

        if (node.kind != XmlNodeKind::ELEMENT) {
            write_inline(node);
            out_ += "\n";
            return;
        }

        write_start_tag(node);
        if (node.children.empty()) {
            out_ += "/>\n";
            return;
        }

        const auto& first = node.children.front();
        if (node.children.size() == 1
            && (first.kind == XmlNodeKind::TEXT || first.kind == XmlNodeKind::CDATA)) {
            out_ += ">";
            write_inline(first);
            out_ += "</" + node.name + ">\n";
            return;
        }

        out_ += ">\n";
        for (const auto& child : node.children) {
            write_node(child, depth + 1);
        }
        indent(depth);
        out_ += "</" + node.name + ">\n";
    }
};

} // namespace

auto parse_xml(const std::string& text) -> XmlDocument {
    XmlReader reader(text);
    return reader.read_document();
}

auto serialize_xml(const XmlDocument& document, size_t indent_width) -> std::string {
    XmlWriter writer(indent_width);
    return writer.write(document);
}

auto format_xml(const std::string& text) -> std::string {
    auto output = serialize_xml(parse_xml(text));
    if (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        output.push_back('\n');
    }
    return output;
}

} // namespace codeclean
