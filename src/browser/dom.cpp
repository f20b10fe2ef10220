#include "gradia/browser/dom.hpp"
#include "gradia/core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace gradia::browser {

// ---------------------------------------------------------------------------
// DomNode
// ---------------------------------------------------------------------------

auto DomNode::attribute(std::string_view name) const -> std::optional<std::string> {
    auto it = attributes.find(std::string(name));
    if (it == attributes.end()) return std::nullopt;
    return it->second;
}

auto DomNode::has_class(std::string_view cls) const -> bool {
    auto it = attributes.find("class");
    if (it == attributes.end()) return false;

    const auto& value = it->second;
    size_t pos = 0;
    while (pos < value.size()) {
        auto start = value.find_first_not_of(" \t\n\r\f", pos);
        if (start == std::string::npos) break;
        auto end = value.find_first_of(" \t\n\r\f", start);
        if (end == std::string::npos) end = value.size();
        if (std::string_view(value).substr(start, end - start) == cls) {
            return true;
        }
        pos = end;
    }
    return false;
}

auto DomNode::text_content() const -> std::string {
    if (node_type == NodeType::Text) return text;

    std::string out;
    for (const auto& child : children) {
        out += child.text_content();
    }
    return out;
}

// ---------------------------------------------------------------------------
// JSON serialization
// ---------------------------------------------------------------------------

namespace {

auto node_type_to_string(NodeType type) -> std::string_view {
    switch (type) {
        case NodeType::Document: return "document";
        case NodeType::Element: return "element";
        case NodeType::Text: return "text";
        case NodeType::Other: return "other";
    }
    return "other";
}

auto node_type_from_string(std::string_view s) -> NodeType {
    if (s == "document") return NodeType::Document;
    if (s == "text") return NodeType::Text;
    if (s == "other") return NodeType::Other;
    return NodeType::Element;
}

} // anonymous namespace

void to_json(json& j, const DomNode& n) {
    j = json{
        {"node_type", node_type_to_string(n.node_type)},
        {"tag_name", n.tag_name},
    };
    if (n.node_type == NodeType::Text) {
        j["text"] = n.text;
    }
    if (!n.attributes.empty()) {
        j["attributes"] = n.attributes;
    }
    if (!n.children.empty()) {
        j["children"] = n.children;
    }
}

void from_json(const json& j, DomNode& n) {
    n.node_type = node_type_from_string(j.value("node_type", "element"));
    n.tag_name = utils::to_lower(j.value("tag_name", ""));
    n.text = j.value("text", "");
    n.attributes = j.value("attributes", std::map<std::string, std::string>{});
    if (j.contains("children")) {
        n.children = j["children"].get<std::vector<DomNode>>();
    }
}

auto from_cdp_node(const json& node) -> DomNode {
    DomNode out;

    switch (node.value("nodeType", 0)) {
        case 1: out.node_type = NodeType::Element; break;
        case 3: out.node_type = NodeType::Text; break;
        case 9: out.node_type = NodeType::Document; break;
        default: out.node_type = NodeType::Other; break;
    }

    auto local_name = node.value("localName", "");
    out.tag_name = utils::to_lower(local_name.empty() ? node.value("nodeName", "")
                                                      : local_name);

    if (out.node_type == NodeType::Text) {
        out.text = node.value("nodeValue", "");
    }

    // CDP reports attributes as a flat [name, value, name, value, ...] array.
    if (node.contains("attributes") && node["attributes"].is_array()) {
        const auto& attrs = node["attributes"];
        for (size_t i = 0; i + 1 < attrs.size(); i += 2) {
            out.attributes[attrs[i].get<std::string>()] = attrs[i + 1].get<std::string>();
        }
    }

    if (node.contains("children") && node["children"].is_array()) {
        out.children.reserve(node["children"].size());
        for (const auto& child : node["children"]) {
            out.children.push_back(from_cdp_node(child));
        }
    }

    // Same-origin iframes carry their own document.
    if (node.contains("contentDocument") && node["contentDocument"].is_object()) {
        out.children.push_back(from_cdp_node(node["contentDocument"]));
    }

    return out;
}

auto parse_inline_style(std::string_view style) -> std::map<std::string, std::string> {
    std::map<std::string, std::string> out;
    for (const auto& decl : utils::split(style, ';')) {
        auto colon = decl.find(':');
        if (colon == std::string::npos) continue;
        auto key = utils::to_lower(utils::trim(std::string_view(decl).substr(0, colon)));
        if (key.empty()) continue;
        out[key] = utils::trim(std::string_view(decl).substr(colon + 1));
    }
    return out;
}

// ---------------------------------------------------------------------------
// Selector
// ---------------------------------------------------------------------------

auto SimpleSelector::matches(const DomNode& node) const -> bool {
    if (!node.is_element()) return false;
    if (!tag.empty() && tag != "*" && tag != node.tag_name) return false;
    return std::ranges::all_of(classes, [&](const auto& cls) {
        return node.has_class(cls);
    });
}

auto Selector::parse(std::string_view text) -> Result<Selector> {
    auto is_ident = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
    };

    Selector selector;
    selector.text_ = utils::trim(text);

    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        if (i >= text.size()) break;

        SimpleSelector part;
        if (text[i] == '*') {
            part.tag = "*";
            ++i;
        } else {
            size_t start = i;
            while (i < text.size() && is_ident(text[i])) ++i;
            part.tag = utils::to_lower(text.substr(start, i - start));
        }

        while (i < text.size() && text[i] == '.') {
            size_t start = ++i;
            while (i < text.size() && is_ident(text[i])) ++i;
            if (i == start) {
                return std::unexpected(make_error(ErrorCode::InvalidArgument,
                    "Empty class name in selector", std::string(text)));
            }
            part.classes.emplace_back(text.substr(start, i - start));
        }

        if (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                "Unsupported selector syntax",
                std::string(text) + " (at '" + text[i] + "')"));
        }
        if (part.tag.empty() && part.classes.empty()) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                "Empty selector component", std::string(text)));
        }
        selector.parts_.push_back(std::move(part));
    }

    if (selector.parts_.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument, "Empty selector"));
    }
    return selector;
}

auto Selector::select(const DomNode& root) const -> std::vector<const DomNode*> {
    std::vector<const DomNode*> ancestors;
    std::vector<const DomNode*> out;
    for (const auto& child : root.children) {
        collect(child, ancestors, out, false);
    }
    return out;
}

auto Selector::select_one(const DomNode& root) const -> const DomNode* {
    std::vector<const DomNode*> ancestors;
    std::vector<const DomNode*> out;
    for (const auto& child : root.children) {
        collect(child, ancestors, out, true);
        if (!out.empty()) return out.front();
    }
    return nullptr;
}

void Selector::collect(const DomNode& node, std::vector<const DomNode*>& ancestors,
                       std::vector<const DomNode*>& out, bool first_only) const {
    if (first_only && !out.empty()) return;

    if (parts_.back().matches(node) && ancestors_match(ancestors)) {
        out.push_back(&node);
        if (first_only) return;
    }

    ancestors.push_back(&node);
    for (const auto& child : node.children) {
        collect(child, ancestors, out, first_only);
        if (first_only && !out.empty()) break;
    }
    ancestors.pop_back();
}

auto Selector::ancestors_match(const std::vector<const DomNode*>& ancestors) const -> bool {
    // Descendant-only chains can be matched greedily from the nearest ancestor.
    auto remaining = static_cast<std::ptrdiff_t>(parts_.size()) - 2;
    for (auto it = ancestors.rbegin(); it != ancestors.rend() && remaining >= 0; ++it) {
        if (parts_[static_cast<size_t>(remaining)].matches(**it)) {
            --remaining;
        }
    }
    return remaining < 0;
}

} // namespace gradia::browser
