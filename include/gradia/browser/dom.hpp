#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "gradia/core/error.hpp"

namespace gradia::browser {

using json = nlohmann::json;

enum class NodeType {
    Document,
    Element,
    Text,
    Other,
};

/// A node of a rendered document captured from the browser.
/// Tag names are lower case; attribute names keep the case the engine reports.
struct DomNode {
    NodeType node_type = NodeType::Element;
    std::string tag_name;
    std::string text;  // text nodes only
    std::map<std::string, std::string> attributes;
    std::vector<DomNode> children;

    [[nodiscard]] auto attribute(std::string_view name) const -> std::optional<std::string>;
    [[nodiscard]] auto has_class(std::string_view cls) const -> bool;
    [[nodiscard]] auto is_element() const -> bool { return node_type == NodeType::Element; }

    /// Concatenated text of every descendant text node, in document order.
    [[nodiscard]] auto text_content() const -> std::string;
};

void to_json(json& j, const DomNode& n);
void from_json(const json& j, DomNode& n);

/// Converts a node of a CDP `DOM.getDocument` response (depth -1) into a DomNode.
auto from_cdp_node(const json& node) -> DomNode;

/// Parses `key: value; key: value` declarations of an inline style attribute.
/// Keys are lower-cased; values are trimmed.
auto parse_inline_style(std::string_view style) -> std::map<std::string, std::string>;

/// One compound selector: optional tag name and any number of classes.
struct SimpleSelector {
    std::string tag;  // empty or "*" matches any element
    std::vector<std::string> classes;

    [[nodiscard]] auto matches(const DomNode& node) const -> bool;
};

/// A chain of compound selectors joined by the descendant combinator,
/// e.g. ".wrap .tablebody td" or "p span". Other CSS syntax is rejected.
class Selector {
public:
    static auto parse(std::string_view text) -> Result<Selector>;

    /// All matching elements under `root`, in document order.
    [[nodiscard]] auto select(const DomNode& root) const -> std::vector<const DomNode*>;

    /// First matching element under `root`, or nullptr.
    [[nodiscard]] auto select_one(const DomNode& root) const -> const DomNode*;

    [[nodiscard]] auto text() const -> std::string_view { return text_; }

private:
    Selector() = default;

    void collect(const DomNode& node, std::vector<const DomNode*>& ancestors,
                 std::vector<const DomNode*>& out, bool first_only) const;
    [[nodiscard]] auto ancestors_match(const std::vector<const DomNode*>& ancestors) const -> bool;

    std::vector<SimpleSelector> parts_;
    std::string text_;
};

} // namespace gradia::browser
