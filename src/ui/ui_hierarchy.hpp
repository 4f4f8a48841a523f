#pragma once
// =============================================================================
// UiHierarchy - uiautomator XML dump as a node tree
// =============================================================================
// The dump uses one uniform element tag (`node`) under a `hierarchy` root;
// the widget class lives in the `class` attribute. Attributes are kept as a
// string map in document order of appearance.
// =============================================================================

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../result.hpp"

namespace tapshot::ui {

// =========================================================================
// Screen rectangle "[x1,y1][x2,y2]"
// =========================================================================

struct BoundingRect {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    long long area() const {
        return static_cast<long long>(x2 - x1) * static_cast<long long>(y2 - y1);
    }
    // Inclusive on all edges
    bool contains(int x, int y) const {
        return x >= x1 && x <= x2 && y >= y1 && y <= y2;
    }
    int center_x() const { return (x1 + x2) / 2; }
    int center_y() const { return (y1 + y2) / 2; }

    std::string str() const;

    bool operator==(const BoundingRect& o) const {
        return x1 == o.x1 && y1 == o.y1 && x2 == o.x2 && y2 == o.y2;
    }
};

// Strict parse of a bounds attribute; x2>=x1 and y2>=y1 required.
std::optional<BoundingRect> parse_bounds(const std::string& bounds);

// Removes every whitespace character ("[ 10,20 ][ 30, 40]" -> "[10,20][30,40]")
std::string normalize_bounds(const std::string& bounds);

using AttributeMap = std::map<std::string, std::string>;

// =========================================================================
// Tree
// =========================================================================

struct UiNode {
    std::string tag;
    AttributeMap attrs;
    int parent = -1;              // index into UiHierarchy::nodes(), -1 = root
    std::vector<int> children;

    const std::string& attr(const std::string& name) const;
    bool has(const std::string& name) const { return attrs.count(name) != 0; }
    std::optional<BoundingRect> bounds() const;
};

class UiHierarchy {
public:
    // Tokenises the dump into elements. Tolerates the XML declaration and
    // comments; mismatched closing tags are an error.
    static Result<UiHierarchy> parse(const std::string& xml);

    // All elements in document order. Index 0 is the root element.
    const std::vector<UiNode>& nodes() const { return nodes_; }
    const UiNode& node(int index) const { return nodes_.at(static_cast<size_t>(index)); }
    bool empty() const { return nodes_.empty(); }

    // Indices of nodes whose tag is `node` (the resolvable controls)
    std::vector<int> control_nodes() const;

    // Descendants of `index` in document order (excluding itself)
    std::vector<int> descendants(int index) const;

private:
    std::vector<UiNode> nodes_;
};

// Decodes the five predefined entities and numeric character references
std::string xml_unescape(const std::string& s);

} // namespace tapshot::ui
