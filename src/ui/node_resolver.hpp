#pragma once
// =============================================================================
// NodeResolver - locate one control node in a hierarchy snapshot
// =============================================================================
// Query kinds:
//   PointQuery   smallest-area node whose bounds contain the point
//                (inclusive; ties go to the earlier node in document order)
//   BoundsQuery  exact match on the whitespace-stripped bounds string
//   PathQuery    XPath-like expression, tried through an ordered list of
//                strategies (see path_strategies())
//
// A matched node must carry a parsable bounds attribute.
// =============================================================================

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../result.hpp"
#include "ui_hierarchy.hpp"

namespace tapshot::ui {

struct PointQuery {
    int x = 0;
    int y = 0;
};

struct BoundsQuery {
    std::string bounds;
};

struct PathQuery {
    std::string path;
};

using NodeQuery = std::variant<PointQuery, BoundsQuery, PathQuery>;

std::string describe(const NodeQuery& q);

struct ResolvedNode {
    int index = -1;               // index into UiHierarchy::nodes()
    AttributeMap attrs;
    BoundingRect rect;
    std::string strategy;         // which lookup produced the match
};

// =========================================================================
// Path strategies
// =========================================================================

// A strategy is pure: (snapshot, path) -> node index or nothing.
using PathStrategyFn = std::optional<int> (*)(const UiHierarchy&, const std::string&);

struct PathStrategy {
    const char* name;
    PathStrategyFn fn;
};

// literal -> class_rewrite -> grouped_tail -> manual_scan
const std::vector<PathStrategy>& path_strategies();

// =========================================================================
// XPath subset evaluator
// =========================================================================
// Supports: absolute (/a/b), descendant (//a), relative (a/b, ./a, .//a),
// name tests (tag or *), predicates [n], [@k='v' and @k2="v2"], [@k],
// [contains(@k,'v')], and one outer group "(path)[n]".
// Positional predicates index per parent, as in XPath 1.0; the group index
// applies to the whole node-set.
Result<std::vector<int>> xpath_select(const UiHierarchy& h, const std::string& expr);

// "(inner)[n]" -> "inner[n]"; anything else is returned trimmed
std::string unwrap_grouped_path(const std::string& path);

// Last location step of a path, aware of brackets, quotes and parentheses
std::string last_path_segment(const std::string& path);

// "android.widget.TextView[@text='x'][2]" -> ".//node[@class='android.widget.TextView' and @text='x'][2]"
// Returns nothing for node/hierarchy tags or malformed segments.
std::optional<std::string> rewrite_class_segment(const std::string& segment);

// =========================================================================
// Resolution
// =========================================================================

Result<ResolvedNode> resolve_point(const UiHierarchy& h, int x, int y);
Result<ResolvedNode> resolve_bounds(const UiHierarchy& h, const std::string& bounds);
Result<ResolvedNode> resolve_path(const UiHierarchy& h, const std::string& path);

Result<ResolvedNode> resolve(const UiHierarchy& h, const NodeQuery& query);

} // namespace tapshot::ui
