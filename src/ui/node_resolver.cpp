// =============================================================================
// NodeResolver - point / bounds / path lookup over a UiHierarchy
// =============================================================================

#include "ui/node_resolver.hpp"
#include "tapshot_log.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

static constexpr const char* TAG = "NodeResolver";

namespace tapshot::ui {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Position of the bracket/paren closing the one opened at `open`, honouring
// quotes and nesting. npos when unbalanced.
size_t findClosing(const std::string& s, size_t open) {
    int depth = 0;
    char quote = 0;
    for (size_t i = open; i < s.size(); ++i) {
        char c = s[i];
        if (quote) {
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '\'' || c == '"') quote = c;
        else if (c == '[' || c == '(') ++depth;
        else if (c == ']' || c == ')') {
            if (--depth == 0) return i;
        }
    }
    return std::string::npos;
}

// Splits "a and b and c" outside of quotes
std::vector<std::string> splitAnd(const std::string& pred) {
    std::vector<std::string> parts;
    char quote = 0;
    size_t start = 0;
    for (size_t i = 0; i < pred.size(); ++i) {
        char c = pred[i];
        if (quote) {
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            continue;
        }
        if (pred.compare(i, 5, " and ") == 0) {
            parts.push_back(trim(pred.substr(start, i - start)));
            start = i + 5;
            i += 4;
        }
    }
    parts.push_back(trim(pred.substr(start)));
    return parts;
}

// name[pred][pred]... -> name + predicate bodies
bool splitStep(const std::string& step, std::string& name, std::vector<std::string>& preds) {
    size_t i = 0;
    while (i < step.size() && step[i] != '[') ++i;
    name = trim(step.substr(0, i));
    preds.clear();
    while (i < step.size()) {
        if (step[i] != '[') {
            if (std::isspace(static_cast<unsigned char>(step[i]))) { ++i; continue; }
            return false;
        }
        size_t close = findClosing(step, i);
        if (close == std::string::npos) return false;
        preds.push_back(trim(step.substr(i + 1, close - i - 1)));
        i = close + 1;
    }
    static const std::regex name_regex(R"([A-Za-z0-9_.:\-]+|\*)");
    return std::regex_match(name, name_regex);
}

// =========================================================================
// Predicate evaluation
// =========================================================================

const std::regex& eqRegex() {
    static const std::regex r(R"re(^@([A-Za-z0-9_:.\-]+)\s*=\s*(['"])(.*)\2$)re");
    return r;
}

Result<std::vector<int>> applyPredicate(const UiHierarchy& h, const std::vector<int>& cand,
                                        const std::string& pred) {
    if (allDigits(pred)) {
        size_t n = 0;
        try {
            n = static_cast<size_t>(std::stoul(pred));
        } catch (const std::exception&) {
            return Err<std::vector<int>>(ErrorKind::Validation, "bad index [" + pred + "]");
        }
        if (n >= 1 && n <= cand.size()) return std::vector<int>{cand[n - 1]};
        return std::vector<int>{};
    }
    if (pred == "last()") {
        if (cand.empty()) return std::vector<int>{};
        return std::vector<int>{cand.back()};
    }

    static const std::regex has_regex(R"re(^@([A-Za-z0-9_:.\-]+)$)re");
    static const std::regex contains_regex(
        R"re(^contains\(\s*@([A-Za-z0-9_:.\-]+)\s*,\s*(['"])(.*)\2\s*\)$)re");

    struct Cond { int kind; std::string attr; std::string value; };  // 0 eq, 1 has, 2 contains
    std::vector<Cond> conds;
    for (const auto& part : splitAnd(pred)) {
        std::smatch m;
        if (std::regex_match(part, m, eqRegex())) conds.push_back({0, m[1], m[3]});
        else if (std::regex_match(part, m, has_regex)) conds.push_back({1, m[1], ""});
        else if (std::regex_match(part, m, contains_regex)) conds.push_back({2, m[1], m[3]});
        else return Err<std::vector<int>>(ErrorKind::Validation, "unsupported predicate [" + part + "]");
    }

    std::vector<int> out;
    for (int idx : cand) {
        const UiNode& n = h.node(idx);
        bool ok = true;
        for (const auto& c : conds) {
            auto it = n.attrs.find(c.attr);
            if (it == n.attrs.end()) { ok = false; break; }
            if (c.kind == 0 && it->second != c.value) { ok = false; break; }
            if (c.kind == 2 && it->second.find(c.value) == std::string::npos) { ok = false; break; }
        }
        if (ok) out.push_back(idx);
    }
    return out;
}

// =========================================================================
// Path evaluation
// =========================================================================

constexpr int DOCUMENT = -1;

struct Step {
    bool descendant = false;
    std::string name;
    std::vector<std::string> preds;
};

std::vector<int> childrenOf(const UiHierarchy& h, int ctx) {
    if (ctx != DOCUMENT) return h.node(ctx).children;
    std::vector<int> top;
    for (size_t i = 0; i < h.nodes().size(); ++i) {
        if (h.nodes()[i].parent < 0) top.push_back(static_cast<int>(i));
    }
    return top;
}

std::vector<int> descendantOrSelf(const UiHierarchy& h, int ctx) {
    std::vector<int> out{ctx};
    if (ctx == DOCUMENT) {
        for (size_t i = 0; i < h.nodes().size(); ++i) out.push_back(static_cast<int>(i));
    } else {
        auto d = h.descendants(ctx);
        out.insert(out.end(), d.begin(), d.end());
    }
    return out;
}

Result<std::vector<Step>> parseSteps(const std::string& path, int& start_ctx) {
    std::vector<Step> steps;
    size_t i = 0;
    start_ctx = 0;  // root element
    if (path.compare(0, 1, "/") == 0) {
        start_ctx = DOCUMENT;
    } else if (path.compare(0, 2, "./") == 0) {
        i = 1;
    }

    bool first = true;
    while (i < path.size()) {
        Step step;
        if (path.compare(i, 2, "//") == 0) {
            step.descendant = true;
            i += 2;
        } else if (path[i] == '/') {
            i += 1;
        } else if (!first) {
            return Err<std::vector<Step>>(ErrorKind::Validation, "expected '/' in " + path);
        }
        first = false;

        // Step runs to the next '/' outside brackets and quotes
        size_t end = i;
        while (end < path.size() && path[end] != '/') {
            if (path[end] == '[') {
                size_t close = findClosing(path, end);
                if (close == std::string::npos) {
                    return Err<std::vector<Step>>(ErrorKind::Validation, "unbalanced '[' in " + path);
                }
                end = close + 1;
            } else {
                ++end;
            }
        }
        if (!splitStep(path.substr(i, end - i), step.name, step.preds)) {
            return Err<std::vector<Step>>(ErrorKind::Validation,
                                          "bad step '" + path.substr(i, end - i) + "'");
        }
        steps.push_back(std::move(step));
        i = end;
    }
    if (steps.empty()) return Err<std::vector<Step>>(ErrorKind::Validation, "empty path");
    return steps;
}

Result<std::vector<int>> evaluatePath(const UiHierarchy& h, const std::string& path) {
    int start_ctx = 0;
    auto steps = parseSteps(path, start_ctx);
    if (steps.is_err()) return steps.error();

    std::vector<int> ctx{start_ctx};
    for (const auto& step : steps.value()) {
        std::vector<int> out;
        for (int c : ctx) {
            std::vector<int> bases = step.descendant ? descendantOrSelf(h, c) : std::vector<int>{c};
            for (int b : bases) {
                std::vector<int> cand;
                for (int ch : childrenOf(h, b)) {
                    if (step.name == "*" || h.node(ch).tag == step.name) cand.push_back(ch);
                }
                for (const auto& pred : step.preds) {
                    auto filtered = applyPredicate(h, cand, pred);
                    if (filtered.is_err()) return filtered.error();
                    cand = std::move(filtered.value());
                }
                out.insert(out.end(), cand.begin(), cand.end());
            }
        }
        std::sort(out.begin(), out.end());
        out.erase(std::unique(out.begin(), out.end()), out.end());
        ctx = std::move(out);
        if (ctx.empty()) break;
    }
    return ctx;
}

std::optional<int> firstOf(const UiHierarchy& h, const std::string& expr, const char* stage) {
    auto r = xpath_select(h, expr);
    if (r.is_err()) {
        TLOG_DEBUG(TAG, "%s: %s", stage, r.error().message.c_str());
        return std::nullopt;
    }
    if (r.value().empty()) return std::nullopt;
    return r.value().front();
}

// =========================================================================
// Strategies (ordered, first match wins)
// =========================================================================

std::optional<int> literalStrategy(const UiHierarchy& h, const std::string& path) {
    return firstOf(h, path, "literal");
}

std::optional<int> classRewriteStrategy(const UiHierarchy& h, const std::string& path) {
    auto rewritten = rewrite_class_segment(last_path_segment(unwrap_grouped_path(path)));
    if (!rewritten) return std::nullopt;
    return firstOf(h, *rewritten, "class_rewrite");
}

std::optional<int> groupedTailStrategy(const UiHierarchy& h, const std::string& path) {
    if (path.find('(') == std::string::npos && path.find("//android.") == std::string::npos) {
        return std::nullopt;
    }
    std::string tail = unwrap_grouped_path(last_path_segment(path));
    if (tail.find('/') != std::string::npos) tail = last_path_segment(tail);
    if (tail.empty()) return std::nullopt;

    auto rewritten = rewrite_class_segment(tail);
    return firstOf(h, rewritten ? *rewritten : ".//" + tail, "grouped_tail");
}

std::optional<int> manualScanStrategy(const UiHierarchy& h, const std::string& path) {
    std::string last = unwrap_grouped_path(last_path_segment(unwrap_grouped_path(path)));
    std::string tag;
    std::vector<std::string> preds;
    if (!splitStep(last, tag, preds)) return std::nullopt;

    std::vector<std::pair<std::string, std::string>> conds;
    std::optional<size_t> index;
    for (const auto& p : preds) {
        if (allDigits(p)) {
            try {
                index = static_cast<size_t>(std::stoul(p));
            } catch (const std::exception&) {
                index.reset();
            }
            continue;
        }
        // Unsupported conditions are skipped at this stage
        for (const auto& part : splitAnd(p)) {
            std::smatch m;
            if (std::regex_match(part, m, eqRegex())) conds.emplace_back(m[1], m[3]);
        }
    }

    std::string ltag = lower(tag);
    bool any_class = ltag == "node" || ltag == "hierarchy" || tag == "*";

    std::vector<int> matches;
    for (int idx : h.control_nodes()) {
        const UiNode& n = h.node(idx);
        if (!any_class && n.attr("class") != tag) continue;
        bool ok = true;
        for (const auto& kv : conds) {
            auto it = n.attrs.find(kv.first);
            if (it == n.attrs.end() || it->second != kv.second) { ok = false; break; }
        }
        if (ok) matches.push_back(idx);
    }
    if (matches.empty()) return std::nullopt;
    if (index && *index >= 1 && *index <= matches.size()) return matches[*index - 1];
    return matches.front();
}

Result<ResolvedNode> finish(const UiHierarchy& h, int index, const std::string& strategy) {
    const UiNode& n = h.node(index);
    auto rect = n.bounds();
    if (!rect) {
        return Err<ResolvedNode>(ErrorKind::Resolution, "matched node has no usable bounds");
    }
    ResolvedNode r;
    r.index = index;
    r.attrs = n.attrs;
    r.rect = *rect;
    r.strategy = strategy;
    return r;
}

} // namespace

// =============================================================================
// Public helpers
// =============================================================================

std::string describe(const NodeQuery& q) {
    if (auto p = std::get_if<PointQuery>(&q)) {
        return "point(" + std::to_string(p->x) + "," + std::to_string(p->y) + ")";
    }
    if (auto b = std::get_if<BoundsQuery>(&q)) return "bounds " + b->bounds;
    return "path " + std::get<PathQuery>(q).path;
}

std::string unwrap_grouped_path(const std::string& path) {
    std::string p = trim(path);
    if (p.empty() || p[0] != '(') return p;
    size_t close = findClosing(p, 0);
    if (close == std::string::npos) return p;

    std::string inner = trim(p.substr(1, close - 1));
    std::string rest = trim(p.substr(close + 1));
    static const std::regex index_regex(R"(\[\s*\d+\s*\])");
    if (!rest.empty() && !std::regex_match(rest, index_regex)) return p;
    return inner + rest;
}

std::string last_path_segment(const std::string& path) {
    std::string p = trim(path);
    size_t last = std::string::npos;
    int depth = 0;
    char quote = 0;
    for (size_t i = 0; i < p.size(); ++i) {
        char c = p[i];
        if (quote) {
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '\'' || c == '"') quote = c;
        else if (c == '[' || c == '(') ++depth;
        else if (c == ']' || c == ')') --depth;
        else if (c == '/' && depth == 0) last = i;
    }
    return last == std::string::npos ? p : p.substr(last + 1);
}

std::optional<std::string> rewrite_class_segment(const std::string& segment) {
    std::string tag;
    std::vector<std::string> preds;
    if (!splitStep(trim(segment), tag, preds)) return std::nullopt;
    std::string ltag = lower(tag);
    if (ltag == "node" || ltag == "hierarchy" || tag == "*") return std::nullopt;

    std::string conds = "@class='" + tag + "'";
    std::string index_part;
    for (const auto& p : preds) {
        if (allDigits(p)) index_part += "[" + p + "]";
        else conds += " and " + p;
    }
    return ".//node[" + conds + "]" + index_part;
}

Result<std::vector<int>> xpath_select(const UiHierarchy& h, const std::string& expr) {
    std::string e = trim(expr);
    if (e.empty()) return Err<std::vector<int>>(ErrorKind::Validation, "empty path");
    if (h.empty()) return std::vector<int>{};

    if (e[0] != '(') return evaluatePath(h, e);

    size_t close = findClosing(e, 0);
    if (close == std::string::npos) {
        return Err<std::vector<int>>(ErrorKind::Validation, "unbalanced '(' in " + e);
    }
    auto inner = evaluatePath(h, trim(e.substr(1, close - 1)));
    if (inner.is_err()) return inner;

    std::string rest = trim(e.substr(close + 1));
    if (rest.empty()) return inner;
    static const std::regex index_regex(R"(\[\s*(\d+)\s*\])");
    std::smatch m;
    if (!std::regex_match(rest, m, index_regex)) {
        return Err<std::vector<int>>(ErrorKind::Validation, "unsupported group suffix " + rest);
    }
    size_t n = 0;
    try {
        n = static_cast<size_t>(std::stoul(m[1].str()));
    } catch (const std::exception&) {
        return Err<std::vector<int>>(ErrorKind::Validation, "bad group index " + rest);
    }
    const auto& set = inner.value();
    if (n >= 1 && n <= set.size()) return std::vector<int>{set[n - 1]};
    return std::vector<int>{};
}

const std::vector<PathStrategy>& path_strategies() {
    // Order reflects observed query shapes, not a proven precedence
    static const std::vector<PathStrategy> strategies = {
        {"literal", &literalStrategy},
        {"class_rewrite", &classRewriteStrategy},
        {"grouped_tail", &groupedTailStrategy},
        {"manual_scan", &manualScanStrategy},
    };
    return strategies;
}

// =============================================================================
// Resolution
// =============================================================================

Result<ResolvedNode> resolve_point(const UiHierarchy& h, int x, int y) {
    int best = -1;
    long long best_area = 0;
    for (size_t i = 0; i < h.nodes().size(); ++i) {
        auto rect = h.nodes()[i].bounds();
        if (!rect || !rect->contains(x, y)) continue;
        if (best < 0 || rect->area() < best_area) {
            best = static_cast<int>(i);
            best_area = rect->area();
        }
    }
    if (best < 0) {
        return Err<ResolvedNode>(ErrorKind::Resolution,
                                 "no node contains point (" + std::to_string(x) + "," + std::to_string(y) + ")");
    }
    return finish(h, best, "point");
}

Result<ResolvedNode> resolve_bounds(const UiHierarchy& h, const std::string& bounds) {
    std::string wanted = normalize_bounds(bounds);
    for (size_t i = 0; i < h.nodes().size(); ++i) {
        auto it = h.nodes()[i].attrs.find("bounds");
        if (it != h.nodes()[i].attrs.end() && it->second == wanted) {
            return finish(h, static_cast<int>(i), "bounds");
        }
    }
    return Err<ResolvedNode>(ErrorKind::Resolution, "bounds not found in current XML: " + wanted);
}

// A strategy whose match has no usable bounds does not end the chain; the
// next strategy gets its turn.
Result<ResolvedNode> resolve_path(const UiHierarchy& h, const std::string& path) {
    std::optional<Error> unusable;
    for (const auto& s : path_strategies()) {
        auto idx = s.fn(h, path);
        if (!idx) continue;

        auto resolved = finish(h, *idx, s.name);
        if (resolved.is_ok()) {
            TLOG_DEBUG(TAG, "path matched by %s: %s", s.name, path.c_str());
            return resolved;
        }
        TLOG_DEBUG(TAG, "%s matched node %d without bounds, trying next strategy", s.name, *idx);
        if (!unusable) unusable = resolved.error();
    }
    if (unusable) return *unusable;
    return Err<ResolvedNode>(ErrorKind::Resolution, "xpath not found in current XML: " + path);
}

Result<ResolvedNode> resolve(const UiHierarchy& h, const NodeQuery& query) {
    if (auto p = std::get_if<PointQuery>(&query)) return resolve_point(h, p->x, p->y);
    if (auto b = std::get_if<BoundsQuery>(&query)) return resolve_bounds(h, b->bounds);
    return resolve_path(h, std::get<PathQuery>(query).path);
}

} // namespace tapshot::ui
