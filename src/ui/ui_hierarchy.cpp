// =============================================================================
// UiHierarchy - uiautomator XML dump parsing
// =============================================================================

#include "ui/ui_hierarchy.hpp"
#include "tapshot_log.hpp"

#include <cctype>
#include <regex>

static constexpr const char* TAG = "UiHierarchy";

namespace tapshot::ui {

namespace {

const std::string& emptyString() {
    static const std::string empty;
    return empty;
}

void appendUtf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Finds the '>' closing a tag that starts at `pos`, skipping quoted values.
size_t findTagEnd(const std::string& xml, size_t pos) {
    char quote = 0;
    for (size_t i = pos; i < xml.size(); ++i) {
        char c = xml[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '>') {
            return i;
        }
    }
    return std::string::npos;
}

} // namespace

// =============================================================================
// BoundingRect
// =============================================================================

std::string BoundingRect::str() const {
    return "[" + std::to_string(x1) + "," + std::to_string(y1) + "][" +
           std::to_string(x2) + "," + std::to_string(y2) + "]";
}

std::optional<BoundingRect> parse_bounds(const std::string& bounds) {
    // Format: [x1,y1][x2,y2]
    static const std::regex bounds_regex(R"(\[(-?\d+),(-?\d+)\]\[(-?\d+),(-?\d+)\])");
    std::smatch match;

    if (!std::regex_match(bounds, match, bounds_regex)) return std::nullopt;
    try {
        BoundingRect r;
        r.x1 = std::stoi(match[1]);
        r.y1 = std::stoi(match[2]);
        r.x2 = std::stoi(match[3]);
        r.y2 = std::stoi(match[4]);
        if (r.x2 < r.x1 || r.y2 < r.y1) return std::nullopt;
        return r;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string normalize_bounds(const std::string& bounds) {
    std::string out;
    out.reserve(bounds.size());
    for (char c : bounds) {
        if (!std::isspace(static_cast<unsigned char>(c))) out += c;
    }
    return out;
}

// =============================================================================
// XML helpers
// =============================================================================

std::string xml_unescape(const std::string& s) {
    if (s.find('&') == std::string::npos) return s;

    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '&') { out += s[i]; continue; }
        size_t semi = s.find(';', i);
        if (semi == std::string::npos || semi - i > 10) { out += s[i]; continue; }

        std::string ent = s.substr(i + 1, semi - i - 1);
        if (ent == "amp") out += '&';
        else if (ent == "lt") out += '<';
        else if (ent == "gt") out += '>';
        else if (ent == "quot") out += '"';
        else if (ent == "apos") out += '\'';
        else if (ent.size() > 1 && ent[0] == '#') {
            try {
                unsigned long cp = (ent[1] == 'x' || ent[1] == 'X')
                    ? std::stoul(ent.substr(2), nullptr, 16)
                    : std::stoul(ent.substr(1), nullptr, 10);
                appendUtf8(out, cp);
            } catch (const std::exception&) {
                out += s.substr(i, semi - i + 1);
            }
        } else {
            out += s.substr(i, semi - i + 1);
        }
        i = semi;
    }
    return out;
}

// =============================================================================
// UiNode
// =============================================================================

const std::string& UiNode::attr(const std::string& name) const {
    auto it = attrs.find(name);
    return it == attrs.end() ? emptyString() : it->second;
}

std::optional<BoundingRect> UiNode::bounds() const {
    auto it = attrs.find("bounds");
    if (it == attrs.end()) return std::nullopt;
    return parse_bounds(it->second);
}

// =============================================================================
// UiHierarchy
// =============================================================================

Result<UiHierarchy> UiHierarchy::parse(const std::string& xml) {
    static const std::regex attr_regex(R"_(([a-zA-Z0-9_:.-]+)\s*=\s*"([^"]*)")_");

    UiHierarchy h;
    std::vector<int> stack;
    size_t pos = 0;

    while ((pos = xml.find('<', pos)) != std::string::npos) {
        if (xml.compare(pos, 4, "<!--") == 0) {
            size_t end = xml.find("-->", pos + 4);
            if (end == std::string::npos) break;
            pos = end + 3;
            continue;
        }
        if (xml.compare(pos, 2, "<?") == 0) {
            size_t end = xml.find("?>", pos + 2);
            if (end == std::string::npos) break;
            pos = end + 2;
            continue;
        }
        if (xml.compare(pos, 2, "<!") == 0) {
            size_t end = xml.find('>', pos);
            if (end == std::string::npos) break;
            pos = end + 1;
            continue;
        }

        size_t end = findTagEnd(xml, pos + 1);
        if (end == std::string::npos) {
            return Err<UiHierarchy>(ErrorKind::Capture, "unterminated tag at offset " + std::to_string(pos));
        }

        if (xml[pos + 1] == '/') {
            std::string name = xml.substr(pos + 2, end - pos - 2);
            while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back()))) name.pop_back();
            if (stack.empty() || h.nodes_[static_cast<size_t>(stack.back())].tag != name) {
                return Err<UiHierarchy>(ErrorKind::Capture, "mismatched closing tag </" + name + ">");
            }
            stack.pop_back();
            pos = end + 1;
            continue;
        }

        bool self_closing = xml[end - 1] == '/';
        size_t body_end = self_closing ? end - 1 : end;
        size_t name_end = pos + 1;
        while (name_end < body_end && !std::isspace(static_cast<unsigned char>(xml[name_end]))) ++name_end;

        UiNode node;
        node.tag = xml.substr(pos + 1, name_end - pos - 1);
        node.parent = stack.empty() ? -1 : stack.back();

        std::string attrs = xml.substr(name_end, body_end - name_end);
        auto attr_begin = std::sregex_iterator(attrs.begin(), attrs.end(), attr_regex);
        for (auto it = attr_begin; it != std::sregex_iterator(); ++it) {
            node.attrs[(*it)[1]] = xml_unescape((*it)[2]);
        }

        int index = static_cast<int>(h.nodes_.size());
        if (node.parent >= 0) h.nodes_[static_cast<size_t>(node.parent)].children.push_back(index);
        h.nodes_.push_back(std::move(node));
        if (!self_closing) stack.push_back(index);

        pos = end + 1;
    }

    if (!stack.empty()) {
        return Err<UiHierarchy>(ErrorKind::Capture,
                                "unclosed element <" + h.nodes_[static_cast<size_t>(stack.back())].tag + ">");
    }
    if (h.nodes_.empty()) {
        return Err<UiHierarchy>(ErrorKind::Capture, "hierarchy has no elements");
    }

    TLOG_TRACE(TAG, "Parsed %zu elements", h.nodes_.size());
    return h;
}

std::vector<int> UiHierarchy::control_nodes() const {
    std::vector<int> out;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (nodes_[i].tag == "node") out.push_back(static_cast<int>(i));
    }
    return out;
}

std::vector<int> UiHierarchy::descendants(int index) const {
    std::vector<int> out;
    std::vector<int> stack(node(index).children.rbegin(), node(index).children.rend());
    while (!stack.empty()) {
        int n = stack.back();
        stack.pop_back();
        out.push_back(n);
        const auto& ch = node(n).children;
        for (auto it = ch.rbegin(); it != ch.rend(); ++it) stack.push_back(*it);
    }
    return out;
}

} // namespace tapshot::ui
