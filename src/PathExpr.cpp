/**
 * @file PathExpr.cpp
 * @brief Implementation of path expression parsing and resolution
 */

#include "jsonops/PathExpr.hpp"
#include "jsonops/Util.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace jsonops {

namespace {
    bool is_digits(const std::string& s) {
        return !s.empty() &&
               std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    bool is_delimiter(char c) {
        return c == '.' || c == '[' || c == ']';
    }

    /**
     * @brief Parse the digits of a bracket index
     * @pre is_digits(digits)
     * @throws InvalidPathSyntax if the number does not fit in size_t
     */
    std::size_t parse_index(const std::string& expr, std::size_t pos, const std::string& digits) {
        constexpr std::size_t max = std::numeric_limits<std::size_t>::max();
        std::size_t n = 0;
        for (char c : digits) {
            const auto d = static_cast<std::size_t>(c - '0');
            if (n > (max - d) / 10) {
                throw InvalidPathSyntax(expr, pos, "index too large");
            }
            n = n * 10 + d;
        }
        return n;
    }

    std::vector<std::string> keys_of(const Value& obj) {
        std::vector<std::string> keys;
        keys.reserve(obj.size());
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            keys.push_back(it.key());
        }
        return keys;
    }

    /**
     * @brief Apply one Key or Index segment
     * @param location Canonical path of `current`; advanced on success
     */
    const Value& step(const Value& current, const Segment& seg, std::string& location) {
        if (seg.type == Segment::Type::Key) {
            if (!current.is_object()) {
                throw TypeMismatch(location, "object", type_name(current));
            }
            auto it = current.find(seg.key);
            if (it == current.end()) {
                throw KeyNotFound(location, seg.key, keys_of(current));
            }
            location = child_path(location, seg.key);
            return *it;
        }

        if (!current.is_array()) {
            throw TypeMismatch(location, "array", type_name(current));
        }
        if (seg.index >= current.size()) {
            throw IndexOutOfRange(location, seg.index, current.size());
        }
        location = child_path(location, seg.index);
        return current[seg.index];
    }

    Value resolve_from(const Value& current, const PathExpression& path,
                       std::size_t first, std::string location) {
        const Value* cur = &current;
        for (std::size_t i = first; i < path.size(); ++i) {
            const auto& seg = path[i];
            if (seg.type != Segment::Type::Wildcard) {
                cur = &step(*cur, seg, location);
                continue;
            }

            if (!cur->is_array()) {
                throw TypeMismatch(location, "array", type_name(*cur));
            }
            Value out = Value::array();
            for (std::size_t idx = 0; idx < cur->size(); ++idx) {
                out.push_back(resolve_from((*cur)[idx], path, i + 1, child_path(location, idx)));
            }
            return out;
        }
        return *cur;
    }
}

PathExpression parse_path(const std::string& expression) {
    const std::string expr = trim(expression);
    if (expr.empty()) {
        throw InvalidPathSyntax(expr, 0, "empty expression");
    }

    PathExpression segments;
    const std::size_t n = expr.size();
    std::size_t pos = 0;
    bool first = true;

    while (true) {
        // Identifier, optional only for a bare bracket group at the root
        if (!(first && expr[pos] == '[')) {
            const std::size_t start = pos;
            while (pos < n && !is_delimiter(expr[pos])) ++pos;
            if (pos == start) {
                if (pos < n && expr[pos] == ']') {
                    throw InvalidPathSyntax(expr, pos, "unmatched ']'");
                }
                throw InvalidPathSyntax(expr, pos, "empty segment");
            }
            std::string name = expr.substr(start, pos - start);
            if (first && is_digits(name)) {
                throw InvalidPathSyntax(expr, start, "expression cannot start with a bare index");
            }
            segments.push_back(Segment::make_key(std::move(name)));
        }

        while (pos < n && expr[pos] == '[') {
            const std::size_t close = expr.find(']', pos + 1);
            if (close == std::string::npos) {
                throw InvalidPathSyntax(expr, pos, "unmatched '['");
            }
            const std::string inner = expr.substr(pos + 1, close - pos - 1);
            if (inner == "*") {
                segments.push_back(Segment::make_wildcard());
            } else if (inner.empty()) {
                throw InvalidPathSyntax(expr, pos, "empty index");
            } else if (!is_digits(inner)) {
                throw InvalidPathSyntax(expr, pos + 1, "non-numeric index '" + inner + "'");
            } else {
                segments.push_back(Segment::make_index(parse_index(expr, pos + 1, inner)));
            }
            pos = close + 1;
        }

        first = false;
        if (pos == n) {
            break;
        }
        if (expr[pos] == '.') {
            ++pos;
            if (pos == n) {
                throw InvalidPathSyntax(expr, pos, "empty segment");
            }
            continue;
        }
        if (expr[pos] == ']') {
            throw InvalidPathSyntax(expr, pos, "unmatched ']'");
        }
        throw InvalidPathSyntax(expr, pos, "expected '.' or '[' after ']'");
    }

    return segments;
}

std::string render_path(const PathExpression& path) {
    std::string out = ROOT_PATH;
    for (const auto& seg : path) {
        switch (seg.type) {
            case Segment::Type::Key:
                out = child_path(out, seg.key);
                break;
            case Segment::Type::Index:
                out = child_path(out, seg.index);
                break;
            case Segment::Type::Wildcard:
                out += "[*]";
                break;
        }
    }
    return out;
}

std::string child_path(const std::string& parent, const std::string& key) {
    std::string out;
    out.reserve(parent.size() + key.size() + 1);
    out += parent;
    out += '.';
    out += key;
    return out;
}

std::string child_path(const std::string& parent, std::size_t index) {
    return parent + "[" + std::to_string(index) + "]";
}

Value resolve(const Value& root, const std::string& expression) {
    return resolve(root, parse_path(expression));
}

Value resolve(const Value& root, const PathExpression& path) {
    return resolve_from(root, path, 0, ROOT_PATH);
}

const Value* resolve_ptr(const Value& root, const std::string& expression) {
    const auto path = parse_path(expression);
    std::string location = ROOT_PATH;
    const Value* current = &root;

    for (const auto& seg : path) {
        if (seg.type == Segment::Type::Wildcard) {
            throw InvalidArgument("Wildcard paths cannot be resolved in place: " + expression);
        }
        current = &step(*current, seg, location);
    }
    return current;
}

bool contains_path(const Value& root, const std::string& expression) {
    const auto path = parse_path(expression);
    try {
        (void)resolve(root, path);
        return true;
    } catch (const KeyNotFound&) {
        return false;
    } catch (const IndexOutOfRange&) {
        return false;
    }
}

} // namespace jsonops
