#include "jsonops/Util.hpp"
#include <cctype>
#include <cstdlib>
#include <string_view>

#if defined(_WIN32)
  #define JSONOPS_ENVIRON _environ
#else
  extern char **environ;
  #define JSONOPS_ENVIRON environ
#endif

namespace jsonops {

namespace {
    bool is_space(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    // Split "key:value" at the first colon and append it to out
    void add_override(std::string_view item, std::vector<std::pair<std::string, Value>>& out) {
        const auto colon = item.find(':');
        if (colon == std::string_view::npos) return;

        std::string key = trim(std::string(item.substr(0, colon)));
        if (key.empty()) return;
        out.emplace_back(std::move(key), parse_json_or_string(trim(std::string(item.substr(colon + 1)))));
    }
}

Value nest_dotted(const std::string& dotted, Value leaf) {
    Value out = std::move(leaf);
    const auto parts = split(dotted, '.');
    for (std::size_t i = parts.size(); i-- > 0;) {
        Value parent = Value::object();
        parent[parts[i]] = std::move(out);
        out = std::move(parent);
    }
    return out;
}

std::string strip_prefix(const std::string& var_name, const std::string& prefix) {
    if (prefix.empty()) return var_name;

    std::string head = to_lower(prefix);
    if (head.back() != '_') head.push_back('_');
    while (head.size() > 1 && head[head.size() - 2] == '_') head.erase(head.size() - 2, 1);

    if (var_name.size() < head.size() || to_lower(var_name.substr(0, head.size())) != head) {
        return "";
    }
    return var_name.substr(head.size());
}

std::string transform_env_name(const std::string& name) {
    const std::string lowered = to_lower(name);
    std::string out;
    out.reserve(lowered.size());
    for (std::size_t i = 0; i < lowered.size(); ++i) {
        if (lowered[i] != '_') {
            out.push_back(lowered[i]);
        } else if (i + 1 < lowered.size() && lowered[i + 1] == '_') {
            out.push_back('_');
            ++i;
        } else {
            out.push_back('.');
        }
    }
    return out;
}

std::vector<std::pair<std::string, Value>> parse_overrides(const std::string& s) {
    std::vector<std::pair<std::string, Value>> out;
    const std::string_view text(s);

    // Top-level commas separate items; commas inside strings, objects or
    // arrays belong to the value
    int nesting = 0;
    char quote = '\0';
    std::size_t item_start = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (quote != '\0') {
            if (c == '\\') ++i;
            else if (c == quote) quote = '\0';
            continue;
        }
        switch (c) {
            case '"':
            case '\'':
                quote = c;
                break;
            case '{':
            case '[':
                ++nesting;
                break;
            case '}':
            case ']':
                --nesting;
                break;
            case ',':
                if (nesting == 0) {
                    add_override(text.substr(item_start, i - item_start), out);
                    item_start = i + 1;
                }
                break;
            default:
                break;
        }
    }
    if (item_start < text.size()) {
        add_override(text.substr(item_start), out);
    }
    return out;
}

std::vector<std::pair<std::string, std::string>> enumerate_environment() {
    std::vector<std::pair<std::string, std::string>> vars;
    if (JSONOPS_ENVIRON == nullptr) return vars;

    for (char** entry = JSONOPS_ENVIRON; *entry != nullptr; ++entry) {
        const std::string_view line(*entry);
        const auto eq = line.find('=');
        // Windows keeps per-drive entries such as "=C:=C:\\" in the block
        if (eq == std::string_view::npos || eq == 0) continue;
        vars.emplace_back(std::string(line.substr(0, eq)), std::string(line.substr(eq + 1)));
    }
    return vars;
}

Value parse_json_or_string(const std::string& raw) {
    try {
        return Value::parse(raw);
    } catch (const Value::parse_error&) {
        return Value(raw);
    }
}

std::string to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string trim(const std::string& s) {
    std::size_t first = 0;
    std::size_t last = s.size();
    while (first < last && is_space(s[first])) ++first;
    while (last > first && is_space(s[last - 1])) --last;
    return s.substr(first, last - first);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= s.size()) {
        std::size_t end = s.find(delim, start);
        if (end == std::string::npos) end = s.size();
        if (end > start) parts.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

} // namespace jsonops
