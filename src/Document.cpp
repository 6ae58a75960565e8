/**
 * @file Document.cpp
 * @brief Implementation of guarded document parsing
 */

#include "jsonops/Document.hpp"
#include "jsonops/Errors.hpp"
#include <algorithm>
#include <cctype>

namespace jsonops {

Value parse_document(std::string_view raw, const std::string& name, const Limits& limits) {
    validate_limits(raw, limits);

    const bool blank = std::all_of(raw.begin(), raw.end(),
                                   [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        throw EmptyInput(name);
    }

    scan_nesting_depth(raw, limits);

    try {
        return Value::parse(raw.begin(), raw.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(name, e.what());
    }
}

} // namespace jsonops
