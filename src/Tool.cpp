/**
 * @file Tool.cpp
 * @brief Implementation of the response-producing wrappers
 */

#include "jsonops/Tool.hpp"
#include "jsonops/Diff.hpp"
#include "jsonops/Document.hpp"
#include "jsonops/Errors.hpp"
#include "jsonops/Format.hpp"
#include "jsonops/Merge.hpp"
#include "jsonops/PathExpr.hpp"
#include "jsonops/Settings.hpp"
#include "jsonops/Util.hpp"

namespace jsonops {
namespace tool {

Value error_response(const std::string& message) {
    Value out = Value::object();
    out["error"] = message;
    return out;
}

bool is_error(const Value& response) {
    return response.is_object() && response.contains("error");
}

Value transform(const std::string& data, const std::string& expression, const Limits& limits) {
    try {
        const Value parsed = parse_document(data, "data", limits);

        if (trim(expression).empty()) {
            return error_response("expression cannot be empty");
        }

        Value result = resolve(parsed, expression);

        Value out = Value::object();
        out["success"] = true;
        out["expression"] = expression;
        out["result_type"] = type_name(result);
        out["result"] = std::move(result);
        return out;
    } catch (const Error& e) {
        return error_response(e.what());
    }
}

Value merge(const std::string& base, const std::string& override_text, const Limits& limits) {
    try {
        const Value base_obj = parse_document(base, "base", limits);
        const Value override_obj = parse_document(override_text, "override", limits);

        if (!base_obj.is_object()) {
            return error_response("base must be a JSON object");
        }
        if (!override_obj.is_object()) {
            return error_response("override must be a JSON object");
        }

        Value out = Value::object();
        out["success"] = true;
        out["result"] = deep_merge(base_obj, override_obj);
        return out;
    } catch (const Error& e) {
        return error_response(e.what());
    }
}

Value diff(const std::string& first, const std::string& second, const Limits& limits) {
    try {
        const Value first_obj = parse_document(first, "first", limits);
        const Value second_obj = parse_document(second, "second", limits);

        const auto records = jsonops::diff(first_obj, second_obj);

        Value out = Value::object();
        out["equal"] = records.empty();
        out["differences"] = to_json(records);
        out["difference_count"] = records.size();
        return out;
    } catch (const Error& e) {
        return error_response(e.what());
    }
}

Value format(const std::string& data, int indent, bool sort_keys, const Limits& limits) {
    try {
        const Value parsed = parse_document(data, "data", limits);

        if (indent < 0 || indent > MAX_INDENT) {
            return error_response("indent must be 0-" + std::to_string(MAX_INDENT));
        }

        Value out = Value::object();
        out["success"] = true;
        out["result"] = jsonops::format(parsed, indent, sort_keys);
        out["minified"] = indent == 0;
        return out;
    } catch (const Error& e) {
        return error_response(e.what());
    }
}

} // namespace tool
} // namespace jsonops
