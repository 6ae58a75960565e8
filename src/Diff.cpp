/**
 * @file Diff.cpp
 * @brief Implementation of structural diff
 */

#include "jsonops/Diff.hpp"
#include "jsonops/PathExpr.hpp"
#include <algorithm>

namespace jsonops {

namespace {

class Differ {
public:
    explicit Differ(std::vector<ChangeRecord>& out) : out_(out) {}

    void compare(const std::string& path, const Value& a, const Value& b) {
        const Kind ka = kind_of(a);
        const Kind kb = kind_of(b);

        if (ka != kb) {
            emit(path, ChangeKind::TypeChanged, &a, &b);
            return;
        }

        switch (ka) {
            case Kind::Null:
                return;
            case Kind::Boolean:
            case Kind::Number:
            case Kind::String:
                if (a != b) {
                    emit(path, ChangeKind::Changed, &a, &b);
                }
                return;
            case Kind::Object:
                compare_objects(path, a, b);
                return;
            case Kind::Array:
                compare_arrays(path, a, b);
                return;
        }
    }

private:
    std::vector<ChangeRecord>& out_;

    void compare_objects(const std::string& path, const Value& a, const Value& b) {
        for (auto it = a.begin(); it != a.end(); ++it) {
            const std::string child = child_path(path, it.key());
            auto other = b.find(it.key());
            if (other == b.end()) {
                emit(child, ChangeKind::Removed, &it.value(), nullptr);
            } else {
                compare(child, it.value(), *other);
            }
        }
        for (auto it = b.begin(); it != b.end(); ++it) {
            if (!a.contains(it.key())) {
                emit(child_path(path, it.key()), ChangeKind::Added, nullptr, &it.value());
            }
        }
    }

    void compare_arrays(const std::string& path, const Value& a, const Value& b) {
        const std::size_t shared = std::min(a.size(), b.size());
        for (std::size_t i = 0; i < shared; ++i) {
            compare(child_path(path, i), a[i], b[i]);
        }
        for (std::size_t i = shared; i < a.size(); ++i) {
            emit(child_path(path, i), ChangeKind::Removed, &a[i], nullptr);
        }
        for (std::size_t i = shared; i < b.size(); ++i) {
            emit(child_path(path, i), ChangeKind::Added, nullptr, &b[i]);
        }
    }

    void emit(std::string path, ChangeKind kind, const Value* old_val, const Value* new_val) {
        ChangeRecord rec;
        rec.path = std::move(path);
        rec.kind = kind;
        if (old_val) rec.old_value = *old_val;
        if (new_val) rec.new_value = *new_val;
        out_.push_back(std::move(rec));
    }
};

} // anonymous namespace

const char* to_string(ChangeKind kind) noexcept {
    switch (kind) {
        case ChangeKind::Added:       return "added";
        case ChangeKind::Removed:     return "removed";
        case ChangeKind::Changed:     return "changed";
        case ChangeKind::TypeChanged: return "type_changed";
    }
    return "unknown";
}

std::vector<ChangeRecord> diff(const Value& first, const Value& second) {
    std::vector<ChangeRecord> records;
    Differ differ(records);
    differ.compare(ROOT_PATH, first, second);
    return records;
}

Value to_json(const ChangeRecord& record) {
    Value out = Value::object();
    out["path"] = record.path;
    out["type"] = to_string(record.kind);

    switch (record.kind) {
        case ChangeKind::Added:
            if (record.new_value) out["value"] = *record.new_value;
            break;
        case ChangeKind::Removed:
            if (record.old_value) out["value"] = *record.old_value;
            break;
        case ChangeKind::TypeChanged:
            if (record.old_value) out["from"] = kind_name(kind_of(*record.old_value));
            if (record.new_value) out["to"] = kind_name(kind_of(*record.new_value));
            [[fallthrough]];
        case ChangeKind::Changed:
            if (record.old_value) out["old_value"] = *record.old_value;
            if (record.new_value) out["new_value"] = *record.new_value;
            break;
    }
    return out;
}

Value to_json(const std::vector<ChangeRecord>& records) {
    Value out = Value::array();
    for (const auto& rec : records) {
        out.push_back(to_json(rec));
    }
    return out;
}

} // namespace jsonops
