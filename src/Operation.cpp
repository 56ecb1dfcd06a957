/**
 * @file Operation.cpp
 * @brief Parsing and application of patch operations
 */

#include "statpatch/Operation.hpp"
#include "statpatch/Merge.hpp"
#include "statpatch/Errors.hpp"
#include <cstdint>
#include <limits>

namespace statpatch {

namespace {
    Value* slot_of(const ParentRef& ref) {
        Value& parent = *ref.parent;
        if (ref.last.is_index()) {
            return ref.last.index < parent.size() ? &parent[ref.last.index] : nullptr;
        }
        auto it = parent.find(ref.last.text);
        return it == parent.end() ? nullptr : &*it;
    }

    void assign(const ParentRef& ref, Value value) {
        Value& parent = *ref.parent;
        if (ref.last.is_index()) {
            while (parent.size() <= ref.last.index) {
                parent.push_back(nullptr);
            }
            parent[ref.last.index] = std::move(value);
        } else {
            parent[ref.last.text] = std::move(value);
        }
    }

    bool fits_int64(const Value& v) {
        return !v.is_number_unsigned() ||
               v.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    }

    struct Applier {
        Value& doc;
        const ResolveOptions& options;

        ParentRef resolve(const Path& path) const {
            return resolve_parent(doc, path, true, options);
        }

        void operator()(const SetOp& op) const {
            assign(resolve(op.path), op.value);
        }

        void operator()(const IncOp& op) const {
            const ParentRef ref = resolve(op.path);
            const Value* current = slot_of(ref);
            if (current == nullptr || current->is_null()) {
                assign(ref, add_numbers(0, op.by));
                return;
            }
            if (!current->is_number()) {
                throw ValidationError("inc target is not numeric");
            }
            assign(ref, add_numbers(*current, op.by));
        }

        void operator()(const DeleteOp& op) const {
            const ParentRef ref = resolve(op.path);
            Value& parent = *ref.parent;
            if (ref.last.is_index()) {
                if (ref.last.index < parent.size()) {
                    parent.erase(ref.last.index);
                }
            } else {
                parent.erase(ref.last.text);
            }
        }

        void operator()(const MergeOp& op) const {
            const ParentRef ref = resolve(op.path);
            Value* current = slot_of(ref);
            if (current != nullptr && current->is_object()) {
                deep_merge_into(*current, op.value);
            } else {
                assign(ref, op.value);
            }
        }

        void operator()(const AppendOp& op) const {
            const ParentRef ref = resolve(op.path);
            Value* current = slot_of(ref);
            if (current == nullptr || current->is_null()) {
                assign(ref, Value::array({op.value}));
            } else if (current->is_array()) {
                current->push_back(op.value);
            } else {
                assign(ref, Value::array({*current, op.value}));
            }
        }
    };

    Path required_path(const Value& raw) {
        auto it = raw.find("path");
        if (it == raw.end() || !it->is_string()) {
            throw ValidationError("Missing or invalid path");
        }
        return parse_path(it->get<std::string>());
    }
}

Value add_numbers(const Value& a, const Value& b) {
    if (a.is_number_float() || b.is_number_float() || !fits_int64(a) || !fits_int64(b)) {
        return a.get<double>() + b.get<double>();
    }

    const auto x = a.get<std::int64_t>();
    const auto y = b.get<std::int64_t>();
    if ((y > 0 && x > std::numeric_limits<std::int64_t>::max() - y) ||
        (y < 0 && x < std::numeric_limits<std::int64_t>::min() - y)) {
        return static_cast<double>(x) + static_cast<double>(y);
    }
    return x + y;
}

Operation parse_operation(const Value& raw) {
    if (!raw.is_object()) {
        throw ValidationError("Each op must be an object");
    }

    auto kind_it = raw.find("op");
    const std::string kind = (kind_it != raw.end() && kind_it->is_string())
        ? kind_it->get<std::string>()
        : (kind_it == raw.end() ? std::string("null") : kind_it->dump());

    if (kind != "set" && kind != "inc" && kind != "delete" &&
        kind != "merge" && kind != "append") {
        throw ValidationError("Unknown op: " + kind);
    }

    Path path = required_path(raw);
    auto value_it = raw.find("value");

    if (kind == "set") {
        if (value_it == raw.end()) {
            throw ValidationError("set op requires 'value'");
        }
        return SetOp{std::move(path), *value_it};
    }

    if (kind == "inc") {
        IncOp op{std::move(path)};
        auto by_it = raw.find("by");
        if (by_it != raw.end()) {
            if (!by_it->is_number()) {
                throw ValidationError("inc 'by' must be a number");
            }
            op.by = *by_it;
        }
        return op;
    }

    if (kind == "delete") {
        return DeleteOp{std::move(path)};
    }

    if (kind == "merge") {
        if (value_it == raw.end() || !value_it->is_object()) {
            throw ValidationError("merge 'value' must be an object");
        }
        return MergeOp{std::move(path), *value_it};
    }

    if (value_it == raw.end()) {
        throw ValidationError("append op requires 'value'");
    }
    return AppendOp{std::move(path), *value_it};
}

void apply_operation(Value& doc, const Operation& op, const ResolveOptions& options) {
    std::visit(Applier{doc, options}, op);
}

} // namespace statpatch
