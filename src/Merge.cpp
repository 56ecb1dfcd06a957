/**
 * @file Merge.cpp
 * @brief Implementation of deep merge
 */

#include "statpatch/Merge.hpp"

namespace statpatch {

void deep_merge_into(Value& dst, const Value& src) {
    if (!dst.is_object() || !src.is_object()) {
        dst = src;
        return;
    }

    for (auto it = src.begin(); it != src.end(); ++it) {
        const auto& key = it.key();
        const auto& incoming = it.value();

        auto existing = dst.find(key);
        if (existing != dst.end() && existing->is_object() && incoming.is_object()) {
            deep_merge_into(*existing, incoming);
        } else {
            dst[key] = incoming;
        }
    }
}

Value deep_merge(const Value& base, const Value& override_val) {
    Value result = base;
    deep_merge_into(result, override_val);
    return result;
}

} // namespace statpatch
