#include "statpatch/DocumentStore.hpp"
#include "statpatch/Errors.hpp"
#include "statpatch/Util.hpp"

namespace statpatch {

Value decode_document(const std::string& key, const std::string& raw) {
    if (trim(raw).empty()) {
        return Value::object();
    }

    Value doc;
    try {
        doc = Value::parse(raw);
    } catch (const nlohmann::json::parse_error& e) {
        throw StorageError(key, std::string("stored body is not valid JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        throw StorageError(key, "stored body is " + type_name(doc) + ", expected object");
    }
    return doc;
}

std::string encode_document(const Value& document) {
    return to_compact_json(document);
}

} // namespace statpatch
