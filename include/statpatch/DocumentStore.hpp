/**
 * @file DocumentStore.hpp
 * @brief Blob storage interface consumed by ConcurrencyGuard
 *
 * A document store keeps one JSON blob per key and reports an opaque
 * version tag (an ETag) for it. Tags are only ever compared for equality.
 *
 * All three calls may block. Absence is reported through an empty
 * optional; every other failure is thrown as StorageError.
 *
 * The store is created by the composition root and passed in by
 * reference; its lifetime must cover every guard using it.
 */

#ifndef STATPATCH_DOCUMENTSTORE_HPP
#define STATPATCH_DOCUMENTSTORE_HPP

#include "statpatch/Value.hpp"
#include <optional>
#include <string>

namespace statpatch {

struct StoredDocument {
    Value document = Value::object();
    std::optional<std::string> version_tag;
};

struct WriteReceipt {
    std::string version_tag;
    std::optional<std::string> version_id; ///< Content version, when the store keeps versions
};

class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    /**
     * @brief Current version tag of key, without reading the body
     * @return Tag, or nullopt if the blob is absent
     * @throws StorageError on any other failure
     */
    virtual std::optional<std::string> probe(const std::string& key) = 0;

    /**
     * @brief Read and decode the blob at key
     * @return Document and its tag, or nullopt if the blob is absent
     * @throws StorageError on transport failure or an undecodable body
     */
    virtual std::optional<StoredDocument> read_body(const std::string& key) = 0;

    /**
     * @brief Replace the blob at key with the serialized document
     *
     * Unconditional: no comparison against the previous tag is made.
     *
     * @throws StorageError on failure
     */
    virtual WriteReceipt write(const std::string& key, const Value& document) = 0;
};

/**
 * @brief Decode a stored blob into a document
 *
 * An empty or whitespace-only body is the empty object.
 *
 * @throws StorageError if the body is not JSON or not a JSON object
 */
Value decode_document(const std::string& key, const std::string& raw);

/**
 * @brief Serialize a document for storage (compact JSON)
 */
std::string encode_document(const Value& document);

} // namespace statpatch

#endif // STATPATCH_DOCUMENTSTORE_HPP
