/**
 * @file MemoryDocumentStore.hpp
 * @brief In-process DocumentStore
 *
 * Keeps serialized blobs in a map. Tags are content digests
 * (see content_tag()). With versioning enabled every write is assigned
 * the next id of a counter starting at "1".
 *
 * Calls are counted and a failure can be armed for the next call of a
 * given kind, which is what the guard and handler tests drive.
 */

#ifndef STATPATCH_MEMORYDOCUMENTSTORE_HPP
#define STATPATCH_MEMORYDOCUMENTSTORE_HPP

#include "statpatch/DocumentStore.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>

namespace statpatch {

class MemoryDocumentStore : public DocumentStore {
public:
    enum class Call { Probe, Read, Write };

    explicit MemoryDocumentStore(bool versioned = false) : versioned_(versioned) {}

    std::optional<std::string> probe(const std::string& key) override;
    std::optional<StoredDocument> read_body(const std::string& key) override;
    WriteReceipt write(const std::string& key, const Value& document) override;

    // Store raw bytes under key, bypassing encoding. Returns the new tag.
    std::string put_raw(const std::string& key, std::string content);

    // Raw bytes under key, if any.
    std::optional<std::string> raw(const std::string& key) const;

    // Make the next call of this kind throw StorageError with details.
    void fail_next(Call call, std::string details);

    std::size_t calls(Call call) const;

private:
    struct Blob {
        std::string content;
        std::string tag;
        std::optional<std::string> version_id;
    };

    void count_and_maybe_fail(Call call, const std::string& key);
    Blob& store_locked(const std::string& key, std::string content);

    mutable std::mutex mutex_;
    std::map<std::string, Blob> blobs_;
    std::map<Call, std::string> armed_failures_;
    std::map<Call, std::size_t> calls_;
    bool versioned_;
    std::uint64_t next_version_ = 1;
};

} // namespace statpatch

#endif // STATPATCH_MEMORYDOCUMENTSTORE_HPP
