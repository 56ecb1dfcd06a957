#include "statpatch/MemoryDocumentStore.hpp"
#include "statpatch/Errors.hpp"
#include "statpatch/Util.hpp"

namespace statpatch {

void MemoryDocumentStore::count_and_maybe_fail(Call call, const std::string& key) {
    ++calls_[call];
    auto it = armed_failures_.find(call);
    if (it != armed_failures_.end()) {
        std::string details = std::move(it->second);
        armed_failures_.erase(it);
        throw StorageError(key, details);
    }
}

MemoryDocumentStore::Blob& MemoryDocumentStore::store_locked(const std::string& key, std::string content) {
    Blob& blob = blobs_[key];
    blob.tag = content_tag(content);
    blob.content = std::move(content);
    if (versioned_) {
        blob.version_id = std::to_string(next_version_++);
    }
    return blob;
}

std::optional<std::string> MemoryDocumentStore::probe(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    count_and_maybe_fail(Call::Probe, key);
    auto it = blobs_.find(key);
    if (it == blobs_.end()) return std::nullopt;
    return it->second.tag;
}

std::optional<StoredDocument> MemoryDocumentStore::read_body(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    count_and_maybe_fail(Call::Read, key);
    auto it = blobs_.find(key);
    if (it == blobs_.end()) return std::nullopt;
    return StoredDocument{decode_document(key, it->second.content), it->second.tag};
}

WriteReceipt MemoryDocumentStore::write(const std::string& key, const Value& document) {
    std::lock_guard<std::mutex> lock(mutex_);
    count_and_maybe_fail(Call::Write, key);
    const Blob& blob = store_locked(key, encode_document(document));
    return WriteReceipt{blob.tag, blob.version_id};
}

std::string MemoryDocumentStore::put_raw(const std::string& key, std::string content) {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_locked(key, std::move(content)).tag;
}

std::optional<std::string> MemoryDocumentStore::raw(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blobs_.find(key);
    if (it == blobs_.end()) return std::nullopt;
    return it->second.content;
}

void MemoryDocumentStore::fail_next(Call call, std::string details) {
    std::lock_guard<std::mutex> lock(mutex_);
    armed_failures_[call] = std::move(details);
}

std::size_t MemoryDocumentStore::calls(Call call) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(call);
    return it == calls_.end() ? 0 : it->second;
}

} // namespace statpatch
