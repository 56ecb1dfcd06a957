/**
 * @file FileDocumentStore.hpp
 * @brief DocumentStore backed by a local directory
 *
 * Used for local runs of the CLI. Key "app/stats.json" lives at
 * <root>/app/stats.json. Tags are content digests; no version ids.
 * Writes go to a temporary sibling which is then renamed over the target.
 */

#ifndef STATPATCH_FILEDOCUMENTSTORE_HPP
#define STATPATCH_FILEDOCUMENTSTORE_HPP

#include "statpatch/DocumentStore.hpp"
#include <filesystem>

namespace statpatch {

class FileDocumentStore : public DocumentStore {
public:
    explicit FileDocumentStore(std::filesystem::path root) : root_(std::move(root)) {}

    std::optional<std::string> probe(const std::string& key) override;
    std::optional<StoredDocument> read_body(const std::string& key) override;
    WriteReceipt write(const std::string& key, const Value& document) override;

    const std::filesystem::path& root() const noexcept { return root_; }

    /**
     * @brief File backing key
     * @throws StorageError for empty or absolute keys and keys containing ".."
     */
    std::filesystem::path path_for(const std::string& key) const;

private:
    std::filesystem::path root_;
};

} // namespace statpatch

#endif // STATPATCH_FILEDOCUMENTSTORE_HPP
