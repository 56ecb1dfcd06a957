/**
 * @file FileDocumentStore.cpp
 * @brief Directory-backed document store
 */

#include "statpatch/FileDocumentStore.hpp"
#include "statpatch/Errors.hpp"
#include "statpatch/Util.hpp"

#include <atomic>
#include <cstdint>
#include <fstream>
#include <functional>
#include <sstream>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace statpatch {

namespace {

/**
 * @brief Read entire file, nullopt if it does not exist
 */
std::optional<std::string> read_file(const std::string& key, const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            throw StorageError(key, "cannot stat " + path.string() + ": " + ec.message());
        }
        return std::nullopt;
    }
    if (!fs::is_regular_file(path, ec)) {
        throw StorageError(key, path.string() + " is not a regular file");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw StorageError(key, "cannot open " + path.string());
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        throw StorageError(key, "read failed for " + path.string());
    }
    return oss.str();
}

/**
 * @brief Sibling of target that no other in-flight write uses
 *
 * Suffixed with the writing thread and a process-wide counter, so
 * concurrent writers to one key never share a temporary file.
 */
fs::path temp_sibling(const fs::path& target) {
    static std::atomic<std::uint64_t> counter{0};
    const std::size_t thread_tag = std::hash<std::thread::id>{}(std::this_thread::get_id());

    std::ostringstream suffix;
    suffix << ".tmp." << std::hex << thread_tag << '.' << counter.fetch_add(1);
    fs::path tmp = target;
    tmp += suffix.str();
    return tmp;
}

} // namespace

fs::path FileDocumentStore::path_for(const std::string& key) const {
    const fs::path rel(key);
    if (key.empty() || rel.is_absolute() || rel.has_root_name()) {
        throw StorageError(key, "invalid object key");
    }
    for (const auto& part : rel) {
        if (part == "..") {
            throw StorageError(key, "invalid object key");
        }
    }
    return root_ / rel;
}

std::optional<std::string> FileDocumentStore::probe(const std::string& key) {
    auto content = read_file(key, path_for(key));
    if (!content) return std::nullopt;
    return content_tag(*content);
}

std::optional<StoredDocument> FileDocumentStore::read_body(const std::string& key) {
    auto content = read_file(key, path_for(key));
    if (!content) return std::nullopt;
    return StoredDocument{decode_document(key, *content), content_tag(*content)};
}

WriteReceipt FileDocumentStore::write(const std::string& key, const Value& document) {
    const fs::path target = path_for(key);
    const std::string payload = encode_document(document);

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw StorageError(key, "cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    const fs::path tmp = temp_sibling(target);
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw StorageError(key, "cannot open " + tmp.string() + " for write");
        }
        ofs << payload;
        ofs.flush();
        if (!ofs) {
            throw StorageError(key, "write failed for " + tmp.string());
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(tmp, ec);
        throw StorageError(key, "cannot replace " + target.string() + ": " + reason);
    }

    return WriteReceipt{content_tag(payload), std::nullopt};
}

} // namespace statpatch
