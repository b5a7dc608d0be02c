#pragma once

#include "blobvault/key_generator.hpp"
#include "blobvault/metadata.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace blobvault {

class StorageBackend;

/// Where content and metadata live inside a backend.
struct StoreLayout {
    std::string file_prefix = "files/";
    std::string metadata_prefix = ".metadata/";

    // Defaults for the GCS provider
    static StoreLayout for_gcs() { return {"files/", "metadata/"}; }
};

/// Content handed back by BlobStore::get.
struct Blob {
    std::vector<uint8_t> content;
    std::string content_type;
    std::string original_name;
};

/// Dual-key object store layered on a StorageBackend.
///
/// Content is stored under the public key. The metadata record is written
/// twice, once per key, and every mutation reaches both copies before the
/// call returns. Operations on the same object are serialized through a
/// sharded lock table keyed by public key (BLOBVAULT_LOCK_SHARDS, default 256).
///
/// Errors: NotFoundError, StoreError, ValidationError (see errors.hpp).
class BlobStore {
public:
    using Clock = std::function<Timestamp()>;

    explicit BlobStore(std::unique_ptr<StorageBackend> backend,
                       StoreLayout layout = {},
                       Clock clock = {});
    ~BlobStore();

    BlobStore(const BlobStore&) = delete;
    BlobStore& operator=(const BlobStore&) = delete;

    /// Store content and return a fresh key pair.
    /// On failure every artifact written by this call is removed (best effort)
    /// and StoreError is thrown.
    KeyPair put(std::span<const uint8_t> content,
                const std::string& original_name,
                const std::string& content_type);

    /// Read content by public key and stamp lastAccessed on both metadata copies.
    Blob get(const std::string& public_key);

    /// Delete by private key. Returns false when nothing is stored under it.
    bool remove(const std::string& private_key);

    /// Metadata by either key.
    MetadataRecord get_metadata(const std::string& key) const;

    /// Private keys of objects whose lastAccessed (or createdAt when never
    /// read) is strictly earlier than cutoff. Malformed entries are skipped.
    std::vector<std::string> list_inactive_since(Timestamp cutoff) const;

    bool is_healthy() const;
    std::string backend_type() const;

    const StoreLayout& layout() const { return layout_; }

    /// Throws ValidationError unless key is 1..128 ASCII alphanumerics.
    static void validate_key(const std::string& key);

    static constexpr size_t MAX_KEY_LENGTH = 128;

private:
    std::string content_key(const std::string& public_key) const;
    std::string metadata_key(const std::string& key) const;

    std::optional<MetadataRecord> read_metadata(const std::string& key) const;
    bool write_metadata(const std::string& key, const MetadataRecord& record);
    bool erase(const std::string& key);

    std::mutex& lock_for(const std::string& public_key) const;
    Timestamp now() const;

    std::unique_ptr<StorageBackend> backend_;
    StoreLayout layout_;
    Clock clock_;
    KeyGenerator keys_;
    mutable std::vector<std::unique_ptr<std::mutex>> locks_;
};

}  // namespace blobvault
