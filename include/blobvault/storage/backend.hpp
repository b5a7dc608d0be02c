#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace blobvault {

// Metadata about a stored object, as reported by the backend
struct ObjectInfo {
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string content_type;
    std::string etag;
};

// Result of a put operation
struct PutResult {
    bool success = false;
    std::string etag;
    std::string error_message;
};

// Result of a get operation
struct GetResult {
    bool success = false;
    bool not_found = false;  // Set when the key does not exist (vs. an I/O failure)
    std::vector<uint8_t> data;
    ObjectInfo info;
    std::string error_message;
};

// Entry in a listing operation
struct ListEntry {
    std::string key;
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
};

// Result of a list operation
struct ListResult {
    bool success = false;
    std::vector<ListEntry> entries;
    bool truncated = false;
    std::string continuation_token;
    std::string error_message;
};

// Options for put operations
struct PutOptions {
    std::string content_type = "application/octet-stream";
};

// Options for list operations
struct ListOptions {
    std::string prefix;
    uint32_t max_keys = 1000;
    std::string continuation_token;
};

// Abstract interface for storage backends.
// Low-level byte storage keyed by string; knows nothing about blob metadata.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // Get the backend type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    // Check if a key exists
    virtual bool exists(const std::string& key) const = 0;

    // Get object info without downloading content
    virtual std::optional<ObjectInfo> head(const std::string& key) const = 0;

    // Read object content
    virtual GetResult get(const std::string& key) const = 0;

    // Write object content, replacing any previous value atomically
    virtual PutResult put(const std::string& key,
                          std::span<const uint8_t> data,
                          const PutOptions& options = {}) = 0;

    // Delete an object. Returns false if nothing was removed.
    virtual bool remove(const std::string& key) = 0;

    // List objects under a prefix, in key order, one page at a time
    virtual ListResult list(const ListOptions& options = {}) const = 0;

    // Health check
    virtual bool is_healthy() const = 0;
};

// Factory for creating storage backends from configuration.
// Throws ConfigurationError when required settings are missing or the
// remote resource cannot be reached.
class StorageBackendFactory {
public:
    // Create a backend from a configuration map ("local" or "gcs")
    static std::unique_ptr<StorageBackend> create(
        const std::string& type,
        const std::map<std::string, std::string>& config);

    // Create a local filesystem backend
    static std::unique_ptr<StorageBackend> create_local(
        const std::filesystem::path& root_path);
};

}  // namespace blobvault
