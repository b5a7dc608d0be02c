#include "blobvault/blob_store.hpp"
#include "blobvault/errors.hpp"
#include "blobvault/log.hpp"
#include "blobvault/storage/backend.hpp"

#include <cstdlib>

namespace blobvault {

namespace {

// Number of per-object lock shards (BLOBVAULT_LOCK_SHARDS, 1..4096)
size_t get_lock_shards() {
    static size_t shards = []() {
        if (const char* env = std::getenv("BLOBVAULT_LOCK_SHARDS")) {
            try {
                size_t val = std::stoul(env);
                if (val >= 1 && val <= 4096) {
                    return val;
                }
            } catch (const std::exception&) {
            }
            log_warn("invalid BLOBVAULT_LOCK_SHARDS=%s, using default", env);
        }
        return size_t{256};
    }();
    return shards;
}

bool is_valid_key(const std::string& key) {
    if (key.empty() || key.size() > BlobStore::MAX_KEY_LENGTH) return false;
    for (char c : key) {
        bool alnum = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        if (!alnum) return false;
    }
    return true;
}

constexpr const char* METADATA_SUFFIX = ".json";

}  // namespace

BlobStore::BlobStore(std::unique_ptr<StorageBackend> backend, StoreLayout layout, Clock clock)
    : backend_(std::move(backend))
    , layout_(std::move(layout))
    , clock_(std::move(clock)) {
    if (!backend_) {
        throw std::invalid_argument("BlobStore requires a storage backend");
    }
    locks_.resize(get_lock_shards());
    for (auto& lock : locks_) {
        lock = std::make_unique<std::mutex>();
    }
}

BlobStore::~BlobStore() = default;

void BlobStore::validate_key(const std::string& key) {
    if (key.empty()) {
        throw ValidationError("key is empty");
    }
    if (!is_valid_key(key)) {
        throw ValidationError("malformed key");
    }
}

KeyPair BlobStore::put(std::span<const uint8_t> content,
                       const std::string& original_name,
                       const std::string& content_type) {
    KeyPair keys = keys_.generate();
    // 256-bit keys do not collide in practice; a store that says otherwise is broken
    if (backend_->exists(metadata_key(keys.public_key)) ||
        backend_->exists(metadata_key(keys.private_key))) {
        throw StoreError("generated key already in use");
    }

    std::lock_guard lock(lock_for(keys.public_key));

    MetadataRecord record;
    record.public_key = keys.public_key;
    record.private_key = keys.private_key;
    record.original_name = original_name;
    record.content_type = content_type;
    record.created_at = now();
    record.size_bytes = content.size();

    PutOptions options;
    if (!content_type.empty()) {
        options.content_type = content_type;
    }

    auto written = backend_->put(content_key(keys.public_key), content, options);
    if (!written.success) {
        erase(content_key(keys.public_key));
        throw StoreError("failed to write content: " + written.error_message);
    }

    if (!write_metadata(keys.public_key, record)) {
        erase(content_key(keys.public_key));
        erase(metadata_key(keys.public_key));
        throw StoreError("failed to write metadata for " + redact_key(keys.public_key));
    }

    if (!write_metadata(keys.private_key, record)) {
        erase(content_key(keys.public_key));
        erase(metadata_key(keys.public_key));
        erase(metadata_key(keys.private_key));
        throw StoreError("failed to write metadata for " + redact_key(keys.private_key));
    }

    log_debug("stored %s (%zu bytes, %s)", redact_key(keys.public_key).c_str(),
              content.size(), content_type.c_str());
    return keys;
}

Blob BlobStore::get(const std::string& public_key) {
    validate_key(public_key);
    std::lock_guard lock(lock_for(public_key));

    auto record = read_metadata(public_key);
    // The private key never grants read access
    if (!record || record->public_key != public_key) {
        throw NotFoundError("no object for key " + redact_key(public_key));
    }

    auto content = backend_->get(content_key(public_key));
    if (!content.success) {
        if (content.not_found) {
            throw StoreError("content missing for " + redact_key(public_key));
        }
        throw StoreError("failed to read content for " + redact_key(public_key) + ": " +
                         content.error_message);
    }

    Timestamp stamp = now();
    if (stamp <= record->created_at) {
        stamp = record->created_at + std::chrono::milliseconds(1);
    }

    MetadataRecord updated = *record;
    updated.last_accessed = stamp;

    if (!write_metadata(public_key, updated)) {
        throw StoreError("failed to update access time for " + redact_key(public_key));
    }
    if (!write_metadata(record->private_key, updated)) {
        if (!write_metadata(public_key, *record)) {
            log_error("could not restore metadata for %s after failed mirror",
                      redact_key(public_key).c_str());
        }
        throw StoreError("failed to mirror access time for " + redact_key(public_key));
    }

    Blob blob;
    blob.content = std::move(content.data);
    blob.content_type = record->content_type;
    blob.original_name = record->original_name;
    return blob;
}

bool BlobStore::remove(const std::string& private_key) {
    validate_key(private_key);

    auto record = read_metadata(private_key);
    if (!record || record->private_key != private_key) {
        return false;
    }

    std::lock_guard lock(lock_for(record->public_key));

    // Re-read under the object lock; a concurrent delete may have won
    record = read_metadata(private_key);
    if (!record || record->private_key != private_key) {
        return false;
    }

    const std::string& public_key = record->public_key;

    if (!erase(content_key(public_key))) {
        log_warn("failed to remove content for %s", redact_key(public_key).c_str());
    }
    bool public_gone = erase(metadata_key(public_key));
    bool private_gone = erase(metadata_key(private_key));

    if (!public_gone || !private_gone) {
        throw StoreError("metadata for " + redact_key(private_key) + " could not be removed");
    }

    log_debug("deleted %s", redact_key(public_key).c_str());
    return true;
}

MetadataRecord BlobStore::get_metadata(const std::string& key) const {
    validate_key(key);

    auto record = read_metadata(key);
    if (!record || (record->public_key != key && record->private_key != key)) {
        throw NotFoundError("no object for key " + redact_key(key));
    }
    return *record;
}

std::vector<std::string> BlobStore::list_inactive_since(Timestamp cutoff) const {
    std::vector<std::string> inactive;

    ListOptions options;
    options.prefix = layout_.metadata_prefix;

    while (true) {
        auto page = backend_->list(options);
        if (!page.success) {
            throw StoreError("failed to list metadata: " + page.error_message);
        }

        for (const auto& entry : page.entries) {
            if (!entry.key.starts_with(layout_.metadata_prefix) ||
                !entry.key.ends_with(METADATA_SUFFIX)) {
                continue;
            }
            std::string key = entry.key.substr(
                layout_.metadata_prefix.size(),
                entry.key.size() - layout_.metadata_prefix.size() - std::char_traits<char>::length(METADATA_SUFFIX));
            if (!is_valid_key(key)) {
                continue;
            }

            auto raw = backend_->get(entry.key);
            if (!raw.success) {
                // Removed since listing, or unreadable
                continue;
            }

            auto record = decode_metadata(std::string(raw.data.begin(), raw.data.end()));
            if (!record) {
                log_debug("skipping malformed metadata %s", entry.key.c_str());
                continue;
            }

            // Each object is reported once, through its private-key copy
            if (record->private_key != key) {
                continue;
            }

            if (record->reference_time() < cutoff) {
                inactive.push_back(key);
            }
        }

        if (!page.truncated || page.continuation_token.empty()) {
            break;
        }
        options.continuation_token = page.continuation_token;
    }

    return inactive;
}

bool BlobStore::is_healthy() const {
    return backend_->is_healthy();
}

std::string BlobStore::backend_type() const {
    return backend_->type_name();
}

std::string BlobStore::content_key(const std::string& public_key) const {
    return layout_.file_prefix + public_key;
}

std::string BlobStore::metadata_key(const std::string& key) const {
    return layout_.metadata_prefix + key + METADATA_SUFFIX;
}

std::optional<MetadataRecord> BlobStore::read_metadata(const std::string& key) const {
    auto raw = backend_->get(metadata_key(key));
    if (!raw.success) {
        if (raw.not_found) {
            return std::nullopt;
        }
        throw StoreError("failed to read metadata for " + redact_key(key) + ": " +
                         raw.error_message);
    }

    auto record = decode_metadata(std::string(raw.data.begin(), raw.data.end()));
    if (!record) {
        throw StoreError("corrupt metadata for " + redact_key(key));
    }
    return record;
}

bool BlobStore::write_metadata(const std::string& key, const MetadataRecord& record) {
    std::string text = encode_metadata(record);
    PutOptions options;
    options.content_type = "application/json";

    auto result = backend_->put(metadata_key(key),
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()),
        options);
    if (!result.success) {
        log_warn("metadata write for %s failed: %s", redact_key(key).c_str(),
                 result.error_message.c_str());
    }
    return result.success;
}

bool BlobStore::erase(const std::string& key) {
    if (backend_->remove(key)) {
        return true;
    }
    // Only a confirmed absence counts; an unreachable backend does not
    return backend_->get(key).not_found;
}

std::mutex& BlobStore::lock_for(const std::string& public_key) const {
    size_t hash = std::hash<std::string>{}(public_key);
    return *locks_[hash % locks_.size()];
}

Timestamp BlobStore::now() const {
    Timestamp t = clock_ ? clock_() : std::chrono::system_clock::now();
    // Persisted timestamps carry millisecond precision
    return std::chrono::floor<std::chrono::milliseconds>(t);
}

}  // namespace blobvault
