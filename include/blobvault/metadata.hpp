#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace blobvault {

using Timestamp = std::chrono::system_clock::time_point;

/// One stored object's metadata. The same record is persisted under the
/// public key and under the private key.
struct MetadataRecord {
    std::string public_key;
    std::string private_key;
    std::string original_name;
    std::string content_type;
    Timestamp created_at;
    std::optional<Timestamp> last_accessed;  // unset until the first successful get
    uint64_t size_bytes = 0;

    // Timestamp used for inactivity decisions
    Timestamp reference_time() const { return last_accessed.value_or(created_at); }

    bool operator==(const MetadataRecord&) const = default;
};

// Serialized form:
//   {"publicKey", "privateKey", "originalName", "mimeType",
//    "createdAt", "lastAccessed" (string or null), "fileSize"}
std::string encode_metadata(const MetadataRecord& record);

// Returns nullopt for malformed JSON or missing/mistyped fields.
// Unknown fields are ignored.
std::optional<MetadataRecord> decode_metadata(const std::string& text);

// "2024-05-01T12:00:00.000Z" (UTC, millisecond precision)
std::string format_iso8601(Timestamp tp);

// Accepts an optional fractional part and a "Z" or "+00:00" suffix
std::optional<Timestamp> parse_iso8601(const std::string& text);

}  // namespace blobvault
