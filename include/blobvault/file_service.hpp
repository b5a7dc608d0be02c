#pragma once

#include "blobvault/blob_store.hpp"
#include "blobvault/traffic_ledger.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace blobvault {

class MetricsExporter;

/// Transport-facing entry point: admission check, store operation, then
/// traffic recording, for each request.
///
/// Throws LimitExceededError when an origin has used up its daily ceiling,
/// otherwise whatever BlobStore throws.
class FileService {
public:
    FileService(BlobStore& store, TrafficLedger& ledger, MetricsExporter* metrics = nullptr);

    KeyPair upload(const std::string& origin,
                   std::span<const uint8_t> content,
                   const std::string& original_name,
                   const std::string& content_type);

    Blob download(const std::string& origin, const std::string& public_key);

    bool remove(const std::string& private_key);

    TrafficUsage usage(const std::string& origin) const;

    BlobStore& store() { return store_; }
    TrafficLedger& ledger() { return ledger_; }

private:
    void count(const std::string& operation, const std::string& result);

    BlobStore& store_;
    TrafficLedger& ledger_;
    MetricsExporter* metrics_;
};

}  // namespace blobvault
