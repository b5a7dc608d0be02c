#include "blobvault/file_service.hpp"
#include "blobvault/errors.hpp"
#include "blobvault/log.hpp"
#include "blobvault/metrics.hpp"

#include <optional>

namespace blobvault {

namespace {

// Metric label for an error escaping a store operation
const char* result_label(const std::exception& e) {
    if (dynamic_cast<const NotFoundError*>(&e)) return "not_found";
    if (dynamic_cast<const ValidationError*>(&e)) return "invalid";
    if (dynamic_cast<const LimitExceededError*>(&e)) return "limited";
    return "error";
}

}  // namespace

FileService::FileService(BlobStore& store, TrafficLedger& ledger, MetricsExporter* metrics)
    : store_(store)
    , ledger_(ledger)
    , metrics_(metrics) {}

void FileService::count(const std::string& operation, const std::string& result) {
    if (metrics_) {
        metrics_->record_request(operation, result);
    }
}

KeyPair FileService::upload(const std::string& origin,
                            std::span<const uint8_t> content,
                            const std::string& original_name,
                            const std::string& content_type) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->request_duration());

    if (!ledger_.check_upload(origin)) {
        auto used = ledger_.usage(origin);
        if (metrics_) metrics_->upload_denied().Increment();
        count("put", "limited");
        log_info("upload refused for %s: %llu of %llu bytes used today", origin.c_str(),
                 static_cast<unsigned long long>(used.uploaded),
                 static_cast<unsigned long long>(used.upload_limit));
        throw LimitExceededError(LimitExceededError::Direction::Upload,
                                 used.uploaded, used.upload_limit);
    }

    KeyPair keys;
    try {
        keys = store_.put(content, original_name, content_type);
    } catch (const Error& e) {
        count("put", result_label(e));
        throw;
    }

    ledger_.record_upload(origin, content.size());
    if (metrics_) metrics_->upload_bytes().Increment(static_cast<double>(content.size()));
    count("put", "ok");
    return keys;
}

Blob FileService::download(const std::string& origin, const std::string& public_key) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->request_duration());

    try {
        BlobStore::validate_key(public_key);
    } catch (const ValidationError&) {
        count("get", "invalid");
        throw;
    }

    if (!ledger_.check_download(origin)) {
        auto used = ledger_.usage(origin);
        if (metrics_) metrics_->download_denied().Increment();
        count("get", "limited");
        log_info("download refused for %s: %llu of %llu bytes used today", origin.c_str(),
                 static_cast<unsigned long long>(used.downloaded),
                 static_cast<unsigned long long>(used.download_limit));
        throw LimitExceededError(LimitExceededError::Direction::Download,
                                 used.downloaded, used.download_limit);
    }

    Blob blob;
    try {
        blob = store_.get(public_key);
    } catch (const Error& e) {
        count("get", result_label(e));
        throw;
    }

    ledger_.record_download(origin, blob.content.size());
    if (metrics_) metrics_->download_bytes().Increment(static_cast<double>(blob.content.size()));
    count("get", "ok");
    return blob;
}

bool FileService::remove(const std::string& private_key) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->request_duration());

    bool removed = false;
    try {
        removed = store_.remove(private_key);
    } catch (const Error& e) {
        count("delete", result_label(e));
        throw;
    }
    count("delete", removed ? "ok" : "not_found");
    return removed;
}

TrafficUsage FileService::usage(const std::string& origin) const {
    if (metrics_) {
        metrics_->record_request("usage", "ok");
    }
    return ledger_.usage(origin);
}

}  // namespace blobvault
