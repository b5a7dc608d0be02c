#pragma once

#include "blobvault/metadata.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>

namespace blobvault {

class PeriodicTask;

/// Today's counters for one origin, plus the ceilings they are checked against.
struct TrafficUsage {
    uint64_t uploaded = 0;
    uint64_t downloaded = 0;
    uint64_t upload_limit = 0;
    uint64_t download_limit = 0;
};

/// Per-origin, per-day byte counters with admission checks.
///
/// A counter is keyed by (origin, local calendar day) and created on the
/// first recorded transfer. Admission is optimistic: a request is refused
/// only when the bytes already recorded today have reached the ceiling, so
/// the request that crosses the line is let through. State lives in memory
/// only.
class TrafficLedger {
public:
    using Clock = std::function<Timestamp()>;

    static constexpr uint64_t DEFAULT_UPLOAD_LIMIT = 100ull * 1024 * 1024;
    static constexpr uint64_t DEFAULT_DOWNLOAD_LIMIT = 500ull * 1024 * 1024;

    TrafficLedger(uint64_t upload_limit = DEFAULT_UPLOAD_LIMIT,
                  uint64_t download_limit = DEFAULT_DOWNLOAD_LIMIT,
                  Clock clock = {});
    ~TrafficLedger();

    TrafficLedger(const TrafficLedger&) = delete;
    TrafficLedger& operator=(const TrafficLedger&) = delete;

    bool check_upload(const std::string& origin) const;
    bool check_download(const std::string& origin) const;

    void record_upload(const std::string& origin, uint64_t bytes);
    void record_download(const std::string& origin, uint64_t bytes);

    /// Read-only; an origin with no activity today reports zeros.
    TrafficUsage usage(const std::string& origin) const;

    /// Drop counters whose day is not today. Returns how many were dropped.
    size_t reclaim();

    /// Run reclaim() every `period` on a background thread.
    void start_reclaimer(std::chrono::milliseconds period = std::chrono::hours(1));
    void stop_reclaimer();

    size_t tracked_counters() const;

    uint64_t upload_limit() const { return upload_limit_; }
    uint64_t download_limit() const { return download_limit_; }

    /// Local calendar day of tp as "YYYY-MM-DD".
    static std::string day_key(Timestamp tp);

private:
    struct Counter {
        std::atomic<uint64_t> uploaded{0};
        std::atomic<uint64_t> downloaded{0};
    };
    using CounterKey = std::pair<std::string, std::string>;  // (origin, day)

    std::string today() const;
    std::shared_ptr<Counter> find(const std::string& origin) const;
    std::shared_ptr<Counter> find_or_create(const std::string& origin);

    uint64_t upload_limit_;
    uint64_t download_limit_;
    Clock clock_;

    mutable std::shared_mutex mutex_;
    std::map<CounterKey, std::shared_ptr<Counter>> counters_;

    std::mutex reclaimer_mutex_;
    std::unique_ptr<PeriodicTask> reclaimer_;
};

}  // namespace blobvault
