#pragma once

#include "blobvault/metadata.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

namespace blobvault {

class BlobStore;
class MetricsExporter;
class PeriodicTask;

/// Deletes objects that have not been read for `inactivity_period`.
///
/// Stopped -> Running on initialize(), Running -> Stopped on stop().
/// While running, a cycle runs immediately and then every `cleanup_interval`.
/// A cycle never throws: enumeration failures yield 0 and individual delete
/// failures are logged and skipped.
class CleanupScheduler {
public:
    using Clock = std::function<Timestamp()>;

    enum class State { Stopped, Running };

    CleanupScheduler(std::chrono::milliseconds inactivity_period,
                     std::chrono::milliseconds cleanup_interval,
                     Clock clock = {});
    ~CleanupScheduler();

    CleanupScheduler(const CleanupScheduler&) = delete;
    CleanupScheduler& operator=(const CleanupScheduler&) = delete;

    /// Throws std::invalid_argument if store is null. The store must outlive
    /// the scheduler.
    void initialize(BlobStore* store);

    /// Idempotent. Waits for an in-progress cycle to finish.
    void stop();

    /// One pass: list inactive objects, delete each. Returns the number deleted.
    size_t run_cleanup_cycle();

    State state() const;

    void set_metrics(MetricsExporter* metrics);

    std::chrono::milliseconds inactivity_period() const { return inactivity_period_; }
    std::chrono::milliseconds cleanup_interval() const { return cleanup_interval_; }

private:
    Timestamp cutoff_for(Timestamp now) const;

    std::chrono::milliseconds inactivity_period_;
    std::chrono::milliseconds cleanup_interval_;
    Clock clock_;

    BlobStore* store_ = nullptr;
    MetricsExporter* metrics_ = nullptr;

    mutable std::mutex state_mutex_;
    State state_ = State::Stopped;
    std::unique_ptr<PeriodicTask> task_;

    // Serializes scheduled and manual cycles
    std::mutex cycle_mutex_;
};

}  // namespace blobvault
