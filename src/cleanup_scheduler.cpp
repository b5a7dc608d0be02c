#include "blobvault/cleanup_scheduler.hpp"
#include "blobvault/blob_store.hpp"
#include "blobvault/log.hpp"
#include "blobvault/metrics.hpp"
#include "blobvault/periodic_task.hpp"

#include <optional>
#include <stdexcept>

namespace blobvault {

CleanupScheduler::CleanupScheduler(std::chrono::milliseconds inactivity_period,
                                   std::chrono::milliseconds cleanup_interval,
                                   Clock clock)
    : inactivity_period_(inactivity_period)
    , cleanup_interval_(cleanup_interval)
    , clock_(std::move(clock)) {}

CleanupScheduler::~CleanupScheduler() {
    stop();
}

void CleanupScheduler::initialize(BlobStore* store) {
    if (!store) {
        throw std::invalid_argument("cleanup scheduler requires a blob store");
    }

    std::lock_guard lock(state_mutex_);
    if (state_ == State::Running) {
        log_warn("cleanup scheduler already running");
        return;
    }

    store_ = store;
    task_ = std::make_unique<PeriodicTask>(
        "cleanup", cleanup_interval_, [this] { run_cleanup_cycle(); }, true);
    state_ = State::Running;
    task_->start();

    log_info("cleanup scheduler started: inactivity %lld h, interval %lld min",
             static_cast<long long>(std::chrono::duration_cast<std::chrono::hours>(inactivity_period_).count()),
             static_cast<long long>(std::chrono::duration_cast<std::chrono::minutes>(cleanup_interval_).count()));
}

void CleanupScheduler::stop() {
    std::unique_ptr<PeriodicTask> task;
    {
        std::lock_guard lock(state_mutex_);
        if (state_ == State::Stopped) return;
        state_ = State::Stopped;
        task = std::move(task_);
    }
    if (task) {
        task->stop();
    }
    log_info("cleanup scheduler stopped");
}

CleanupScheduler::State CleanupScheduler::state() const {
    std::lock_guard lock(state_mutex_);
    return state_;
}

void CleanupScheduler::set_metrics(MetricsExporter* metrics) {
    std::lock_guard lock(state_mutex_);
    metrics_ = metrics;
}

Timestamp CleanupScheduler::cutoff_for(Timestamp now) const {
    // Periods reaching back past the epoch select nothing
    auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
    if (inactivity_period_ >= since_epoch) {
        return Timestamp::min();
    }
    return now - inactivity_period_;
}

size_t CleanupScheduler::run_cleanup_cycle() {
    BlobStore* store = nullptr;
    MetricsExporter* metrics = nullptr;
    {
        std::lock_guard lock(state_mutex_);
        store = store_;
        metrics = metrics_;
    }
    if (!store) {
        log_error("cleanup cycle requested before the scheduler was initialized");
        return 0;
    }

    std::lock_guard cycle_lock(cycle_mutex_);

    std::optional<ScopedTimer> timer;
    if (metrics) {
        metrics->cleanup_cycles().Increment();
        timer.emplace(metrics->cleanup_duration());
    }

    Timestamp now = clock_ ? clock_() : std::chrono::system_clock::now();
    Timestamp cutoff = cutoff_for(now);

    std::vector<std::string> candidates;
    try {
        candidates = store->list_inactive_since(cutoff);
    } catch (const std::exception& e) {
        log_error("cleanup: listing inactive objects failed: %s", e.what());
        if (metrics) metrics->cleanup_failures().Increment();
        return 0;
    }

    size_t deleted = 0;
    for (const auto& key : candidates) {
        try {
            if (store->remove(key)) {
                ++deleted;
            }
        } catch (const std::exception& e) {
            log_warn("cleanup: failed to delete %s: %s", redact_key(key).c_str(), e.what());
            if (metrics) metrics->evictions_failed().Increment();
        }
    }

    if (metrics) {
        metrics->evictions_total().Increment(static_cast<double>(deleted));
    }
    if (!candidates.empty() || verbose_logging()) {
        log_info("cleanup: deleted %zu of %zu inactive objects", deleted, candidates.size());
    }
    return deleted;
}

}  // namespace blobvault
