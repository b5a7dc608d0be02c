#include "blobvault/traffic_ledger.hpp"
#include "blobvault/log.hpp"
#include "blobvault/periodic_task.hpp"

#include <ctime>

namespace blobvault {

TrafficLedger::TrafficLedger(uint64_t upload_limit, uint64_t download_limit, Clock clock)
    : upload_limit_(upload_limit)
    , download_limit_(download_limit)
    , clock_(std::move(clock)) {}

TrafficLedger::~TrafficLedger() {
    stop_reclaimer();
}

std::string TrafficLedger::day_key(Timestamp tp) {
    time_t t = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_val;
    localtime_r(&t, &tm_val);
    char buf[16];
    strftime(buf, sizeof(buf), "%Y-%m-%d", &tm_val);
    return buf;
}

std::string TrafficLedger::today() const {
    return day_key(clock_ ? clock_() : std::chrono::system_clock::now());
}

std::shared_ptr<TrafficLedger::Counter> TrafficLedger::find(const std::string& origin) const {
    CounterKey key{origin, today()};
    std::shared_lock lock(mutex_);
    auto it = counters_.find(key);
    return it == counters_.end() ? nullptr : it->second;
}

std::shared_ptr<TrafficLedger::Counter> TrafficLedger::find_or_create(const std::string& origin) {
    CounterKey key{origin, today()};
    {
        std::shared_lock lock(mutex_);
        auto it = counters_.find(key);
        if (it != counters_.end()) return it->second;
    }
    std::unique_lock lock(mutex_);
    auto& slot = counters_[key];
    if (!slot) {
        slot = std::make_shared<Counter>();
    }
    return slot;
}

bool TrafficLedger::check_upload(const std::string& origin) const {
    auto counter = find(origin);
    return !counter || counter->uploaded.load(std::memory_order_relaxed) < upload_limit_;
}

bool TrafficLedger::check_download(const std::string& origin) const {
    auto counter = find(origin);
    return !counter || counter->downloaded.load(std::memory_order_relaxed) < download_limit_;
}

void TrafficLedger::record_upload(const std::string& origin, uint64_t bytes) {
    find_or_create(origin)->uploaded.fetch_add(bytes, std::memory_order_relaxed);
}

void TrafficLedger::record_download(const std::string& origin, uint64_t bytes) {
    find_or_create(origin)->downloaded.fetch_add(bytes, std::memory_order_relaxed);
}

TrafficUsage TrafficLedger::usage(const std::string& origin) const {
    TrafficUsage result;
    result.upload_limit = upload_limit_;
    result.download_limit = download_limit_;
    if (auto counter = find(origin)) {
        result.uploaded = counter->uploaded.load(std::memory_order_relaxed);
        result.downloaded = counter->downloaded.load(std::memory_order_relaxed);
    }
    return result;
}

size_t TrafficLedger::reclaim() {
    std::string current = today();
    size_t removed = 0;

    std::unique_lock lock(mutex_);
    for (auto it = counters_.begin(); it != counters_.end();) {
        if (it->first.second != current) {
            it = counters_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    lock.unlock();

    if (removed > 0) {
        log_debug("traffic ledger: reclaimed %zu stale counters", removed);
    }
    return removed;
}

void TrafficLedger::start_reclaimer(std::chrono::milliseconds period) {
    std::lock_guard lock(reclaimer_mutex_);
    if (reclaimer_) return;
    reclaimer_ = std::make_unique<PeriodicTask>("usage-sweep", period, [this] { reclaim(); });
    reclaimer_->start();
}

void TrafficLedger::stop_reclaimer() {
    std::unique_ptr<PeriodicTask> task;
    {
        std::lock_guard lock(reclaimer_mutex_);
        task = std::move(reclaimer_);
    }
    if (task) {
        task->stop();
    }
}

size_t TrafficLedger::tracked_counters() const {
    std::shared_lock lock(mutex_);
    return counters_.size();
}

}  // namespace blobvault
