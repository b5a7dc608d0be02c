#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace blobvault {

class BlobStore;
class PeriodicTask;
class TrafficLedger;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports blobvault metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// periodically refreshes the gauges and serializes the registry to a .prom
/// file using atomic temp+rename.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels = {});
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Sources for gauge snapshots (not owned).
    void set_store(const BlobStore* store) { store_ = store; }
    void set_ledger(const TrafficLedger* ledger) { ledger_ = ledger; }

    void start();

    /// Stop the writer and write one final snapshot.
    void stop();

    /// Refresh gauges and write the file now. Returns false if the write failed.
    bool write_file();

    /// Count one request. operation: put|get|delete|usage; result: ok|not_found|limited|invalid|error
    void record_request(const std::string& operation, const std::string& result);

    prometheus::Counter& upload_bytes() { return *upload_bytes_; }
    prometheus::Counter& download_bytes() { return *download_bytes_; }
    prometheus::Counter& upload_denied() { return *upload_denied_; }
    prometheus::Counter& download_denied() { return *download_denied_; }
    prometheus::Counter& evictions_total() { return *evictions_total_; }
    prometheus::Counter& evictions_failed() { return *evictions_failed_; }
    prometheus::Counter& cleanup_cycles() { return *cleanup_cycles_; }
    prometheus::Counter& cleanup_failures() { return *cleanup_failures_; }

    prometheus::Histogram& request_duration() { return *request_duration_; }
    prometheus::Histogram& cleanup_duration() { return *cleanup_duration_; }

    const std::filesystem::path& path() const { return prom_file_path_; }

private:
    void update_gauges();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    const BlobStore* store_ = nullptr;
    const TrafficLedger* ledger_ = nullptr;

    // --- Counters ---
    prometheus::Family<prometheus::Counter>* requests_family_;
    prometheus::Counter* upload_bytes_;
    prometheus::Counter* download_bytes_;
    prometheus::Counter* upload_denied_;
    prometheus::Counter* download_denied_;
    prometheus::Counter* evictions_total_;
    prometheus::Counter* evictions_failed_;
    prometheus::Counter* cleanup_cycles_;
    prometheus::Counter* cleanup_failures_;

    // --- Gauges ---
    prometheus::Gauge* ledger_counters_;
    prometheus::Gauge* backend_healthy_;
    prometheus::Gauge* upload_limit_;
    prometheus::Gauge* download_limit_;

    // --- Histograms ---
    prometheus::Histogram* request_duration_;
    prometheus::Histogram* cleanup_duration_;

    std::unique_ptr<PeriodicTask> writer_;
};

}  // namespace blobvault
