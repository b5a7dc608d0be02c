#include "blobvault/metrics.hpp"
#include "blobvault/blob_store.hpp"
#include "blobvault/log.hpp"
#include "blobvault/periodic_task.hpp"
#include "blobvault/traffic_ledger.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace blobvault {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    requests_family_ = &prometheus::BuildCounter()
        .Name("blobvault_requests_total")
        .Help("Requests handled, by operation and result")
        .Labels(labels)
        .Register(*registry_);

    auto& bytes_family = prometheus::BuildCounter()
        .Name("blobvault_transfer_bytes_total")
        .Help("Content bytes moved, by direction")
        .Labels(labels)
        .Register(*registry_);
    upload_bytes_ = &bytes_family.Add({{"direction", "upload"}});
    download_bytes_ = &bytes_family.Add({{"direction", "download"}});

    auto& denied_family = prometheus::BuildCounter()
        .Name("blobvault_admission_denied_total")
        .Help("Requests refused by the daily traffic ceiling")
        .Labels(labels)
        .Register(*registry_);
    upload_denied_ = &denied_family.Add({{"direction", "upload"}});
    download_denied_ = &denied_family.Add({{"direction", "download"}});

    auto& evictions_family = prometheus::BuildCounter()
        .Name("blobvault_evictions_total")
        .Help("Inactive objects processed by the cleanup scheduler")
        .Labels(labels)
        .Register(*registry_);
    evictions_total_ = &evictions_family.Add({{"result", "deleted"}});
    evictions_failed_ = &evictions_family.Add({{"result", "failed"}});

    auto& cycles_family = prometheus::BuildCounter()
        .Name("blobvault_cleanup_cycles_total")
        .Help("Cleanup cycles started")
        .Labels(labels)
        .Register(*registry_);
    cleanup_cycles_ = &cycles_family.Add({{"result", "started"}});
    cleanup_failures_ = &cycles_family.Add({{"result", "list_failed"}});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    ledger_counters_ = &gauge_reg("blobvault_ledger_counters", "Live per-origin traffic counters");
    backend_healthy_ = &gauge_reg("blobvault_backend_healthy", "1 if the storage backend is reachable");
    upload_limit_ = &gauge_reg("blobvault_upload_limit_bytes", "Daily upload ceiling per origin");
    download_limit_ = &gauge_reg("blobvault_download_limit_bytes", "Daily download ceiling per origin");

    // --- Histograms ---

    request_duration_ = &prometheus::BuildHistogram()
        .Name("blobvault_request_duration_seconds")
        .Help("Request duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.001, 0.005, 0.01, 0.05, 0.1, 0.5, 1, 5, 10, 30});

    cleanup_duration_ = &prometheus::BuildHistogram()
        .Name("blobvault_cleanup_duration_seconds")
        .Help("Cleanup cycle duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.5, 1, 5, 10, 30, 60, 300});
}

MetricsExporter::~MetricsExporter() {
    if (writer_) {
        writer_->stop();
    }
}

void MetricsExporter::start() {
    if (writer_) return;
    writer_ = std::make_unique<PeriodicTask>(
        "metrics", std::chrono::duration_cast<std::chrono::milliseconds>(write_interval_),
        [this] { write_file(); });
    writer_->start();
}

void MetricsExporter::stop() {
    if (writer_) {
        writer_->stop();
        writer_.reset();
    }
    // Always write a final snapshot
    write_file();
}

void MetricsExporter::record_request(const std::string& operation, const std::string& result) {
    requests_family_->Add({{"operation", operation}, {"result", result}}).Increment();
}

void MetricsExporter::update_gauges() {
    if (ledger_) {
        ledger_counters_->Set(static_cast<double>(ledger_->tracked_counters()));
        upload_limit_->Set(static_cast<double>(ledger_->upload_limit()));
        download_limit_->Set(static_cast<double>(ledger_->download_limit()));
    }
    if (store_) {
        backend_healthy_->Set(store_->is_healthy() ? 1.0 : 0.0);
    }
}

bool MetricsExporter::write_file() {
    update_gauges();

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("cannot write metrics file %s", tmp_path.c_str());
        return false;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) {
        log_warn("short write to metrics file %s", tmp_path.c_str());
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("cannot rename metrics file: %s", ec.message().c_str());
        return false;
    }
    return true;
}

}  // namespace blobvault
