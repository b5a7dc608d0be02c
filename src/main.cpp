#include "blobvault/blob_store.hpp"
#include "blobvault/cleanup_scheduler.hpp"
#include "blobvault/control_server.hpp"
#include "blobvault/file_service.hpp"
#include "blobvault/log.hpp"
#include "blobvault/metrics.hpp"
#include "blobvault/service_config.hpp"
#include "blobvault/storage/backend.hpp"
#include "blobvault/traffic_ledger.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

bool daemonize() {
    pid_t pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);  // Parent exits

    if (setsid() < 0) return false;

    // Second fork to prevent acquiring a controlling terminal
    pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);

    // stdout/stderr are redirected to the log file after this returns
    close(STDIN_FILENO);
    if (open("/dev/null", O_RDONLY) < 0) return false;  // stdin = fd 0

    return true;
}

bool write_pid_file(const std::filesystem::path& path) {
    std::ofstream ofs(path);
    if (!ofs) return false;
    ofs << getpid() << "\n";
    return static_cast<bool>(ofs);
}
}  // namespace

int main(int argc, char* argv[]) {
    using namespace blobvault;

    auto config_opt = ServiceConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Daemonize if requested (before log redirect so we fork first)
    if (config.daemonize) {
        if (!daemonize()) {
            std::cerr << "Failed to daemonize" << std::endl;
            return 1;
        }
    }

    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.log_file.parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (!log) {
            std::cerr << "Cannot open log file " << config.log_file << std::endl;
            return 1;
        }
        dup2(fileno(log), STDOUT_FILENO);
        dup2(fileno(log), STDERR_FILENO);
        fclose(log);
    }

    set_verbose_logging(config.verbose);

    std::cout << "blobvaultd starting..." << std::endl;
    std::cout << config.describe() << std::flush;

    if (!config.pid_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.pid_file.parent_path(), ec);
        if (!write_pid_file(config.pid_file)) {
            log_warn("cannot write pid file %s", config.pid_file.c_str());
        }
    }

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    std::unique_ptr<BlobStore> store;
    try {
        store = std::make_unique<BlobStore>(
            StorageBackendFactory::create(config.backend.type, config.backend.params),
            config.layout());
    } catch (const std::exception& e) {
        log_error("failed to initialize %s backend: %s", config.backend.type.c_str(), e.what());
        return 1;
    }

    if (!store->is_healthy()) {
        log_warn("%s backend reports unhealthy at startup", store->backend_type().c_str());
    }

    TrafficLedger ledger(config.upload_limit, config.download_limit);
    ledger.start_reclaimer(std::chrono::seconds(config.usage_sweep_interval_secs));

    std::unique_ptr<MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"backend", config.backend.type}});
        metrics->set_store(store.get());
        metrics->set_ledger(&ledger);
        metrics->start();
    }

    CleanupScheduler cleanup(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::hours(24) * config.inactivity_days),
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::hours(1) * config.cleanup_interval_hours));
    cleanup.set_metrics(metrics.get());
    cleanup.initialize(store.get());

    FileService service(*store, ledger, metrics.get());

    std::unique_ptr<ControlServer> control;
    if (config.control_enabled) {
        control = std::make_unique<ControlServer>(
            service, config.state_dir / "control.sock", config.control_threads);
        err = control->start();
        if (!err.empty()) {
            log_error("failed to start control server: %s", err.c_str());
            cleanup.stop();
            ledger.stop_reclaimer();
            if (metrics) metrics->stop();
            return 1;
        }
    }

    std::cout << "blobvaultd running (PID " << getpid() << ")" << std::endl;

    // Wait until shutdown signal, then stop outside signal context.
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    log_info("shutting down");
    if (control) control->stop();
    cleanup.stop();
    ledger.stop_reclaimer();
    if (metrics) metrics->stop();

    if (!config.pid_file.empty()) {
        unlink(config.pid_file.c_str());
    }

    std::cout << "blobvaultd exited cleanly" << std::endl;
    return 0;
}
