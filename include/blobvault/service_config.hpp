#pragma once

#include "blobvault/blob_store.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace blobvault {

/// Storage backend selection ("local" or "gcs") plus the parameters handed
/// to StorageBackendFactory.
struct BackendConfig {
    std::string type = "local";
    std::map<std::string, std::string> params;

    bool empty() const { return type.empty(); }

    /// Validate required fields for this backend type.
    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Configuration for blobvaultd (and the backend half of blobvault-ctl).
///
/// Precedence: built-in defaults, then environment variables, then
/// command-line flags and --config files in the order they appear.
struct ServiceConfig {
    BackendConfig backend;

    // Layout overrides; empty means the backend's default
    std::string file_prefix;
    std::string metadata_prefix;

    // Traffic ceilings per origin per day
    uint64_t upload_limit = 100ULL * 1024 * 1024;     // 100 MiB
    uint64_t download_limit = 500ULL * 1024 * 1024;   // 500 MiB
    size_t usage_sweep_interval_secs = 3600;

    // Eviction
    uint64_t inactivity_days = 30;
    uint64_t cleanup_interval_hours = 24;

    // Upper bounds for the eviction settings (100 years)
    static constexpr uint64_t kMaxInactivityDays = 36500;
    static constexpr uint64_t kMaxCleanupIntervalHours = 876000;

    // Control socket
    std::filesystem::path state_dir;  // Default: <root>/.blobvault, /tmp/blobvault for gcs
    size_t control_threads = 8;
    bool control_enabled = true;

    // Daemon
    bool daemonize = false;
    bool verbose = false;
    std::filesystem::path pid_file;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    /// Parse configuration from the environment and command line arguments.
    /// Returns empty optional on error or --help (prints usage to stderr).
    static std::optional<ServiceConfig> from_args(int argc, char* argv[]);

    /// Overlay PROVIDER, FOLDER, CONFIG, UPLOAD_LIMIT, DOWNLOAD_LIMIT,
    /// INACTIVITY_PERIOD_DAYS and CLEANUP_INTERVAL_HOURS.
    /// Returns error message or empty string.
    std::string apply_env();

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Load a GCS provider file: bucket, credentials, projectId,
    /// metadataPrefix, filePrefix, createBucketIfNotExists, location,
    /// storageClass, endpoint.
    bool load_provider_file(const std::filesystem::path& path);

    /// Fill in defaults (state_dir, local root) based on the backend.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    /// Object layout for the configured backend.
    StoreLayout layout() const;

    /// One line per setting, credentials masked.
    std::string describe() const;
};

/// Outcome of parse_backend_option().
enum class OptionResult { Handled, NotBackendOption, Error };

/// Consume a backend option at argv[i] (--backend, --root, --backend-config,
/// --gcs-*), advancing i past its value. Shared by blobvaultd and blobvault-ctl.
OptionResult parse_backend_option(ServiceConfig& config, int argc, char* argv[], int& i);

/// Usage text for the options parse_backend_option() accepts.
const char* backend_options_usage();

}  // namespace blobvault
