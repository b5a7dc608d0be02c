#include "blobvault/service_config.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace blobvault {

// --- BackendConfig ---

std::string BackendConfig::validate() const {
    if (type.empty()) return "backend type is required";
    if (type == "local") {
        if (params.count("path") == 0 || params.at("path").empty())
            return "local backend requires 'path' (--root)";
    } else if (type == "gcs") {
        if (params.count("bucket") == 0 || params.at("bucket").empty())
            return "gcs backend requires 'bucket'";
    } else {
        return "unknown backend type: " + type;
    }
    return {};
}

// --- ServiceConfig ---

namespace {

// Strict decimal parse; rejects signs, blanks and trailing garbage.
bool parse_u64(const std::string& text, uint64_t& out) {
    if (text.empty() || text[0] < '0' || text[0] > '9') return false;
    try {
        size_t used = 0;
        unsigned long long v = std::stoull(text, &used);
        if (used != text.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_number_arg(const char* name, const char* value, uint64_t& out) {
    if (!parse_u64(value, out)) {
        std::cerr << "Error: " << name << " expects a non-negative integer, got '" << value << "'\n";
        return false;
    }
    return true;
}

bool parse_size_arg(const char* name, const char* value, size_t& out) {
    uint64_t v = 0;
    if (!parse_number_arg(name, value, v)) return false;
    out = static_cast<size_t>(v);
    return true;
}

// Params may be given as JSON strings, booleans or numbers
std::string param_value(const nlohmann::json& val) {
    return val.is_string() ? val.get<std::string>() : val.dump();
}

bool is_secret_param(const std::string& key) {
    return key == "credentials_json" || key.find("secret") != std::string::npos ||
           key.find("token") != std::string::npos;
}

}  // namespace

OptionResult parse_backend_option(ServiceConfig& config, int argc, char* argv[], int& i) {
    std::string arg = argv[i];

    auto next_arg = [&](const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    if (arg == "--gcs-no-verify-ssl") {
        config.backend.params["verify_ssl"] = "false";
        return OptionResult::Handled;
    }

    // Flag -> backend param
    static const std::pair<const char*, const char*> gcs_flags[] = {
        {"--gcs-bucket", "bucket"},
        {"--gcs-project-id", "project_id"},
        {"--gcs-credentials-file", "credentials_file"},
        {"--gcs-endpoint", "endpoint"},
        {"--gcs-prefix", "path_prefix"},
    };
    for (const auto& [flag, param] : gcs_flags) {
        if (arg == flag) {
            auto* v = next_arg(flag);
            if (!v) return OptionResult::Error;
            config.backend.params[param] = v;
            return OptionResult::Handled;
        }
    }

    if (arg == "--backend") {
        auto* v = next_arg("--backend");
        if (!v) return OptionResult::Error;
        config.backend.type = v;
    } else if (arg == "--root") {
        auto* v = next_arg("--root");
        if (!v) return OptionResult::Error;
        config.backend.params["path"] = v;
    } else if (arg == "--backend-config") {
        auto* v = next_arg("--backend-config");
        if (!v) return OptionResult::Error;
        if (!config.load_provider_file(v)) return OptionResult::Error;
    } else {
        return OptionResult::NotBackendOption;
    }
    return OptionResult::Handled;
}

const char* backend_options_usage() {
    return
        "Storage backend:\n"
        "  --backend <local|gcs>            Backend type (env PROVIDER, default: local)\n"
        "  --root <dir>                     Local storage root (env FOLDER, default: ./storage)\n"
        "  --backend-config <file>          GCS provider file (env CONFIG)\n"
        "  --gcs-bucket <name>              GCS bucket\n"
        "  --gcs-project-id <id>            GCS project ID\n"
        "  --gcs-credentials-file <path>    Service account JSON key file\n"
        "  --gcs-endpoint <url>             JSON API endpoint (emulators)\n"
        "  --gcs-prefix <prefix>            Object name prefix inside the bucket\n"
        "  --gcs-no-verify-ssl              Skip SSL verification\n";
}

std::optional<ServiceConfig> ServiceConfig::from_args(int argc, char* argv[]) {
    ServiceConfig config;

    auto err = config.apply_env();
    if (!err.empty()) {
        std::cerr << "Error: " << err << "\n";
        return std::nullopt;
    }

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        auto handled = parse_backend_option(config, argc, argv, i);
        if (handled == OptionResult::Error) return std::nullopt;
        if (handled == OptionResult::Handled) continue;

        std::string arg = argv[i];

        if (arg == "--upload-limit") {
            auto* v = next_arg(i, "--upload-limit");
            if (!v || !parse_number_arg("--upload-limit", v, config.upload_limit)) return std::nullopt;
        } else if (arg == "--download-limit") {
            auto* v = next_arg(i, "--download-limit");
            if (!v || !parse_number_arg("--download-limit", v, config.download_limit)) return std::nullopt;
        } else if (arg == "--inactivity-days") {
            auto* v = next_arg(i, "--inactivity-days");
            if (!v || !parse_number_arg("--inactivity-days", v, config.inactivity_days)) return std::nullopt;
        } else if (arg == "--cleanup-interval-hours") {
            auto* v = next_arg(i, "--cleanup-interval-hours");
            if (!v || !parse_number_arg("--cleanup-interval-hours", v, config.cleanup_interval_hours))
                return std::nullopt;
        } else if (arg == "--usage-sweep-interval") {
            auto* v = next_arg(i, "--usage-sweep-interval");
            if (!v || !parse_size_arg("--usage-sweep-interval", v, config.usage_sweep_interval_secs))
                return std::nullopt;
        } else if (arg == "--state-dir") {
            auto* v = next_arg(i, "--state-dir");
            if (!v) return std::nullopt;
            config.state_dir = v;
        } else if (arg == "--control-threads") {
            auto* v = next_arg(i, "--control-threads");
            if (!v || !parse_size_arg("--control-threads", v, config.control_threads)) return std::nullopt;
        } else if (arg == "--no-control") {
            config.control_enabled = false;
        } else if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--daemon") {
            config.daemonize = true;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--pid-file") {
            auto* v = next_arg(i, "--pid-file");
            if (!v) return std::nullopt;
            config.pid_file = v;
        } else if (arg == "--log-file") {
            auto* v = next_arg(i, "--log-file");
            if (!v) return std::nullopt;
            config.log_file = v;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            auto* v = next_arg(i, "--metrics-interval");
            if (!v || !parse_size_arg("--metrics-interval", v, config.metrics_interval_secs))
                return std::nullopt;
        } else if (arg == "--help" || arg == "-h") {
            std::cerr <<
                "Usage: blobvaultd [options]\n"
                "\n" << backend_options_usage() <<
                "\n"
                "Limits (per origin, per local calendar day):\n"
                "  --upload-limit <bytes>           Upload ceiling (env UPLOAD_LIMIT, default: 104857600)\n"
                "  --download-limit <bytes>         Download ceiling (env DOWNLOAD_LIMIT, default: 524288000)\n"
                "  --usage-sweep-interval <secs>    Reclaim stale usage counters (default: 3600)\n"
                "\n"
                "Eviction:\n"
                "  --inactivity-days <N>            Evict after N days unread (env INACTIVITY_PERIOD_DAYS, default: 30)\n"
                "  --cleanup-interval-hours <N>     Cleanup cycle period (env CLEANUP_INTERVAL_HOURS, default: 24)\n"
                "\n"
                "Control socket:\n"
                "  --state-dir <dir>                Directory for control.sock (default: <root>/.blobvault)\n"
                "  --control-threads <N>            Request worker threads (default: 8)\n"
                "  --no-control                     Do not open the control socket\n"
                "\n"
                "Daemon options:\n"
                "  --config <path>                  JSON config file\n"
                "  --daemon                         Run as daemon\n"
                "  --verbose                        Verbose output\n"
                "  --pid-file <path>                PID file path\n"
                "  --log-file <path>                Log file path\n"
                "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
                "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
                "  --help                           Show this help\n";
            return std::nullopt;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    config.apply_defaults();
    return config;
}

std::string ServiceConfig::apply_env() {
    if (const char* v = std::getenv("PROVIDER"); v && *v) {
        backend.type = v;
    }
    if (const char* v = std::getenv("FOLDER"); v && *v) {
        backend.params["path"] = v;
    }

    struct NumericEnv {
        const char* name;
        uint64_t* target;
    };
    const NumericEnv numeric[] = {
        {"UPLOAD_LIMIT", &upload_limit},
        {"DOWNLOAD_LIMIT", &download_limit},
        {"INACTIVITY_PERIOD_DAYS", &inactivity_days},
        {"CLEANUP_INTERVAL_HOURS", &cleanup_interval_hours},
    };
    for (const auto& env : numeric) {
        const char* v = std::getenv(env.name);
        if (!v || !*v) continue;
        if (!parse_u64(v, *env.target)) {
            return std::string(env.name) + " must be a non-negative integer, got '" + v + "'";
        }
    }

    if (const char* v = std::getenv("CONFIG"); v && *v) {
        if (!load_provider_file(v)) {
            return std::string("cannot load provider file from CONFIG=") + v;
        }
    }
    return {};
}

bool ServiceConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("root")) backend.params["path"] = j["root"].get<std::string>();
        if (j.contains("backend_config")) {
            if (!load_provider_file(j["backend_config"].get<std::string>())) return false;
        }
        if (j.contains("file_prefix")) file_prefix = j["file_prefix"].get<std::string>();
        if (j.contains("metadata_prefix")) metadata_prefix = j["metadata_prefix"].get<std::string>();
        if (j.contains("upload_limit")) upload_limit = j["upload_limit"].get<uint64_t>();
        if (j.contains("download_limit")) download_limit = j["download_limit"].get<uint64_t>();
        if (j.contains("usage_sweep_interval"))
            usage_sweep_interval_secs = j["usage_sweep_interval"].get<size_t>();
        if (j.contains("inactivity_days")) inactivity_days = j["inactivity_days"].get<uint64_t>();
        if (j.contains("cleanup_interval_hours"))
            cleanup_interval_hours = j["cleanup_interval_hours"].get<uint64_t>();
        if (j.contains("state_dir")) state_dir = j["state_dir"].get<std::string>();
        if (j.contains("control_threads")) control_threads = j["control_threads"].get<size_t>();
        if (j.contains("control_enabled")) control_enabled = j["control_enabled"].get<bool>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("pid_file")) pid_file = j["pid_file"].get<std::string>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        // "backend": "gcs" or {"type": "gcs", "bucket": "...", ...}
        if (j.contains("backend")) {
            auto& jb = j["backend"];
            if (jb.is_string()) {
                backend.type = jb.get<std::string>();
            } else if (jb.is_object()) {
                if (jb.contains("type")) backend.type = jb["type"].get<std::string>();
                for (auto& [key, val] : jb.items()) {
                    if (key != "type") {
                        backend.params[key] = param_value(val);
                    }
                }
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

bool ServiceConfig::load_provider_file(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open provider file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        auto& p = backend.params;
        if (j.contains("bucket")) p["bucket"] = j["bucket"].get<std::string>();
        if (j.contains("projectId")) p["project_id"] = j["projectId"].get<std::string>();
        if (j.contains("endpoint")) p["endpoint"] = j["endpoint"].get<std::string>();
        if (j.contains("location")) p["location"] = j["location"].get<std::string>();
        if (j.contains("storageClass")) p["storage_class"] = j["storageClass"].get<std::string>();
        if (j.contains("createBucketIfNotExists"))
            p["create_bucket"] = j["createBucketIfNotExists"].get<bool>() ? "true" : "false";

        // Credentials: a key file path, or the service account object inline
        if (j.contains("credentials")) {
            auto& jc = j["credentials"];
            if (jc.is_string()) {
                p["credentials_file"] = jc.get<std::string>();
                p.erase("credentials_json");
            } else if (jc.is_object()) {
                p["credentials_json"] = jc.dump();
                p.erase("credentials_file");
            }
        }

        if (j.contains("filePrefix")) file_prefix = j["filePrefix"].get<std::string>();
        if (j.contains("metadataPrefix")) metadata_prefix = j["metadataPrefix"].get<std::string>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing provider file: " << e.what() << "\n";
        return false;
    }
}

void ServiceConfig::apply_defaults() {
    if (backend.type == "local" &&
        (backend.params.count("path") == 0 || backend.params["path"].empty())) {
        backend.params["path"] = "./storage";
    }

    if (state_dir.empty()) {
        if (backend.type == "local") {
            state_dir = std::filesystem::path(backend.params["path"]) / ".blobvault";
        } else {
            state_dir = "/tmp/blobvault";
        }
    }
}

std::string ServiceConfig::validate() const {
    auto err = backend.validate();
    if (!err.empty()) return err;

    if (upload_limit == 0) return "upload_limit must be positive";
    if (download_limit == 0) return "download_limit must be positive";
    if (inactivity_days == 0) return "inactivity_days must be positive";
    if (cleanup_interval_hours == 0) return "cleanup_interval_hours must be positive";
    if (inactivity_days > kMaxInactivityDays) {
        return "inactivity_days must be at most " + std::to_string(kMaxInactivityDays);
    }
    if (cleanup_interval_hours > kMaxCleanupIntervalHours) {
        return "cleanup_interval_hours must be at most " + std::to_string(kMaxCleanupIntervalHours);
    }
    if (usage_sweep_interval_secs == 0) return "usage_sweep_interval must be positive";
    if (metrics_interval_secs == 0) return "metrics_interval must be positive";
    if (control_enabled && control_threads == 0) return "control_threads must be positive";
    if (control_enabled && state_dir.empty()) return "state_dir is required for the control socket";

    auto l = layout();
    if (l.file_prefix == l.metadata_prefix) {
        return "file and metadata prefixes must differ";
    }
    if (l.metadata_prefix.empty()) {
        return "metadata prefix must not be empty";
    }
    if (l.file_prefix.starts_with(l.metadata_prefix) || l.metadata_prefix.starts_with(l.file_prefix)) {
        return "file and metadata prefixes must not nest";
    }
    return {};
}

StoreLayout ServiceConfig::layout() const {
    StoreLayout l = backend.type == "gcs" ? StoreLayout::for_gcs() : StoreLayout{};
    if (!file_prefix.empty()) l.file_prefix = file_prefix;
    if (!metadata_prefix.empty()) l.metadata_prefix = metadata_prefix;
    return l;
}

std::string ServiceConfig::describe() const {
    std::ostringstream out;
    out << "  backend: " << backend.type << "\n";
    for (const auto& [key, value] : backend.params) {
        out << "    " << key << ": " << (is_secret_param(key) ? "****" : value) << "\n";
    }
    auto l = layout();
    out << "  file prefix: " << l.file_prefix << "\n"
        << "  metadata prefix: " << l.metadata_prefix << "\n"
        << "  upload limit: " << upload_limit << " bytes/day\n"
        << "  download limit: " << download_limit << " bytes/day\n"
        << "  inactivity: " << inactivity_days << " days\n"
        << "  cleanup interval: " << cleanup_interval_hours << " hours\n"
        << "  usage sweep interval: " << usage_sweep_interval_secs << "s\n";
    if (control_enabled) {
        out << "  control socket: " << (state_dir / "control.sock").string()
            << " (" << control_threads << " workers)\n";
    } else {
        out << "  control socket: disabled\n";
    }
    if (!metrics_file.empty()) {
        out << "  metrics: " << metrics_file.string() << " every " << metrics_interval_secs << "s\n";
    }
    return out.str();
}

}  // namespace blobvault
