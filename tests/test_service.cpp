// Test suite for the blobvault service layer.
//
// Tests:
//   1. TrafficLedger: ceilings, optimistic admission, isolation, day rollover
//   2. FileService: admission -> store -> recording, including the
//      denied-upload and upload-then-download scenarios
//   3. ServiceConfig: CLI, environment, JSON config, provider file, validation
//   4. ControlServer: request/response over the Unix socket
//   5. MetricsExporter: textfile output, scheduler counters

#include "test_harness.hpp"

#include "blobvault/blob_store.hpp"
#include "blobvault/cleanup_scheduler.hpp"
#include "blobvault/control_server.hpp"
#include "blobvault/errors.hpp"
#include "blobvault/file_service.hpp"
#include "blobvault/metrics.hpp"
#include "blobvault/service_config.hpp"
#include "blobvault/storage/backend.hpp"
#include "blobvault/traffic_ledger.hpp"

#include <cstring>
#include <ctime>
#include <optional>
#include <sstream>
#include <sys/socket.h>
#include <sys/un.h>

using namespace blobvault;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

namespace {

/// Local wall-clock time on a fixed date.
Timestamp local_time(int year, int month, int day, int hour, int minute) {
    struct tm tm_val{};
    tm_val.tm_year = year - 1900;
    tm_val.tm_mon = month - 1;
    tm_val.tm_mday = day;
    tm_val.tm_hour = hour;
    tm_val.tm_min = minute;
    tm_val.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(mktime(&tm_val));
}

/// Clock pinned to a settable instant.
struct ManualClock {
    std::atomic<int64_t> ms{0};

    explicit ManualClock(Timestamp start) { set(start); }
    void set(Timestamp tp) {
        ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }
    void advance(std::chrono::milliseconds d) { ms += d.count(); }
    std::function<Timestamp()> fn() {
        return [this] { return Timestamp(std::chrono::milliseconds(ms.load())); };
    }
};

size_t count_files(const fs::path& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) return 0;
    size_t n = 0;
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file()) ++n;
    }
    return n;
}

std::optional<ServiceConfig> parse_args(std::vector<std::string> args) {
    args.insert(args.begin(), "blobvaultd");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return ServiceConfig::from_args(static_cast<int>(argv.size()), argv.data());
}

void clear_env() {
    for (const char* name : {"PROVIDER", "FOLDER", "CONFIG", "UPLOAD_LIMIT", "DOWNLOAD_LIMIT",
                             "INACTIVITY_PERIOD_DAYS", "CLEANUP_INTERVAL_HOURS"}) {
        unsetenv(name);
    }
}

/// Send one request on the control socket and return everything the server
/// writes back.
std::string control_request(const fs::path& sock_path, const std::string& request) {
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return "";

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        return "";
    }

    size_t off = 0;
    while (off < request.size()) {
        ssize_t n = send(fd, request.data() + off, request.size() - off, MSG_NOSIGNAL);
        if (n <= 0) break;
        off += static_cast<size_t>(n);
    }
    shutdown(fd, SHUT_WR);

    std::string resp;
    char buf[4096];
    ssize_t n;
    while ((n = recv(fd, buf, sizeof(buf), 0)) > 0) {
        resp.append(buf, static_cast<size_t>(n));
    }
    close(fd);
    return resp;
}

/// First line of a reply, without the newline.
std::string header_of(const std::string& reply) {
    auto nl = reply.find('\n');
    return nl == std::string::npos ? reply : reply.substr(0, nl);
}

std::vector<std::string> words(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream in(line);
    std::string w;
    while (in >> w) out.push_back(w);
    return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// 1. TrafficLedger
// ---------------------------------------------------------------------------

static void test_traffic_ledger() {
    std::cout << "\n=== TrafficLedger ===" << std::endl;

    {
        TEST(fresh_origin_admitted_with_zero_usage);
        TrafficLedger ledger(1024, 2048);
        ASSERT_TRUE(ledger.check_upload("a"), "upload admitted");
        ASSERT_TRUE(ledger.check_download("a"), "download admitted");
        auto u = ledger.usage("a");
        ASSERT_EQ(u.uploaded, uint64_t{0}, "uploaded");
        ASSERT_EQ(u.downloaded, uint64_t{0}, "downloaded");
        ASSERT_EQ(u.upload_limit, uint64_t{1024}, "upload limit");
        ASSERT_EQ(u.download_limit, uint64_t{2048}, "download limit");
        ASSERT_EQ(ledger.tracked_counters(), size_t{0}, "checks create no counters");
        PASS();
    }
    {
        TEST(default_limits);
        TrafficLedger ledger;
        ASSERT_EQ(ledger.upload_limit(), uint64_t{100} * 1024 * 1024, "100 MiB upload");
        ASSERT_EQ(ledger.download_limit(), uint64_t{500} * 1024 * 1024, "500 MiB download");
        PASS();
    }
    {
        TEST(denied_at_ceiling);
        TrafficLedger ledger(1024, 1024);
        ledger.record_upload("a", 1023);
        ASSERT_TRUE(ledger.check_upload("a"), "one byte below ceiling is admitted");
        ledger.record_upload("a", 1);
        ASSERT_TRUE(!ledger.check_upload("a"), "at ceiling is denied");
        ledger.record_download("a", 5000);
        ASSERT_TRUE(!ledger.check_download("a"), "above ceiling is denied");
        PASS();
    }
    {
        TEST(optimistic_admission_lets_crossing_request_through);
        TrafficLedger ledger(1024, 1024);
        ledger.record_upload("a", 1000);
        ASSERT_TRUE(ledger.check_upload("a"), "below ceiling admits regardless of request size");
        ledger.record_upload("a", 2048);
        ASSERT_EQ(ledger.usage("a").uploaded, uint64_t{3048}, "recorded past the ceiling");
        ASSERT_TRUE(!ledger.check_upload("a"), "next request denied");
        PASS();
    }
    {
        TEST(origins_do_not_interfere);
        TrafficLedger ledger(100, 100);
        ledger.record_upload("a", 100);
        ledger.record_download("a", 7);
        ASSERT_EQ(ledger.usage("b").uploaded, uint64_t{0}, "b untouched");
        ASSERT_TRUE(ledger.check_upload("b"), "b admitted");
        ASSERT_TRUE(!ledger.check_upload("a"), "a denied");
        ASSERT_EQ(ledger.usage("a").downloaded, uint64_t{7}, "directions tracked separately");
        PASS();
    }
    {
        TEST(new_day_starts_from_zero);
        ManualClock clock(local_time(2024, 6, 15, 23, 59));
        TrafficLedger ledger(100, 100, clock.fn());
        ledger.record_upload("a", 100);
        ASSERT_TRUE(!ledger.check_upload("a"), "denied before midnight");
        clock.advance(2min);
        ASSERT_TRUE(ledger.check_upload("a"), "admitted after midnight");
        ASSERT_EQ(ledger.usage("a").uploaded, uint64_t{0}, "fresh counter");
        PASS();
    }
    {
        TEST(reclaim_drops_previous_days);
        ManualClock clock(local_time(2024, 6, 15, 23, 59));
        TrafficLedger ledger(100, 100, clock.fn());
        ledger.record_upload("a", 1);
        ledger.record_upload("b", 1);
        ASSERT_EQ(ledger.reclaim(), size_t{0}, "nothing stale yet");
        clock.advance(2min);
        ledger.record_upload("c", 1);
        ASSERT_EQ(ledger.tracked_counters(), size_t{3}, "three live counters");
        ASSERT_EQ(ledger.reclaim(), size_t{2}, "yesterday's counters dropped");
        ASSERT_EQ(ledger.tracked_counters(), size_t{1}, "today's counter kept");
        ASSERT_EQ(ledger.usage("c").uploaded, uint64_t{1}, "today's value intact");
        PASS();
    }
    {
        TEST(background_reclaimer_sweeps);
        ManualClock clock(local_time(2024, 6, 15, 12, 0));
        TrafficLedger ledger(100, 100, clock.fn());
        ledger.record_download("a", 10);
        ledger.start_reclaimer(20ms);
        clock.advance(std::chrono::hours(24));
        bool swept = wait_for([&] { return ledger.tracked_counters() == 0; });
        ledger.stop_reclaimer();
        ASSERT_TRUE(swept, "stale counter reclaimed by the sweep");
        PASS();
    }
    {
        TEST(day_key_format);
        auto key = TrafficLedger::day_key(local_time(2024, 2, 29, 10, 30));
        ASSERT_EQ(key, std::string("2024-02-29"), "local calendar day");
        PASS();
    }
    {
        TEST(concurrent_records_are_not_lost);
        TrafficLedger ledger(1ull << 40, 1ull << 40);
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < 1000; ++i) {
                    ledger.record_upload("shared", 1);
                }
            });
        }
        for (auto& th : threads) th.join();
        ASSERT_EQ(ledger.usage("shared").uploaded, uint64_t{8000}, "all increments counted");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. FileService
// ---------------------------------------------------------------------------

static void test_file_service() {
    std::cout << "\n=== FileService ===" << std::endl;

    auto tmpdir = make_temp_dir("blobvault-service");
    BlobStore store(StorageBackendFactory::create_local(tmpdir));

    {
        TEST(upload_denied_when_ceiling_consumed);
        TrafficLedger ledger(1024, 1024);
        FileService service(store, ledger);
        ledger.record_upload("X", 1024);

        std::vector<uint8_t> two_kb(2048, 'z');
        bool denied = false;
        try {
            service.upload("X", two_kb, "big.bin", "application/octet-stream");
        } catch (const LimitExceededError& e) {
            denied = true;
            ASSERT_TRUE(e.direction() == LimitExceededError::Direction::Upload, "upload direction");
            ASSERT_EQ(e.used(), uint64_t{1024}, "used");
            ASSERT_EQ(e.limit(), uint64_t{1024}, "limit");
        }
        ASSERT_TRUE(denied, "upload should be refused");
        ASSERT_EQ(count_files(tmpdir / "files"), size_t{0}, "no content stored");
        ASSERT_EQ(ledger.usage("X").uploaded, uint64_t{1024}, "nothing recorded for the refusal");
        PASS();
    }
    {
        TEST(upload_then_download_roundtrip);
        TrafficLedger ledger(1024, 1024);
        FileService service(store, ledger);
        std::string text = "payload for the round trip";
        auto keys = service.upload("Y", bytes_of(text), "p.txt", "text/plain");
        auto blob = service.download("Y", keys.public_key);
        ASSERT_EQ(string_of(blob.content), text, "downloaded bytes equal uploaded bytes");
        auto u = ledger.usage("Y");
        ASSERT_EQ(u.uploaded, uint64_t{text.size()}, "upload recorded");
        ASSERT_EQ(u.downloaded, uint64_t{text.size()}, "download recorded");
        auto rec = store.get_metadata(keys.public_key);
        ASSERT_TRUE(rec.last_accessed.has_value(), "lastAccessed updated");
        PASS();
    }
    {
        TEST(download_ceiling_is_optimistic);
        TrafficLedger ledger(1024, 10);
        FileService service(store, ledger);
        auto keys = service.upload("Z", std::vector<uint8_t>(20, 'a'), "a", "");
        service.download("Z", keys.public_key);  // admitted at 0 < 10, records 20
        ASSERT_THROWS(service.download("Z", keys.public_key), LimitExceededError,
                      "second download refused");
        ASSERT_EQ(ledger.usage("Z").downloaded, uint64_t{20}, "only the admitted download counted");
        PASS();
    }
    {
        TEST(invalid_key_rejected_before_admission);
        TrafficLedger ledger(1024, 1024);
        FileService service(store, ledger);
        ASSERT_THROWS(service.download("W", "../../etc/passwd"), ValidationError, "bad key");
        ASSERT_EQ(ledger.tracked_counters(), size_t{0}, "no counter created");
        PASS();
    }
    {
        TEST(missing_object_records_nothing);
        TrafficLedger ledger(1024, 1024);
        FileService service(store, ledger);
        ASSERT_THROWS(service.download("W", std::string(64, 'f')), NotFoundError, "not found");
        ASSERT_EQ(ledger.usage("W").downloaded, uint64_t{0}, "no bytes recorded");
        PASS();
    }
    {
        TEST(remove_by_private_key);
        TrafficLedger ledger(1024, 1024);
        FileService service(store, ledger);
        auto keys = service.upload("V", bytes_of("x"), "x", "");
        ASSERT_TRUE(service.remove(keys.private_key), "first delete");
        ASSERT_TRUE(!service.remove(keys.private_key), "second delete");
        ASSERT_THROWS(service.download("V", keys.public_key), NotFoundError, "gone");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 3. ServiceConfig
// ---------------------------------------------------------------------------

static void test_service_config() {
    std::cout << "\n=== ServiceConfig ===" << std::endl;

    clear_env();
    auto tmpdir = make_temp_dir("blobvault-config");

    {
        TEST(backend_config_validation);
        BackendConfig bc;
        bc.type = "";
        ASSERT_NOT_EMPTY(bc.validate(), "empty type should fail");
        bc.type = "ftp";
        ASSERT_TRUE(bc.validate().find("unknown") != std::string::npos, "unknown type");
        bc.type = "gcs";
        ASSERT_TRUE(bc.validate().find("bucket") != std::string::npos, "gcs needs bucket");
        bc.params["bucket"] = "b";
        ASSERT_EMPTY(bc.validate(), "gcs with bucket");
        bc.type = "local";
        ASSERT_TRUE(bc.validate().find("path") != std::string::npos, "local needs path");
        PASS();
    }
    {
        TEST(defaults);
        auto cfg = parse_args({});
        ASSERT_TRUE(cfg.has_value(), "no args should parse");
        ASSERT_EQ(cfg->backend.type, std::string("local"), "local backend");
        ASSERT_EQ(cfg->backend.params["path"], std::string("./storage"), "default root");
        ASSERT_EQ(cfg->state_dir, fs::path("./storage/.blobvault"), "state dir under root");
        ASSERT_EQ(cfg->upload_limit, uint64_t{104857600}, "upload limit");
        ASSERT_EQ(cfg->download_limit, uint64_t{524288000}, "download limit");
        ASSERT_EQ(cfg->inactivity_days, uint64_t{30}, "inactivity");
        ASSERT_EQ(cfg->cleanup_interval_hours, uint64_t{24}, "cleanup interval");
        ASSERT_EQ(cfg->usage_sweep_interval_secs, size_t{3600}, "sweep interval");
        ASSERT_TRUE(cfg->control_enabled, "control socket on by default");
        ASSERT_EMPTY(cfg->validate(), "defaults are valid");
        ASSERT_EQ(cfg->layout().metadata_prefix, std::string(".metadata/"), "local layout");
        PASS();
    }
    {
        TEST(gcs_flags);
        auto cfg = parse_args({"--backend", "gcs", "--gcs-bucket", "bkt",
                               "--gcs-project-id", "proj", "--gcs-endpoint", "http://localhost:4443",
                               "--gcs-no-verify-ssl"});
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->backend.type, std::string("gcs"), "type");
        ASSERT_EQ(cfg->backend.params["bucket"], std::string("bkt"), "bucket");
        ASSERT_EQ(cfg->backend.params["project_id"], std::string("proj"), "project");
        ASSERT_EQ(cfg->backend.params["verify_ssl"], std::string("false"), "verify ssl");
        ASSERT_EQ(cfg->state_dir, fs::path("/tmp/blobvault"), "gcs state dir");
        ASSERT_EQ(cfg->layout().metadata_prefix, std::string("metadata/"), "gcs layout");
        ASSERT_TRUE(cfg->backend.params.count("path") == 0, "no local root for gcs");
        ASSERT_EMPTY(cfg->validate(), "valid");
        PASS();
    }
    {
        TEST(service_flags);
        auto cfg = parse_args({"--root", "/srv/blobs", "--upload-limit", "2048",
                               "--download-limit", "4096", "--inactivity-days", "7",
                               "--cleanup-interval-hours", "6", "--usage-sweep-interval", "60",
                               "--control-threads", "2", "--metrics-file", "/tmp/bv.prom",
                               "--metrics-interval", "5", "--verbose", "--no-control"});
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->backend.params["path"], std::string("/srv/blobs"), "root");
        ASSERT_EQ(cfg->upload_limit, uint64_t{2048}, "upload");
        ASSERT_EQ(cfg->download_limit, uint64_t{4096}, "download");
        ASSERT_EQ(cfg->inactivity_days, uint64_t{7}, "inactivity");
        ASSERT_EQ(cfg->cleanup_interval_hours, uint64_t{6}, "cleanup");
        ASSERT_EQ(cfg->usage_sweep_interval_secs, size_t{60}, "sweep");
        ASSERT_EQ(cfg->control_threads, size_t{2}, "threads");
        ASSERT_EQ(cfg->metrics_interval_secs, size_t{5}, "metrics interval");
        ASSERT_TRUE(cfg->verbose, "verbose");
        ASSERT_TRUE(!cfg->control_enabled, "control disabled");
        ASSERT_EQ(cfg->state_dir, fs::path("/srv/blobs/.blobvault"), "state dir follows root");
        PASS();
    }
    {
        TEST(bad_arguments_rejected);
        ASSERT_TRUE(!parse_args({"--upload-limit", "lots"}), "non-numeric limit");
        ASSERT_TRUE(!parse_args({"--upload-limit", "-5"}), "negative limit");
        ASSERT_TRUE(!parse_args({"--inactivity-days"}), "missing value");
        ASSERT_TRUE(!parse_args({"--frobnicate"}), "unknown option");
        ASSERT_TRUE(!parse_args({"--config", (tmpdir / "missing.json").string()}),
                    "missing config file");
        PASS();
    }
    {
        TEST(environment_overlay);
        setenv("PROVIDER", "local", 1);
        setenv("FOLDER", "/data/env-root", 1);
        setenv("UPLOAD_LIMIT", "111", 1);
        setenv("DOWNLOAD_LIMIT", "222", 1);
        setenv("INACTIVITY_PERIOD_DAYS", "3", 1);
        setenv("CLEANUP_INTERVAL_HOURS", "2", 1);
        auto cfg = parse_args({"--download-limit", "999"});
        clear_env();
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->backend.params["path"], std::string("/data/env-root"), "FOLDER");
        ASSERT_EQ(cfg->upload_limit, uint64_t{111}, "UPLOAD_LIMIT");
        ASSERT_EQ(cfg->download_limit, uint64_t{999}, "CLI overrides environment");
        ASSERT_EQ(cfg->inactivity_days, uint64_t{3}, "INACTIVITY_PERIOD_DAYS");
        ASSERT_EQ(cfg->cleanup_interval_hours, uint64_t{2}, "CLEANUP_INTERVAL_HOURS");
        PASS();
    }
    {
        TEST(bad_environment_rejected);
        setenv("UPLOAD_LIMIT", "ten", 1);
        auto cfg = parse_args({});
        clear_env();
        ASSERT_TRUE(!cfg.has_value(), "non-numeric UPLOAD_LIMIT");
        PASS();
    }
    {
        TEST(json_config_file);
        auto path = tmpdir / "blobvault.json";
        write_file(path, R"({
            "backend": {"type": "gcs", "bucket": "json-bucket", "create_bucket": true},
            "upload_limit": 5000,
            "inactivity_days": 14,
            "state_dir": "/run/blobvault",
            "control_threads": 3,
            "metrics_file": "/var/lib/node_exporter/blobvault.prom"
        })");
        auto cfg = parse_args({"--config", path.string()});
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->backend.type, std::string("gcs"), "type");
        ASSERT_EQ(cfg->backend.params["bucket"], std::string("json-bucket"), "bucket");
        ASSERT_EQ(cfg->backend.params["create_bucket"], std::string("true"), "bool param");
        ASSERT_EQ(cfg->upload_limit, uint64_t{5000}, "upload");
        ASSERT_EQ(cfg->inactivity_days, uint64_t{14}, "inactivity");
        ASSERT_EQ(cfg->state_dir, fs::path("/run/blobvault"), "state dir");
        ASSERT_EQ(cfg->control_threads, size_t{3}, "threads");
        PASS();
    }
    {
        TEST(later_arguments_win);
        auto path = tmpdir / "limits.json";
        write_file(path, R"({"upload_limit": 9})");
        auto a = parse_args({"--upload-limit", "5", "--config", path.string()});
        auto b = parse_args({"--config", path.string(), "--upload-limit", "5"});
        ASSERT_TRUE(a && b, "both parse");
        ASSERT_EQ(a->upload_limit, uint64_t{9}, "config after flag wins");
        ASSERT_EQ(b->upload_limit, uint64_t{5}, "flag after config wins");
        PASS();
    }
    {
        TEST(malformed_json_rejected);
        auto path = tmpdir / "bad.json";
        write_file(path, "{\"upload_limit\": ");
        ASSERT_TRUE(!parse_args({"--config", path.string()}), "truncated JSON");
        write_file(path, R"({"upload_limit": "lots"})");
        ASSERT_TRUE(!parse_args({"--config", path.string()}), "mistyped field");
        PASS();
    }
    {
        TEST(provider_file_with_inline_credentials);
        auto path = tmpdir / "gcs.json";
        write_file(path, R"({
            "bucket": "provider-bucket",
            "projectId": "provider-project",
            "credentials": {"type": "service_account", "client_email": "svc@example.com"},
            "metadataPrefix": "meta/",
            "filePrefix": "blobs/",
            "createBucketIfNotExists": true,
            "location": "EU",
            "storageClass": "NEARLINE"
        })");
        auto cfg = parse_args({"--backend", "gcs", "--backend-config", path.string()});
        ASSERT_TRUE(cfg.has_value(), "should parse");
        auto& p = cfg->backend.params;
        ASSERT_EQ(p["bucket"], std::string("provider-bucket"), "bucket");
        ASSERT_EQ(p["project_id"], std::string("provider-project"), "project");
        ASSERT_EQ(p["create_bucket"], std::string("true"), "create bucket");
        ASSERT_EQ(p["location"], std::string("EU"), "location");
        ASSERT_EQ(p["storage_class"], std::string("NEARLINE"), "storage class");
        ASSERT_TRUE(p["credentials_json"].find("svc@example.com") != std::string::npos,
                    "inline credentials kept as JSON");
        ASSERT_EQ(cfg->layout().metadata_prefix, std::string("meta/"), "metadata prefix");
        ASSERT_EQ(cfg->layout().file_prefix, std::string("blobs/"), "file prefix");
        ASSERT_TRUE(cfg->describe().find("svc@example.com") == std::string::npos,
                    "credentials masked in describe()");
        PASS();
    }
    {
        TEST(provider_file_from_environment);
        auto path = tmpdir / "gcs-path.json";
        write_file(path, R"({"bucket": "env-bucket", "credentials": "/etc/gcs/key.json"})");
        setenv("PROVIDER", "gcs", 1);
        setenv("CONFIG", path.c_str(), 1);
        auto cfg = parse_args({});
        clear_env();
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->backend.params["bucket"], std::string("env-bucket"), "bucket");
        ASSERT_EQ(cfg->backend.params["credentials_file"], std::string("/etc/gcs/key.json"),
                  "credentials path");
        PASS();
    }
    {
        TEST(validation_errors);
        ServiceConfig cfg;
        cfg.backend.params["path"] = "/tmp";
        cfg.apply_defaults();
        ASSERT_EMPTY(cfg.validate(), "baseline valid");

        auto broken = cfg;
        broken.upload_limit = 0;
        ASSERT_TRUE(broken.validate().find("upload_limit") != std::string::npos, "zero upload");

        broken = cfg;
        broken.inactivity_days = 0;
        ASSERT_TRUE(broken.validate().find("inactivity") != std::string::npos, "zero inactivity");

        broken = cfg;
        broken.inactivity_days = ServiceConfig::kMaxInactivityDays + 1;
        ASSERT_TRUE(broken.validate().find("inactivity_days must be at most") != std::string::npos,
                    "inactivity beyond the clock range");

        broken = cfg;
        broken.cleanup_interval_hours = ServiceConfig::kMaxCleanupIntervalHours + 1;
        ASSERT_TRUE(broken.validate().find("cleanup_interval_hours must be at most") != std::string::npos,
                    "oversized cleanup interval");

        auto huge = parse_args({"--root", "/tmp", "--inactivity-days", "1000000"});
        ASSERT_TRUE(huge.has_value(), "flag parses");
        ASSERT_NOT_EMPTY(huge->validate(), "million-day inactivity rejected at startup");

        broken = cfg;
        broken.file_prefix = "same/";
        broken.metadata_prefix = "same/";
        ASSERT_TRUE(broken.validate().find("prefix") != std::string::npos, "identical prefixes");

        broken = cfg;
        broken.backend.type = "s3";
        ASSERT_TRUE(broken.validate().find("unknown") != std::string::npos, "unknown backend");
        PASS();
    }
    {
        TEST(backend_option_passthrough);
        ServiceConfig cfg;
        std::string a0 = "tool", a1 = "--limit", a2 = "5";
        char* argv[] = {a0.data(), a1.data(), a2.data()};
        int i = 1;
        ASSERT_TRUE(parse_backend_option(cfg, 3, argv, i) == OptionResult::NotBackendOption,
                    "non-backend flag left alone");
        ASSERT_EQ(i, 1, "index unchanged");
        std::string b1 = "--root", b2 = "/x";
        char* argv2[] = {a0.data(), b1.data(), b2.data()};
        ASSERT_TRUE(parse_backend_option(cfg, 3, argv2, i) == OptionResult::Handled, "root handled");
        ASSERT_EQ(i, 2, "value consumed");
        ASSERT_EQ(cfg.backend.params["path"], std::string("/x"), "root stored");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 4. ControlServer
// ---------------------------------------------------------------------------

static void test_control_server() {
    std::cout << "\n=== ControlServer ===" << std::endl;

    auto tmpdir = make_temp_dir("blobvault-control");
    BlobStore store(StorageBackendFactory::create_local(tmpdir / "root"));
    TrafficLedger ledger(8, 1024);
    FileService service(store, ledger);
    auto sock_path = tmpdir / "state" / "control.sock";
    ControlServer server(service, sock_path, 4);

    {
        TEST(start_creates_socket);
        auto err = server.start();
        ASSERT_EMPTY(err, "start failed");
        ASSERT_TRUE(fs::exists(sock_path), "socket file exists");
        PASS();
    }
    {
        TEST(health);
        auto reply = control_request(sock_path, "HEALTH\n");
        ASSERT_EQ(header_of(reply), std::string("OK local"), "health reply");
        PASS();
    }

    std::string public_key;
    std::string private_key;
    {
        TEST(put_returns_key_pair);
        auto reply = control_request(sock_path, "PUT web 5 text%2Fplain my%20notes.txt\nhello");
        auto w = words(header_of(reply));
        ASSERT_EQ(w.size(), size_t{3}, "OK <pub> <priv>: " + reply);
        ASSERT_EQ(w[0], std::string("OK"), "status");
        public_key = w[1];
        private_key = w[2];
        ASSERT_EQ(public_key.size(), size_t{64}, "public key length");
        PASS();
    }
    {
        TEST(get_returns_header_and_body);
        auto reply = control_request(sock_path, "GET web " + public_key + "\n");
        ASSERT_EQ(header_of(reply), std::string("OK 5 text%2Fplain my%20notes.txt"), "header");
        ASSERT_EQ(reply.substr(reply.find('\n') + 1), std::string("hello"), "body");
        PASS();
    }
    {
        TEST(usage_reports_counters);
        auto reply = control_request(sock_path, "USAGE web\n");
        ASSERT_EQ(header_of(reply), std::string("OK 5 5 8 1024"), "usage reply");
        PASS();
    }
    {
        TEST(upload_limit_reported);
        // 5 bytes used of 8: admitted, then 10 used: refused
        auto second = control_request(sock_path, "PUT web 5 text%2Fplain b.txt\nworld");
        ASSERT_EQ(words(header_of(second))[0], std::string("OK"), "second put admitted");
        auto third = control_request(sock_path, "PUT web 1 text%2Fplain c.txt\n!");
        ASSERT_EQ(header_of(third), std::string("LIMIT upload 10 8"), "third put refused");
        auto other = control_request(sock_path, "PUT cli 1 text%2Fplain d.txt\n!");
        ASSERT_EQ(words(header_of(other))[0], std::string("OK"), "other origin unaffected");
        PASS();
    }
    {
        TEST(empty_fields_roundtrip);
        auto put = control_request(sock_path, "PUT cli 2 %00 %00\nhi");
        auto w = words(header_of(put));
        ASSERT_TRUE(w.size() == 3 && w[0] == "OK", "put with empty type and name: " + put);
        auto get = control_request(sock_path, "GET cli " + w[1] + "\n");
        ASSERT_EQ(header_of(get), std::string("OK 2 %00 %00"), "empty fields keep their slots");
        PASS();
    }
    {
        TEST(private_key_cannot_read);
        auto reply = control_request(sock_path, "GET web " + private_key + "\n");
        ASSERT_EQ(header_of(reply), std::string("NOTFOUND"), "private key read refused");
        PASS();
    }
    {
        TEST(delete_then_notfound);
        ASSERT_EQ(header_of(control_request(sock_path, "DEL " + private_key + "\n")),
                  std::string("OK"), "first delete");
        ASSERT_EQ(header_of(control_request(sock_path, "DEL " + private_key + "\n")),
                  std::string("NOTFOUND"), "second delete");
        ASSERT_EQ(header_of(control_request(sock_path, "GET web " + public_key + "\n")),
                  std::string("NOTFOUND"), "get after delete");
        PASS();
    }
    {
        TEST(invalid_requests);
        auto bad_key = header_of(control_request(sock_path, "GET web ../../etc/passwd\n"));
        ASSERT_TRUE(bad_key.rfind("INVALID", 0) == 0, "malformed key: " + bad_key);
        auto unknown = header_of(control_request(sock_path, "FETCH x\n"));
        ASSERT_TRUE(unknown.rfind("INVALID", 0) == 0, "unknown command: " + unknown);
        auto bad_size = header_of(control_request(sock_path, "PUT web many a b\n"));
        ASSERT_TRUE(bad_size.rfind("INVALID", 0) == 0, "bad size: " + bad_size);
        auto too_big = header_of(control_request(
            sock_path, "PUT web " + std::to_string(ControlServer::MAX_BODY_BYTES + 1) + " a b\n"));
        ASSERT_TRUE(too_big.rfind("INVALID", 0) == 0, "oversized body: " + too_big);
        auto truncated = header_of(control_request(sock_path, "PUT cli 10 a b\nabc"));
        ASSERT_TRUE(truncated.rfind("INVALID", 0) == 0, "truncated body: " + truncated);
        PASS();
    }
    {
        TEST(parallel_clients);
        std::atomic<int> ok{0};
        std::vector<std::thread> clients;
        for (int t = 0; t < 8; ++t) {
            clients.emplace_back([&] {
                if (header_of(control_request(sock_path, "HEALTH\n")) == "OK local") ++ok;
            });
        }
        for (auto& c : clients) c.join();
        ASSERT_EQ(ok.load(), 8, "every client answered");
        PASS();
    }
    {
        TEST(stop_removes_socket);
        server.stop();
        ASSERT_TRUE(!fs::exists(sock_path), "socket removed");
        server.stop();
        PASS();
    }
    {
        TEST(repeated_start_stop_never_hangs);
        auto cycle_path = tmpdir / "state" / "cycle.sock";
        for (int i = 0; i < 50; ++i) {
            ControlServer cycling(service, cycle_path, 4);
            auto err = cycling.start();
            ASSERT_EMPTY(err, "start failed");
            if (i % 10 == 0) {
                ASSERT_EQ(header_of(control_request(cycle_path, "HEALTH\n")),
                          std::string("OK local"), "answers between restarts");
            }
            cycling.stop();
        }
        ASSERT_TRUE(!fs::exists(cycle_path), "socket removed after last stop");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 5. MetricsExporter
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== MetricsExporter ===" << std::endl;

    auto tmpdir = make_temp_dir("blobvault-metrics");
    auto prom_path = tmpdir / "blobvault.prom";

    {
        TEST(service_activity_exported);
        BlobStore store(StorageBackendFactory::create_local(tmpdir / "root"));
        TrafficLedger ledger(4, 1024);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {{"instance", "test"}});
        exporter.set_store(&store);
        exporter.set_ledger(&ledger);
        FileService service(store, ledger, &exporter);

        auto keys = service.upload("m", bytes_of("12345"), "a", "");
        service.download("m", keys.public_key);
        ASSERT_THROWS(service.upload("m", bytes_of("x"), "b", ""), LimitExceededError, "denied");

        ASSERT_TRUE(exporter.write_file(), "write_file should succeed");
        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("blobvault_requests_total") != std::string::npos, "requests");
        ASSERT_TRUE(content.find("result=\"limited\"") != std::string::npos, "limited result");
        ASSERT_TRUE(content.find("blobvault_transfer_bytes_total") != std::string::npos, "bytes");
        ASSERT_TRUE(content.find("blobvault_admission_denied_total") != std::string::npos, "denials");
        ASSERT_TRUE(content.find("blobvault_backend_healthy") != std::string::npos, "health gauge");
        ASSERT_TRUE(content.find("blobvault_ledger_counters") != std::string::npos, "ledger gauge");
        ASSERT_TRUE(content.find("instance=\"test\"") != std::string::npos, "constant label");
        ASSERT_EQ(exporter.upload_bytes().Value(), 5.0, "upload bytes counter");
        ASSERT_EQ(exporter.download_bytes().Value(), 5.0, "download bytes counter");
        ASSERT_EQ(exporter.upload_denied().Value(), 1.0, "upload denial counter");
        PASS();
    }
    {
        TEST(metrics_attached_to_running_scheduler);
        BlobStore store(StorageBackendFactory::create_local(tmpdir / "cleanup-root"));
        MetricsExporter exporter(tmpdir / "cleanup.prom", std::chrono::seconds(60));
        CleanupScheduler sched(std::chrono::hours(24), std::chrono::hours(1));
        sched.initialize(&store);
        sched.set_metrics(&exporter);
        sched.run_cleanup_cycle();
        sched.stop();
        ASSERT_TRUE(exporter.cleanup_cycles().Value() >= 1.0, "cycle counted after attach");
        ASSERT_EQ(exporter.cleanup_failures().Value(), 0.0, "no failed cycles");
        PASS();
    }
    {
        TEST(no_tmp_file_left_behind);
        auto tmp_path = prom_path;
        tmp_path += ".tmp";
        ASSERT_TRUE(!fs::exists(tmp_path), ".tmp file should not persist");
        PASS();
    }
    {
        TEST(stop_writes_final_snapshot);
        fs::remove(prom_path);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60));
        exporter.start();
        exporter.stop();
        ASSERT_TRUE(fs::exists(prom_path), "final snapshot written");
        PASS();
    }
    {
        TEST(unwritable_path_reports_failure);
        MetricsExporter exporter(tmpdir / "no-such-dir" / "x.prom", std::chrono::seconds(60));
        ASSERT_TRUE(!exporter.write_file(), "write into a missing directory fails");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "blobvault service test suite" << std::endl;
    std::cout << "============================" << std::endl;

    test_traffic_ledger();
    test_file_service();
    test_service_config();
    test_control_server();
    test_metrics();

    return report_results();
}
