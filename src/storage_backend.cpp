#include "blobvault/storage/backend.hpp"
#include "blobvault/errors.hpp"
#include "blobvault/log.hpp"
#include "blobvault/metadata.hpp"
#include "blobvault/net/http.hpp"

#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <shared_mutex>
#include <sstream>

namespace blobvault {

using json = nlohmann::json;

// ============================================================================
// Configurable shard count
// ============================================================================

// Number of lock shards for the local backend (BLOBVAULT_STORAGE_SHARDS, 1..4096)
static size_t get_num_shards() {
    static size_t num_shards = []() {
        if (const char* env = std::getenv("BLOBVAULT_STORAGE_SHARDS")) {
            try {
                size_t val = std::stoul(env);
                if (val >= 1 && val <= 4096) {
                    return val;
                }
            } catch (const std::exception&) {
            }
            log_warn("invalid BLOBVAULT_STORAGE_SHARDS=%s, using default", env);
        }
        return size_t{256};
    }();
    return num_shards;
}

// ============================================================================
// LocalStorageBackend - File system implementation
// ============================================================================

class LocalStorageBackend : public StorageBackend {
public:
    explicit LocalStorageBackend(const std::filesystem::path& root)
        : root_(std::filesystem::absolute(root)) {
        std::error_code ec;
        std::filesystem::create_directories(root_, ec);
        if (ec) {
            throw ConfigurationError("cannot create storage root " + root_.string() +
                                     ": " + ec.message());
        }

        shards_.resize(get_num_shards());
        for (auto& shard : shards_) {
            shard = std::make_unique<Shard>();
        }

        log_debug("local storage backend at %s (%zu lock shards)",
                  root_.c_str(), shards_.size());
    }

    std::string type_name() const override { return "local"; }

    bool exists(const std::string& key) const override {
        auto path = key_to_path(key);
        std::shared_lock lock(get_shard(key).mutex);
        std::error_code ec;
        return std::filesystem::is_regular_file(path, ec);
    }

    std::optional<ObjectInfo> head(const std::string& key) const override {
        auto path = key_to_path(key);
        std::shared_lock lock(get_shard(key).mutex);

        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return std::nullopt;
        }

        ObjectInfo info;
        info.size = std::filesystem::file_size(path, ec);
        if (ec) return std::nullopt;

        auto ftime = std::filesystem::last_write_time(path, ec);
        if (!ec) {
            info.last_modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                std::chrono::file_clock::to_sys(ftime));
        }
        info.content_type = "application/octet-stream";
        return info;
    }

    GetResult get(const std::string& key) const override {
        GetResult result;
        auto path = key_to_path(key);
        std::shared_lock lock(get_shard(key).mutex);

        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            result.not_found = true;
            result.error_message = "Object not found: " + key;
            return result;
        }

        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file) {
            result.error_message = "Failed to open " + key;
            return result;
        }

        auto tellg_val = file.tellg();
        if (tellg_val < 0) {
            result.error_message = "Cannot determine file size: " + key;
            return result;
        }

        auto size = static_cast<size_t>(tellg_val);
        file.seekg(0);
        result.data.resize(size);
        file.read(reinterpret_cast<char*>(result.data.data()),
                  static_cast<std::streamsize>(size));
        if (!file) {
            result.data.clear();
            result.error_message = "Failed to read " + key;
            return result;
        }

        result.success = true;
        result.info.size = size;
        result.info.content_type = "application/octet-stream";
        return result;
    }

    PutResult put(const std::string& key,
                  std::span<const uint8_t> data,
                  const PutOptions& /*options*/) override {
        PutResult result;
        auto path = key_to_path(key);
        std::unique_lock lock(get_shard(key).mutex);

        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            result.error_message = "Failed to create directory: " + ec.message();
            return result;
        }

        // Write to temp file then rename (atomic)
        auto temp_path = path.string() + ".tmp." +
            std::to_string(temp_counter_.fetch_add(1, std::memory_order_relaxed));

        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                result.error_message = "Failed to create file";
                return result;
            }

            file.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
            file.flush();
            if (!file) {
                file.close();
                std::filesystem::remove(temp_path, ec);
                result.error_message = "Failed to write data";
                return result;
            }
        }

        std::filesystem::rename(temp_path, path, ec);
        if (ec) {
            std::error_code rm_ec;
            std::filesystem::remove(temp_path, rm_ec);
            result.error_message = "Failed to rename file: " + ec.message();
            return result;
        }

        result.success = true;
        return result;
    }

    bool remove(const std::string& key) override {
        auto path = key_to_path(key);
        std::unique_lock lock(get_shard(key).mutex);

        std::error_code ec;
        bool removed = std::filesystem::remove(path, ec);
        if (ec) {
            log_warn("failed to remove %s: %s", key.c_str(), ec.message().c_str());
            return false;
        }
        return removed;
    }

    ListResult list(const ListOptions& options) const override {
        ListResult result;

        // Directory that can contain keys with this prefix
        auto search_path = root_;
        if (!options.prefix.empty()) {
            search_path = root_ / options.prefix;
            if (options.prefix.back() != '/') {
                search_path = search_path.parent_path();
            }
        }

        std::error_code ec;
        if (!std::filesystem::is_directory(search_path, ec)) {
            result.success = true;
            return result;
        }

        // Entries removed between readdir and stat are skipped
        std::vector<ListEntry> matches;
        std::filesystem::recursive_directory_iterator it(search_path, ec);
        if (ec) {
            result.error_message = "cannot open " + search_path.string() + ": " + ec.message();
            return result;
        }
        for (std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec) break;

            const auto& entry = *it;
            std::error_code entry_ec;
            if (!entry.is_regular_file(entry_ec)) continue;

            std::string key = entry.path().lexically_relative(root_).generic_string();
            if (!key.starts_with(options.prefix)) continue;
            if (key.find(".tmp.") != std::string::npos) continue;  // in-flight writes
            if (!options.continuation_token.empty() && key <= options.continuation_token) continue;

            ListEntry le;
            le.size = entry.file_size(entry_ec);
            if (entry_ec) continue;
            auto ftime = entry.last_write_time(entry_ec);
            if (entry_ec) continue;
            le.last_modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                std::chrono::file_clock::to_sys(ftime));
            le.key = std::move(key);
            matches.push_back(std::move(le));
        }
        if (ec) {
            result.error_message = "failed to list " + search_path.string() + ": " + ec.message();
            return result;
        }

        std::sort(matches.begin(), matches.end(),
                  [](const ListEntry& a, const ListEntry& b) { return a.key < b.key; });

        if (options.max_keys > 0 && matches.size() > options.max_keys) {
            matches.resize(options.max_keys);
            result.truncated = true;
            result.continuation_token = matches.back().key;
        }

        result.entries = std::move(matches);
        result.success = true;
        return result;
    }

    bool is_healthy() const override {
        std::error_code ec;
        return std::filesystem::is_directory(root_, ec);
    }

private:
    struct Shard {
        mutable std::shared_mutex mutex;
    };

    std::filesystem::path root_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> temp_counter_{0};

    Shard& get_shard(const std::string& key) const {
        size_t hash = std::hash<std::string>{}(key);
        return *shards_[hash % shards_.size()];
    }

    std::filesystem::path key_to_path(const std::string& key) const {
        // Reject keys that could escape the root
        if (key.empty() || key[0] == '/' || key.find("..") != std::string::npos) {
            throw ValidationError("invalid storage key: path traversal attempt detected");
        }

        auto result = root_ / key;

        std::error_code ec;
        auto canonical_root = std::filesystem::weakly_canonical(root_, ec);
        auto canonical_result = std::filesystem::weakly_canonical(result, ec);
        if (!ec && !canonical_result.string().starts_with(canonical_root.string())) {
            throw ValidationError("invalid storage key: path traversal attempt detected");
        }

        return result;
    }
};

// ============================================================================
// GCSStorageBackend - Google Cloud Storage JSON API
// ============================================================================

class GCSStorageBackend : public StorageBackend {
public:
    struct Config {
        std::string project_id;
        std::string bucket;
        std::string path_prefix;
        std::string credentials_json;       // Service account JSON content
        std::string credentials_file;       // Or path to JSON key file
        std::string endpoint;               // Empty for Google, custom for emulator
        bool verify_ssl = true;
        bool create_bucket = false;
        std::string location = "US";
        std::string storage_class = "STANDARD";
        int max_retries = 3;
        std::chrono::milliseconds retry_delay{1000};
    };

    explicit GCSStorageBackend(const Config& config)
        : config_(config) {
        if (config_.bucket.empty()) {
            throw ConfigurationError("GCS backend requires a bucket name");
        }

        net::HttpClientConfig http_config;
        http_config.user_agent = "blobvault-gcs/1.0";
        http_config.verify_ssl_by_default = config_.verify_ssl;
        http_config.max_retries = config_.max_retries;
        http_config.initial_retry_delay = config_.retry_delay;
        http_client_ = std::make_unique<net::HttpClient>(http_config);

        if (config_.credentials_json.empty() && !config_.credentials_file.empty()) {
            std::ifstream cred_file(config_.credentials_file);
            if (!cred_file) {
                throw ConfigurationError("cannot read GCS credentials file " +
                                         config_.credentials_file);
            }
            std::ostringstream ss;
            ss << cred_file.rdbuf();
            config_.credentials_json = ss.str();
        }

        ensure_bucket();
    }

    std::string type_name() const override { return "gcs"; }

    bool exists(const std::string& key) const override {
        return head(key).has_value();
    }

    std::optional<ObjectInfo> head(const std::string& key) const override {
        auto request = net::HttpRequest::get(metadata_url(key));
        add_auth_header(request);

        auto response = http_client_->execute_with_retry(request);
        if (!response.ok()) {
            return std::nullopt;
        }

        auto body = json::parse(response.body_string(), nullptr, false);
        if (body.is_discarded()) {
            return std::nullopt;
        }
        return object_info(body);
    }

    GetResult get(const std::string& key) const override {
        GetResult result;

        auto request = net::HttpRequest::get(download_url(key));
        add_auth_header(request);

        auto response = http_client_->execute_with_retry(request);
        if (response.status_code == 404) {
            result.not_found = true;
            result.error_message = "Object not found: " + key;
            return result;
        }
        if (!response.ok()) {
            result.error_message = describe_failure(response);
            return result;
        }

        result.success = true;
        result.data = std::move(response.body);
        result.info.size = result.data.size();
        result.info.content_type = response.headers.get("Content-Type").value_or("");
        result.info.etag = response.headers.get("ETag").value_or("");
        return result;
    }

    PutResult put(const std::string& key,
                  std::span<const uint8_t> data,
                  const PutOptions& options) override {
        PutResult result;

        auto request = net::HttpRequest::post(upload_url(key),
            std::vector<uint8_t>(data.begin(), data.end()));
        request.headers.set_content_type(options.content_type.empty()
            ? "application/octet-stream" : options.content_type);
        add_auth_header(request);

        auto response = http_client_->execute_with_retry(request);
        if (!response.ok()) {
            result.error_message = describe_failure(response);
            return result;
        }

        result.success = true;
        auto body = json::parse(response.body_string(), nullptr, false);
        if (body.is_object()) {
            result.etag = body.value("etag", "");
        }
        return result;
    }

    bool remove(const std::string& key) override {
        auto request = net::HttpRequest::del(metadata_url(key));
        add_auth_header(request);

        auto response = http_client_->execute_with_retry(request);
        if (response.ok()) {
            return true;
        }
        if (response.status_code != 404) {
            log_warn("GCS delete of %s failed: %s", key.c_str(), describe_failure(response).c_str());
        }
        return false;
    }

    ListResult list(const ListOptions& options) const override {
        ListResult result;

        auto url = api_base() + "/b/" + net::url_encode(config_.bucket) + "/o?";

        std::vector<std::string> params;
        std::string full_prefix = make_key(options.prefix);
        if (!full_prefix.empty()) {
            params.push_back("prefix=" + net::url_encode(full_prefix));
        }
        params.push_back("maxResults=" + std::to_string(options.max_keys));
        if (!options.continuation_token.empty()) {
            params.push_back("pageToken=" + net::url_encode(options.continuation_token));
        }
        for (size_t i = 0; i < params.size(); ++i) {
            if (i > 0) url += "&";
            url += params[i];
        }

        auto request = net::HttpRequest::get(url);
        add_auth_header(request);

        auto response = http_client_->execute_with_retry(request);
        if (!response.ok()) {
            result.error_message = describe_failure(response);
            return result;
        }

        auto body = json::parse(response.body_string(), nullptr, false);
        if (!body.is_object()) {
            result.error_message = "malformed list response";
            return result;
        }

        result.continuation_token = body.value("nextPageToken", "");
        result.truncated = !result.continuation_token.empty();

        if (body.contains("items") && body["items"].is_array()) {
            for (const auto& item : body["items"]) {
                std::string name = item.value("name", "");
                if (!config_.path_prefix.empty()) {
                    if (!name.starts_with(config_.path_prefix)) continue;
                    name = name.substr(config_.path_prefix.size());
                }
                auto info = object_info(item);
                ListEntry entry;
                entry.key = std::move(name);
                entry.size = info.size;
                entry.last_modified = info.last_modified;
                result.entries.push_back(std::move(entry));
            }
        }

        result.success = true;
        return result;
    }

    bool is_healthy() const override {
        auto request = net::HttpRequest::get(bucket_url());
        add_auth_header(request);
        return http_client_->execute(request).ok();
    }

private:
    Config config_;
    std::unique_ptr<net::HttpClient> http_client_;

    // OAuth2 token cache
    mutable std::mutex token_mutex_;
    mutable std::string cached_token_;
    mutable std::chrono::steady_clock::time_point token_expiry_;

    void ensure_bucket() {
        auto request = net::HttpRequest::get(bucket_url());
        add_auth_header(request);
        auto response = http_client_->execute_with_retry(request);

        if (response.ok()) {
            log_info("using GCS bucket %s", config_.bucket.c_str());
            return;
        }
        if (response.status_code != 404) {
            throw ConfigurationError("cannot access GCS bucket " + config_.bucket + ": " +
                                     describe_failure(response));
        }
        if (!config_.create_bucket) {
            throw ConfigurationError("GCS bucket " + config_.bucket +
                                     " does not exist and bucket creation is disabled");
        }
        if (config_.project_id.empty()) {
            throw ConfigurationError("creating GCS bucket " + config_.bucket +
                                     " requires a project id");
        }

        json bucket_resource = {
            {"name", config_.bucket},
            {"location", config_.location},
            {"storageClass", config_.storage_class},
        };
        auto create = net::HttpRequest::post(
            api_base() + "/b?project=" + net::url_encode(config_.project_id), bucket_resource.dump());
        create.headers.set_content_type("application/json");
        add_auth_header(create);

        auto created = http_client_->execute_with_retry(create);
        if (!created.ok()) {
            throw ConfigurationError("failed to create GCS bucket " + config_.bucket + ": " +
                                     describe_failure(created));
        }
        log_info("created GCS bucket %s in %s (%s)", config_.bucket.c_str(),
                 config_.location.c_str(), config_.storage_class.c_str());
    }

    static std::string describe_failure(const net::HttpResponse& response) {
        if (!response.error.empty()) return response.error;
        return "HTTP " + std::to_string(response.status_code);
    }

    static ObjectInfo object_info(const json& item) {
        ObjectInfo info;
        // size is a decimal string in the JSON API
        if (item.contains("size")) {
            const auto& size = item["size"];
            if (size.is_string()) {
                try {
                    info.size = std::stoull(size.get<std::string>());
                } catch (const std::exception&) {
                    info.size = 0;
                }
            } else if (size.is_number_unsigned()) {
                info.size = size.get<uint64_t>();
            }
        }
        info.etag = item.value("etag", "");
        info.content_type = item.value("contentType", "");
        if (auto updated = parse_iso8601(item.value("updated", ""))) {
            info.last_modified = *updated;
        }
        return info;
    }

    std::string api_base() const {
        if (!config_.endpoint.empty()) {
            return config_.endpoint + "/storage/v1";
        }
        return "https://storage.googleapis.com/storage/v1";
    }

    std::string upload_base() const {
        if (!config_.endpoint.empty()) {
            return config_.endpoint + "/upload/storage/v1";
        }
        return "https://storage.googleapis.com/upload/storage/v1";
    }

    std::string make_key(const std::string& key) const {
        return config_.path_prefix + key;
    }

    std::string bucket_url() const {
        return api_base() + "/b/" + net::url_encode(config_.bucket);
    }

    std::string metadata_url(const std::string& key) const {
        return bucket_url() + "/o/" + net::url_encode(make_key(key));
    }

    std::string download_url(const std::string& key) const {
        return metadata_url(key) + "?alt=media";
    }

    std::string upload_url(const std::string& key) const {
        return upload_base() + "/b/" + net::url_encode(config_.bucket) +
               "/o?uploadType=media&name=" + net::url_encode(make_key(key));
    }

    // OAuth2 Bearer token from service account JSON
    void add_auth_header(net::HttpRequest& request) const {
        auto token = get_access_token();
        if (!token.empty()) {
            request.headers.set_bearer_token(token);
        }
    }

    std::string get_access_token() const {
        std::lock_guard lock(token_mutex_);

        auto now = std::chrono::steady_clock::now();
        if (!cached_token_.empty() && now < token_expiry_) {
            return cached_token_;
        }

        if (config_.credentials_json.empty()) {
            return "";  // emulator or anonymous access
        }

        auto creds = json::parse(config_.credentials_json, nullptr, false);
        if (!creds.is_object()) {
            log_error("GCS credentials are not valid JSON");
            return "";
        }

        std::string client_email = creds.value("client_email", "");
        std::string private_key = creds.value("private_key", "");
        std::string token_uri = creds.value("token_uri", "https://oauth2.googleapis.com/token");
        if (client_email.empty() || private_key.empty()) {
            log_error("GCS credentials lack client_email or private_key");
            return "";
        }

        auto iat = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();

        json header = {{"alg", "RS256"}, {"typ", "JWT"}};
        json claims = {
            {"iss", client_email},
            {"scope", "https://www.googleapis.com/auth/devstorage.read_write"},
            {"aud", token_uri},
            {"iat", iat},
            {"exp", iat + 3600},
        };

        std::string signing_input = net::base64url_encode(header.dump()) + "." +
                                    net::base64url_encode(claims.dump());

        auto signature = rsa_sign_sha256(private_key, signing_input);
        if (signature.empty()) {
            log_error("failed to sign GCS token request");
            return "";
        }

        std::string jwt = signing_input + "." + net::base64url_encode(signature);
        std::string post_body =
            "grant_type=urn%3Aietf%3Aparams%3Aoauth%3Agrant-type%3Ajwt-bearer&assertion=" + jwt;

        auto token_request = net::HttpRequest::post(token_uri, post_body);
        token_request.headers.set_content_type("application/x-www-form-urlencoded");

        auto token_response = http_client_->execute_with_retry(token_request);
        if (!token_response.ok()) {
            log_error("GCS token exchange failed: %s", describe_failure(token_response).c_str());
            return "";
        }

        auto token = json::parse(token_response.body_string(), nullptr, false);
        if (!token.is_object()) {
            log_error("GCS token response is not valid JSON");
            return "";
        }

        cached_token_ = token.value("access_token", "");
        token_expiry_ = std::chrono::steady_clock::now() + std::chrono::minutes(55);
        return cached_token_;
    }

    // RSA-SHA256 signing using OpenSSL
    static std::vector<uint8_t> rsa_sign_sha256(const std::string& pem_key, const std::string& data) {
        std::unique_ptr<BIO, decltype(&BIO_free)> bio(
            BIO_new_mem_buf(pem_key.data(), static_cast<int>(pem_key.size())), BIO_free);
        if (!bio) return {};

        std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey(
            PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr), EVP_PKEY_free);
        if (!pkey) return {};

        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
        if (!ctx) return {};

        if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1 ||
            EVP_DigestSignUpdate(ctx.get(), data.data(), data.size()) != 1) {
            return {};
        }

        size_t sig_len = 0;
        if (EVP_DigestSignFinal(ctx.get(), nullptr, &sig_len) != 1) return {};
        std::vector<uint8_t> signature(sig_len);
        if (EVP_DigestSignFinal(ctx.get(), signature.data(), &sig_len) != 1) return {};
        signature.resize(sig_len);
        return signature;
    }
};

// ============================================================================
// Factory
// ============================================================================

static bool flag_value(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& config) {

    if (type == "local") {
        auto it = config.find("path");
        if (it == config.end() || it->second.empty()) {
            throw ConfigurationError("Local backend requires 'path' config");
        }
        return std::make_unique<LocalStorageBackend>(it->second);
    }

    if (type == "gcs") {
        GCSStorageBackend::Config gcs_config;

        auto it = config.find("bucket");
        if (it == config.end() || it->second.empty()) {
            throw ConfigurationError("GCS backend requires 'bucket' config");
        }
        gcs_config.bucket = it->second;

        if ((it = config.find("project_id")) != config.end()) gcs_config.project_id = it->second;
        if ((it = config.find("credentials_json")) != config.end()) gcs_config.credentials_json = it->second;
        if ((it = config.find("credentials_file")) != config.end()) gcs_config.credentials_file = it->second;
        if ((it = config.find("endpoint")) != config.end()) gcs_config.endpoint = it->second;
        if ((it = config.find("path_prefix")) != config.end()) gcs_config.path_prefix = it->second;
        if ((it = config.find("location")) != config.end()) gcs_config.location = it->second;
        if ((it = config.find("storage_class")) != config.end()) gcs_config.storage_class = it->second;
        if ((it = config.find("create_bucket")) != config.end()) {
            gcs_config.create_bucket = flag_value(it->second);
        }
        if ((it = config.find("verify_ssl")) != config.end()) {
            gcs_config.verify_ssl = flag_value(it->second);
        }
        try {
            if ((it = config.find("max_retries")) != config.end()) {
                gcs_config.max_retries = std::stoi(it->second);
            }
            if ((it = config.find("retry_delay_ms")) != config.end()) {
                gcs_config.retry_delay = std::chrono::milliseconds(std::stol(it->second));
            }
        } catch (const std::exception&) {
            throw ConfigurationError("GCS retry settings must be integers");
        }
        if (gcs_config.max_retries < 0 || gcs_config.retry_delay.count() < 0) {
            throw ConfigurationError("GCS retry settings must not be negative");
        }

        return std::make_unique<GCSStorageBackend>(gcs_config);
    }

    throw ConfigurationError("Unknown storage backend type: " + type);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_local(
    const std::filesystem::path& root_path) {
    return std::make_unique<LocalStorageBackend>(root_path);
}

}  // namespace blobvault
