// blobvault-ctl: Offline administration tool for a blobvault store.
//
// Talks to the storage backend directly, using the same backend flags and
// environment as blobvaultd.
//
// Usage: blobvault-ctl [backend options] <subcommand> [args]
//
// Subcommands:
//   put <file> [--name N] [--type T]   Store a file, print its key pair
//   get <publicKey> [--output <file>]  Fetch content (stamps lastAccessed)
//   delete <privateKey>                Delete an object
//   stat <key>                         Print the metadata record
//   inactive --before <time>           Private keys of objects idle since <time>
//   cleanup                            Run one eviction cycle now

#include "blobvault/blob_store.hpp"
#include "blobvault/cleanup_scheduler.hpp"
#include "blobvault/errors.hpp"
#include "blobvault/log.hpp"
#include "blobvault/service_config.hpp"
#include "blobvault/storage/backend.hpp"

#include <chrono>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

using blobvault::Timestamp;

/// Parse a duration string like "30d", "6h", "90m", "3600s" or a raw epoch.
/// Returns the cutoff time point, or nullopt if the value is malformed.
std::optional<Timestamp> parse_before_time(const std::string& arg) {
    if (arg.empty()) return std::nullopt;

    char unit = arg.back();
    std::string digits = arg;
    if (unit == 'd' || unit == 'h' || unit == 'm' || unit == 's') {
        digits.pop_back();
    }
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    uint64_t val = strtoull(digits.c_str(), nullptr, 10);

    std::chrono::seconds ago{0};
    switch (unit) {
        case 'd': ago = std::chrono::seconds(val * 86400); break;
        case 'h': ago = std::chrono::seconds(val * 3600); break;
        case 'm': ago = std::chrono::seconds(val * 60); break;
        case 's': ago = std::chrono::seconds(val); break;
        default:
            // Raw epoch seconds
            return Timestamp(std::chrono::seconds(val));
    }
    return std::chrono::system_clock::now() - ago;
}

void print_usage() {
    fprintf(stderr,
        "Usage: blobvault-ctl [backend options] <subcommand> [args]\n"
        "\n"
        "Subcommands:\n"
        "  put <file>                    Store a file, print publicKey and privateKey\n"
        "  get <publicKey>               Write content to stdout (or --output)\n"
        "  delete <privateKey>           Delete an object\n"
        "  stat <key>                    Print the metadata record for either key\n"
        "  inactive --before <time>      Private keys of objects idle since <time>\n"
        "  cleanup                       Run one eviction cycle (uses --inactivity-days)\n"
        "\n"
        "Options:\n"
        "  --name <name>                 Original name for put (default: file name)\n"
        "  --type <mime>                 Content type for put (default: application/octet-stream)\n"
        "  --output <file>               Write get output to file\n"
        "  --before <time>               Epoch seconds or duration (30d, 6h, 90m)\n"
        "  --limit <N>                   Max keys to print for inactive\n"
        "  --inactivity-days <N>         Eviction threshold for cleanup (env INACTIVITY_PERIOD_DAYS)\n"
        "  --verbose                     Debug logging\n"
        "  --help                        Show this help\n"
        "\n");
    fputs(blobvault::backend_options_usage(), stderr);
}

bool read_file(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return false;
    out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    return !ifs.bad();
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace blobvault;

    ServiceConfig config;
    auto env_err = config.apply_env();
    if (!env_err.empty()) {
        fprintf(stderr, "Error: %s\n", env_err.c_str());
        return 1;
    }

    std::string subcommand;
    std::string operand;
    std::string name;
    std::string content_type = "application/octet-stream";
    std::string output_file;
    std::string before_str;
    uint64_t limit = 0;

    for (int i = 1; i < argc; ++i) {
        auto handled = parse_backend_option(config, argc, argv, i);
        if (handled == OptionResult::Error) return 1;
        if (handled == OptionResult::Handled) continue;

        std::string arg = argv[i];
        if (arg == "--name") {
            if (++i >= argc) { fprintf(stderr, "--name requires argument\n"); return 1; }
            name = argv[i];
        } else if (arg == "--type") {
            if (++i >= argc) { fprintf(stderr, "--type requires argument\n"); return 1; }
            content_type = argv[i];
        } else if (arg == "--output") {
            if (++i >= argc) { fprintf(stderr, "--output requires argument\n"); return 1; }
            output_file = argv[i];
        } else if (arg == "--before") {
            if (++i >= argc) { fprintf(stderr, "--before requires argument\n"); return 1; }
            before_str = argv[i];
        } else if (arg == "--limit") {
            if (++i >= argc) { fprintf(stderr, "--limit requires argument\n"); return 1; }
            limit = strtoull(argv[i], nullptr, 10);
        } else if (arg == "--inactivity-days") {
            if (++i >= argc) { fprintf(stderr, "--inactivity-days requires argument\n"); return 1; }
            config.inactivity_days = strtoull(argv[i], nullptr, 10);
        } else if (arg == "--verbose") {
            set_verbose_logging(true);
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg[0] != '-' && subcommand.empty()) {
            subcommand = arg;
        } else if (arg[0] != '-' && operand.empty() &&
                   (subcommand == "put" || subcommand == "get" ||
                    subcommand == "delete" || subcommand == "stat")) {
            operand = arg;
        } else {
            fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            print_usage();
            return 1;
        }
    }

    if (subcommand.empty()) {
        print_usage();
        return 1;
    }

    config.apply_defaults();
    auto err = config.backend.validate();
    if (!err.empty()) {
        fprintf(stderr, "Configuration error: %s\n", err.c_str());
        return 1;
    }

    std::unique_ptr<BlobStore> store;
    try {
        store = std::make_unique<BlobStore>(
            StorageBackendFactory::create(config.backend.type, config.backend.params),
            config.layout());
    } catch (const std::exception& e) {
        fprintf(stderr, "Cannot open %s backend: %s\n", config.backend.type.c_str(), e.what());
        return 1;
    }

    // --- Subcommands ---

    try {
        if (subcommand == "put") {
            if (operand.empty()) {
                fprintf(stderr, "Usage: blobvault-ctl put <file> [--name N] [--type T]\n");
                return 1;
            }
            std::vector<uint8_t> content;
            if (!read_file(operand, content)) {
                fprintf(stderr, "Cannot read %s\n", operand.c_str());
                return 1;
            }
            if (name.empty()) {
                name = std::filesystem::path(operand).filename().string();
            }
            auto keys = store->put(content, name, content_type);
            printf("publicKey:  %s\n", keys.public_key.c_str());
            printf("privateKey: %s\n", keys.private_key.c_str());
        } else if (subcommand == "get") {
            if (operand.empty()) {
                fprintf(stderr, "Usage: blobvault-ctl get <publicKey> [--output <file>]\n");
                return 1;
            }
            auto blob = store->get(operand);
            FILE* out = stdout;
            if (!output_file.empty()) {
                out = fopen(output_file.c_str(), "wb");
                if (!out) {
                    fprintf(stderr, "Cannot open output file: %s\n", output_file.c_str());
                    return 1;
                }
            }
            size_t written = fwrite(blob.content.data(), 1, blob.content.size(), out);
            if (out != stdout) fclose(out);
            if (written != blob.content.size()) {
                fprintf(stderr, "Short write (%zu of %zu bytes)\n", written, blob.content.size());
                return 1;
            }
            fprintf(stderr, "%s (%s, %zu bytes)\n", blob.original_name.c_str(),
                    blob.content_type.c_str(), blob.content.size());
        } else if (subcommand == "delete") {
            if (operand.empty()) {
                fprintf(stderr, "Usage: blobvault-ctl delete <privateKey>\n");
                return 1;
            }
            if (!store->remove(operand)) {
                printf("NOTFOUND\n");
                return 2;
            }
            printf("deleted\n");
        } else if (subcommand == "stat") {
            if (operand.empty()) {
                fprintf(stderr, "Usage: blobvault-ctl stat <key>\n");
                return 1;
            }
            auto record = store->get_metadata(operand);
            // Never echo the private key back for a public-key lookup
            if (record.public_key == operand) {
                record.private_key = redact_key(record.private_key);
            }
            printf("%s\n", encode_metadata(record).c_str());
        } else if (subcommand == "inactive") {
            if (before_str.empty()) {
                fprintf(stderr, "Usage: blobvault-ctl inactive --before <time>\n");
                return 1;
            }
            auto cutoff = parse_before_time(before_str);
            if (!cutoff) {
                fprintf(stderr, "Error: bad --before value: %s\n", before_str.c_str());
                return 1;
            }
            auto keys = store->list_inactive_since(*cutoff);
            uint64_t count = 0;
            for (const auto& key : keys) {
                if (limit > 0 && count >= limit) break;
                printf("%s\n", key.c_str());
                ++count;
            }
            fprintf(stderr, "%zu inactive object(s) before %s\n", keys.size(),
                    format_iso8601(*cutoff).c_str());
        } else if (subcommand == "cleanup") {
            if (config.inactivity_days == 0 ||
                config.inactivity_days > ServiceConfig::kMaxInactivityDays) {
                fprintf(stderr, "Error: --inactivity-days must be between 1 and %" PRIu64 "\n",
                        ServiceConfig::kMaxInactivityDays);
                return 1;
            }
            CleanupScheduler cleanup(
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::hours(24) * config.inactivity_days),
                std::chrono::hours(24));
            cleanup.initialize(store.get());
            // initialize() already ran one cycle; stop() waits for it
            cleanup.stop();
            printf("cleanup cycle complete\n");
        } else {
            fprintf(stderr, "Unknown subcommand: %s\n", subcommand.c_str());
            print_usage();
            return 1;
        }
    } catch (const NotFoundError&) {
        printf("NOTFOUND\n");
        return 2;
    } catch (const ValidationError& e) {
        fprintf(stderr, "Invalid: %s\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    return 0;
}
