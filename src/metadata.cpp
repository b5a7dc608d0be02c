#include "blobvault/metadata.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdio>
#include <ctime>

namespace blobvault {

using json = nlohmann::json;

std::string format_iso8601(Timestamp tp) {
    auto ms_total = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
    auto secs = ms_total / 1000;
    auto ms = ms_total % 1000;
    if (ms < 0) {
        ms += 1000;
        secs -= 1;
    }

    time_t t = static_cast<time_t>(secs);
    struct tm tm_val;
    gmtime_r(&t, &tm_val);

    char buf[40];
    size_t n = strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_val);
    snprintf(buf + n, sizeof(buf) - n, ".%03dZ", static_cast<int>(ms));
    return buf;
}

std::optional<Timestamp> parse_iso8601(const std::string& text) {
    int year, month, day, hour, minute, second;
    int consumed = 0;
    if (sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
               &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
        minute > 59 || second > 60) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);
    long millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (int d = digits; d < 3; ++d) millis *= 10;
    }

    std::string zone = text.substr(pos);
    if (zone != "Z" && zone != "+00:00") {
        return std::nullopt;
    }

    struct tm tm_val{};
    tm_val.tm_year = year - 1900;
    tm_val.tm_mon = month - 1;
    tm_val.tm_mday = day;
    tm_val.tm_hour = hour;
    tm_val.tm_min = minute;
    tm_val.tm_sec = second;
    time_t t = timegm(&tm_val);

    return std::chrono::system_clock::from_time_t(t) + std::chrono::milliseconds(millis);
}

std::string encode_metadata(const MetadataRecord& record) {
    json j;
    j["publicKey"] = record.public_key;
    j["privateKey"] = record.private_key;
    j["originalName"] = record.original_name;
    j["mimeType"] = record.content_type;
    j["createdAt"] = format_iso8601(record.created_at);
    if (record.last_accessed) {
        j["lastAccessed"] = format_iso8601(*record.last_accessed);
    } else {
        j["lastAccessed"] = nullptr;
    }
    j["fileSize"] = record.size_bytes;
    return j.dump(2);
}

std::optional<MetadataRecord> decode_metadata(const std::string& text) {
    auto j = json::parse(text, nullptr, false);
    if (!j.is_object()) {
        return std::nullopt;
    }

    for (const char* field : {"publicKey", "privateKey", "createdAt"}) {
        if (!j.contains(field) || !j[field].is_string()) {
            return std::nullopt;
        }
    }

    MetadataRecord record;
    record.public_key = j["publicKey"].get<std::string>();
    record.private_key = j["privateKey"].get<std::string>();
    if (record.public_key.empty() || record.private_key.empty()) {
        return std::nullopt;
    }

    if (j.contains("originalName") && j["originalName"].is_string()) {
        record.original_name = j["originalName"].get<std::string>();
    }
    if (j.contains("mimeType") && j["mimeType"].is_string()) {
        record.content_type = j["mimeType"].get<std::string>();
    }

    auto created = parse_iso8601(j["createdAt"].get<std::string>());
    if (!created) {
        return std::nullopt;
    }
    record.created_at = *created;

    if (j.contains("lastAccessed") && !j["lastAccessed"].is_null()) {
        if (!j["lastAccessed"].is_string()) {
            return std::nullopt;
        }
        auto accessed = parse_iso8601(j["lastAccessed"].get<std::string>());
        if (!accessed) {
            return std::nullopt;
        }
        record.last_accessed = *accessed;
    }

    if (j.contains("fileSize")) {
        if (!j["fileSize"].is_number_unsigned() && !j["fileSize"].is_number_integer()) {
            return std::nullopt;
        }
        auto size = j["fileSize"].get<int64_t>();
        if (size < 0) {
            return std::nullopt;
        }
        record.size_bytes = static_cast<uint64_t>(size);
    }

    return record;
}

}  // namespace blobvault
