#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace optgate::constants {
    // Broker allows 100 REST calls per minute; one call per 600ms stays under it.
    constexpr int64_t MIN_INTERVAL_MS = 600;
    constexpr size_t MAX_CALLS_PER_MINUTE = 100;
    constexpr size_t PACING_QUEUE_CAPACITY = 50;
    constexpr int64_t PACING_CALLER_TIMEOUT_MS = 45000;
    constexpr size_t PACING_HISTORY_SIZE = 100;

    constexpr int64_t LEG_JOIN_TIMEOUT_MS = 60000;

    constexpr int64_t RELAY_POLL_INTERVAL_MS = 500;
    constexpr uint64_t RELAY_HEARTBEAT_EVERY = 10;

    // Underlying index values below this are treated as noise (NIFTY > 1000, SENSEX > 10000).
    constexpr double SPOT_SANITY_THRESHOLD = 1000.0;

    // Spacing between consecutive feed subscribe messages.
    constexpr int64_t SUBSCRIBE_SPACING_MS = 50;
    constexpr int64_t FEED_CONNECT_WAIT_MS = 15000;

    constexpr uint16_t DEFAULT_PORT = 8000;
    constexpr const char* VERSION = "1.0";
}

namespace optgate::utils {

    // Function: epoch_seconds
    // Description: Wall-clock time as fractional seconds since the Unix epoch.
    inline double epoch_seconds() {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration<double>(now).count();
    }

    // Function: iso8601_utc
    // Description: Formats a wall-clock instant as "YYYY-MM-DDTHH:MM:SS.mmmZ".
    inline std::string iso8601_utc(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()) {
        std::time_t secs = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
        std::tm tm{};
        gmtime_r(&secs, &tm);
        char buf[32];
        snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                 tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                 tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
        return std::string(buf);
    }

    inline std::string to_upper(std::string_view text) {
        std::string out(text);
        for (auto& c : out) {
            if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
        }
        return out;
    }

    inline bool starts_with_ci(std::string_view text, char c) {
        if (text.empty()) return false;
        char first = text.front();
        if (first >= 'A' && first <= 'Z') first = static_cast<char>(first - 'A' + 'a');
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        return first == c;
    }

    // Function: json_escape
    // Description: Escapes a string for embedding inside a JSON string literal.
    inline std::string json_escape(std::string_view text) {
        std::string out;
        out.reserve(text.size() + 2);
        for (char c : text) {
            switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(c));
                        out += buf;
                    } else {
                        out += c;
                    }
            }
        }
        return out;
    }

    // Quoted JSON string.
    inline std::string json_string(std::string_view text) {
        return "\"" + json_escape(text) + "\"";
    }

    // JSON has no NaN/Inf; those are written as 0.
    inline std::string json_number(double value) {
        if (!std::isfinite(value)) return "0";
        char buf[32];
        snprintf(buf, sizeof(buf), "%.15g", value);
        return std::string(buf);
    }

    // Truncates toward zero. Empty when the value is not finite or does not
    // fit in int64_t.
    inline std::optional<int64_t> to_int64(double value) {
        // 2^63 is exact as a double; INT64_MAX is not.
        constexpr double limit = 9223372036854775808.0;
        if (!std::isfinite(value) || value >= limit || value < -limit) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }

}
