#pragma once

#include "common/Logger.hpp"
#include "common/Utils.hpp"
#include <cstdint>
#include <string>

namespace optgate {

    // Function: GatewayConfig
    // Description: Runtime settings. Defaults come from optgate::constants, then an
    //              optional JSON file overrides them, then OPTGATE_* environment
    //              variables override both.
    struct GatewayConfig {
        std::string bind_address = "0.0.0.0";
        uint16_t port = constants::DEFAULT_PORT;

        std::string log_file = "optgate.log";
        bool log_stderr = false;
        LogLevel log_level = LogLevel::INFO;

        std::string broker_host = "api.icicidirect.com";
        std::string broker_port = "443";
        std::string broker_base_path = "/breezeapi/api/v1/";
        std::string feed_url = "wss://livestream.icicidirect.com/";

        // Required in X-Terminal-Auth on /api/ routes when not empty.
        std::string auth_token;

        int64_t min_interval_ms = constants::MIN_INTERVAL_MS;
        size_t queue_capacity = constants::PACING_QUEUE_CAPACITY;
        int64_t caller_timeout_ms = constants::PACING_CALLER_TIMEOUT_MS;
        size_t max_per_minute = constants::MAX_CALLS_PER_MINUTE;
        int64_t leg_join_timeout_ms = constants::LEG_JOIN_TIMEOUT_MS;
        int64_t relay_poll_ms = constants::RELAY_POLL_INTERVAL_MS;
        uint64_t heartbeat_every = constants::RELAY_HEARTBEAT_EVERY;

        // Overlays the members present in a JSON file. Throws GatewayError when the
        // file cannot be read or is not a JSON object.
        void load_file(const std::string& path);

        // Overlays OPTGATE_PORT, OPTGATE_LOG_FILE, OPTGATE_LOG_LEVEL, OPTGATE_BROKER_HOST,
        // OPTGATE_FEED_URL, OPTGATE_AUTH_TOKEN, OPTGATE_MIN_INTERVAL_MS and
        // OPTGATE_QUEUE_CAPACITY.
        // Throws GatewayError on a malformed number.
        void load_env();

        // Defaults, then the file (if path is not empty), then the environment.
        static GatewayConfig load(const std::string& path);
    };

    LogLevel parse_log_level(const std::string& text);

}
