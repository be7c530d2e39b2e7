#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Json.hpp"
#include <cstdlib>
#include <iostream>

namespace optgate {

    namespace {

        int64_t parse_integer(const std::string& name, const std::string& text, int64_t min, int64_t max) {
            char* end = nullptr;
            long long value = std::strtoll(text.c_str(), &end, 10);
            if (text.empty() || *end != '\0' || value < min || value > max) {
                throw GatewayError("config: invalid " + name + " '" + text + "'");
            }
            return value;
        }

        std::string get_env(const char* name) {
            const char* env_p = std::getenv(name);
            if (env_p) {
                return std::string(env_p);
            }
            return "";
        }

        void read_integer(simdjson::dom::object root, const char* key, int64_t min, int64_t max, int64_t& out) {
            auto value = json::field(root, key);
            if (!value) return;
            auto number = json::as_number(*value);
            if (!number || *number < static_cast<double>(min) || *number > static_cast<double>(max)) {
                throw GatewayError(std::string("config: invalid ") + key);
            }
            out = static_cast<int64_t>(*number);
        }

        void read_string(simdjson::dom::object root, const char* key, std::string& out) {
            if (auto value = json::string_field(root, key)) {
                out = *value;
            }
        }

    }

    LogLevel parse_log_level(const std::string& text) {
        std::string upper = utils::to_upper(text);
        if (upper == "DEBUG") return LogLevel::DEBUG;
        if (upper == "INFO") return LogLevel::INFO;
        if (upper == "WARN" || upper == "WARNING") return LogLevel::WARNING;
        if (upper == "ERROR") return LogLevel::ERROR;
        throw GatewayError("config: unknown log level '" + text + "'");
    }

    void GatewayConfig::load_file(const std::string& path) {
        simdjson::dom::parser parser;
        simdjson::dom::element doc;
        auto error = parser.load(path).get(doc);
        if (error) {
            throw GatewayError("config: cannot read " + path + ": " + simdjson::error_message(error));
        }
        simdjson::dom::object root;
        if (doc.get(root) != simdjson::SUCCESS) {
            throw GatewayError("config: " + path + " is not a JSON object");
        }

        std::cout << "[Config] Loading settings from " << path << "..." << std::endl;

        read_string(root, "bind_address", bind_address);
        int64_t port_value = port;
        read_integer(root, "port", 1, 65535, port_value);
        port = static_cast<uint16_t>(port_value);

        read_string(root, "log_file", log_file);
        bool mirror = log_stderr;
        if (root["log_stderr"].get(mirror) == simdjson::SUCCESS) {
            log_stderr = mirror;
        }
        if (auto level = json::string_field(root, "log_level")) {
            log_level = parse_log_level(*level);
        }

        read_string(root, "broker_host", broker_host);
        read_string(root, "broker_port", broker_port);
        read_string(root, "broker_base_path", broker_base_path);
        read_string(root, "feed_url", feed_url);
        read_string(root, "auth_token", auth_token);

        int64_t capacity = static_cast<int64_t>(queue_capacity);
        int64_t per_minute = static_cast<int64_t>(max_per_minute);
        int64_t heartbeat = static_cast<int64_t>(heartbeat_every);
        read_integer(root, "min_interval_ms", 0, 60000, min_interval_ms);
        read_integer(root, "queue_capacity", 1, 100000, capacity);
        read_integer(root, "caller_timeout_ms", 1, 3600000, caller_timeout_ms);
        read_integer(root, "max_per_minute", 1, 100000, per_minute);
        read_integer(root, "leg_join_timeout_ms", 1, 3600000, leg_join_timeout_ms);
        read_integer(root, "relay_poll_ms", 1, 60000, relay_poll_ms);
        read_integer(root, "heartbeat_every", 1, 100000, heartbeat);
        queue_capacity = static_cast<size_t>(capacity);
        max_per_minute = static_cast<size_t>(per_minute);
        heartbeat_every = static_cast<uint64_t>(heartbeat);
    }

    void GatewayConfig::load_env() {
        std::string value = get_env("OPTGATE_PORT");
        if (!value.empty()) port = static_cast<uint16_t>(parse_integer("OPTGATE_PORT", value, 1, 65535));

        value = get_env("OPTGATE_LOG_FILE");
        if (!value.empty()) log_file = value;

        value = get_env("OPTGATE_LOG_LEVEL");
        if (!value.empty()) log_level = parse_log_level(value);

        value = get_env("OPTGATE_BROKER_HOST");
        if (!value.empty()) broker_host = value;

        value = get_env("OPTGATE_FEED_URL");
        if (!value.empty()) feed_url = value;

        value = get_env("OPTGATE_AUTH_TOKEN");
        if (!value.empty()) auth_token = value;

        value = get_env("OPTGATE_MIN_INTERVAL_MS");
        if (!value.empty()) min_interval_ms = parse_integer("OPTGATE_MIN_INTERVAL_MS", value, 0, 60000);

        value = get_env("OPTGATE_QUEUE_CAPACITY");
        if (!value.empty()) {
            queue_capacity = static_cast<size_t>(parse_integer("OPTGATE_QUEUE_CAPACITY", value, 1, 100000));
        }
    }

    GatewayConfig GatewayConfig::load(const std::string& path) {
        GatewayConfig config;
        if (!path.empty()) {
            config.load_file(path);
        }
        config.load_env();
        return config;
    }

}
