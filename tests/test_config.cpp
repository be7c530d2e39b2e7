#include "common/Config.hpp"
#include "common/Errors.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

static int failures = 0;

static void check(bool condition, const std::string& name) {
    if (condition) {
        std::cout << "[PASS] " << name << std::endl;
    } else {
        std::cout << "[FAIL] " << name << std::endl;
        ++failures;
    }
}

static std::string write_file(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

static void clear_env() {
    for (const char* name : {"OPTGATE_PORT", "OPTGATE_LOG_FILE", "OPTGATE_LOG_LEVEL", "OPTGATE_BROKER_HOST",
                             "OPTGATE_FEED_URL", "OPTGATE_AUTH_TOKEN", "OPTGATE_MIN_INTERVAL_MS",
                             "OPTGATE_QUEUE_CAPACITY"}) {
        unsetenv(name);
    }
}

template<typename F>
static bool throws_config_error(F&& f) {
    try {
        f();
    } catch (const optgate::GatewayError&) {
        return true;
    }
    return false;
}

int main() {
    std::cout << "Running Config Unit Test..." << std::endl;
    clear_env();

    // Defaults.
    {
        auto config = optgate::GatewayConfig::load("");
        check(config.port == 8000 && config.min_interval_ms == 600 && config.max_per_minute == 100,
              "pacing defaults");
        check(config.queue_capacity == 50 && config.relay_poll_ms == 500 && config.heartbeat_every == 10,
              "queue and relay defaults");
        check(config.auth_token.empty() && config.log_level == optgate::LogLevel::INFO, "no token, INFO logging");
    }

    // File overlay.
    std::string path = write_file("optgate_test_config.json", R"({
        "port": 9100, "log_level": "debug", "log_stderr": true,
        "broker_host": "broker.test", "auth_token": "secret-token",
        "min_interval_ms": 250, "queue_capacity": "20", "heartbeat_every": 4
    })");
    {
        auto config = optgate::GatewayConfig::load(path);
        check(config.port == 9100 && config.log_level == optgate::LogLevel::DEBUG && config.log_stderr,
              "file values applied");
        check(config.broker_host == "broker.test" && config.auth_token == "secret-token", "file strings applied");
        check(config.min_interval_ms == 250 && config.queue_capacity == 20 && config.heartbeat_every == 4,
              "file numbers applied");
        check(config.broker_port == "443" && config.relay_poll_ms == 500, "absent members keep defaults");
    }

    // Environment wins over the file.
    {
        setenv("OPTGATE_PORT", "9200", 1);
        setenv("OPTGATE_MIN_INTERVAL_MS", "700", 1);
        setenv("OPTGATE_AUTH_TOKEN", "env-token", 1);
        setenv("OPTGATE_LOG_LEVEL", "error", 1);
        auto config = optgate::GatewayConfig::load(path);
        check(config.port == 9200 && config.min_interval_ms == 700, "environment numbers override");
        check(config.auth_token == "env-token" && config.log_level == optgate::LogLevel::ERROR,
              "environment strings override");
        check(config.queue_capacity == 20, "file value kept where the environment is silent");
        clear_env();
    }

    // Bad input.
    {
        setenv("OPTGATE_PORT", "80x", 1);
        check(throws_config_error([]() { optgate::GatewayConfig::load(""); }), "malformed port rejected");
        setenv("OPTGATE_PORT", "70000", 1);
        check(throws_config_error([]() { optgate::GatewayConfig::load(""); }), "port out of range rejected");
        clear_env();

        std::string bad = write_file("optgate_test_bad.json", R"({"queue_capacity": 0})");
        check(throws_config_error([&bad]() { optgate::GatewayConfig::load(bad); }), "zero capacity rejected");
        std::string array = write_file("optgate_test_array.json", "[1,2]");
        check(throws_config_error([&array]() { optgate::GatewayConfig::load(array); }), "non-object file rejected");
        check(throws_config_error([]() { optgate::GatewayConfig::load("/nonexistent/optgate.json"); }),
              "missing file rejected");
        std::remove(bad.c_str());
        std::remove(array.c_str());
    }

    // Log levels.
    {
        check(optgate::parse_log_level("warn") == optgate::LogLevel::WARNING &&
              optgate::parse_log_level("WARNING") == optgate::LogLevel::WARNING, "warning spellings");
        check(optgate::parse_log_level("Debug") == optgate::LogLevel::DEBUG, "case-insensitive");
        check(throws_config_error([]() { optgate::parse_log_level("verbose"); }), "unknown level rejected");
    }

    std::remove(path.c_str());

    if (failures > 0) {
        std::cout << failures << " check(s) failed." << std::endl;
        return 1;
    }
    return 0;
}
