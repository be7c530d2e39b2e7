#include "broker/RestBrokerClient.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "common/Utils.hpp"
#include "server/GatewayServer.hpp"
#include "session/GatewayService.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

std::atomic<bool> keep_running{true};

void signal_handler(int) {
    keep_running = false;
}

// Function: main
// Description: Entry point. Loads settings, starts the logger and serves the gateway
//              until SIGINT/SIGTERM.
// Inputs: optgate [config.json] [port]
// Outputs: Returns 0 on clean shutdown, 1 on startup failure.
int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    optgate::GatewayConfig config;
    try {
        config = optgate::GatewayConfig::load(argc > 1 ? argv[1] : "");
        if (argc > 2) {
            int port = std::atoi(argv[2]);
            if (port <= 0 || port > 65535) {
                std::cerr << "[System] Invalid port: " << argv[2] << std::endl;
                return 1;
            }
            config.port = static_cast<uint16_t>(port);
        }
    } catch (const std::exception& e) {
        std::cerr << "[System] " << e.what() << std::endl;
        return 1;
    }

    optgate::AsyncLogger::instance().set_level(config.log_level);
    optgate::AsyncLogger::instance().start(config.log_file, config.log_stderr);
    LOG_INFO("Starting optgate %s...", optgate::constants::VERSION);

    optgate::BrokerEndpoint endpoint;
    endpoint.host = config.broker_host;
    endpoint.port = config.broker_port;
    endpoint.base_path = config.broker_base_path;
    endpoint.feed_url = config.feed_url;

    optgate::SessionOptions session_options;
    session_options.pacing.min_interval = std::chrono::milliseconds(config.min_interval_ms);
    session_options.pacing.capacity = config.queue_capacity;
    session_options.pacing.caller_timeout = std::chrono::milliseconds(config.caller_timeout_ms);
    session_options.pacing.max_per_minute = config.max_per_minute;
    session_options.leg_join_timeout = std::chrono::milliseconds(config.leg_join_timeout_ms);

    optgate::GatewayService service(
        [endpoint]() { return std::make_shared<optgate::RestBrokerClient>(endpoint); },
        session_options);

    optgate::ServerOptions server_options;
    server_options.bind_address = config.bind_address;
    server_options.port = config.port;
    server_options.relay.poll_interval = std::chrono::milliseconds(config.relay_poll_ms);
    server_options.relay.heartbeat_every = config.heartbeat_every;
    server_options.router.auth_token = config.auth_token;

    optgate::GatewayServer server(service, server_options);

    std::thread watcher([&server]() {
        while (keep_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        server.stop();
    });

    int rc = 0;
    try {
        std::cout << "optgate " << optgate::constants::VERSION << " on port " << config.port
                  << " (broker " << config.broker_host << ")" << std::endl;
        server.run();
    } catch (const std::exception& e) {
        std::cerr << "[System] Server failed: " << e.what() << std::endl;
        LOG_ERROR("Server failed: %s", e.what());
        rc = 1;
    }

    keep_running = false;
    watcher.join();

    std::cout << "Stopping gateway..." << std::endl;
    LOG_INFO("Stopping gateway...");
    service.disconnect();
    optgate::AsyncLogger::instance().stop();

    return rc;
}
