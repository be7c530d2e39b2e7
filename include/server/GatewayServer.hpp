#pragma once

#include "relay/RelayLoop.hpp"
#include "server/ApiRouter.hpp"
#include "session/GatewayService.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

namespace optgate {

    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace websocket = beast::websocket;
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    struct ServerOptions {
        std::string bind_address = "0.0.0.0";
        uint16_t port = constants::DEFAULT_PORT;
        RelayOptions relay;
        RouterOptions router;
    };

    /**
     * @class GatewayServer
     * @brief HTTP + websocket front end. One thread per accepted connection.
     *
     * HTTP requests (keep-alive) go through ApiRouter. An upgrade on /ws/ticks turns
     * the connection into a relay observer: a RelayLoop pushing frames from the
     * GatewayService until the observer goes away or the server stops.
     */
    class GatewayServer {
    public:
        GatewayServer(GatewayService& service, ServerOptions options);
        ~GatewayServer();

        GatewayServer(const GatewayServer&) = delete;
        GatewayServer& operator=(const GatewayServer&) = delete;

        // Binds, then accepts until stop(). Throws if the port cannot be bound.
        void run();

        // Closes the listener, ends every relay loop, shuts down open connections
        // and waits for their threads. Safe from a signal-watching thread.
        void stop();

        size_t active_connections() const;

        // Sockets stop() would shut down right now.
        size_t tracked_sockets() const;

    private:
        void serve_connection(tcp::socket socket);
        void serve_ticks(websocket::stream<tcp::socket>& stream);
        http::response<http::string_body> to_http(const http::request<http::string_body>& request,
                                                  const ApiResponse& response) const;

        void track(tcp::socket* socket);
        void untrack(tcp::socket* socket);

        GatewayService& service_;
        ServerOptions options_;
        ApiRouter router_;

        net::io_context ioc_;
        tcp::acceptor acceptor_;
        std::atomic<bool> running_{false};

        mutable std::mutex conn_mutex_;
        std::condition_variable conn_cv_;
        std::set<tcp::socket*> sockets_;
        std::set<RelayLoop*> relays_;
        size_t active_ = 0;
    };

}
