#include "server/GatewayServer.hpp"
#include "common/Logger.hpp"
#include <iostream>
#include <thread>

namespace optgate {

    namespace {

        // Observer transport for one /ws/ticks connection.
        class WebSocketSink : public FrameSink {
        public:
            explicit WebSocketSink(websocket::stream<tcp::socket>& stream) : stream_(stream) {}

            void send(const std::string& frame) override {
                stream_.text(true);
                stream_.write(net::buffer(frame)); // throws beast::system_error once the observer is gone
            }

        private:
            websocket::stream<tcp::socket>& stream_;
        };

    }

    GatewayServer::GatewayServer(GatewayService& service, ServerOptions options)
        : service_(service),
          options_(std::move(options)),
          router_(service, options_.router),
          acceptor_(ioc_) {}

    GatewayServer::~GatewayServer() {
        stop();
    }

    void GatewayServer::run() {
        auto const address = net::ip::make_address(options_.bind_address);
        tcp::endpoint endpoint{address, options_.port};
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
        running_ = true;

        std::cout << "[Server] Listening on " << options_.bind_address << ":" << options_.port << std::endl;
        LOG_INFO("[Server] listening on %s:%u", options_.bind_address.c_str(), static_cast<unsigned>(options_.port));

        while (running_) {
            tcp::socket socket(ioc_);
            beast::error_code ec;
            acceptor_.accept(socket, ec);
            if (!running_) break;
            if (ec) {
                LOG_WARN("[Server] accept: %s", ec.message().c_str());
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(conn_mutex_);
                ++active_;
            }
            std::thread([this, s = std::move(socket)]() mutable {
                serve_connection(std::move(s));
                std::lock_guard<std::mutex> lock(conn_mutex_);
                --active_;
                conn_cv_.notify_all();
            }).detach();
        }
        beast::error_code ec;
        acceptor_.close(ec);
        std::cout << "[Server] Listener closed." << std::endl;
    }

    void GatewayServer::stop() {
        if (!running_.exchange(false)) return;

        // A blocking accept() only returns on a connection: make one.
        beast::error_code ec;
        {
            auto address = net::ip::make_address(options_.bind_address, ec);
            if (ec || address.is_unspecified()) {
                address = net::ip::make_address("127.0.0.1");
            }
            net::io_context wake_ioc;
            tcp::socket wake(wake_ioc);
            wake.connect(tcp::endpoint{address, options_.port}, ec);
        }

        std::unique_lock<std::mutex> lock(conn_mutex_);
        for (RelayLoop* relay : relays_) {
            relay->stop();
        }
        for (tcp::socket* socket : sockets_) {
            socket->shutdown(tcp::socket::shutdown_both, ec);
        }
        conn_cv_.wait(lock, [this] { return active_ == 0; });
        LOG_INFO("[Server] stopped");
    }

    size_t GatewayServer::active_connections() const {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        return active_;
    }

    size_t GatewayServer::tracked_sockets() const {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        return sockets_.size();
    }

    void GatewayServer::track(tcp::socket* socket) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        sockets_.insert(socket);
    }

    void GatewayServer::untrack(tcp::socket* socket) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        sockets_.erase(socket);
    }

    void GatewayServer::serve_connection(tcp::socket socket) {
        track(&socket);
        try {
            beast::flat_buffer buffer;
            for (;;) {
                http::request<http::string_body> req;
                beast::error_code ec;
                http::read(socket, buffer, req, ec);
                if (ec == http::error::end_of_stream || ec == net::error::connection_reset ||
                    ec == net::error::eof) {
                    break;
                }
                if (ec) {
                    LOG_DEBUG("[Server] read: %s", ec.message().c_str());
                    break;
                }

                std::string target(req.target());
                if (websocket::is_upgrade(req) && ApiRouter::path_of(target) == "/ws/ticks") {
                    untrack(&socket);
                    websocket::stream<tcp::socket> stream(std::move(socket));
                    track(&stream.next_layer());
                    try {
                        stream.accept(req);
                        serve_ticks(stream);
                    } catch (...) {
                        // The stream dies with this frame; stop() must not see it.
                        untrack(&stream.next_layer());
                        throw;
                    }
                    untrack(&stream.next_layer());
                    return;
                }

                ApiRequest request;
                request.method = std::string(req.method_string());
                request.target = target;
                request.body = req.body();
                auto auth = req.find("X-Terminal-Auth");
                if (auth != req.end()) {
                    request.auth_token = std::string(auth->value());
                }

                ApiResponse response = router_.handle(request);
                LOG_DEBUG("[Server] %s %s -> %d", request.method.c_str(), target.c_str(), response.status);

                auto res = to_http(req, response);
                bool keep_alive = res.keep_alive();
                http::write(socket, res, ec);
                if (ec || !keep_alive) break;
            }
            beast::error_code ignored;
            socket.shutdown(tcp::socket::shutdown_send, ignored);
        } catch (const std::exception& e) {
            LOG_WARN("[Server] connection error: %s", e.what());
        }
        untrack(&socket);
    }

    void GatewayServer::serve_ticks(websocket::stream<tcp::socket>& stream) {
        LOG_INFO("[Relay] observer connected");
        WebSocketSink sink(stream);
        RelayLoop relay(service_, sink, options_.relay);
        {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            if (!running_) return;
            relays_.insert(&relay);
        }
        try {
            relay.run();
        } catch (...) {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            relays_.erase(&relay);
            throw;
        }
        {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            relays_.erase(&relay);
        }
        LOG_INFO("[Relay] observer left after %llu updates, %llu heartbeats",
                 static_cast<unsigned long long>(relay.updates_sent()),
                 static_cast<unsigned long long>(relay.heartbeats_sent()));

        beast::error_code ec;
        stream.close(websocket::close_code::normal, ec);
    }

    http::response<http::string_body> GatewayServer::to_http(const http::request<http::string_body>& request,
                                                              const ApiResponse& response) const {
        http::response<http::string_body> res{static_cast<http::status>(response.status), request.version()};
        res.set(http::field::server, "optgate");
        res.set(http::field::access_control_allow_origin, "*");
        res.set(http::field::access_control_allow_headers, "*");
        if (request.method() == http::verb::options) {
            res.set(http::field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS, PATCH");
            res.set(http::field::access_control_max_age, "86400");
        } else {
            res.set(http::field::content_type, "application/json");
        }
        res.keep_alive(request.keep_alive());
        res.body() = response.body;
        res.prepare_payload();
        return res;
    }

}
