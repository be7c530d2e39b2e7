#pragma once

#include "broker/BrokerClient.hpp"
#include "common/Utils.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <ixwebsocket/IXWebSocket.h>

namespace optgate {

    namespace beast = boost::beast;     // from <boost/beast.hpp>
    namespace http = beast::http;       // from <boost/beast/http.hpp>
    namespace net = boost::asio;        // from <boost/asio.hpp>
    namespace ssl = net::ssl;           // from <boost/asio/ssl.hpp>
    using tcp = net::ip::tcp;           // from <boost/asio/ip/tcp.hpp>

    struct BrokerEndpoint {
        std::string host = "api.icicidirect.com";
        std::string port = "443";
        std::string base_path = "/breezeapi/api/v1/";
        std::string feed_url = "wss://livestream.icicidirect.com/";
        std::chrono::milliseconds feed_connect_wait{constants::FEED_CONNECT_WAIT_MS};
    };

    /**
     * @class RestBrokerClient
     * @brief BrokerClient over the broker's HTTPS REST API and push-feed websocket.
     *
     * REST: one keep-alive TLS stream (Boost.Beast), reopened after any failure.
     * Every call after session establishment carries X-Timestamp, X-AppKey,
     * X-SessionToken and X-Checksum (see broker_checksum).
     * Feed: ixwebsocket; each text message is handed to the tick callback as-is.
     */
    class RestBrokerClient : public BrokerClient {
    public:
        explicit RestBrokerClient(BrokerEndpoint endpoint = {});
        ~RestBrokerClient() override;

        std::string generate_session(const BrokerCredentials& credentials) override;
        std::string get_customer_details() override;

        std::string get_option_chain_quotes(const InstrumentQuery& query) override;
        std::string get_quotes(const InstrumentQuery& query) override;

        std::string place_order(const OrderLeg& leg) override;
        std::string cancel_order(const std::string& order_id, const std::string& exchange_code) override;
        std::string modify_order(const ModifyRequest& request) override;

        std::string get_order_list(const std::string& exchange_code,
                                   const std::string& from_date, const std::string& to_date) override;
        std::string get_trade_list(const std::string& exchange_code,
                                   const std::string& from_date, const std::string& to_date) override;
        std::string get_portfolio_positions() override;
        std::string get_portfolio_holdings() override;
        std::string get_funds() override;
        std::string get_historical(const HistoricalQuery& query) override;

        void ws_connect() override;
        void ws_disconnect() override;
        void subscribe_feeds(const FeedRequest& request) override;
        void unsubscribe_feeds(const FeedRequest& request) override;
        void set_on_ticks(TickCallback callback) override;

    private:
        // Sends one request and returns the response body. Throws BrokerCallError.
        std::string request(http::verb verb, const std::string& endpoint, const std::string& body, bool signed_call = true);
        void connect();
        void send_feed(const std::string& message);
        void on_feed_message(const ix::WebSocketMessagePtr& msg);

        BrokerEndpoint endpoint_;

        std::mutex rest_mutex_;
        net::io_context ioc_;
        ssl::context ssl_ctx_{ssl::context::tlsv12_client};
        std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> stream_;
        beast::flat_buffer buffer_;

        std::string app_key_;
        std::string secret_;
        std::string session_token_;

        ix::WebSocket web_socket_;
        std::mutex feed_mutex_;
        std::condition_variable feed_cv_;
        bool feed_open_ = false;
        std::mutex callback_mutex_;
        TickCallback on_ticks_;
    };

}
