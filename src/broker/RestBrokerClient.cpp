#include "broker/RestBrokerClient.hpp"
#include "broker/Checksum.hpp"
#include "common/Errors.hpp"
#include "common/Json.hpp"
#include "common/Logger.hpp"
#include <ixwebsocket/IXNetSystem.h>
#include <openssl/err.h>
#include <iostream>
#include <sstream>

namespace optgate {

    namespace {

        // Flat JSON object of string (or bool) members, in insertion order. The
        // exact text is what gets checksummed, so it is built once and reused.
        class JsonBody {
        public:
            JsonBody& add(const char* key, std::string_view value) {
                separator();
                o_ << utils::json_string(key) << ":" << utils::json_string(value);
                return *this;
            }

            JsonBody& add_if(const char* key, std::string_view value) {
                if (!value.empty()) add(key, value);
                return *this;
            }

            JsonBody& flag(const char* key, bool value) {
                separator();
                o_ << utils::json_string(key) << ":" << (value ? "true" : "false");
                return *this;
            }

            std::string str() const { return o_.str() + "}"; }

        private:
            void separator() {
                o_ << (first_ ? "{" : ",");
                first_ = false;
            }

            std::ostringstream o_;
            bool first_ = true;
        };

        std::string number_text(double value) {
            return utils::json_number(value);
        }

        void add_instrument(JsonBody& body, const InstrumentQuery& query) {
            body.add("stock_code", query.stock_code)
                .add("exchange_code", query.exchange_code)
                .add_if("product_type", query.product_type)
                .add_if("expiry_date", query.expiry_date)
                .add_if("right", query.right)
                .add_if("strike_price", query.strike_price);
        }

        std::string feed_message(const char* action, const FeedRequest& request) {
            JsonBody body;
            body.add("action", action)
                .add("stock_code", request.stock_code)
                .add("exchange_code", request.exchange_code)
                .add("product_type", request.product_type)
                .add("expiry_date", request.expiry_date)
                .add("strike_price", request.strike_price)
                .add("right", request.right)
                .flag("get_exchange_quotes", request.exchange_quotes)
                .flag("get_market_depth", request.market_depth);
            return body.str();
        }

    }

    RestBrokerClient::RestBrokerClient(BrokerEndpoint endpoint) : endpoint_(std::move(endpoint)) {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);

        // Required on Windows, harmless on Linux.
        ix::initNetSystem();
        web_socket_.setUrl(endpoint_.feed_url);
        web_socket_.setPingInterval(15);
        web_socket_.disableAutomaticReconnection();
        web_socket_.setOnMessageCallback([this](const ix::WebSocketMessagePtr& msg) {
            on_feed_message(msg);
        });
    }

    RestBrokerClient::~RestBrokerClient() {
        web_socket_.stop();
        if (stream_) {
            beast::error_code ec;
            stream_->shutdown(ec);
        }
        ix::uninitNetSystem();
    }

    void RestBrokerClient::connect() {
        try {
            tcp::resolver resolver(ioc_);
            auto const results = resolver.resolve(endpoint_.host, endpoint_.port);

            stream_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ioc_, ssl_ctx_);

            // Set SNI Hostname (many hosts need this to handshake successfully)
            if (!SSL_set_tlsext_host_name(stream_->native_handle(), endpoint_.host.c_str())) {
                beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                throw beast::system_error{ec};
            }

            beast::get_lowest_layer(*stream_).expires_after(std::chrono::seconds(30));
            beast::get_lowest_layer(*stream_).connect(results);
            beast::get_lowest_layer(*stream_).socket().set_option(tcp::no_delay(true));
            stream_->handshake(ssl::stream_base::client);
            std::cout << "[Broker] Connected to " << endpoint_.host << " via Boost.Beast" << std::endl;
        } catch (std::exception const& e) {
            stream_.reset();
            LOG_ERROR("[Broker] connection to %s failed: %s", endpoint_.host.c_str(), e.what());
            throw BrokerCallError(std::string("broker connection failed: ") + e.what());
        }
    }

    std::string RestBrokerClient::request(http::verb verb, const std::string& endpoint,
                                          const std::string& body, bool signed_call) {
        std::lock_guard<std::mutex> lock(rest_mutex_);
        if (!stream_) {
            connect();
        }

        http::request<http::string_body> req{verb, endpoint_.base_path + endpoint, 11};
        req.set(http::field::host, endpoint_.host);
        req.set(http::field::user_agent, std::string("optgate/") + constants::VERSION);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::connection, "keep-alive");
        if (signed_call) {
            std::string timestamp = broker_timestamp();
            req.set("X-Checksum", "token " + broker_checksum(timestamp, body, secret_));
            req.set("X-Timestamp", timestamp);
            req.set("X-AppKey", app_key_);
            req.set("X-SessionToken", session_token_);
        }
        req.body() = body;
        req.prepare_payload();

        http::response<http::string_body> res;
        try {
            beast::get_lowest_layer(*stream_).expires_after(std::chrono::seconds(30));
            http::write(*stream_, req);
            http::read(*stream_, buffer_, res);
        } catch (std::exception const& e) {
            stream_.reset();
            buffer_.clear();
            auto method = http::to_string(verb);
            LOG_ERROR("[Broker] %.*s %s failed: %s", static_cast<int>(method.size()), method.data(),
                      endpoint.c_str(), e.what());
            throw BrokerCallError(std::string("broker request failed: ") + e.what());
        }

        if (!res.keep_alive()) {
            LOG_INFO("[Broker] server requested close, reconnecting on next call");
            stream_.reset();
            buffer_.clear();
        }

        if (res.body().empty()) {
            throw BrokerCallError("broker returned HTTP " + std::to_string(res.result_int()) + " with no body");
        }
        return res.body();
    }

    std::string RestBrokerClient::generate_session(const BrokerCredentials& credentials) {
        app_key_ = credentials.api_key;
        secret_ = credentials.api_secret;

        std::string body = JsonBody()
            .add("SessionToken", credentials.session_token)
            .add("AppKey", credentials.api_key)
            .str();
        std::string response = request(http::verb::get, "customerdetails", body, false);

        simdjson::dom::parser parser;
        simdjson::dom::element doc;
        simdjson::dom::element success;
        simdjson::dom::object details;
        if (json::parse(parser, response, doc) == simdjson::SUCCESS &&
            doc["Success"].get(success) == simdjson::SUCCESS &&
            success.get(details) == simdjson::SUCCESS) {
            session_token_ = json::string_field(details, "session_token").value_or("");
        }
        if (session_token_.empty()) {
            LOG_WARN("[Broker] customerdetails returned no session_token");
        }
        return response;
    }

    std::string RestBrokerClient::get_customer_details() {
        std::string body = JsonBody()
            .add("SessionToken", session_token_)
            .add("AppKey", app_key_)
            .str();
        return request(http::verb::get, "customerdetails", body, false);
    }

    std::string RestBrokerClient::get_option_chain_quotes(const InstrumentQuery& query) {
        JsonBody body;
        add_instrument(body, query);
        return request(http::verb::get, "optionchain", body.str());
    }

    std::string RestBrokerClient::get_quotes(const InstrumentQuery& query) {
        JsonBody body;
        add_instrument(body, query);
        return request(http::verb::get, "quotes", body.str());
    }

    std::string RestBrokerClient::place_order(const OrderLeg& leg) {
        std::string body = JsonBody()
            .add("stock_code", leg.stock_code)
            .add("exchange_code", leg.exchange_code)
            .add("product", leg.product)
            .add("action", action_name(leg.action))
            .add("order_type", leg.order_type)
            .add("stoploss", number_text(leg.stoploss))
            .add("quantity", std::to_string(leg.quantity.value_or(0)))
            .add("price", number_text(leg.price))
            .add("validity", "day")
            .add("validity_date", leg.expiry_date)
            .add("disclosed_quantity", "0")
            .add("expiry_date", leg.expiry_date)
            .add("right", right_name(leg.right))
            .add("strike_price", number_text(leg.strike_price.value_or(0.0)))
            .add("user_remark", leg.user_remark)
            .str();
        return request(http::verb::post, "order", body);
    }

    std::string RestBrokerClient::cancel_order(const std::string& order_id, const std::string& exchange_code) {
        std::string body = JsonBody()
            .add("order_id", order_id)
            .add("exchange_code", exchange_code)
            .str();
        return request(http::verb::delete_, "order", body);
    }

    std::string RestBrokerClient::modify_order(const ModifyRequest& modify) {
        std::string body = JsonBody()
            .add("order_id", modify.order_id)
            .add("exchange_code", modify.exchange_code)
            .add("quantity", modify.quantity)
            .add("price", modify.price)
            .add("stoploss", modify.stoploss)
            .add("validity", modify.validity)
            .str();
        return request(http::verb::put, "order", body);
    }

    std::string RestBrokerClient::get_order_list(const std::string& exchange_code,
                                                 const std::string& from_date, const std::string& to_date) {
        std::string body = JsonBody()
            .add("exchange_code", exchange_code)
            .add("from_date", from_date)
            .add("to_date", to_date)
            .str();
        return request(http::verb::get, "order", body);
    }

    std::string RestBrokerClient::get_trade_list(const std::string& exchange_code,
                                                 const std::string& from_date, const std::string& to_date) {
        std::string body = JsonBody()
            .add("exchange_code", exchange_code)
            .add("from_date", from_date)
            .add("to_date", to_date)
            .str();
        return request(http::verb::get, "trades", body);
    }

    std::string RestBrokerClient::get_portfolio_positions() {
        return request(http::verb::get, "portfoliopositions", "{}");
    }

    std::string RestBrokerClient::get_portfolio_holdings() {
        return request(http::verb::get, "portfolioholdings", "{}");
    }

    std::string RestBrokerClient::get_funds() {
        return request(http::verb::get, "funds", "{}");
    }

    std::string RestBrokerClient::get_historical(const HistoricalQuery& query) {
        JsonBody body;
        body.add("interval", query.interval)
            .add("from_date", query.from_date)
            .add("to_date", query.to_date)
            .add("stock_code", query.stock_code)
            .add("exchange_code", query.exchange_code);
        if (!query.expiry_date.empty()) {
            body.add("expiry_date", query.expiry_date).add("product_type", "options");
        }
        body.add_if("right", query.right).add_if("strike_price", query.strike_price);
        return request(http::verb::get, "historicalcharts", body.str());
    }

    void RestBrokerClient::on_feed_message(const ix::WebSocketMessagePtr& msg) {
        if (msg->type == ix::WebSocketMessageType::Message) {
            TickCallback callback;
            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                callback = on_ticks_;
            }
            if (callback) {
                callback(msg->str);
            }
        } else if (msg->type == ix::WebSocketMessageType::Open) {
            std::cout << "[Feed] Connected to " << endpoint_.feed_url << std::endl;
            {
                std::lock_guard<std::mutex> lock(feed_mutex_);
                feed_open_ = true;
            }
            feed_cv_.notify_all();
        } else if (msg->type == ix::WebSocketMessageType::Close) {
            std::cout << "[Feed] Disconnected. Code: " << msg->closeInfo.code
                      << " Reason: " << msg->closeInfo.reason << std::endl;
            std::lock_guard<std::mutex> lock(feed_mutex_);
            feed_open_ = false;
        } else if (msg->type == ix::WebSocketMessageType::Error) {
            LOG_ERROR("[Feed] error: %s", msg->errorInfo.reason.c_str());
        }
    }

    void RestBrokerClient::ws_connect() {
        ix::WebSocketHttpHeaders headers;
        headers["X-AppKey"] = app_key_;
        headers["X-SessionToken"] = session_token_;
        web_socket_.setExtraHeaders(headers);
        web_socket_.start();

        std::unique_lock<std::mutex> lock(feed_mutex_);
        if (!feed_cv_.wait_for(lock, endpoint_.feed_connect_wait, [this] { return feed_open_; })) {
            lock.unlock();
            web_socket_.stop();
            throw BrokerCallError("push channel did not open within " +
                                  std::to_string(endpoint_.feed_connect_wait.count()) + "ms");
        }
    }

    void RestBrokerClient::ws_disconnect() {
        web_socket_.stop();
        std::lock_guard<std::mutex> lock(feed_mutex_);
        feed_open_ = false;
    }

    void RestBrokerClient::send_feed(const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(feed_mutex_);
            if (!feed_open_) {
                throw BrokerCallError("push channel is not open");
            }
        }
        ix::WebSocketSendInfo info = web_socket_.send(message);
        if (!info.success) {
            throw BrokerCallError("push channel send failed");
        }
    }

    void RestBrokerClient::subscribe_feeds(const FeedRequest& request) {
        send_feed(feed_message("subscribe", request));
    }

    void RestBrokerClient::unsubscribe_feeds(const FeedRequest& request) {
        send_feed(feed_message("unsubscribe", request));
    }

    void RestBrokerClient::set_on_ticks(TickCallback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        on_ticks_ = std::move(callback);
    }

}
