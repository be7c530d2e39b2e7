#pragma once

#include "common/Types.hpp"
#include <functional>
#include <string>
#include <string_view>

namespace optgate {

    struct BrokerCredentials {
        std::string api_key;
        std::string api_secret;
        std::string session_token;
    };

    // Instrument selector shared by chain and quote queries. Empty fields are omitted.
    struct InstrumentQuery {
        std::string stock_code;
        std::string exchange_code;
        std::string product_type = "options";
        std::string expiry_date;
        std::string right;        // "Call" / "Put" / ""
        std::string strike_price; // "" for the whole chain
    };

    struct ModifyRequest {
        std::string order_id;
        std::string exchange_code = "NFO";
        std::string quantity = "0";
        std::string price = "0";
        std::string stoploss = "0";
        std::string validity = "day";
    };

    struct HistoricalQuery {
        std::string stock_code;
        std::string exchange_code;
        std::string interval = "1day";
        std::string from_date;
        std::string to_date;
        std::string expiry_date;
        std::string right;
        std::string strike_price;
    };

    struct FeedRequest {
        std::string stock_code;
        std::string exchange_code;
        std::string product_type = "options";
        std::string expiry_date;
        std::string strike_price;
        std::string right;        // "Call" / "Put"
        bool exchange_quotes = true;
        bool market_depth = false;
    };

    /**
     * @class BrokerClient
     * @brief The broker's trading API as the gateway consumes it.
     *
     * REST-style calls are synchronous and return the broker's JSON document as
     * text ({"Success": ..., "Status": 200, "Error": null}). Transport failures
     * throw BrokerCallError. Calls are not thread-safe on their own: the session
     * funnels every REST call through its PacingQueue lane.
     */
    class BrokerClient {
    public:
        using TickCallback = std::function<void(std::string_view payload)>;

        virtual ~BrokerClient() = default;

        virtual std::string generate_session(const BrokerCredentials& credentials) = 0;
        virtual std::string get_customer_details() = 0;

        virtual std::string get_option_chain_quotes(const InstrumentQuery& query) = 0;
        virtual std::string get_quotes(const InstrumentQuery& query) = 0;

        virtual std::string place_order(const OrderLeg& leg) = 0;
        virtual std::string cancel_order(const std::string& order_id, const std::string& exchange_code) = 0;
        virtual std::string modify_order(const ModifyRequest& request) = 0;

        virtual std::string get_order_list(const std::string& exchange_code,
                                           const std::string& from_date, const std::string& to_date) = 0;
        virtual std::string get_trade_list(const std::string& exchange_code,
                                           const std::string& from_date, const std::string& to_date) = 0;
        virtual std::string get_portfolio_positions() = 0;
        virtual std::string get_portfolio_holdings() = 0;
        virtual std::string get_funds() = 0;
        virtual std::string get_historical(const HistoricalQuery& query) = 0;

        // Push channel. ws_connect() blocks until the channel is open or throws.
        virtual void ws_connect() = 0;
        virtual void ws_disconnect() = 0;
        virtual void subscribe_feeds(const FeedRequest& request) = 0;
        virtual void unsubscribe_feeds(const FeedRequest& request) = 0;

        // Invoked on the push listener thread with each raw tick payload.
        virtual void set_on_ticks(TickCallback callback) = 0;
    };

}
