#include "server/ApiRouter.hpp"
#include "broker/Checksum.hpp"
#include "session/GatewayService.hpp"
#include "FakeBroker.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

using namespace std::chrono_literals;

static int failures = 0;

static void check(bool condition, const std::string& name) {
    if (condition) {
        std::cout << "[PASS] " << name << std::endl;
    } else {
        std::cout << "[FAIL] " << name << std::endl;
        ++failures;
    }
}

static bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

static optgate::ApiResponse call(const optgate::ApiRouter& router, const std::string& method,
                                 const std::string& target, const std::string& body = "",
                                 const std::string& token = "") {
    return router.handle(optgate::ApiRequest{method, target, body, token});
}

static const char* CREDENTIALS = R"({"api_key":"KEY123456789","api_secret":"secret","session_token":"12345"})";

int main() {
    std::cout << "Running ApiRouter Unit Test..." << std::endl;

    optgate::SessionOptions session_options;
    session_options.pacing.min_interval = 1ms;
    session_options.subscribe_spacing = 1ms;

    std::shared_ptr<FakeBroker> broker;
    optgate::GatewayService service([&broker]() {
        broker = std::make_shared<FakeBroker>();
        return broker;
    }, session_options);
    optgate::ApiRouter router(service);

    // Before connecting.
    {
        auto funds = call(router, "GET", "/api/funds");
        check(funds.status == 401 && funds.body == "{\"success\":false,\"error\":\"Not connected\"}",
              "session endpoints need a connection");

        auto ticks = call(router, "GET", "/api/ticks");
        check(ticks.status == 200 && ticks.body == "{\"changed\":false,\"version\":0}", "ticks idle before connect");

        auto rate = call(router, "GET", "/api/ratelimit");
        check(rate.status == 200 && contains(rate.body, "\"queue_depth\":0"), "rate status without a session");

        auto health = call(router, "GET", "/health");
        check(health.status == 200 && contains(health.body, "\"connected\":false") &&
              contains(health.body, "\"tick_count\":0"), "health without a session");

        auto missing = call(router, "POST", "/api/connect", R"({"api_key":"KEY"})");
        check(missing.status == 400 &&
              missing.body == "{\"success\":false,\"error\":\"Missing: api_key, api_secret, session_token\"}",
              "connect lists required fields");

        auto refused = call(router, "POST", "/api/connect",
                            R"({"api_key":"KEY","api_secret":"wrong","session_token":"1"})");
        check(refused.status == 200 && contains(refused.body, "\"success\":false") &&
              contains(refused.body, "Invalid credentials"), "broker refusal reported");
        check(!service.connected(), "refused connect keeps no session");
    }

    // Generic routing.
    {
        auto options = call(router, "OPTIONS", "/api/order");
        check(options.status == 200 && options.body.empty(), "preflight answered");

        auto unknown = call(router, "GET", "/api/nothing");
        check(unknown.status == 404 && contains(unknown.body, "No route for GET /api/nothing"), "unknown route");

        auto wrong_method = call(router, "GET", "/api/order");
        check(wrong_method.status == 404, "method is part of the route");

        auto ping = call(router, "GET", "/ping");
        check(contains(ping.body, "\"status\":\"online\""), "ping");

        auto expiries = call(router, "GET", "/api/expiries?stock_code=SENSEX");
        check(contains(expiries.body, "\"stock_code\":\"SENSEX\"") && contains(expiries.body, "Thursday"),
              "expiries for the requested index");
    }

    // Connected flows.
    {
        auto connected = call(router, "POST", "/api/connect", CREDENTIALS);
        check(connected.status == 200 && contains(connected.body, "\"session_token\":\"S3SS10N\"") &&
              contains(connected.body, "\"name\":\"Test Trader\""), "connect returns the session details");

        auto chain = call(router, "GET", "/api/optionchain?stock_code=nifty&expiry_date=27-Oct-2026");
        check(chain.status == 200 && contains(chain.body, "\"count\":3"), "chain rows counted");
        check(service.version() == 2, "chain seeds the cache");

        auto no_expiry = call(router, "GET", "/api/optionchain?stock_code=NIFTY");
        check(no_expiry.status == 400 && contains(no_expiry.body, "expiry_date required"), "chain needs an expiry");

        std::string since = std::to_string(service.version());
        auto same = call(router, "GET", "/api/ticks?since_version=" + since);
        check(same.body == "{\"changed\":false,\"version\":" + since + "}", "pull with the current version");
        auto changed = call(router, "GET", "/api/ticks?since_version=0");
        check(contains(changed.body, "\"changed\":true") && contains(changed.body, "\"stock_code\":\"NIFTY\""),
              "pull with an older version");
        auto bad_since = call(router, "GET", "/api/ticks?since_version=abc");
        check(bad_since.status == 400, "non-numeric since_version rejected");

        auto no_body = call(router, "POST", "/api/ws/subscribe", "not json");
        check(no_body.status == 400 && contains(no_body.body, "Invalid JSON"), "subscribe needs a JSON body");
        auto no_strikes = call(router, "POST", "/api/ws/subscribe", R"({"expiry_date":"27-Oct-2026"})");
        check(no_strikes.status == 400 && contains(no_strikes.body, "expiry_date and strikes required"),
              "subscribe needs strikes");
        auto bad_strike = call(router, "POST", "/api/ws/subscribe",
                               R"({"expiry_date":"27-Oct-2026","strikes":["abc"]})");
        check(bad_strike.status == 400, "unparseable strike rejected");

        auto subscribed = call(router, "POST", "/api/ws/subscribe",
                               R"({"stock_code":"NIFTY","expiry_date":"27-Oct-2026","strikes":[21500,"21600.0"]})");
        check(contains(subscribed.body, "\"subscribed\":4") && contains(subscribed.body, "\"total_subs\":4"),
              "both rights subscribed by default");
        auto replaced = call(router, "POST", "/api/ws/subscribe",
                             R"({"expiry_date":"27-Oct-2026","strikes":[21700],"rights":["Put"]})");
        check(contains(replaced.body, "\"subscribed\":1") && contains(replaced.body, "\"total_subs\":1"),
              "a new subscription replaces the old set");
        check(broker->unsubscribed.size() == 4, "previous set unsubscribed");

        auto health = call(router, "GET", "/health");
        check(contains(health.body, "\"connected\":true") && contains(health.body, "\"ws_running\":true") &&
              contains(health.body, "\"subscriptions\":1"), "health reflects the session");

        auto spot = call(router, "GET", "/api/spot?stock_code=NIFTY&exchange_code=NSE");
        check(contains(spot.body, "\"spot\":21480.75") && contains(spot.body, "\"source\":\"rest_quote\""),
              "spot from a quote");

        auto quote = call(router, "GET", "/api/quote?stock_code=NIFTY&exchange_code=NFO&right=ce");
        check(contains(quote.body, "\"success\":true") && contains(quote.body, "101.5"), "quote passes the reply");
        auto no_exchange = call(router, "GET", "/api/quote?stock_code=NIFTY");
        check(no_exchange.status == 400, "quote needs an exchange");

        auto order = call(router, "POST", "/api/order",
                          R"({"stock_code":"NIFTY","action":"sell","quantity":"50","expiry_date":"27-Oct-2026",
                              "strike_price":21500,"right":"call","order_type":"MARKET"})");
        check(order.body == "{\"success\":true,\"order_id\":\"ORD-1\",\"error\":\"\"}", "order placed");
        check(broker->orders.size() == 1 && broker->orders[0].action == optgate::Action::Sell &&
              broker->orders[0].order_type == "market" && *broker->orders[0].quantity == 50,
              "order fields read from the body");

        auto strategy = call(router, "POST", "/api/strategy/execute", R"({"legs":[
            {"stock_code":"NIFTY","quantity":50,"expiry_date":"27-Oct-2026","strike_price":21500,"right":"call"},
            {"stock_code":"NIFTY","expiry_date":"27-Oct-2026","strike_price":21600,"right":"call"},
            {"stock_code":"NIFTY","quantity":50,"expiry_date":"27-Oct-2026","strike_price":21400,"right":"put"}]})");
        check(contains(strategy.body, "\"success\":false,\"results\":[") &&
              contains(strategy.body, "{\"leg_index\":1,\"success\":false,\"order_id\":\"\",\"error\":\"leg missing quantity\"}"),
              "incomplete leg reported in place");
        check(contains(strategy.body, "{\"leg_index\":2,\"success\":true"), "other legs still placed");
        check(broker->orders.size() == 3, "two legs reached the broker");

        auto huge = call(router, "POST", "/api/order",
                         R"({"stock_code":"NIFTY","quantity":1e30,"expiry_date":"27-Oct-2026",
                             "strike_price":21500,"right":"call"})");
        check(contains(huge.body, "leg missing quantity") && broker->orders.size() == 3,
              "quantity beyond int64 never reaches the broker");

        auto no_legs = call(router, "POST", "/api/strategy/execute", R"({"legs":[]})");
        check(no_legs.status == 400 && contains(no_legs.body, "No legs provided"), "empty strategy rejected");

        auto square = call(router, "POST", "/api/squareoff",
                           R"({"stock_code":"NIFTY","action":"buy","quantity":50,"expiry_date":"27-Oct-2026",
                               "strike_price":21500,"right":"call"})");
        check(contains(square.body, "\"success\":true") && broker->orders.back().action == optgate::Action::Sell,
              "square-off reverses the side");

        auto no_id = call(router, "POST", "/api/order/cancel", "{}");
        check(no_id.status == 400 && contains(no_id.body, "order_id required"), "cancel needs an order id");
        auto cancel = call(router, "POST", "/api/order/cancel", R"({"order_id":"missing"})");
        check(cancel.body == "{\"success\":false,\"error\":\"Order not found\"}", "cancel rejection passed on");
        auto modify = call(router, "PATCH", "/api/order/modify", R"({"order_id":"ORD-1","price":101.5})");
        check(modify.body == "{\"success\":true,\"error\":\"\"}", "modify acknowledged");

        check(contains(call(router, "GET", "/api/orders").body, "\"data\":[{\"order_id\":\"ORD-1\""), "order book");
        check(call(router, "GET", "/api/trades").body == "{\"success\":true,\"data\":[]}", "empty trade book");
        check(contains(call(router, "GET", "/api/positions").body, "\"holdings\":[]"), "positions and holdings");
        check(contains(call(router, "GET", "/api/funds").body, "total_bank_balance"), "funds");

        auto history = call(router, "GET",
                            "/api/historical?stock_code=NIFTY&exchange_code=NSE&from_date=2026-10-01&to_date=2026-10-16");
        check(contains(history.body, "\"data\":[{\"datetime\":\"2026-10-16\""), "historical rows");
        auto no_range = call(router, "GET", "/api/historical?stock_code=NIFTY&exchange_code=NSE");
        check(no_range.status == 400, "historical needs a date range");

        auto disconnected = call(router, "POST", "/api/disconnect");
        check(contains(disconnected.body, "Disconnected") && !service.connected(), "disconnect");
        check(call(router, "GET", "/api/orders").status == 401, "session endpoints closed again");
    }

    // Checksum helper.
    {
        auto signed_body = call(router, "POST", "/api/checksum",
                                R"({"timestamp":"2026-10-17T09:15:00.000Z","payload":{"a":1},"secret":"s"})");
        std::string expected = optgate::broker_checksum("2026-10-17T09:15:00.000Z", "{\"a\":1}", "s");
        check(signed_body.status == 200 && signed_body.body ==
              "{\"checksum\":\"" + expected + "\",\"timestamp\":\"2026-10-17T09:15:00.000Z\"}",
              "checksum over the compact payload");
        std::string spaced = optgate::broker_checksum("2026-10-17T09:15:00.000Z", "{\"a\": 1}", "s");
        check(spaced != expected && signed_body.body.find(spaced) == std::string::npos,
              "spaced separators sign differently");

        auto stamped = call(router, "POST", "/api/checksum", R"({"secret":"s"})");
        check(stamped.status == 200 && contains(stamped.body, ".000Z\""), "timestamp filled in");

        auto invalid = call(router, "POST", "/api/checksum", "nope");
        check(invalid.status == 400 && invalid.body == "{\"error\":\"Invalid JSON\"}", "checksum needs a body");
    }

    // Shared-token gate.
    {
        optgate::RouterOptions options;
        options.auth_token = "tok";
        optgate::ApiRouter guarded(service, options);
        check(call(guarded, "GET", "/api/ratelimit").status == 401, "missing token refused");
        check(call(guarded, "GET", "/api/ratelimit", "", "bad").status == 401, "wrong token refused");
        check(call(guarded, "GET", "/api/ratelimit", "", "tok").status == 200, "matching token accepted");
        auto health = call(guarded, "GET", "/health");
        check(health.status == 200 && contains(health.body, "\"auth_enabled\":true"), "health stays open");
        check(call(guarded, "OPTIONS", "/api/order").status == 200, "preflight needs no token");
    }

    // Query strings.
    {
        check(optgate::ApiRouter::url_decode("a%20b+c%2") == "a b c%2", "url decoding");
        auto query = optgate::ApiRouter::query_of("/x?a=1&b=two%2Fthree&c");
        check(query.size() == 3 && query["a"] == "1" && query["b"] == "two/three" && query["c"].empty(),
              "query parameters split and decoded");
        check(optgate::ApiRouter::path_of("/api/spot?stock_code=NIFTY") == "/api/spot", "path without query");

        optgate::RequestParams params("/x?stock_code=BANKNIFTY&right=put", R"({"stock_code":"NIFTY","strike":21500})");
        check(params.get_or("stock_code", "") == "NIFTY", "body wins over the query");
        check(params.get_or("right", "") == "put", "query used when the body lacks the member");
        check(params.get("strike").value_or("") == "21500", "numbers read as text");
        check(!params.get("expiry_date").has_value(), "absent parameter");
    }

    if (failures > 0) {
        std::cout << failures << " check(s) failed." << std::endl;
        return 1;
    }
    return 0;
}
