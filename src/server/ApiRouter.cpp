#include "server/ApiRouter.hpp"
#include "broker/BrokerResponse.hpp"
#include "broker/Checksum.hpp"
#include "common/Errors.hpp"
#include "common/Json.hpp"
#include "common/Logger.hpp"
#include "common/Utils.hpp"
#include "market_data/ExpiryCalendar.hpp"
#include "relay/Frames.hpp"
#include "relay/RelayLoop.hpp"
#include <cstdlib>
#include <sstream>

namespace optgate {

    using utils::json_string;

    namespace {

        const char* bool_text(bool value) { return value ? "true" : "false"; }

        ApiResponse ok_body(const std::string& body) {
            return ApiResponse{200, body};
        }

        // {"success":true,"data":<data>}
        ApiResponse ok_data(const std::string& data) {
            return ok_body("{\"success\":true,\"data\":" + data + "}");
        }

        ApiResponse leg_response(const LegResult& result) {
            std::ostringstream o;
            o << "{\"success\":" << bool_text(result.success) << ",";
            o << "\"order_id\":" << json_string(result.order_id) << ",";
            o << "\"error\":" << json_string(result.error) << "}";
            return ok_body(o.str());
        }

        ApiResponse broker_ack(const BrokerResponse& response) {
            std::ostringstream o;
            o << "{\"success\":" << bool_text(response.ok) << ",";
            o << "\"error\":" << json_string(response.ok ? "" : response.error) << "}";
            return ok_body(o.str());
        }

        size_t array_size(const std::string& text) {
            simdjson::dom::parser parser;
            simdjson::dom::element doc;
            simdjson::dom::array rows;
            if (json::parse(parser, text, doc) != simdjson::SUCCESS || doc.get(rows) != simdjson::SUCCESS) {
                return 0;
            }
            return rows.size();
        }

        // The broker's connect failures are terse; point at the usual causes.
        std::string connect_hint(const std::string& message) {
            std::string lower = message;
            for (auto& c : lower) {
                if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
            }
            if (lower.find("null") != std::string::npos) {
                return " (session token stale, generate a new one for today)";
            }
            if (lower.find("key") != std::string::npos) {
                return " (check the API key and secret)";
            }
            return "";
        }

        int hex_value(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

    }

    ApiResponse json_error(int status, const std::string& message) {
        return ApiResponse{status, "{\"success\":false,\"error\":" + json_string(message) + "}"};
    }

    // ---------------------------------------------------------------------
    // RequestParams
    // ---------------------------------------------------------------------

    RequestParams::RequestParams(std::string_view target, std::string_view body)
        : query_(ApiRouter::query_of(target)) {
        if (body.empty()) return;
        simdjson::dom::element doc;
        simdjson::dom::object object;
        if (json::parse(parser_, body, doc) == simdjson::SUCCESS && doc.get(object) == simdjson::SUCCESS) {
            body_ = object;
        }
    }

    std::optional<std::string> RequestParams::get(std::string_view key) const {
        if (body_) {
            if (auto value = json::string_field(*body_, key)) {
                return value;
            }
        }
        auto it = query_.find(key);
        if (it != query_.end() && !it->second.empty()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::string RequestParams::get_or(std::string_view key, const std::string& fallback) const {
        auto value = get(key);
        return value ? *value : fallback;
    }

    std::optional<simdjson::dom::element> RequestParams::element(std::string_view key) const {
        if (!body_) return std::nullopt;
        return json::field(*body_, key);
    }

    // ---------------------------------------------------------------------
    // ApiRouter
    // ---------------------------------------------------------------------

    ApiRouter::ApiRouter(GatewayService& service, RouterOptions options)
        : service_(service), options_(std::move(options)) {
        routes_[{"GET", "/"}] = &ApiRouter::health;
        routes_[{"GET", "/health"}] = &ApiRouter::health;
        routes_[{"GET", "/ping"}] = &ApiRouter::ping;
        routes_[{"POST", "/api/connect"}] = &ApiRouter::connect;
        routes_[{"POST", "/api/disconnect"}] = &ApiRouter::disconnect;
        routes_[{"GET", "/api/expiries"}] = &ApiRouter::expiries;
        routes_[{"GET", "/api/spot"}] = &ApiRouter::spot;
        routes_[{"GET", "/api/optionchain"}] = &ApiRouter::option_chain;
        routes_[{"GET", "/api/quote"}] = &ApiRouter::quote;
        routes_[{"POST", "/api/ws/subscribe"}] = &ApiRouter::subscribe;
        routes_[{"GET", "/api/ticks"}] = &ApiRouter::ticks;
        routes_[{"POST", "/api/order"}] = &ApiRouter::order;
        routes_[{"POST", "/api/strategy/execute"}] = &ApiRouter::strategy;
        routes_[{"POST", "/api/squareoff"}] = &ApiRouter::square_off;
        routes_[{"POST", "/api/order/cancel"}] = &ApiRouter::cancel;
        routes_[{"PATCH", "/api/order/modify"}] = &ApiRouter::modify;
        routes_[{"GET", "/api/orders"}] = &ApiRouter::orders;
        routes_[{"GET", "/api/trades"}] = &ApiRouter::trades;
        routes_[{"GET", "/api/positions"}] = &ApiRouter::positions;
        routes_[{"GET", "/api/funds"}] = &ApiRouter::funds;
        routes_[{"GET", "/api/historical"}] = &ApiRouter::historical;
        routes_[{"GET", "/api/ratelimit"}] = &ApiRouter::rate_limit;
        routes_[{"POST", "/api/checksum"}] = &ApiRouter::checksum;
    }

    ApiRouter::Handler ApiRouter::find(const std::string& method, const std::string& path) const {
        auto it = routes_.find({method, path});
        return it == routes_.end() ? nullptr : it->second;
    }

    ApiResponse ApiRouter::handle(const ApiRequest& request) const {
        std::string path = path_of(request.target);

        if (request.method == "OPTIONS") {
            return ApiResponse{200, ""};
        }
        if (!options_.auth_token.empty() && path.rfind("/api/", 0) == 0 &&
            request.auth_token != options_.auth_token) {
            return json_error(401, "Unauthorized: missing or invalid X-Terminal-Auth");
        }

        Handler handler = find(request.method, path);
        if (!handler) {
            return json_error(404, "No route for " + request.method + " " + path);
        }

        RequestParams params(request.target, request.body);
        try {
            return (this->*handler)(params);
        } catch (const NotConnected& e) {
            return json_error(401, e.what());
        } catch (const std::exception& e) {
            LOG_WARN("[API] %s %s failed: %s", request.method.c_str(), path.c_str(), e.what());
            return json_error(200, e.what());
        }
    }

    std::string ApiRouter::path_of(std::string_view target) {
        auto pos = target.find('?');
        return std::string(pos == std::string_view::npos ? target : target.substr(0, pos));
    }

    std::map<std::string, std::string, std::less<>> ApiRouter::query_of(std::string_view target) {
        std::map<std::string, std::string, std::less<>> out;
        auto pos = target.find('?');
        if (pos == std::string_view::npos) return out;
        std::string_view query = target.substr(pos + 1);
        while (!query.empty()) {
            auto amp = query.find('&');
            std::string_view pair = query.substr(0, amp);
            if (!pair.empty()) {
                auto eq = pair.find('=');
                std::string key = url_decode(pair.substr(0, eq));
                std::string value = eq == std::string_view::npos ? "" : url_decode(pair.substr(eq + 1));
                out.emplace(std::move(key), std::move(value));
            }
            if (amp == std::string_view::npos) break;
            query.remove_prefix(amp + 1);
        }
        return out;
    }

    std::string ApiRouter::url_decode(std::string_view text) {
        std::string out;
        out.reserve(text.size());
        for (size_t i = 0; i < text.size(); ++i) {
            char c = text[i];
            if (c == '+') {
                out += ' ';
            } else if (c == '%' && i + 2 < text.size() &&
                       hex_value(text[i + 1]) >= 0 && hex_value(text[i + 2]) >= 0) {
                out += static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2]));
                i += 2;
            } else {
                out += c;
            }
        }
        return out;
    }

    // --- health ----------------------------------------------------------

    ApiResponse ApiRouter::health(const RequestParams&) const {
        auto session = service_.current();
        PacingStatus rate = service_.rate_status();
        std::ostringstream o;
        o << "{\"status\":\"online\",";
        o << "\"connected\":" << bool_text(session != nullptr) << ",";
        o << "\"ws_running\":" << bool_text(session && session->feed_live()) << ",";
        o << "\"subscriptions\":" << (session ? session->subscription_count() : 0) << ",";
        o << "\"tick_count\":" << (session ? session->cache().size() : 0) << ",";
        o << "\"rest_calls_min\":" << rate.calls_last_minute << ",";
        o << "\"queue_depth\":" << rate.queue_depth << ",";
        o << "\"auth_enabled\":" << bool_text(!options_.auth_token.empty()) << ",";
        o << "\"version\":" << json_string(constants::VERSION) << ",";
        o << "\"timestamp\":" << json_string(utils::iso8601_utc()) << "}";
        return ok_body(o.str());
    }

    ApiResponse ApiRouter::ping(const RequestParams&) const {
        std::ostringstream o;
        o << "{\"status\":\"online\",";
        o << "\"version\":" << json_string(constants::VERSION) << ",";
        o << "\"ts\":" << json_string(utils::iso8601_utc()) << "}";
        return ok_body(o.str());
    }

    // --- session ---------------------------------------------------------

    ApiResponse ApiRouter::connect(const RequestParams& params) const {
        BrokerCredentials credentials;
        credentials.api_key = params.get_or("api_key", "");
        credentials.api_secret = params.get_or("api_secret", "");
        credentials.session_token = params.get_or("session_token", params.get_or("apisession", ""));
        if (credentials.api_key.empty() || credentials.api_secret.empty() || credentials.session_token.empty()) {
            return json_error(400, "Missing: api_key, api_secret, session_token");
        }

        try {
            ConnectInfo info = service_.connect(credentials);
            std::ostringstream o;
            o << "{\"success\":true,";
            o << "\"session_token\":" << json_string(info.session_token) << ",";
            o << "\"message\":\"Connected\"";
            if (!info.name.empty()) o << ",\"name\":" << json_string(info.name);
            if (!info.email.empty()) o << ",\"email\":" << json_string(info.email);
            o << "}";
            return ok_body(o.str());
        } catch (const std::exception& e) {
            std::string message = e.what();
            LOG_ERROR("[API] connect failed: %s", message.c_str());
            return json_error(200, message + connect_hint(message));
        }
    }

    ApiResponse ApiRouter::disconnect(const RequestParams&) const {
        service_.disconnect();
        return ok_body("{\"success\":true,\"message\":\"Disconnected\"}");
    }

    // --- market data -----------------------------------------------------

    ApiResponse ApiRouter::expiries(const RequestParams& params) const {
        std::string stock_code = params.get_or("stock_code", "NIFTY");
        std::ostringstream o;
        o << "{\"success\":true,";
        o << "\"stock_code\":" << json_string(stock_code) << ",";
        o << "\"expiries\":" << frames::expiries_json(weekly_expiries(stock_code, options_.expiry_count)) << "}";
        return ok_body(o.str());
    }

    ApiResponse ApiRouter::spot(const RequestParams& params) const {
        auto session = service_.session();
        std::string stock_code = params.get_or("stock_code", "NIFTY");
        std::string exchange_code = params.get_or("exchange_code", "NSE");

        auto quote = session->spot_price(stock_code, exchange_code);
        if (!quote) {
            return json_error(200, "No spot price returned for " + stock_code + "/" + exchange_code);
        }
        std::ostringstream o;
        o << "{\"success\":true,";
        o << "\"spot\":" << utils::json_number(quote->spot) << ",";
        o << "\"source\":" << json_string(quote->source) << ",";
        o << "\"stock_code\":" << json_string(stock_code) << ",";
        o << "\"exchange_code\":" << json_string(exchange_code) << "}";
        return ok_body(o.str());
    }

    ApiResponse ApiRouter::option_chain(const RequestParams& params) const {
        auto session = service_.session();
        auto expiry = params.get("expiry_date");
        if (!expiry) {
            return json_error(400, "expiry_date required");
        }
        std::string rows = session->fetch_option_chain(params.get_or("stock_code", "NIFTY"),
                                                       params.get_or("exchange_code", "NFO"),
                                                       *expiry,
                                                       parse_right(params.get_or("right", "Call")),
                                                       params.get_or("strike_price", ""));
        return ok_body("{\"success\":true,\"data\":" + rows + ",\"count\":" + std::to_string(array_size(rows)) + "}");
    }

    ApiResponse ApiRouter::quote(const RequestParams& params) const {
        auto session = service_.session();
        InstrumentQuery query;
        query.stock_code = params.get_or("stock_code", "");
        query.exchange_code = params.get_or("exchange_code", "");
        query.expiry_date = params.get_or("expiry_date", "");
        query.right = params.get_or("right", "");
        query.strike_price = params.get_or("strike_price", "");
        if (query.stock_code.empty() || query.exchange_code.empty()) {
            return json_error(400, "stock_code and exchange_code required");
        }
        if (!query.right.empty()) {
            query.right = std::string(right_name(parse_right(query.right)));
        }
        std::string body = session->get_quote(query);
        parse_broker_response(body); // throws on a non-JSON reply
        return ok_data(body);
    }

    ApiResponse ApiRouter::subscribe(const RequestParams& params) const {
        auto session = service_.session();
        if (!params.has_body()) {
            return json_error(400, "Invalid JSON");
        }
        std::string stock_code = utils::to_upper(params.get_or("stock_code", "NIFTY"));
        std::string exchange_code = params.get_or("exchange_code", "NFO");
        std::string expiry = params.get_or("expiry_date", "");

        std::vector<int64_t> strikes;
        simdjson::dom::array strike_list;
        auto strikes_element = params.element("strikes");
        if (strikes_element && strikes_element->get(strike_list) == simdjson::SUCCESS) {
            for (auto entry : strike_list) {
                auto text = json::as_string(entry);
                auto strike = text ? parse_strike(*text) : std::nullopt;
                if (!strike) {
                    return json_error(400, "invalid strike in strikes");
                }
                strikes.push_back(*strike);
            }
        }
        if (expiry.empty() || strikes.empty()) {
            return json_error(400, "expiry_date and strikes required");
        }

        std::vector<Right> rights;
        simdjson::dom::array right_list;
        auto rights_element = params.element("rights");
        if (rights_element && rights_element->get(right_list) == simdjson::SUCCESS) {
            for (auto entry : right_list) {
                if (auto text = json::as_string(entry)) {
                    rights.push_back(parse_right(*text));
                }
            }
        }
        if (rights.empty()) {
            rights = {Right::Call, Right::Put};
        }

        session->unsubscribe_all();
        SubscribeResult result = session->subscribe_option_chain(stock_code, exchange_code, expiry, strikes, rights);

        std::ostringstream o;
        o << "{\"success\":true,";
        o << "\"subscribed\":" << result.subscribed << ",";
        o << "\"total_subs\":" << result.total_subs << ",";
        o << "\"errors\":[";
        for (size_t i = 0; i < result.errors.size(); i++) {
            o << json_string(result.errors[i]);
            if (i + 1 < result.errors.size()) o << ",";
        }
        o << "]}";
        return ok_body(o.str());
    }

    ApiResponse ApiRouter::ticks(const RequestParams& params) const {
        uint64_t since = 0;
        if (auto text = params.get("since_version")) {
            char* end = nullptr;
            unsigned long long value = std::strtoull(text->c_str(), &end, 10);
            if (*end != '\0') {
                return json_error(400, "since_version must be an integer");
            }
            since = value;
        }
        return ok_body(pull(service_, since));
    }

    // --- orders ----------------------------------------------------------

    ApiResponse ApiRouter::order(const RequestParams& params) const {
        auto session = service_.session();
        if (!params.has_body()) {
            return json_error(400, "Invalid JSON");
        }
        return leg_response(session->place_order(leg_from_json(*params.body())));
    }

    ApiResponse ApiRouter::strategy(const RequestParams& params) const {
        auto session = service_.session();
        if (!params.has_body()) {
            return json_error(400, "Invalid JSON");
        }
        std::vector<OrderLeg> legs;
        simdjson::dom::array leg_list;
        auto legs_element = params.element("legs");
        if (legs_element && legs_element->get(leg_list) == simdjson::SUCCESS) {
            for (auto entry : leg_list) {
                simdjson::dom::object object;
                if (entry.get(object) == simdjson::SUCCESS) {
                    legs.push_back(leg_from_json(object));
                } else {
                    legs.push_back(OrderLeg{}); // rejected by validation, keeps its index
                }
            }
        }
        if (legs.empty()) {
            return json_error(400, "No legs provided");
        }

        std::vector<LegResult> results = session->place_strategy(legs);
        bool all_ok = true;
        for (const auto& r : results) {
            all_ok = all_ok && r.success;
        }
        return ok_body("{\"success\":" + std::string(bool_text(all_ok)) +
                       ",\"results\":" + frames::leg_results_json(results) + "}");
    }

    ApiResponse ApiRouter::square_off(const RequestParams& params) const {
        auto session = service_.session();
        if (!params.has_body()) {
            return json_error(400, "Invalid JSON");
        }
        return leg_response(session->square_off(leg_from_json(*params.body())));
    }

    ApiResponse ApiRouter::cancel(const RequestParams& params) const {
        auto session = service_.session();
        if (!params.has_body()) {
            return json_error(400, "Invalid JSON");
        }
        std::string order_id = params.get_or("order_id", "");
        if (order_id.empty()) {
            return json_error(400, "order_id required");
        }
        return broker_ack(session->cancel_order(order_id, params.get_or("exchange_code", "NFO")));
    }

    ApiResponse ApiRouter::modify(const RequestParams& params) const {
        auto session = service_.session();
        if (!params.has_body()) {
            return json_error(400, "Invalid JSON");
        }
        ModifyRequest request;
        request.order_id = params.get_or("order_id", "");
        if (request.order_id.empty()) {
            return json_error(400, "order_id required");
        }
        request.exchange_code = params.get_or("exchange_code", request.exchange_code);
        request.quantity = params.get_or("quantity", request.quantity);
        request.price = params.get_or("price", request.price);
        request.stoploss = params.get_or("stoploss", request.stoploss);
        request.validity = params.get_or("validity", request.validity);
        return broker_ack(session->modify_order(request));
    }

    // --- books -----------------------------------------------------------

    ApiResponse ApiRouter::orders(const RequestParams&) const {
        return ok_data(service_.session()->order_book());
    }

    ApiResponse ApiRouter::trades(const RequestParams&) const {
        return ok_data(service_.session()->trade_book());
    }

    ApiResponse ApiRouter::positions(const RequestParams&) const {
        PortfolioView view = service_.session()->positions();
        return ok_data("{\"positions\":" + view.positions + ",\"holdings\":" + view.holdings + "}");
    }

    ApiResponse ApiRouter::funds(const RequestParams&) const {
        return ok_data(service_.session()->funds());
    }

    ApiResponse ApiRouter::historical(const RequestParams& params) const {
        auto session = service_.session();
        HistoricalQuery query;
        query.stock_code = params.get_or("stock_code", "");
        query.exchange_code = params.get_or("exchange_code", "");
        query.interval = params.get_or("interval", query.interval);
        query.from_date = params.get_or("from_date", "");
        query.to_date = params.get_or("to_date", "");
        query.expiry_date = params.get_or("expiry_date", "");
        query.right = params.get_or("right", "");
        query.strike_price = params.get_or("strike_price", "");
        if (query.stock_code.empty() || query.exchange_code.empty() ||
            query.from_date.empty() || query.to_date.empty()) {
            return json_error(400, "stock_code, exchange_code, from_date and to_date required");
        }
        return ok_data(session->historical(query));
    }

    // --- utilities -------------------------------------------------------

    ApiResponse ApiRouter::rate_limit(const RequestParams&) const {
        return ok_body(frames::rate_status(service_.rate_status()));
    }

    // The payload is signed as compact JSON, the text RestBrokerClient sends.
    // A signer that writes ", " and ": " separators or \uXXXX escapes gets a
    // different digest for the same payload.
    ApiResponse ApiRouter::checksum(const RequestParams& params) const {
        if (!params.has_body()) {
            return ApiResponse{400, "{\"error\":\"Invalid JSON\"}"};
        }
        try {
            std::string timestamp = params.get_or("timestamp", broker_timestamp());
            auto payload = params.element("payload");
            std::string body = payload ? json::to_text(*payload) : "{}";
            std::string digest = broker_checksum(timestamp, body, params.get_or("secret", ""));
            return ok_body("{\"checksum\":" + json_string(digest) + ",\"timestamp\":" + json_string(timestamp) + "}");
        } catch (const std::exception& e) {
            return ApiResponse{400, "{\"error\":" + json_string(e.what()) + "}"};
        }
    }

    // ---------------------------------------------------------------------

    OrderLeg leg_from_json(simdjson::dom::object object) {
        OrderLeg leg;
        leg.stock_code = json::string_field(object, "stock_code").value_or("");
        leg.exchange_code = json::string_field(object, "exchange_code").value_or(leg.exchange_code);
        leg.product = json::string_field(object, "product").value_or(leg.product);
        leg.action = parse_action(json::string_field(object, "action").value_or("buy"));
        leg.order_type = json::string_field(object, "order_type").value_or(leg.order_type);
        for (auto& c : leg.order_type) {
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        }
        if (auto quantity = json::number_field(object, "quantity")) {
            leg.quantity = utils::to_int64(*quantity);
        }
        leg.price = json::number_field(object, "price").value_or(0.0);
        leg.stoploss = json::number_field(object, "stoploss").value_or(0.0);
        leg.expiry_date = json::string_field(object, "expiry_date").value_or("");
        leg.strike_price = json::number_field(object, "strike_price");
        leg.right = parse_right(json::string_field(object, "right").value_or("call"));
        leg.user_remark = json::string_field(object, "user_remark").value_or(leg.user_remark);
        return leg;
    }

}
