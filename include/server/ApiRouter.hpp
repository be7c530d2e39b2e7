#pragma once

#include "common/Types.hpp"
#include "session/GatewayService.hpp"
#include "simdjson.h"
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace optgate {

    struct ApiRequest {
        std::string method;      // "GET", "POST", "PATCH", "OPTIONS", ...
        std::string target;      // path with query string
        std::string body;
        std::string auth_token;  // X-Terminal-Auth header, if sent
    };

    struct ApiResponse {
        int status = 200;
        std::string body;
    };

    struct RouterOptions {
        // When not empty, every /api/ request must carry it in X-Terminal-Auth.
        std::string auth_token;
        size_t expiry_count = 5;
    };

    // Function: RequestParams
    // Description: Parameters of one request. Body members (JSON object) win over
    //              query-string members of the same name.
    class RequestParams {
    public:
        RequestParams(std::string_view target, std::string_view body);

        RequestParams(const RequestParams&) = delete;
        RequestParams& operator=(const RequestParams&) = delete;

        // True when the body parsed to a JSON object.
        bool has_body() const { return body_.has_value(); }

        std::optional<std::string> get(std::string_view key) const;
        std::string get_or(std::string_view key, const std::string& fallback) const;

        // Body member, unconverted.
        std::optional<simdjson::dom::element> element(std::string_view key) const;
        std::optional<simdjson::dom::object> body() const { return body_; }

    private:
        std::map<std::string, std::string, std::less<>> query_;
        simdjson::dom::parser parser_;
        std::optional<simdjson::dom::object> body_;
    };

    /**
     * @class ApiRouter
     * @brief Maps the gateway's HTTP surface onto GatewayService and the current Session.
     *
     * Transport-free: the server hands in method, target, body and the auth header
     * and writes back the status and JSON body. Operations that need a session answer
     * 401 when there is none; broker and gateway failures answer 200 with
     * {"success":false,"error":...}; unusable input answers 400.
     */
    class ApiRouter {
    public:
        explicit ApiRouter(GatewayService& service, RouterOptions options = {});

        ApiResponse handle(const ApiRequest& request) const;

        static std::string path_of(std::string_view target);
        static std::map<std::string, std::string, std::less<>> query_of(std::string_view target);
        static std::string url_decode(std::string_view text);

    private:
        using Handler = ApiResponse (ApiRouter::*)(const RequestParams&) const;

        Handler find(const std::string& method, const std::string& path) const;

        ApiResponse health(const RequestParams& params) const;
        ApiResponse ping(const RequestParams& params) const;
        ApiResponse connect(const RequestParams& params) const;
        ApiResponse disconnect(const RequestParams& params) const;
        ApiResponse expiries(const RequestParams& params) const;
        ApiResponse spot(const RequestParams& params) const;
        ApiResponse option_chain(const RequestParams& params) const;
        ApiResponse quote(const RequestParams& params) const;
        ApiResponse subscribe(const RequestParams& params) const;
        ApiResponse ticks(const RequestParams& params) const;
        ApiResponse order(const RequestParams& params) const;
        ApiResponse strategy(const RequestParams& params) const;
        ApiResponse square_off(const RequestParams& params) const;
        ApiResponse cancel(const RequestParams& params) const;
        ApiResponse modify(const RequestParams& params) const;
        ApiResponse orders(const RequestParams& params) const;
        ApiResponse trades(const RequestParams& params) const;
        ApiResponse positions(const RequestParams& params) const;
        ApiResponse funds(const RequestParams& params) const;
        ApiResponse historical(const RequestParams& params) const;
        ApiResponse rate_limit(const RequestParams& params) const;
        ApiResponse checksum(const RequestParams& params) const;

        GatewayService& service_;
        RouterOptions options_;
        std::map<std::pair<std::string, std::string>, Handler> routes_;
    };

    // Order leg from a request object. Missing required members stay unset so the
    // orchestrator rejects the leg on its own.
    OrderLeg leg_from_json(simdjson::dom::object object);

    // Response helpers.
    ApiResponse json_error(int status, const std::string& message);

}
