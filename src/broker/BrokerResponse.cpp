#include "broker/BrokerResponse.hpp"
#include "common/Errors.hpp"
#include "common/Json.hpp"
#include <cmath>

namespace optgate {

    BrokerResponse parse_broker_response(std::string_view body) {
        simdjson::dom::parser parser;
        simdjson::dom::element doc;
        auto error = json::parse(parser, body, doc);
        if (error) {
            throw BrokerCallError(std::string("broker response is not JSON: ") + simdjson::error_message(error));
        }
        simdjson::dom::object root;
        if (doc.get(root) != simdjson::SUCCESS) {
            throw BrokerCallError("broker response is not a JSON object");
        }

        BrokerResponse response;
        if (auto status = json::number_field(root, "Status")) {
            // Out-of-range codes stay 0 and read as a failure.
            if (std::isfinite(*status) && *status >= 0 && *status < 1000) {
                response.status = static_cast<int>(*status);
            }
        }
        response.ok = response.status == 200;

        if (auto success = json::field(root, "Success")) {
            response.success = json::to_text(*success);
            simdjson::dom::object details;
            if (success->get(details) == simdjson::SUCCESS) {
                response.order_id = json::string_field(details, "order_id").value_or("");
            }
        }

        if (!response.ok) {
            if (auto text = json::string_field(root, "Error")) {
                response.error = *text;
            } else if (auto value = json::field(root, "Error")) {
                response.error = json::to_text(*value);
            } else {
                response.error = "broker status " + std::to_string(response.status);
            }
        }
        return response;
    }

    std::string success_rows(const BrokerResponse& response) {
        if (response.success.empty() || response.success == "null") return "[]";
        if (response.success.front() == '[') return response.success;
        return "[" + response.success + "]";
    }

}
