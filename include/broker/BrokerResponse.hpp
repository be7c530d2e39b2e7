#pragma once

#include <string>
#include <string_view>

namespace optgate {

    // Function: BrokerResponse
    // Description: The envelope every broker REST call returns, with the pieces the
    //              gateway acts on pulled out. "success" is the raw "Success" member
    //              rendered back to JSON ("null" when absent).
    struct BrokerResponse {
        int status = 0;
        bool ok = false;          // Status == 200
        std::string order_id;     // Success.order_id, when present
        std::string error;        // Error, when not ok
        std::string success = "null";
    };

    // Throws BrokerCallError when the body is not a JSON object.
    BrokerResponse parse_broker_response(std::string_view body);

    // "Success" as a JSON array: arrays as-is, an object wrapped in [ ], null as [].
    std::string success_rows(const BrokerResponse& response);

}
