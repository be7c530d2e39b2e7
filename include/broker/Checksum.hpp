#pragma once

#include <string>
#include <string_view>

namespace optgate {

    // Function: broker_checksum
    // Description: Request signature the broker expects in X-Checksum:
    //              lowercase hex SHA-256 of timestamp + body + secret.
    // Inputs: timestamp - "YYYY-MM-DDTHH:MM:SS.000Z", the same value sent in X-Timestamp.
    //         body - the exact JSON body sent.
    // Outputs: 64 hex characters.
    std::string broker_checksum(std::string_view timestamp, std::string_view body, std::string_view secret);

    // Current UTC time in the broker's timestamp format (milliseconds zeroed).
    std::string broker_timestamp();

}
