#pragma once

#include <stdexcept>
#include <string>

namespace optgate {

    // Base of every error the gateway raises on purpose.
    class GatewayError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // No broker session is active.
    class NotConnected : public GatewayError {
    public:
        NotConnected() : GatewayError("Not connected") {}
    };

    // Pacing queue: the caller stopped waiting. The work itself may still run.
    class PacingTimeout : public GatewayError {
    public:
        explicit PacingTimeout(long long waited_ms)
            : GatewayError("pacing queue: no result after " + std::to_string(waited_ms) + "ms") {}
    };

    // Pacing queue: a pending item was dropped to admit a newer one.
    class PacingEvicted : public GatewayError {
    public:
        PacingEvicted() : GatewayError("pacing queue: request evicted by newer work (queue full)") {}
    };

    // Pacing queue: full of order-mutating work, which is never evicted.
    class PacingOverflow : public GatewayError {
    public:
        PacingOverflow() : GatewayError("pacing queue: full of order requests, rejected") {}
    };

    class PacingStopped : public GatewayError {
    public:
        PacingStopped() : GatewayError("pacing queue: stopped") {}
    };

    // The broker rejected a call or the transport failed.
    class BrokerCallError : public GatewayError {
    public:
        using GatewayError::GatewayError;
    };

    // Push payload without the fields needed to identify the instrument.
    class MalformedTick : public GatewayError {
    public:
        using GatewayError::GatewayError;
    };

    // Cache key that does not parse into symbol/strike/right.
    class MalformedKey : public GatewayError {
    public:
        explicit MalformedKey(const std::string& key) : GatewayError("malformed cache key: " + key) {}
    };

    // Order leg missing required fields.
    class InvalidLeg : public GatewayError {
    public:
        using GatewayError::GatewayError;
    };

}
