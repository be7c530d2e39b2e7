#pragma once

#include "common/Types.hpp"
#include "common/Utils.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace optgate {

    /**
     * @class OrderOrchestrator
     * @brief Fans a multi-leg strategy out to one unit per leg and collects every
     *        outcome, sorted by the caller's leg order.
     *
     * Units run on their own threads. A unit that has not finished within the join
     * timeout is reported as failed; it keeps running detached and its late result
     * is discarded. A failing or throwing unit never affects its siblings.
     */
    class OrderOrchestrator {
    public:
        // Places one validated leg and returns the broker's JSON response.
        using Submitter = std::function<std::string(const OrderLeg&)>;

        explicit OrderOrchestrator(Submitter submitter,
                                   std::chrono::milliseconds join_timeout = std::chrono::milliseconds(constants::LEG_JOIN_TIMEOUT_MS));

        // Function: orchestrate
        // Description: Submits all legs concurrently.
        // Outputs: Exactly legs.size() results, ordered by leg_index.
        std::vector<LegResult> orchestrate(const std::vector<OrderLeg>& legs) const;

        // Throws InvalidLeg naming the first missing required field.
        static void validate(const OrderLeg& leg);

        // The closing leg: opposite action, square-off remark.
        static OrderLeg square_off_leg(const OrderLeg& leg);

        // One full single-leg submission: validate, submit, parse. Never throws
        // for std::exception failures; they become the result's error.
        static LegResult submit_one(const Submitter& submitter, const OrderLeg& leg, size_t index);

    private:
        Submitter submitter_;
        std::chrono::milliseconds join_timeout_;
    };

}
