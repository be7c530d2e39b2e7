#pragma once

#include "common/Types.hpp"
#include "market_data/FieldAliases.hpp"
#include "simdjson.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace optgate {

    // One broker payload entry mapped onto a cache key and a partial update.
    struct NormalizedTick {
        InstrumentKey key;
        TickFields fields;
        // Underlying index value carried on the tick, when it passed the sanity check.
        std::optional<double> underlying;
    };

    struct TickBatch {
        std::vector<NormalizedTick> ticks;
        size_t dropped = 0;
    };

    /**
     * @class TickNormalizer
     * @brief Maps broker payloads (push ticks, chain rows, quote rows) to cache updates
     *        through the FieldAliases tables.
     */
    class TickNormalizer {
    public:
        // Function: from_feed
        // Description: Normalizes one push-feed tick. Only fields present in the tick
        //              are engaged. A missing strike reads as 0.
        // Outputs: The normalized tick. Throws MalformedTick when the symbol is missing
        //          or the strike does not parse.
        static NormalizedTick from_feed(simdjson::dom::object tick);

        // Function: normalize_feed
        // Description: Normalizes a push payload: a single tick object or an array of
        //              them. Malformed ticks are logged, counted and skipped.
        // Outputs: The usable ticks. Throws MalformedTick when the payload is not JSON.
        static TickBatch normalize_feed(std::string_view payload);

        // Function: from_chain_row
        // Description: Normalizes one option-chain row for the requested symbol and right.
        // Outputs: Throws MalformedKey when the row has no usable strike.
        static NormalizedTick from_chain_row(simdjson::dom::object row, const std::string& symbol, Right right);

        // Rows that fail are logged, counted and skipped.
        static TickBatch normalize_chain(simdjson::dom::array rows, const std::string& symbol, Right right);

        // Spot heuristic: first positive underlying candidate, accepted only above
        // constants::SPOT_SANITY_THRESHOLD. Best effort.
        static std::optional<double> underlying_spot(simdjson::dom::object tick);

        // First positive price of a quote row.
        static std::optional<double> quote_price(simdjson::dom::object row);
    };

}
