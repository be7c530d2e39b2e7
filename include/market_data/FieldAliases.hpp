#pragma once

#include "simdjson.h"
#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace optgate {

    // Logical fields the gateway reads out of broker payloads.
    enum class TickField : uint8_t {
        Symbol,
        Strike,
        Right,
        Expiry,
        Ltp,
        OpenInterest,
        Volume,
        ImpliedVol,
        Bid,
        Ask,
        ChangePct,
        FeedTime,
        Underlying,
        Count
    };

    enum class PayloadShape : uint8_t {
        FeedTick,  // push-feed tick
        ChainRow,  // row of an option-chain REST response
        QuoteRow   // row of a quote REST response
    };

    // One candidate name, tagged with the broker schema revision that uses it.
    struct FieldAlias {
        std::string_view name;
        uint8_t schema_version;
    };

    /**
     * @class FieldAliases
     * @brief Ordered candidate names per logical field, one table per payload shape.
     *
     * The broker spells the same field differently across SDK revisions and across
     * payload shapes ("best_bid_price", "best-bid-price", "bid_price"). Lookups try
     * the candidates in table order and take the first one that is present and
     * non-empty.
     */
    class FieldAliases {
    public:
        using Row = std::pair<TickField, std::vector<FieldAlias>>;

        FieldAliases(PayloadShape shape, std::initializer_list<Row> rows);

        static const FieldAliases& for_shape(PayloadShape shape);

        PayloadShape shape() const { return shape_; }

        const std::vector<FieldAlias>& candidates(TickField field) const;

        // First candidate holding a number (or a numeric string).
        std::optional<double> number(simdjson::dom::object object, TickField field) const;

        // First candidate holding a non-empty string (numbers are rendered as text).
        std::optional<std::string> text(simdjson::dom::object object, TickField field) const;

        // First candidate with a positive numeric value. Used where the broker
        // reports 0 for "not available".
        std::optional<double> positive(simdjson::dom::object object, TickField field) const;

    private:
        PayloadShape shape_;
        std::array<std::vector<FieldAlias>, static_cast<size_t>(TickField::Count)> table_;
    };

    std::string_view field_name(TickField field);

}
