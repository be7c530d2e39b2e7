#include "market_data/FieldAliases.hpp"
#include "common/Json.hpp"

namespace optgate {

    namespace {

        // Schema 1: names of the current broker SDK. Schema 2: short or hyphenated
        // names seen in older SDKs and some REST payloads.
        const FieldAliases& feed_tick_aliases();
        const FieldAliases& chain_row_aliases();
        const FieldAliases& quote_row_aliases();

    }

    FieldAliases::FieldAliases(PayloadShape shape, std::initializer_list<Row> rows) : shape_(shape) {
        for (const auto& row : rows) {
            table_[static_cast<size_t>(row.first)] = row.second;
        }
    }

    const FieldAliases& FieldAliases::for_shape(PayloadShape shape) {
        switch (shape) {
            case PayloadShape::FeedTick: return feed_tick_aliases();
            case PayloadShape::ChainRow: return chain_row_aliases();
            case PayloadShape::QuoteRow: return quote_row_aliases();
        }
        return feed_tick_aliases();
    }

    const std::vector<FieldAlias>& FieldAliases::candidates(TickField field) const {
        return table_[static_cast<size_t>(field)];
    }

    std::optional<double> FieldAliases::number(simdjson::dom::object object, TickField field) const {
        for (const auto& alias : candidates(field)) {
            if (auto value = json::number_field(object, alias.name)) {
                return value;
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> FieldAliases::text(simdjson::dom::object object, TickField field) const {
        for (const auto& alias : candidates(field)) {
            if (auto value = json::string_field(object, alias.name)) {
                return value;
            }
        }
        return std::nullopt;
    }

    std::optional<double> FieldAliases::positive(simdjson::dom::object object, TickField field) const {
        for (const auto& alias : candidates(field)) {
            auto value = json::number_field(object, alias.name);
            if (value && *value > 0.0) {
                return value;
            }
        }
        return std::nullopt;
    }

    std::string_view field_name(TickField field) {
        switch (field) {
            case TickField::Symbol: return "symbol";
            case TickField::Strike: return "strike";
            case TickField::Right: return "right";
            case TickField::Expiry: return "expiry";
            case TickField::Ltp: return "ltp";
            case TickField::OpenInterest: return "oi";
            case TickField::Volume: return "volume";
            case TickField::ImpliedVol: return "iv";
            case TickField::Bid: return "bid";
            case TickField::Ask: return "ask";
            case TickField::ChangePct: return "change_pct";
            case TickField::FeedTime: return "feed_time";
            case TickField::Underlying: return "underlying";
            case TickField::Count: break;
        }
        return "unknown";
    }

    namespace {

        const FieldAliases& feed_tick_aliases() {
            static const FieldAliases table(PayloadShape::FeedTick, {
                {TickField::Symbol,       {{"stock_code", 1}, {"symbol", 2}}},
                {TickField::Strike,       {{"strike_price", 1}, {"strike", 2}}},
                {TickField::Right,        {{"right", 1}, {"option_type", 2}}},
                {TickField::Expiry,       {{"expiry_date", 1}}},
                {TickField::Ltp,          {{"last_traded_price", 1}, {"ltp", 2}}},
                {TickField::OpenInterest, {{"open_interest", 1}, {"oi", 2}}},
                {TickField::Volume,       {{"total_quantity_traded", 1}, {"volume", 2}}},
                {TickField::ImpliedVol,   {{"implied_volatility", 1}, {"iv", 2}}},
                {TickField::Bid,          {{"best_bid_price", 1}, {"bid_price", 2}}},
                {TickField::Ask,          {{"best_offer_price", 1}, {"ask_price", 2}}},
                {TickField::ChangePct,    {{"change_percent", 1}, {"change_pct", 2}}},
                {TickField::FeedTime,     {{"exchange_feed_time", 1}}},
                // Underlying index value carried on option ticks. Order matters.
                {TickField::Underlying,   {{"index_close_price", 1}, {"UnderlyingValue", 1},
                                           {"underlying_value", 2}, {"close_price", 2},
                                           {"index_price", 2}, {"underlying_spot_price", 2}}},
            });
            return table;
        }

        const FieldAliases& chain_row_aliases() {
            static const FieldAliases table(PayloadShape::ChainRow, {
                {TickField::Symbol,       {{"stock_code", 1}}},
                {TickField::Strike,       {{"strike_price", 1}, {"strike-price", 2}}},
                {TickField::Right,        {{"right", 1}}},
                {TickField::Expiry,       {{"expiry_date", 1}, {"expiry-date", 2}}},
                {TickField::Ltp,          {{"ltp", 1}, {"last_traded_price", 2}}},
                {TickField::OpenInterest, {{"open_interest", 1}, {"open-interest", 2}}},
                {TickField::Volume,       {{"total_quantity_traded", 1}, {"total-quantity-traded", 2}}},
                {TickField::ImpliedVol,   {{"implied_volatility", 1}, {"implied-volatility", 2}}},
                {TickField::Bid,          {{"best_bid_price", 1}, {"best-bid-price", 2}}},
                {TickField::Ask,          {{"best_offer_price", 1}, {"best-offer-price", 2}}},
                {TickField::ChangePct,    {{"ltp_percent_change", 1}, {"change_percent", 2}}},
            });
            return table;
        }

        const FieldAliases& quote_row_aliases() {
            static const FieldAliases table(PayloadShape::QuoteRow, {
                {TickField::Symbol,     {{"stock_code", 1}}},
                {TickField::Ltp,        {{"ltp", 1}, {"last_traded_price", 1}, {"close", 2},
                                         {"last_price", 2}, {"LastPrice", 2}}},
                {TickField::Bid,        {{"best_bid_price", 1}}},
                {TickField::Ask,        {{"best_offer_price", 1}}},
                {TickField::ChangePct,  {{"ltp_percent_change", 1}}},
            });
            return table;
        }

    }

}
