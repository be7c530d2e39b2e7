#include "market_data/TickNormalizer.hpp"
#include "common/Errors.hpp"
#include "common/Json.hpp"
#include "common/Logger.hpp"
#include "common/Utils.hpp"

namespace optgate {

    namespace {

        void read_market_fields(const FieldAliases& aliases, simdjson::dom::object object, TickFields& fields) {
            fields.ltp = aliases.number(object, TickField::Ltp);
            fields.oi = aliases.number(object, TickField::OpenInterest);
            fields.volume = aliases.number(object, TickField::Volume);
            fields.iv = aliases.number(object, TickField::ImpliedVol);
            fields.bid = aliases.number(object, TickField::Bid);
            fields.ask = aliases.number(object, TickField::Ask);
            fields.change_pct = aliases.number(object, TickField::ChangePct);
        }

    }

    NormalizedTick TickNormalizer::from_feed(simdjson::dom::object tick) {
        const auto& aliases = FieldAliases::for_shape(PayloadShape::FeedTick);

        auto symbol = aliases.text(tick, TickField::Symbol);
        if (!symbol) {
            throw MalformedTick("tick without stock_code");
        }

        std::string strike_text = aliases.text(tick, TickField::Strike).value_or("0");
        auto strike = parse_strike(strike_text);
        if (!strike) {
            throw MalformedTick("tick with unparseable strike '" + strike_text + "'");
        }

        std::string right_text = aliases.text(tick, TickField::Right).value_or("CE");

        NormalizedTick out;
        out.key = InstrumentKey::option(utils::to_upper(*symbol), *strike, parse_right(right_text));
        read_market_fields(aliases, tick, out.fields);
        out.fields.feed_time = aliases.text(tick, TickField::FeedTime);
        out.underlying = underlying_spot(tick);
        return out;
    }

    TickBatch TickNormalizer::normalize_feed(std::string_view payload) {
        // Feed callbacks arrive on the listener thread; one parser per thread.
        static thread_local simdjson::dom::parser parser;

        TickBatch batch;
        simdjson::dom::element doc;
        auto error = json::parse(parser, payload, doc);
        if (error) {
            throw MalformedTick(std::string("feed payload is not JSON: ") + simdjson::error_message(error));
        }

        auto take = [&batch](simdjson::dom::element entry) {
            simdjson::dom::object tick;
            if (entry.get(tick) != simdjson::SUCCESS) {
                LOG_WARN("[Feed] dropped non-object tick");
                ++batch.dropped;
                return;
            }
            try {
                batch.ticks.push_back(from_feed(tick));
            } catch (const MalformedTick& e) {
                LOG_WARN("[Feed] dropped tick: %s", e.what());
                ++batch.dropped;
            }
        };

        simdjson::dom::array entries;
        if (doc.get(entries) == simdjson::SUCCESS) {
            for (auto entry : entries) {
                take(entry);
            }
        } else {
            take(doc);
        }
        return batch;
    }

    NormalizedTick TickNormalizer::from_chain_row(simdjson::dom::object row, const std::string& symbol, Right right) {
        const auto& aliases = FieldAliases::for_shape(PayloadShape::ChainRow);

        auto strike_text = aliases.text(row, TickField::Strike);
        std::optional<int64_t> strike;
        if (strike_text) strike = parse_strike(*strike_text);
        if (!strike) {
            throw MalformedKey(symbol + ":" + strike_text.value_or("") + ":" + std::string(right_code(right)));
        }

        NormalizedTick out;
        out.key = InstrumentKey::option(symbol, *strike, right);
        read_market_fields(aliases, row, out.fields);
        return out;
    }

    TickBatch TickNormalizer::normalize_chain(simdjson::dom::array rows, const std::string& symbol, Right right) {
        TickBatch batch;
        for (auto entry : rows) {
            simdjson::dom::object row;
            if (entry.get(row) != simdjson::SUCCESS) {
                ++batch.dropped;
                continue;
            }
            try {
                batch.ticks.push_back(from_chain_row(row, symbol, right));
            } catch (const MalformedKey& e) {
                LOG_DEBUG("[Chain] skipped row: %s", e.what());
                ++batch.dropped;
            }
        }
        return batch;
    }

    std::optional<double> TickNormalizer::underlying_spot(simdjson::dom::object tick) {
        auto value = FieldAliases::for_shape(PayloadShape::FeedTick).positive(tick, TickField::Underlying);
        if (value && *value > constants::SPOT_SANITY_THRESHOLD) {
            return value;
        }
        return std::nullopt;
    }

    std::optional<double> TickNormalizer::quote_price(simdjson::dom::object row) {
        return FieldAliases::for_shape(PayloadShape::QuoteRow).positive(row, TickField::Ltp);
    }

}
