#include "market_data/TickNormalizer.hpp"
#include "common/Errors.hpp"
#include "common/Json.hpp"
#include <iostream>
#include <string>

static int failures = 0;

static void check(bool condition, const std::string& name) {
    if (condition) {
        std::cout << "[PASS] " << name << std::endl;
    } else {
        std::cout << "[FAIL] " << name << std::endl;
        ++failures;
    }
}

// Parses text that must be a JSON object; the object lives as long as the parser.
static simdjson::dom::object object_of(simdjson::dom::parser& parser, const std::string& text) {
    simdjson::dom::element doc;
    simdjson::dom::object object;
    if (optgate::json::parse(parser, text, doc) != simdjson::SUCCESS || doc.get(object) != simdjson::SUCCESS) {
        std::cout << "[FAIL] fixture is not a JSON object: " << text << std::endl;
        ++failures;
    }
    return object;
}

int main() {
    std::cout << "Running TickNormalizer Unit Test..." << std::endl;

    // Alternate field names map onto the same fields.
    {
        simdjson::dom::parser parser;
        auto tick = object_of(parser, R"({"symbol":"nifty","strike":"21500.00","option_type":"PE",
            "ltp":"101.5","oi":2000,"volume":10,"iv":12.5,"bid_price":101,"ask_price":102,
            "change_pct":-1.2,"index_close_price":21530.4})");
        auto n = optgate::TickNormalizer::from_feed(tick);
        check(n.key.to_wire() == "NIFTY:21500:PE", "alias names build the key");
        check(n.fields.ltp.value_or(0) == 101.5 && n.fields.oi.value_or(0) == 2000 &&
              n.fields.bid.value_or(0) == 101 && n.fields.ask.value_or(0) == 102, "alias names fill the fields");
        check(n.fields.change_pct.value_or(0) == -1.2, "negative change kept");
        check(n.underlying.value_or(0) == 21530.4, "underlying captured from the tick");
    }

    // Primary names win over alternates.
    {
        simdjson::dom::parser parser;
        auto tick = object_of(parser, R"({"stock_code":"NIFTY","symbol":"OTHER","strike_price":21600,
            "right":"Call","last_traded_price":50,"ltp":49})");
        auto n = optgate::TickNormalizer::from_feed(tick);
        check(n.key.symbol == "NIFTY" && n.key.right == optgate::Right::Call, "primary symbol and right used");
        check(n.fields.ltp.value_or(0) == 50, "primary price name preferred");
    }

    // Absent fields stay unengaged, defaults for strike and right.
    {
        simdjson::dom::parser parser;
        auto tick = object_of(parser, R"({"stock_code":"NIFTY","last_traded_price":12})");
        auto n = optgate::TickNormalizer::from_feed(tick);
        check(n.key.strike == 0 && n.key.right == optgate::Right::Call, "missing strike reads 0, missing right reads CE");
        check(!n.fields.oi && !n.fields.bid && !n.fields.iv, "absent fields not engaged");
        check(!n.underlying, "no underlying without a candidate field");
    }

    // Missing symbol is malformed.
    {
        simdjson::dom::parser parser;
        auto tick = object_of(parser, R"({"strike_price":21500,"ltp":3})");
        bool thrown = false;
        try {
            optgate::TickNormalizer::from_feed(tick);
        } catch (const optgate::MalformedTick&) {
            thrown = true;
        }
        check(thrown, "tick without symbol rejected");
    }

    // A strike no key can hold is malformed too.
    {
        simdjson::dom::parser parser;
        auto tick = object_of(parser, R"({"stock_code":"NIFTY","strike_price":"1e30","right":"Call","ltp":3})");
        bool thrown = false;
        try {
            optgate::TickNormalizer::from_feed(tick);
        } catch (const optgate::MalformedTick&) {
            thrown = true;
        }
        check(thrown, "tick with oversized strike rejected");
    }

    // Batches drop malformed entries only.
    {
        auto batch = optgate::TickNormalizer::normalize_feed(R"([
            {"stock_code":"NIFTY","strike_price":"21500","right":"Put","ltp":10},
            {"strike_price":"21600","right":"Put","ltp":11},
            {"stock_code":"NIFTY","strike_price":"21700","right":"Put","ltp":12},
            42
        ])");
        check(batch.ticks.size() == 2 && batch.dropped == 2, "two good ticks, two dropped");

        auto single = optgate::TickNormalizer::normalize_feed(R"({"stock_code":"NIFTY","strike_price":"21500","ltp":10})");
        check(single.ticks.size() == 1, "single-object payload accepted");

        bool thrown = false;
        try {
            optgate::TickNormalizer::normalize_feed("not json at all");
        } catch (const optgate::MalformedTick&) {
            thrown = true;
        }
        check(thrown, "non-JSON payload rejected");
    }

    // Spot heuristic.
    {
        simdjson::dom::parser parser;
        auto small = object_of(parser, R"({"stock_code":"NIFTY","index_close_price":950})");
        check(!optgate::TickNormalizer::underlying_spot(small), "value under the sanity threshold ignored");

        simdjson::dom::parser parser2;
        auto fallback = object_of(parser2, R"({"stock_code":"NIFTY","index_close_price":0,"close_price":"21500.5"})");
        check(optgate::TickNormalizer::underlying_spot(fallback).value_or(0) == 21500.5, "first positive candidate used");
    }

    // Chain rows.
    {
        simdjson::dom::parser parser;
        simdjson::dom::element doc;
        simdjson::dom::array rows;
        std::string text = R"([
            {"strike_price":"21500","ltp":"120.5","open_interest":"1000","best_bid_price":"120","best_offer_price":"121"},
            {"strike-price":21600,"last_traded_price":80},
            {"ltp":5}
        ])";
        bool parsed = optgate::json::parse(parser, text, doc) == simdjson::SUCCESS && doc.get(rows) == simdjson::SUCCESS;
        check(parsed, "chain fixture parses");
        if (parsed) {
            auto batch = optgate::TickNormalizer::normalize_chain(rows, "NIFTY", optgate::Right::Put);
            check(batch.ticks.size() == 2 && batch.dropped == 1, "row without strike skipped");
            if (batch.ticks.size() == 2) {
                check(batch.ticks[0].key.to_wire() == "NIFTY:21500:PE" &&
                      batch.ticks[0].fields.ltp.value_or(0) == 120.5 &&
                      batch.ticks[0].fields.ask.value_or(0) == 121, "underscore names read");
                check(batch.ticks[1].key.strike == 21600 && batch.ticks[1].fields.ltp.value_or(0) == 80,
                      "hyphenated names read");
            }
        }
    }

    // Quote rows.
    {
        simdjson::dom::parser parser;
        auto row = object_of(parser, R"({"ltp":0,"close":21450.5})");
        check(optgate::TickNormalizer::quote_price(row).value_or(0) == 21450.5, "quote price skips zero candidates");
    }

    if (failures > 0) {
        std::cout << failures << " check(s) failed." << std::endl;
        return 1;
    }
    return 0;
}
