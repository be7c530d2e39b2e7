#include "common/Types.hpp"
#include "common/Utils.hpp"
#include <cmath>
#include <cstdlib>
#include <vector>

namespace optgate {

    namespace {

        std::vector<std::string_view> split_colon(std::string_view wire) {
            std::vector<std::string_view> parts;
            size_t start = 0;
            while (true) {
                size_t end = wire.find(':', start);
                if (end == std::string_view::npos) {
                    parts.push_back(wire.substr(start));
                    break;
                }
                parts.push_back(wire.substr(start, end - start));
                start = end + 1;
            }
            return parts;
        }

    }

    std::optional<int64_t> parse_strike(std::string_view text) {
        if (text.empty()) return std::nullopt;
        std::string buf(text);
        char* end = nullptr;
        double value = std::strtod(buf.c_str(), &end);
        if (end == buf.c_str() || *end != '\0' || value < 0) {
            return std::nullopt;
        }
        return utils::to_int64(value);
    }

    InstrumentKey InstrumentKey::option(std::string symbol, int64_t strike, Right right, std::string expiry) {
        InstrumentKey key;
        key.symbol = std::move(symbol);
        key.strike = strike;
        key.right = right;
        key.expiry = std::move(expiry);
        return key;
    }

    InstrumentKey InstrumentKey::spot(std::string symbol) {
        InstrumentKey key;
        key.symbol = std::move(symbol);
        key.right = Right::Spot;
        return key;
    }

    std::optional<InstrumentKey> InstrumentKey::parse(std::string_view wire) {
        auto parts = split_colon(wire);
        if (parts.empty() || parts[0].empty()) return std::nullopt;

        if (parts.size() == 2) {
            if (utils::to_upper(parts[1]) != "SPOT") return std::nullopt;
            return spot(std::string(parts[0]));
        }
        if (parts.size() != 3 && parts.size() != 4) return std::nullopt;

        std::string right_text = utils::to_upper(parts[2]);
        Right right;
        if (right_text == "CE" || right_text == "CALL") {
            right = Right::Call;
        } else if (right_text == "PE" || right_text == "PUT") {
            right = Right::Put;
        } else {
            return std::nullopt;
        }

        auto strike = parse_strike(parts[1]);
        if (!strike) return std::nullopt;

        std::string expiry = parts.size() == 4 ? std::string(parts[3]) : std::string();
        return option(std::string(parts[0]), *strike, right, std::move(expiry));
    }

    InstrumentKey InstrumentKey::from_wire(std::string_view wire) {
        auto parsed = parse(wire);
        if (parsed) return *parsed;
        InstrumentKey key;
        key.opaque = std::string(wire);
        if (key.opaque.empty()) key.opaque = ":";
        return key;
    }

    std::string InstrumentKey::to_wire() const {
        if (is_opaque()) return opaque;
        if (right == Right::Spot) return symbol + ":SPOT";
        std::string wire = symbol + ":" + std::to_string(strike) + ":" + std::string(right_code(right));
        if (!expiry.empty()) wire += ":" + expiry;
        return wire;
    }

    void TickRecord::merge(const TickFields& fields) {
        if (fields.ltp) ltp = *fields.ltp;
        if (fields.oi) oi = *fields.oi;
        if (fields.volume) volume = *fields.volume;
        if (fields.iv) iv = *fields.iv;
        if (fields.bid) bid = *fields.bid;
        if (fields.ask) ask = *fields.ask;
        if (fields.change_pct) change_pct = *fields.change_pct;
        if (fields.feed_time) feed_time = *fields.feed_time;
        if (fields.source) source = *fields.source;
    }

    std::string_view right_code(Right right) {
        switch (right) {
            case Right::Call: return "CE";
            case Right::Put: return "PE";
            case Right::Spot: return "SPOT";
        }
        return "";
    }

    std::string_view right_name(Right right) {
        switch (right) {
            case Right::Call: return "Call";
            case Right::Put: return "Put";
            case Right::Spot: return "";
        }
        return "";
    }

    Right parse_right(std::string_view text) {
        return utils::starts_with_ci(text, 'c') ? Right::Call : Right::Put;
    }

    std::string_view action_name(Action action) {
        return action == Action::Sell ? "sell" : "buy";
    }

    Action parse_action(std::string_view text) {
        return utils::starts_with_ci(text, 's') ? Action::Sell : Action::Buy;
    }

}
