#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace optgate {

    // Option right. Spot is the reserved pseudo-right for an underlying index price.
    enum class Right : uint8_t {
        Call,
        Put,
        Spot
    };

    enum class Action : uint8_t {
        Buy,
        Sell
    };

    // Function: InstrumentKey
    // Description: Structured identity of one cache entry.
    //              Wire form: "SYMBOL:STRIKE:CE|PE[:EXPIRY]" or "SYMBOL:SPOT".
    //              Opaque keys hold a wire string that did not parse; they are
    //              stored so the version still advances, but never reported as rows.
    struct InstrumentKey {
        std::string symbol;
        int64_t strike = 0;
        Right right = Right::Call;
        std::string expiry;
        std::string opaque;

        static InstrumentKey option(std::string symbol, int64_t strike, Right right, std::string expiry = "");
        static InstrumentKey spot(std::string symbol);

        // Returns std::nullopt for malformed keys.
        static std::optional<InstrumentKey> parse(std::string_view wire);
        // Never fails: a malformed key becomes an opaque key.
        static InstrumentKey from_wire(std::string_view wire);

        bool is_spot() const { return opaque.empty() && right == Right::Spot; }
        bool is_option() const { return opaque.empty() && right != Right::Spot; }
        bool is_opaque() const { return !opaque.empty(); }

        std::string to_wire() const;

        bool operator<(const InstrumentKey& other) const {
            return std::tie(opaque, symbol, strike, right, expiry) <
                   std::tie(other.opaque, other.symbol, other.strike, other.right, other.expiry);
        }
        bool operator==(const InstrumentKey& other) const {
            return std::tie(opaque, symbol, strike, right, expiry) ==
                   std::tie(other.opaque, other.symbol, other.strike, other.right, other.expiry);
        }
    };

    // Function: TickFields
    // Description: A partial market-data update. Only engaged fields overwrite
    //              the cached record.
    struct TickFields {
        std::optional<double> ltp;
        std::optional<double> oi;
        std::optional<double> volume;
        std::optional<double> iv;
        std::optional<double> bid;
        std::optional<double> ask;
        std::optional<double> change_pct;
        std::optional<std::string> feed_time;
        std::optional<std::string> source;
    };

    // Function: TickRecord
    // Description: Last known state of one instrument.
    struct TickRecord {
        double ltp = 0.0;
        double oi = 0.0;
        double volume = 0.0;
        double iv = 0.0;
        double bid = 0.0;
        double ask = 0.0;
        double change_pct = 0.0;
        std::string feed_time;
        std::string source;
        double updated_at = 0.0; // epoch seconds, local clock

        void merge(const TickFields& fields);
    };

    // One flattened option-chain row as published to observers.
    struct OptionRow {
        std::string stock_code;
        int64_t strike = 0;
        std::string right; // "CE" / "PE"
        double ltp = 0.0;
        double oi = 0.0;
        double volume = 0.0;
        double iv = 0.0;
        double bid = 0.0;
        double ask = 0.0;
        double change_pct = 0.0;
        double last_updated = 0.0;
    };

    // Function: OrderLeg
    // Description: One single-instrument order of a strategy. Required fields are
    //              optional/empty here so an incomplete leg can be represented and
    //              rejected on its own.
    struct OrderLeg {
        std::string stock_code;
        std::string exchange_code = "NFO";
        std::string product = "options";
        Action action = Action::Buy;
        std::string order_type = "market";
        std::optional<int64_t> quantity;
        double price = 0.0;
        double stoploss = 0.0;
        std::string expiry_date;
        std::optional<double> strike_price;
        Right right = Right::Call;
        std::string user_remark = "optgate";
    };

    struct LegResult {
        size_t leg_index = 0;
        bool success = false;
        std::string order_id;
        std::string error;
    };

    // Subscription tuple active on the push feed.
    struct FeedSubscription {
        std::string symbol;
        int64_t strike = 0;
        Right right = Right::Call;
        std::string expiry;

        bool operator<(const FeedSubscription& other) const {
            return std::tie(symbol, strike, right, expiry) <
                   std::tie(other.symbol, other.strike, other.right, other.expiry);
        }
    };

    // Rate-status query result.
    struct PacingStatus {
        size_t calls_last_minute = 0;
        size_t max_per_minute = 0;
        int64_t min_interval_ms = 0;
        size_t queue_depth = 0;
    };

    // Strikes may arrive as "21500", "21500.0" or "21500.00"; truncated through double.
    std::optional<int64_t> parse_strike(std::string_view text);

    // "CE"/"PE"/"SPOT"
    std::string_view right_code(Right right);
    // "Call"/"Put" as the broker API spells it.
    std::string_view right_name(Right right);
    // Accepts "Call", "call", "CE", "c", "Put", "PE", ... Anything not starting with
    // 'c'/'C' is a put, as the broker treats it.
    Right parse_right(std::string_view text);

    std::string_view action_name(Action action);
    Action parse_action(std::string_view text);

}
