#include "relay/Frames.hpp"
#include "common/Utils.hpp"
#include <sstream>

namespace optgate::frames {

    using utils::json_number;
    using utils::json_string;

    std::string rows_json(const std::vector<OptionRow>& rows) {
        std::ostringstream o;
        o << "[";
        for (size_t i = 0; i < rows.size(); i++) {
            const auto& r = rows[i];
            o << "{";
            o << "\"stock_code\":" << json_string(r.stock_code) << ",";
            o << "\"strike\":" << r.strike << ",";
            o << "\"right\":" << json_string(r.right) << ",";
            o << "\"ltp\":" << json_number(r.ltp) << ",";
            o << "\"oi\":" << json_number(r.oi) << ",";
            o << "\"volume\":" << json_number(r.volume) << ",";
            o << "\"iv\":" << json_number(r.iv) << ",";
            o << "\"bid\":" << json_number(r.bid) << ",";
            o << "\"ask\":" << json_number(r.ask) << ",";
            o << "\"change_pct\":" << json_number(r.change_pct) << ",";
            o << "\"last_updated\":" << json_number(r.last_updated);
            o << "}";
            if (i + 1 < rows.size()) o << ",";
        }
        o << "]";
        return o.str();
    }

    std::string spots_json(const std::map<std::string, double>& spots) {
        std::ostringstream o;
        o << "{";
        bool first = true;
        for (const auto& [symbol, ltp] : spots) {
            if (!first) o << ",";
            first = false;
            o << json_string(symbol) << ":" << json_number(ltp);
        }
        o << "}";
        return o.str();
    }

    std::string tick_update(const CacheFrame& frame, bool feed_live, double ts) {
        std::ostringstream o;
        o << "{\"type\":\"tick_update\",";
        o << "\"version\":" << frame.version << ",";
        o << "\"ticks\":" << rows_json(frame.rows) << ",";
        o << "\"spot_prices\":" << spots_json(frame.spot_prices) << ",";
        o << "\"ts\":" << json_number(ts) << ",";
        o << "\"feedLive\":" << (feed_live ? "true" : "false");
        o << "}";
        return o.str();
    }

    std::string heartbeat(bool feed_live, double ts) {
        std::ostringstream o;
        o << "{\"type\":\"heartbeat\",";
        o << "\"ts\":" << json_number(ts) << ",";
        o << "\"feedLive\":" << (feed_live ? "true" : "false");
        o << "}";
        return o.str();
    }

    std::string pull_unchanged(uint64_t version) {
        return "{\"changed\":false,\"version\":" + std::to_string(version) + "}";
    }

    std::string pull_changed(const CacheFrame& frame, bool feed_live) {
        std::ostringstream o;
        o << "{\"changed\":true,";
        o << "\"version\":" << frame.version << ",";
        o << "\"ticks\":" << rows_json(frame.rows) << ",";
        o << "\"spot_prices\":" << spots_json(frame.spot_prices) << ",";
        o << "\"feedLive\":" << (feed_live ? "true" : "false");
        o << "}";
        return o.str();
    }

    std::string rate_status(const PacingStatus& status) {
        std::ostringstream o;
        o << "{\"calls_last_minute\":" << status.calls_last_minute << ",";
        o << "\"max_per_minute\":" << status.max_per_minute << ",";
        o << "\"min_interval_ms\":" << status.min_interval_ms << ",";
        o << "\"queue_depth\":" << status.queue_depth << "}";
        return o.str();
    }

    std::string expiries_json(const std::vector<ExpiryDate>& expiries) {
        std::ostringstream o;
        o << "[";
        for (size_t i = 0; i < expiries.size(); i++) {
            const auto& e = expiries[i];
            o << "{";
            o << "\"date\":" << json_string(e.date) << ",";
            o << "\"label\":" << json_string(e.label) << ",";
            o << "\"days_away\":" << e.days_away << ",";
            o << "\"weekday\":" << json_string(e.weekday) << ",";
            o << "\"timestamp\":" << json_string(e.iso);
            o << "}";
            if (i + 1 < expiries.size()) o << ",";
        }
        o << "]";
        return o.str();
    }

    std::string leg_result_json(const LegResult& result) {
        std::ostringstream o;
        o << "{\"leg_index\":" << result.leg_index << ",";
        o << "\"success\":" << (result.success ? "true" : "false") << ",";
        o << "\"order_id\":" << json_string(result.order_id) << ",";
        o << "\"error\":" << json_string(result.error) << "}";
        return o.str();
    }

    std::string leg_results_json(const std::vector<LegResult>& results) {
        std::string out = "[";
        for (size_t i = 0; i < results.size(); i++) {
            if (i > 0) out += ",";
            out += leg_result_json(results[i]);
        }
        out += "]";
        return out;
    }

}
