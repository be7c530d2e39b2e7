#pragma once

#include "common/Types.hpp"
#include "market_data/ExpiryCalendar.hpp"
#include "market_data/TickCache.hpp"
#include <map>
#include <string>
#include <vector>

namespace optgate {

    // JSON renderings of what the gateway publishes to observers.
    namespace frames {

        std::string rows_json(const std::vector<OptionRow>& rows);
        std::string spots_json(const std::map<std::string, double>& spots);

        // {"type":"tick_update","version":N,"ticks":[...],"spot_prices":{...},"ts":T,"feedLive":B}
        std::string tick_update(const CacheFrame& frame, bool feed_live, double ts);

        // {"type":"heartbeat","ts":T,"feedLive":B}
        std::string heartbeat(bool feed_live, double ts);

        // {"changed":false,"version":N}
        std::string pull_unchanged(uint64_t version);

        // {"changed":true,"version":N,"ticks":[...],"spot_prices":{...},"feedLive":B}
        std::string pull_changed(const CacheFrame& frame, bool feed_live);

        // {"calls_last_minute":..,"max_per_minute":..,"min_interval_ms":..,"queue_depth":..}
        std::string rate_status(const PacingStatus& status);

        std::string expiries_json(const std::vector<ExpiryDate>& expiries);

        std::string leg_result_json(const LegResult& result);
        std::string leg_results_json(const std::vector<LegResult>& results);

    }

}
