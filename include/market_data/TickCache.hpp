#pragma once

#include "common/Types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace optgate {

    struct CacheSnapshot {
        std::map<InstrumentKey, TickRecord> records;
        uint64_t version = 0;
    };

    // Rows, spot prices and the version they were read at, taken under one lock.
    struct CacheFrame {
        std::vector<OptionRow> rows;
        std::map<std::string, double> spot_prices;
        uint64_t version = 0;
    };

    /**
     * @class TickCache
     * @brief Versioned store of the last known state per instrument.
     *
     * Both the push-feed callback and REST snapshot seeding write through update(),
     * so the version advances exactly once per update no matter the producer.
     * The version is a change token for relay observers; clear() resets it to 0.
     */
    class TickCache {
    public:
        TickCache() = default;

        TickCache(const TickCache&) = delete;
        TickCache& operator=(const TickCache&) = delete;

        // Function: update
        // Description: Merges the engaged fields into the record (created if absent),
        //              stamps the local update time and bumps the version.
        // Outputs: The version after this update.
        uint64_t update(const InstrumentKey& key, const TickFields& fields);

        // Wire-key form ("NIFTY:21500:CE", "NIFTY:SPOT"). A key that does not parse
        // is stored as opaque: counted in the version, skipped by delta().
        uint64_t update(std::string_view wire_key, const TickFields& fields);

        CacheSnapshot snapshot() const;

        uint64_t version() const;

        size_t size() const;

        void clear();

        std::vector<OptionRow> delta() const;

        // {symbol: ltp} for spot entries with a positive price.
        std::map<std::string, double> spot_prices() const;

        std::optional<double> spot(const std::string& symbol) const;

        CacheFrame frame() const;

    private:
        void collect_rows(std::vector<OptionRow>& rows) const;
        void collect_spots(std::map<std::string, double>& spots) const;

        mutable std::shared_mutex mutex_;
        std::map<InstrumentKey, TickRecord> records_;
        uint64_t version_ = 0;
    };

}
