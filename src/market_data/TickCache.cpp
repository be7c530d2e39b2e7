#include "market_data/TickCache.hpp"
#include "common/Logger.hpp"
#include "common/Utils.hpp"
#include <mutex>

namespace optgate {

    uint64_t TickCache::update(const InstrumentKey& key, const TickFields& fields) {
        double now = utils::epoch_seconds();
        std::unique_lock<std::shared_mutex> lock(mutex_);
        TickRecord& record = records_[key];
        record.merge(fields);
        record.updated_at = now;
        return ++version_;
    }

    uint64_t TickCache::update(std::string_view wire_key, const TickFields& fields) {
        return update(InstrumentKey::from_wire(wire_key), fields);
    }

    CacheSnapshot TickCache::snapshot() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        CacheSnapshot snap;
        snap.records = records_;
        snap.version = version_;
        return snap;
    }

    uint64_t TickCache::version() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return version_;
    }

    size_t TickCache::size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return records_.size();
    }

    void TickCache::clear() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        records_.clear();
        version_ = 0;
    }

    std::vector<OptionRow> TickCache::delta() const {
        std::vector<OptionRow> rows;
        std::shared_lock<std::shared_mutex> lock(mutex_);
        collect_rows(rows);
        return rows;
    }

    std::map<std::string, double> TickCache::spot_prices() const {
        std::map<std::string, double> spots;
        std::shared_lock<std::shared_mutex> lock(mutex_);
        collect_spots(spots);
        return spots;
    }

    std::optional<double> TickCache::spot(const std::string& symbol) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = records_.find(InstrumentKey::spot(symbol));
        if (it == records_.end() || it->second.ltp <= 0.0) {
            return std::nullopt;
        }
        return it->second.ltp;
    }

    CacheFrame TickCache::frame() const {
        CacheFrame frame;
        std::shared_lock<std::shared_mutex> lock(mutex_);
        collect_rows(frame.rows);
        collect_spots(frame.spot_prices);
        frame.version = version_;
        return frame;
    }

    // Caller holds the lock.
    void TickCache::collect_rows(std::vector<OptionRow>& rows) const {
        rows.reserve(records_.size());
        for (const auto& [key, tick] : records_) {
            if (key.is_opaque()) {
                LOG_DEBUG("[Cache] skipping malformed key '%s'", key.opaque.c_str());
                continue;
            }
            if (!key.is_option()) continue;

            OptionRow row;
            row.stock_code = key.symbol;
            row.strike = key.strike;
            row.right = std::string(right_code(key.right));
            row.ltp = tick.ltp;
            row.oi = tick.oi;
            row.volume = tick.volume;
            row.iv = tick.iv;
            row.bid = tick.bid;
            row.ask = tick.ask;
            row.change_pct = tick.change_pct;
            row.last_updated = tick.updated_at;
            rows.push_back(std::move(row));
        }
    }

    // Caller holds the lock.
    void TickCache::collect_spots(std::map<std::string, double>& spots) const {
        for (const auto& [key, tick] : records_) {
            if (key.is_spot() && tick.ltp > 0.0) {
                spots[key.symbol] = tick.ltp;
            }
        }
    }

}
