#pragma once

#include "broker/BrokerClient.hpp"
#include "broker/BrokerResponse.hpp"
#include "common/Types.hpp"
#include "common/Utils.hpp"
#include "execution/OrderOrchestrator.hpp"
#include "execution/PacingQueue.hpp"
#include "market_data/TickCache.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace optgate {

    struct SessionOptions {
        PacingQueue::Options pacing;
        std::chrono::milliseconds leg_join_timeout{constants::LEG_JOIN_TIMEOUT_MS};
        std::chrono::milliseconds subscribe_spacing{constants::SUBSCRIBE_SPACING_MS};
    };

    struct ConnectInfo {
        std::string session_token;
        std::string name;
        std::string email;
    };

    struct SubscribeResult {
        size_t subscribed = 0;
        size_t total_subs = 0;
        std::vector<std::string> errors;
    };

    struct SpotQuote {
        double spot = 0.0;
        std::string source; // "ws_tick" or "rest_quote"
    };

    // Both documents are JSON arrays.
    struct PortfolioView {
        std::string positions = "[]";
        std::string holdings = "[]";
    };

    /**
     * @class Session
     * @brief Everything that lives for one authenticated broker session: the pacing
     *        lane, the tick cache, the feed subscription set and the broker handle.
     *
     * Every REST-backed operation runs on the PacingQueue lane. Snapshot-type calls
     * seed the TickCache through the same update() the push feed uses.
     * Destroying the session stops the feed and fails any still-queued calls.
     */
    class Session {
    public:
        explicit Session(std::shared_ptr<BrokerClient> broker, SessionOptions options = {});
        ~Session();

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        // Function: establish
        // Description: Opens the broker session (through the pacing lane) and reads
        //              the account holder's details, best effort.
        // Outputs: Session details. Throws BrokerCallError when the broker refuses.
        ConnectInfo establish(const BrokerCredentials& credentials);

        // Function: fetch_option_chain
        // Description: One chain snapshot for one right. Each row also seeds the cache.
        // Outputs: The broker's rows as a JSON array.
        std::string fetch_option_chain(const std::string& symbol, const std::string& exchange,
                                       const std::string& expiry, Right right,
                                       const std::string& strike = "");

        // Raw broker response.
        std::string get_quote(const InstrumentQuery& query);

        // Function: spot_price
        // Description: Index spot. Cached value first (fed from option ticks), else a
        //              paced quote call whose price is cached with source "rest".
        // Outputs: nullopt when neither source yields a plausible index value.
        std::optional<SpotQuote> spot_price(const std::string& symbol, const std::string& exchange);

        LegResult place_order(const OrderLeg& leg);
        std::vector<LegResult> place_strategy(const std::vector<OrderLeg>& legs);
        LegResult square_off(const OrderLeg& leg);

        BrokerResponse cancel_order(const std::string& order_id, const std::string& exchange);
        BrokerResponse modify_order(const ModifyRequest& request);

        // Today's orders / trades as JSON arrays.
        std::string order_book();
        std::string trade_book();

        // Two paced calls.
        PortfolioView positions();

        // The funds object as JSON ("{}" when absent).
        std::string funds();

        // OHLCV rows as a JSON array.
        std::string historical(const HistoricalQuery& query);

        // Function: start_feed
        // Description: Opens the push channel and routes its ticks into the cache.
        //              No-op when already live.
        void start_feed();
        void stop_feed();
        bool feed_live() const { return feed_live_.load(); }

        // Function: subscribe_option_chain
        // Description: Subscribes every (strike, right) pair not already subscribed,
        //              spacing the messages by subscribe_spacing. Starts the feed if
        //              needed. Per-pair failures are collected, not thrown.
        SubscribeResult subscribe_option_chain(const std::string& symbol, const std::string& exchange,
                                               const std::string& expiry,
                                               const std::vector<int64_t>& strikes,
                                               const std::vector<Right>& rights);

        void unsubscribe_all();

        size_t subscription_count() const;

        // Feed callback body: normalize each tick, update the cache, capture the spot.
        void on_ticks(std::string_view payload);

        PacingStatus rate_status() const { return queue_->status(); }

        TickCache& cache() { return *cache_; }
        const TickCache& cache() const { return *cache_; }

    private:
        template<typename F>
        auto paced(F&& work, PacingQueue::Kind kind = PacingQueue::Kind::Read) {
            return queue_->enqueue(std::forward<F>(work), kind);
        }

        OrderOrchestrator::Submitter order_submitter() const;

        std::shared_ptr<BrokerClient> broker_;
        SessionOptions options_;
        std::shared_ptr<PacingQueue> queue_;
        std::shared_ptr<TickCache> cache_;
        OrderOrchestrator orchestrator_;

        std::mutex feed_mutex_;
        std::atomic<bool> feed_live_{false};

        // Active subscriptions and the exchange each was placed on.
        mutable std::mutex subs_mutex_;
        std::map<FeedSubscription, std::string> subscriptions_;
    };

    // Applies one push payload to a cache. Malformed ticks are dropped and logged.
    void ingest_ticks(TickCache& cache, std::string_view payload);

}
