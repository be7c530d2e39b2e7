#include "session/Session.hpp"
#include "common/Errors.hpp"
#include "common/Json.hpp"
#include "common/Logger.hpp"
#include "market_data/TickNormalizer.hpp"
#include <iostream>
#include <thread>

namespace optgate {

    namespace {

        // Parses a broker body and returns its "Success" member rendered as JSON.
        // Throws BrokerCallError when the broker reported a failure.
        BrokerResponse require_ok(const std::string& body, const char* what) {
            BrokerResponse response = parse_broker_response(body);
            if (!response.ok) {
                LOG_WARN("[Session] %s failed: %s", what, response.error.c_str());
                throw BrokerCallError(response.error);
            }
            return response;
        }

        // "YYYY-MM-DD" of today, UTC.
        std::string today_utc() {
            return utils::iso8601_utc().substr(0, 10);
        }

    }

    void ingest_ticks(TickCache& cache, std::string_view payload) {
        TickBatch batch;
        try {
            batch = TickNormalizer::normalize_feed(payload);
        } catch (const MalformedTick& e) {
            LOG_WARN("[Feed] %s", e.what());
            return;
        }

        for (const auto& tick : batch.ticks) {
            cache.update(tick.key, tick.fields);
            if (tick.underlying) {
                TickFields spot;
                spot.ltp = *tick.underlying;
                spot.source = "ws_tick";
                cache.update(InstrumentKey::spot(tick.key.symbol), spot);
            }
        }
        if (batch.dropped > 0) {
            LOG_DEBUG("[Feed] batch: %zu applied, %zu dropped", batch.ticks.size(), batch.dropped);
        }
    }

    Session::Session(std::shared_ptr<BrokerClient> broker, SessionOptions options)
        : broker_(std::move(broker)),
          options_(options),
          queue_(std::make_shared<PacingQueue>(options_.pacing)),
          cache_(std::make_shared<TickCache>()),
          orchestrator_(order_submitter(), options_.leg_join_timeout) {
        if (!broker_) {
            throw GatewayError("session needs a broker client");
        }
    }

    Session::~Session() {
        stop_feed();
        queue_->stop();
    }

    OrderOrchestrator::Submitter Session::order_submitter() const {
        // Leg units may outlive a timed-out join; they hold the lane and the broker.
        auto queue = queue_;
        auto broker = broker_;
        return [queue, broker](const OrderLeg& leg) {
            return queue->enqueue([broker, leg]() { return broker->place_order(leg); },
                                  PacingQueue::Kind::OrderMutating);
        };
    }

    ConnectInfo Session::establish(const BrokerCredentials& credentials) {
        LOG_INFO("[Session] connecting, key %.8s...", credentials.api_key.c_str());
        std::string body = paced([this, credentials]() { return broker_->generate_session(credentials); });
        BrokerResponse response = require_ok(body, "generate_session");

        ConnectInfo info;
        simdjson::dom::parser parser;
        simdjson::dom::element doc;
        simdjson::dom::object details;
        if (json::parse(parser, response.success, doc) == simdjson::SUCCESS &&
            doc.get(details) == simdjson::SUCCESS) {
            info.session_token = json::string_field(details, "session_token").value_or("");
        }

        try {
            std::string customer = paced([this]() { return broker_->get_customer_details(); });
            BrokerResponse account = parse_broker_response(customer);
            if (account.ok && json::parse(parser, account.success, doc) == simdjson::SUCCESS &&
                doc.get(details) == simdjson::SUCCESS) {
                info.name = json::string_field(details, "name").value_or("");
                info.email = json::string_field(details, "email").value_or("");
            }
        } catch (const GatewayError& e) {
            LOG_WARN("[Session] customer details unavailable: %s", e.what());
        }

        LOG_INFO("[Session] connected");
        return info;
    }

    std::string Session::fetch_option_chain(const std::string& symbol, const std::string& exchange,
                                            const std::string& expiry, Right right,
                                            const std::string& strike) {
        InstrumentQuery query;
        query.stock_code = symbol;
        query.exchange_code = exchange;
        query.expiry_date = expiry;
        query.right = std::string(right_name(right));
        query.strike_price = strike;

        LOG_INFO("[Chain] %s %s %s", symbol.c_str(), expiry.c_str(), query.right.c_str());
        std::string body = paced([this, query]() { return broker_->get_option_chain_quotes(query); });
        BrokerResponse response = require_ok(body, "get_option_chain_quotes");
        std::string rows_text = success_rows(response);

        simdjson::dom::parser parser;
        simdjson::dom::element doc;
        simdjson::dom::array rows;
        if (json::parse(parser, rows_text, doc) == simdjson::SUCCESS && doc.get(rows) == simdjson::SUCCESS) {
            TickBatch batch = TickNormalizer::normalize_chain(rows, utils::to_upper(symbol), right);
            for (const auto& tick : batch.ticks) {
                cache_->update(tick.key, tick.fields);
            }
            LOG_INFO("[Chain] seeded %zu rows (%zu skipped)", batch.ticks.size(), batch.dropped);
        }
        return rows_text;
    }

    std::string Session::get_quote(const InstrumentQuery& query) {
        return paced([this, query]() { return broker_->get_quotes(query); });
    }

    std::optional<SpotQuote> Session::spot_price(const std::string& symbol, const std::string& exchange) {
        std::string upper = utils::to_upper(symbol);
        auto cached = cache_->spot(upper);
        if (cached && *cached > constants::SPOT_SANITY_THRESHOLD) {
            return SpotQuote{*cached, "ws_tick"};
        }

        InstrumentQuery query;
        query.stock_code = symbol;
        query.exchange_code = exchange;
        query.product_type = "cash";
        std::string body = paced([this, query]() { return broker_->get_quotes(query); });
        BrokerResponse response = require_ok(body, "get_quotes");

        simdjson::dom::parser parser;
        simdjson::dom::element doc;
        simdjson::dom::array rows;
        std::string rows_text = success_rows(response);
        if (json::parse(parser, rows_text, doc) != simdjson::SUCCESS || doc.get(rows) != simdjson::SUCCESS) {
            return std::nullopt;
        }
        for (auto entry : rows) {
            simdjson::dom::object row;
            if (entry.get(row) != simdjson::SUCCESS) continue;
            auto price = TickNormalizer::quote_price(row);
            if (price && *price > constants::SPOT_SANITY_THRESHOLD) {
                TickFields fields;
                fields.ltp = *price;
                fields.source = "rest";
                cache_->update(InstrumentKey::spot(upper), fields);
                return SpotQuote{*price, "rest_quote"};
            }
        }
        LOG_WARN("[Spot] no plausible price for %s/%s", symbol.c_str(), exchange.c_str());
        return std::nullopt;
    }

    LegResult Session::place_order(const OrderLeg& leg) {
        return orchestrator_.orchestrate({leg}).front();
    }

    std::vector<LegResult> Session::place_strategy(const std::vector<OrderLeg>& legs) {
        return orchestrator_.orchestrate(legs);
    }

    LegResult Session::square_off(const OrderLeg& leg) {
        return place_order(OrderOrchestrator::square_off_leg(leg));
    }

    BrokerResponse Session::cancel_order(const std::string& order_id, const std::string& exchange) {
        std::string body = paced([this, order_id, exchange]() { return broker_->cancel_order(order_id, exchange); },
                                 PacingQueue::Kind::OrderMutating);
        return parse_broker_response(body);
    }

    BrokerResponse Session::modify_order(const ModifyRequest& request) {
        std::string body = paced([this, request]() { return broker_->modify_order(request); },
                                 PacingQueue::Kind::OrderMutating);
        return parse_broker_response(body);
    }

    std::string Session::order_book() {
        std::string day = today_utc();
        std::string body = paced([this, day]() {
            return broker_->get_order_list("NFO", day + "T00:00:00.000Z", day + "T23:59:59.000Z");
        });
        return success_rows(require_ok(body, "get_order_list"));
    }

    std::string Session::trade_book() {
        std::string day = today_utc();
        std::string body = paced([this, day]() {
            return broker_->get_trade_list("NFO", day + "T00:00:00.000Z", day + "T23:59:59.000Z");
        });
        return success_rows(require_ok(body, "get_trade_list"));
    }

    PortfolioView Session::positions() {
        PortfolioView view;
        std::string pos = paced([this]() { return broker_->get_portfolio_positions(); });
        view.positions = success_rows(require_ok(pos, "get_portfolio_positions"));
        std::string hld = paced([this]() { return broker_->get_portfolio_holdings(); });
        view.holdings = success_rows(require_ok(hld, "get_portfolio_holdings"));
        return view;
    }

    std::string Session::funds() {
        std::string body = paced([this]() { return broker_->get_funds(); });
        BrokerResponse response = require_ok(body, "get_funds");
        return response.success == "null" ? "{}" : response.success;
    }

    std::string Session::historical(const HistoricalQuery& query) {
        std::string body = paced([this, query]() { return broker_->get_historical(query); });
        return success_rows(require_ok(body, "get_historical"));
    }

    void Session::start_feed() {
        std::lock_guard<std::mutex> lock(feed_mutex_);
        if (feed_live_) {
            LOG_INFO("[Feed] already running");
            return;
        }
        // The cache, not the session, is what the listener thread touches.
        std::weak_ptr<TickCache> cache = cache_;
        broker_->set_on_ticks([cache](std::string_view payload) {
            if (auto target = cache.lock()) {
                ingest_ticks(*target, payload);
            }
        });
        broker_->ws_connect();
        feed_live_ = true;
        std::cout << "[Feed] Push channel live." << std::endl;
        LOG_INFO("[Feed] push channel live");
    }

    void Session::stop_feed() {
        std::lock_guard<std::mutex> lock(feed_mutex_);
        if (feed_live_) {
            try {
                broker_->ws_disconnect();
            } catch (const std::exception& e) {
                LOG_WARN("[Feed] disconnect failed: %s", e.what());
            }
        }
        broker_->set_on_ticks(nullptr);
        feed_live_ = false;

        std::lock_guard<std::mutex> subs_lock(subs_mutex_);
        subscriptions_.clear();
    }

    SubscribeResult Session::subscribe_option_chain(const std::string& symbol, const std::string& exchange,
                                                    const std::string& expiry,
                                                    const std::vector<int64_t>& strikes,
                                                    const std::vector<Right>& rights) {
        if (!feed_live_) {
            start_feed();
        }

        SubscribeResult result;
        for (int64_t strike : strikes) {
            for (Right right : rights) {
                FeedSubscription sub{symbol, strike, right, expiry};
                std::string label = InstrumentKey::option(symbol, strike, right, expiry).to_wire();
                // Reserved before the broker call so a concurrent request skips it.
                {
                    std::lock_guard<std::mutex> lock(subs_mutex_);
                    if (!subscriptions_.emplace(sub, exchange).second) continue;
                }

                FeedRequest request;
                request.stock_code = symbol;
                request.exchange_code = exchange;
                request.expiry_date = expiry;
                request.strike_price = std::to_string(strike);
                request.right = std::string(right_name(right));
                try {
                    broker_->subscribe_feeds(request);
                    ++result.subscribed;
                    std::this_thread::sleep_for(options_.subscribe_spacing);
                } catch (const std::exception& e) {
                    {
                        std::lock_guard<std::mutex> lock(subs_mutex_);
                        subscriptions_.erase(sub);
                    }
                    result.errors.push_back(label + ": " + e.what());
                }
            }
        }

        result.total_subs = subscription_count();
        LOG_INFO("[Feed] subscribed %zu new, %zu total, %zu errors",
                 result.subscribed, result.total_subs, result.errors.size());
        return result;
    }

    void Session::unsubscribe_all() {
        std::map<FeedSubscription, std::string> active;
        {
            std::lock_guard<std::mutex> lock(subs_mutex_);
            active.swap(subscriptions_);
        }
        if (!feed_live_) return;

        for (const auto& [sub, exchange] : active) {
            FeedRequest request;
            request.stock_code = sub.symbol;
            request.exchange_code = exchange;
            request.expiry_date = sub.expiry;
            request.strike_price = std::to_string(sub.strike);
            request.right = std::string(right_name(sub.right));
            try {
                broker_->unsubscribe_feeds(request);
            } catch (const std::exception& e) {
                LOG_WARN("[Feed] unsubscribe %s:%lld failed: %s", sub.symbol.c_str(),
                         static_cast<long long>(sub.strike), e.what());
            }
        }
        LOG_INFO("[Feed] all feeds unsubscribed (%zu)", active.size());
    }

    size_t Session::subscription_count() const {
        std::lock_guard<std::mutex> lock(subs_mutex_);
        return subscriptions_.size();
    }

    void Session::on_ticks(std::string_view payload) {
        ingest_ticks(*cache_, payload);
    }

}
