#include "session/GatewayService.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"

namespace optgate {

    GatewayService::GatewayService(BrokerFactory factory, SessionOptions options)
        : factory_(std::move(factory)), options_(options) {}

    GatewayService::~GatewayService() {
        disconnect();
    }

    ConnectInfo GatewayService::connect(const BrokerCredentials& credentials) {
        disconnect();

        auto session = std::make_shared<Session>(factory_(), options_);
        ConnectInfo info = session->establish(credentials);

        std::lock_guard<std::mutex> lock(mutex_);
        session_ = std::move(session);
        return info;
    }

    void GatewayService::disconnect() {
        std::shared_ptr<Session> old;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            old.swap(session_);
        }
        if (old) {
            old->stop_feed();
            LOG_INFO("[Gateway] session closed");
        }
    }

    bool GatewayService::connected() const {
        return current() != nullptr;
    }

    std::shared_ptr<Session> GatewayService::session() const {
        auto session = current();
        if (!session) {
            throw NotConnected();
        }
        return session;
    }

    std::shared_ptr<Session> GatewayService::current() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_;
    }

    uint64_t GatewayService::version() const {
        auto session = current();
        return session ? session->cache().version() : 0;
    }

    CacheFrame GatewayService::frame() const {
        auto session = current();
        return session ? session->cache().frame() : CacheFrame{};
    }

    bool GatewayService::feed_live() const {
        auto session = current();
        return session && session->feed_live();
    }

    PacingStatus GatewayService::rate_status() const {
        if (auto session = current()) {
            return session->rate_status();
        }
        PacingStatus idle;
        idle.max_per_minute = options_.pacing.max_per_minute;
        idle.min_interval_ms = options_.pacing.min_interval.count();
        return idle;
    }

}
