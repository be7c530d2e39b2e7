#pragma once

#include "broker/BrokerClient.hpp"
#include "relay/RelayLoop.hpp"
#include "session/Session.hpp"
#include <functional>
#include <memory>
#include <mutex>

namespace optgate {

    /**
     * @class GatewayService
     * @brief Owns the current Session, if any.
     *
     * connect() replaces any previous session with a fresh one (empty cache, no
     * subscriptions); disconnect() destroys it. Request handlers hold the session
     * through a shared_ptr, so a disconnect never pulls it from under a call in flight.
     * As a RelaySource it reports the current session's cache, or version 0 and an
     * empty frame when there is none.
     */
    class GatewayService : public RelaySource {
    public:
        using BrokerFactory = std::function<std::shared_ptr<BrokerClient>()>;

        explicit GatewayService(BrokerFactory factory, SessionOptions options = {});
        ~GatewayService() override;

        // Throws whatever session establishment throws; no session is kept then.
        ConnectInfo connect(const BrokerCredentials& credentials);

        void disconnect();

        bool connected() const;

        // Throws NotConnected when there is no session.
        std::shared_ptr<Session> session() const;

        // nullptr when there is no session.
        std::shared_ptr<Session> current() const;

        uint64_t version() const override;
        CacheFrame frame() const override;
        bool feed_live() const override;

        // Pacing status of the current session; idle figures when not connected.
        PacingStatus rate_status() const;

    private:
        BrokerFactory factory_;
        SessionOptions options_;

        mutable std::mutex mutex_;
        std::shared_ptr<Session> session_;
    };

}
