#pragma once

#include "common/Utils.hpp"
#include "market_data/TickCache.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace optgate {

    // Where relay frames come from: whatever session is current.
    class RelaySource {
    public:
        virtual ~RelaySource() = default;

        virtual uint64_t version() const = 0;
        virtual CacheFrame frame() const = 0;
        virtual bool feed_live() const = 0;
    };

    // One observer's transport. send() throws on transport failure or close.
    class FrameSink {
    public:
        virtual ~FrameSink() = default;

        virtual void send(const std::string& frame) = 0;
    };

    struct RelayOptions {
        std::chrono::milliseconds poll_interval{constants::RELAY_POLL_INTERVAL_MS};
        uint64_t heartbeat_every = constants::RELAY_HEARTBEAT_EVERY;
    };

    /**
     * @class RelayLoop
     * @brief Change-driven push loop for one observer.
     *
     * Every poll interval it compares the source version with the last one sent.
     * A change sends a full tick_update frame; otherwise every heartbeat_every-th
     * iteration sends a heartbeat. The first iteration always sends a tick_update.
     * The loop ends (DISCONNECTED) when the sink throws or stop() is called.
     */
    class RelayLoop {
    public:
        enum class State : uint8_t {
            Connected,
            Disconnected
        };

        RelayLoop(const RelaySource& source, FrameSink& sink, RelayOptions options = {});

        // Blocks on the calling thread until disconnected.
        void run();

        // Ends run() at its next wake-up. Safe from any thread.
        void stop();

        State state() const { return state_.load(); }
        uint64_t updates_sent() const { return updates_sent_.load(); }
        uint64_t heartbeats_sent() const { return heartbeats_sent_.load(); }

    private:
        bool wait_interval();

        const RelaySource& source_;
        FrameSink& sink_;
        RelayOptions options_;

        std::atomic<State> state_{State::Connected};
        std::atomic<uint64_t> updates_sent_{0};
        std::atomic<uint64_t> heartbeats_sent_{0};

        std::mutex mutex_;
        std::condition_variable cv_;
        bool stopping_ = false;
    };

    // Function: pull
    // Description: Polling fallback. A since_version equal to the current version
    //              means nothing changed; anything else returns the full frame.
    // Outputs: The JSON response body.
    std::string pull(const RelaySource& source, uint64_t since_version);

}
