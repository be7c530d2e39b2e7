#include "relay/RelayLoop.hpp"
#include "common/Logger.hpp"
#include "relay/Frames.hpp"

namespace optgate {

    RelayLoop::RelayLoop(const RelaySource& source, FrameSink& sink, RelayOptions options)
        : source_(source), sink_(sink), options_(options) {
        if (options_.heartbeat_every == 0) options_.heartbeat_every = 1;
    }

    void RelayLoop::stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
    }

    // Sleeps one poll interval. Returns false when stopped.
    bool RelayLoop::wait_interval() {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, options_.poll_interval, [this] { return stopping_; });
    }

    void RelayLoop::run() {
        state_ = State::Connected;
        std::optional<uint64_t> last_version;
        uint64_t counter = 0;

        try {
            while (wait_interval()) {
                uint64_t current = source_.version();
                ++counter;

                if (last_version && current == *last_version) {
                    if (counter % options_.heartbeat_every == 0) {
                        sink_.send(frames::heartbeat(source_.feed_live(), utils::epoch_seconds()));
                        ++heartbeats_sent_;
                    }
                    continue;
                }

                CacheFrame frame = source_.frame();
                last_version = frame.version;
                sink_.send(frames::tick_update(frame, source_.feed_live(), utils::epoch_seconds()));
                ++updates_sent_;
            }
        } catch (const std::exception& e) {
            LOG_INFO("[Relay] observer gone: %s", e.what());
        }

        state_ = State::Disconnected;
        LOG_INFO("[Relay] loop ended after %llu updates, %llu heartbeats",
                 static_cast<unsigned long long>(updates_sent_.load()),
                 static_cast<unsigned long long>(heartbeats_sent_.load()));
    }

    std::string pull(const RelaySource& source, uint64_t since_version) {
        uint64_t current = source.version();
        if (current == since_version) {
            return frames::pull_unchanged(current);
        }
        return frames::pull_changed(source.frame(), source.feed_live());
    }

}
