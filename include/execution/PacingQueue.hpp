#pragma once

#include "common/Errors.hpp"
#include "common/Types.hpp"
#include "common/Utils.hpp"
#include <array>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>

namespace optgate {

    /**
     * @class PacingQueue
     * @brief Single execution lane for every outbound broker REST call.
     *
     * Callers block in enqueue() while one background thread executes the queued
     * work in FIFO order, starting each item no sooner than min_interval after the
     * previous start. The queue is bounded: when full, the oldest pending read is
     * evicted to admit the new item. Order-mutating work is never evicted; if only
     * order-mutating work is pending, the new item is refused instead.
     *
     * A caller that times out stops waiting; its work stays queued and may still
     * execute, with the result discarded.
     */
    class PacingQueue {
    public:
        enum class Kind : uint8_t {
            Read,
            OrderMutating
        };

        struct Options {
            std::chrono::milliseconds min_interval{constants::MIN_INTERVAL_MS};
            size_t capacity = constants::PACING_QUEUE_CAPACITY;
            std::chrono::milliseconds caller_timeout{constants::PACING_CALLER_TIMEOUT_MS};
            size_t max_per_minute = constants::MAX_CALLS_PER_MINUTE;
        };

        PacingQueue();
        explicit PacingQueue(Options options);
        ~PacingQueue();

        PacingQueue(const PacingQueue&) = delete;
        PacingQueue& operator=(const PacingQueue&) = delete;

        /**
         * @brief Queues work and blocks until it has executed.
         *
         * @return The work's return value.
         * @throws Whatever the work threw (to this caller only), PacingTimeout,
         *         PacingEvicted, PacingOverflow or PacingStopped.
         */
        template<typename F>
        auto enqueue(F&& work, Kind kind = Kind::Read) {
            return enqueue(std::forward<F>(work), kind, options_.caller_timeout);
        }

        template<typename F>
        auto enqueue(F&& work, Kind kind, std::chrono::milliseconds timeout) {
            using Result = std::invoke_result_t<std::decay_t<F>&>;

            auto promise = std::make_shared<std::promise<Result>>();
            std::future<Result> future = promise->get_future();

            WorkItem item;
            item.kind = kind;
            item.run = [promise, fn = std::forward<F>(work)]() mutable {
                try {
                    if constexpr (std::is_void_v<Result>) {
                        fn();
                        promise->set_value();
                    } else {
                        promise->set_value(fn());
                    }
                } catch (...) {
                    // Delivered to the submitting caller through the future.
                    promise->set_exception(std::current_exception());
                }
            };
            item.fail = [promise](std::exception_ptr error) {
                promise->set_exception(error);
            };

            submit(std::move(item));

            if (future.wait_for(timeout) != std::future_status::ready) {
                throw PacingTimeout(timeout.count());
            }
            return future.get();
        }

        // Function: stop
        // Description: Stops the lane. Pending callers fail with PacingStopped.
        //              Idempotent; also called by the destructor.
        void stop();

        // Executions started within the trailing 60 seconds.
        size_t calls_last_minute() const;

        // Items still queued. The item the lane holds while waiting out
        // min_interval is not counted and can no longer be evicted, so up to
        // capacity + 1 items may be outstanding.
        size_t queue_depth() const;

        PacingStatus status() const;

        const Options& options() const { return options_; }

    private:
        struct WorkItem {
            std::function<void()> run;
            std::function<void(std::exception_ptr)> fail;
            Kind kind = Kind::Read;
        };

        void submit(WorkItem item);
        void run();
        void record_start(std::chrono::steady_clock::time_point start);

        Options options_;

        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<WorkItem> pending_;
        bool stopping_ = false;

        // Ring of recent execution start times for calls_last_minute().
        mutable std::mutex history_mutex_;
        std::array<std::chrono::steady_clock::time_point, constants::PACING_HISTORY_SIZE> history_{};
        size_t history_next_ = 0;
        size_t history_count_ = 0;

        std::thread lane_;
    };

}
