#include "execution/PacingQueue.hpp"
#include "common/Errors.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

static int failures = 0;

static void check(bool condition, const std::string& name) {
    if (condition) {
        std::cout << "[PASS] " << name << std::endl;
    } else {
        std::cout << "[FAIL] " << name << std::endl;
        ++failures;
    }
}

template<typename Pred>
static bool eventually(Pred pred, std::chrono::milliseconds limit = 2000ms) {
    auto deadline = Clock::now() + limit;
    while (Clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(1ms);
    }
    return pred();
}

// Outcome of one caller thread, polled from the test thread.
enum Outcome : int { Waiting = 0, Done = 1, Evicted = 2, Stopped = 3, Other = 4 };

static optgate::PacingQueue::Options fast_options(std::chrono::milliseconds interval, size_t capacity = 50) {
    optgate::PacingQueue::Options options;
    options.min_interval = interval;
    options.capacity = capacity;
    options.caller_timeout = 10000ms;
    return options;
}

static void test_spacing_between_concurrent_callers() {
    optgate::PacingQueue queue(fast_options(50ms));
    std::mutex mutex;
    std::vector<Clock::time_point> starts;

    std::vector<std::thread> callers;
    for (int i = 0; i < 5; ++i) {
        callers.emplace_back([&]() {
            queue.enqueue([&]() {
                std::lock_guard<std::mutex> lock(mutex);
                starts.push_back(Clock::now());
                return 0;
            });
        });
    }
    for (auto& t : callers) t.join();

    std::sort(starts.begin(), starts.end());
    bool spaced = starts.size() == 5;
    for (size_t i = 1; i < starts.size(); ++i) {
        auto gap = std::chrono::duration_cast<std::chrono::milliseconds>(starts[i] - starts[i - 1]);
        if (gap < 45ms) spaced = false;
    }
    check(spaced, "five concurrent calls start at least one interval apart");
}

static void test_sixty_calls_take_fifty_nine_intervals() {
    optgate::PacingQueue queue(fast_options(10ms, 100));
    auto begin = Clock::now();
    int sum = 0;
    for (int i = 0; i < 60; ++i) {
        sum += queue.enqueue([i]() { return i; });
    }
    auto elapsed = Clock::now() - begin;
    check(sum == 1770, "sixty calls return their own results");
    check(elapsed >= 590ms, "sixty calls take at least 59 intervals");
    check(queue.calls_last_minute() == 60, "calls_last_minute counts every execution");
    check(queue.queue_depth() == 0, "queue drained");

    optgate::PacingStatus status = queue.status();
    check(status.min_interval_ms == 10 && status.max_per_minute == 100, "status reports configuration");
}

static void test_error_reaches_only_its_caller() {
    optgate::PacingQueue queue(fast_options(5ms));
    std::string message;
    try {
        queue.enqueue([]() -> int { throw std::runtime_error("broker said no"); });
    } catch (const std::runtime_error& e) {
        message = e.what();
    }
    check(message == "broker said no", "work exception propagates to the caller");
    check(queue.enqueue([]() { return 7; }) == 7, "lane keeps running after a failed call");
}

static void test_caller_timeout() {
    optgate::PacingQueue queue(fast_options(5ms));
    std::atomic<bool> executed{false};
    bool timed_out = false;
    try {
        queue.enqueue([&]() {
            std::this_thread::sleep_for(200ms);
            executed = true;
            return 1;
        }, optgate::PacingQueue::Kind::Read, 20ms);
    } catch (const optgate::PacingTimeout&) {
        timed_out = true;
    }
    check(timed_out, "caller stops waiting after its timeout");
    check(eventually([&]() { return executed.load(); }), "timed-out work still executes");
    check(queue.enqueue([]() { return 2; }) == 2, "queue usable after a caller timeout");
}

// Holds the lane busy until released.
struct LaneBlocker {
    std::promise<void> release;
    std::shared_future<void> released{release.get_future().share()};
    std::atomic<bool> started{false};
    std::thread caller;

    void occupy(optgate::PacingQueue& queue) {
        caller = std::thread([this, &queue]() {
            queue.enqueue([this]() {
                started = true;
                released.wait();
                return 0;
            }, optgate::PacingQueue::Kind::Read, 10000ms);
        });
    }

    void finish() {
        release.set_value();
        caller.join();
    }
};

static void test_overflow_evicts_oldest_read() {
    optgate::PacingQueue queue(fast_options(1ms, 2));
    LaneBlocker blocker;
    blocker.occupy(queue);
    check(eventually([&]() { return blocker.started.load(); }), "lane picked the blocking item");

    std::atomic<int> outcome[3] = {Waiting, Waiting, Waiting};
    std::vector<std::thread> callers;
    auto read_call = [&](size_t slot) {
        try {
            queue.enqueue([slot]() { return static_cast<int>(slot); });
            outcome[slot] = Done;
        } catch (const optgate::PacingEvicted&) {
            outcome[slot] = Evicted;
        } catch (const std::exception&) {
            outcome[slot] = Other;
        }
    };

    callers.emplace_back(read_call, 0);
    check(eventually([&]() { return queue.queue_depth() == 1; }), "first read pending");
    callers.emplace_back(read_call, 1);
    check(eventually([&]() { return queue.queue_depth() == 2; }), "queue at capacity");
    callers.emplace_back(read_call, 2);
    check(eventually([&]() { return outcome[0] == Evicted; }), "oldest read evicted by the newest");
    check(queue.queue_depth() == 2, "depth stays at capacity after eviction");

    blocker.finish();
    for (auto& t : callers) t.join();
    check(outcome[1] == Done && outcome[2] == Done, "remaining reads execute");
}

static void test_order_work_is_never_evicted() {
    optgate::PacingQueue queue(fast_options(1ms, 1));
    LaneBlocker blocker;
    blocker.occupy(queue);
    check(eventually([&]() { return blocker.started.load(); }), "lane busy");

    std::atomic<int> order_outcome{Waiting};
    std::thread order_caller([&]() {
        try {
            queue.enqueue([]() { return 1; }, optgate::PacingQueue::Kind::OrderMutating);
            order_outcome = Done;
        } catch (const std::exception&) {
            order_outcome = Other;
        }
    });
    check(eventually([&]() { return queue.queue_depth() == 1; }), "order pending");

    bool overflow = false;
    try {
        queue.enqueue([]() { return 2; });
    } catch (const optgate::PacingOverflow&) {
        overflow = true;
    }
    check(overflow, "read refused when only order work is pending");
    check(queue.queue_depth() == 1, "pending order untouched");

    blocker.finish();
    order_caller.join();
    check(order_outcome == Done, "order executes");
}

static void test_order_work_evicts_pending_read() {
    optgate::PacingQueue queue(fast_options(1ms, 1));
    LaneBlocker blocker;
    blocker.occupy(queue);
    check(eventually([&]() { return blocker.started.load(); }), "lane busy");

    std::atomic<int> read_outcome{Waiting};
    std::thread read_caller([&]() {
        try {
            queue.enqueue([]() { return 1; });
            read_outcome = Done;
        } catch (const optgate::PacingEvicted&) {
            read_outcome = Evicted;
        } catch (const std::exception&) {
            read_outcome = Other;
        }
    });
    check(eventually([&]() { return queue.queue_depth() == 1; }), "read pending");

    std::atomic<int> order_outcome{Waiting};
    std::thread order_caller([&]() {
        try {
            queue.enqueue([]() { return 2; }, optgate::PacingQueue::Kind::OrderMutating);
            order_outcome = Done;
        } catch (const std::exception&) {
            order_outcome = Other;
        }
    });
    check(eventually([&]() { return read_outcome == Evicted; }), "order admitted by evicting the read");

    blocker.finish();
    read_caller.join();
    order_caller.join();
    check(order_outcome == Done, "order executes after eviction");
}

static void test_stop_fails_pending() {
    optgate::PacingQueue queue(fast_options(1ms));
    LaneBlocker blocker;
    blocker.occupy(queue);
    check(eventually([&]() { return blocker.started.load(); }), "lane busy");

    std::atomic<int> outcome{Waiting};
    std::thread pending([&]() {
        try {
            queue.enqueue([]() { return 1; });
            outcome = Done;
        } catch (const optgate::PacingStopped&) {
            outcome = Stopped;
        } catch (const std::exception&) {
            outcome = Other;
        }
    });
    check(eventually([&]() { return queue.queue_depth() == 1; }), "item pending before stop");

    std::thread stopper([&]() { queue.stop(); });
    std::this_thread::sleep_for(20ms);
    blocker.finish();
    stopper.join();
    pending.join();
    check(outcome == Stopped, "pending caller fails with PacingStopped");

    bool refused = false;
    try {
        queue.enqueue([]() { return 1; });
    } catch (const optgate::PacingStopped&) {
        refused = true;
    }
    check(refused, "enqueue after stop is refused");
}

static void test_depth_excludes_item_waiting_to_start() {
    optgate::PacingQueue queue(fast_options(400ms));
    queue.enqueue([]() { return 0; });

    std::atomic<bool> second_done{false};
    std::atomic<bool> third_done{false};
    std::thread second([&]() {
        queue.enqueue([]() { return 2; });
        second_done = true;
    });
    std::this_thread::sleep_for(50ms);
    check(queue.queue_depth() == 0 && !second_done, "item waiting for its start time not counted");

    std::thread third([&]() {
        queue.enqueue([]() { return 3; });
        third_done = true;
    });
    check(eventually([&]() { return queue.queue_depth() == 1; }, 200ms) && !second_done,
          "item behind it counted");

    second.join();
    third.join();
    check(second_done && third_done && queue.queue_depth() == 0, "both executed");
}

int main() {
    std::cout << "Running PacingQueue Unit Test..." << std::endl;

    test_spacing_between_concurrent_callers();
    test_sixty_calls_take_fifty_nine_intervals();
    test_error_reaches_only_its_caller();
    test_caller_timeout();
    test_overflow_evicts_oldest_read();
    test_order_work_is_never_evicted();
    test_order_work_evicts_pending_read();
    test_stop_fails_pending();
    test_depth_excludes_item_waiting_to_start();

    if (failures > 0) {
        std::cout << failures << " check(s) failed." << std::endl;
        return 1;
    }
    return 0;
}
