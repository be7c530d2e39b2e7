#include "execution/PacingQueue.hpp"
#include "common/Logger.hpp"

namespace optgate {

    PacingQueue::PacingQueue() : PacingQueue(Options{}) {}

    PacingQueue::PacingQueue(Options options) : options_(options) {
        if (options_.capacity == 0) options_.capacity = 1;
        lane_ = std::thread(&PacingQueue::run, this);
        LOG_INFO("[Pacing] started: 1 call per %lldms, capacity %zu",
                 static_cast<long long>(options_.min_interval.count()), options_.capacity);
    }

    PacingQueue::~PacingQueue() {
        stop();
    }

    void PacingQueue::stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ && !lane_.joinable()) return;
            stopping_ = true;
        }
        cv_.notify_all();
        if (lane_.joinable()) {
            lane_.join();
        }

        std::deque<WorkItem> orphaned;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            orphaned.swap(pending_);
        }
        for (auto& item : orphaned) {
            item.fail(std::make_exception_ptr(PacingStopped()));
        }
    }

    // Function: submit
    // Description: Admits one item, evicting the oldest pending read on overflow.
    // Inputs: item - work plus its failure channel.
    // Outputs: None. Throws PacingStopped or PacingOverflow.
    void PacingQueue::submit(WorkItem item) {
        WorkItem evicted;
        bool has_evicted = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw PacingStopped();
            }

            if (pending_.size() >= options_.capacity) {
                auto victim = pending_.begin();
                while (victim != pending_.end() && victim->kind == Kind::OrderMutating) {
                    ++victim;
                }
                if (victim == pending_.end()) {
                    LOG_WARN("[Pacing] queue full of order requests, rejecting new item");
                    throw PacingOverflow();
                }
                evicted = std::move(*victim);
                pending_.erase(victim);
                has_evicted = true;
            }

            pending_.push_back(std::move(item));
        }
        cv_.notify_one();

        if (has_evicted) {
            LOG_WARN("[Pacing] queue full (%zu), evicted oldest pending read", options_.capacity);
            evicted.fail(std::make_exception_ptr(PacingEvicted()));
        }
    }

    // Function: run
    // Description: The execution lane. One item at a time, spaced by min_interval
    //              between start times.
    void PacingQueue::run() {
        bool has_last_start = false;
        std::chrono::steady_clock::time_point last_start;

        while (true) {
            WorkItem item;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
                if (stopping_) break;
                item = std::move(pending_.front());
                pending_.pop_front();

                if (has_last_start) {
                    auto earliest = last_start + options_.min_interval;
                    if (cv_.wait_until(lock, earliest, [this] { return stopping_; })) {
                        // Hand it back so stop() fails it with the rest.
                        pending_.push_front(std::move(item));
                        break;
                    }
                }
            }

            last_start = std::chrono::steady_clock::now();
            has_last_start = true;
            record_start(last_start);

            item.run();
        }
    }

    void PacingQueue::record_start(std::chrono::steady_clock::time_point start) {
        std::lock_guard<std::mutex> lock(history_mutex_);
        history_[history_next_] = start;
        history_next_ = (history_next_ + 1) % history_.size();
        if (history_count_ < history_.size()) ++history_count_;
    }

    size_t PacingQueue::calls_last_minute() const {
        auto cutoff = std::chrono::steady_clock::now() - std::chrono::seconds(60);
        std::lock_guard<std::mutex> lock(history_mutex_);
        size_t count = 0;
        for (size_t i = 0; i < history_count_; ++i) {
            if (history_[i] > cutoff) ++count;
        }
        return count;
    }

    size_t PacingQueue::queue_depth() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    PacingStatus PacingQueue::status() const {
        PacingStatus status;
        status.calls_last_minute = calls_last_minute();
        status.max_per_minute = options_.max_per_minute;
        status.min_interval_ms = options_.min_interval.count();
        status.queue_depth = queue_depth();
        return status;
    }

}
