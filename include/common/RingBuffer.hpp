#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <thread>

namespace optgate {

    // Function: RingBuffer
    // Description: Bounded many-producer/single-consumer ring. Producers are
    //              serialized by a spin flag and never block on a full ring: the
    //              item is dropped and counted. The consumer side is lock-free.
    //              Size must be a power of 2; one slot stays free, so the ring
    //              holds at most Size - 1 items.
    template<typename T, size_t Size>
    class RingBuffer {
        static_assert(Size >= 2 && (Size & (Size - 1)) == 0, "Buffer size must be a power of 2");

        static constexpr size_t MASK = Size - 1;

        struct alignas(64) Slot {
            T value;
        };

    public:
        // Function: push
        // Description: Copies an item in. Safe from any number of threads.
        // Outputs: false if the ring was full and the item was dropped.
        bool push(const T& item) {
            while (producer_lock_.test_and_set(std::memory_order_acquire)) {
                std::this_thread::yield();
            }
            size_t head = head_.load(std::memory_order_relaxed);
            size_t next = (head + 1) & MASK;
            bool stored = next != tail_.load(std::memory_order_acquire);
            if (stored) {
                slots_[head].value = item;
                head_.store(next, std::memory_order_release);
            }
            producer_lock_.clear(std::memory_order_release);

            if (!stored) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
            }
            return stored;
        }

        // Consumer only.
        bool pop(T& item) {
            size_t tail = tail_.load(std::memory_order_relaxed);
            if (tail == head_.load(std::memory_order_acquire)) {
                return false;
            }
            item = slots_[tail].value;
            tail_.store((tail + 1) & MASK, std::memory_order_release);
            return true;
        }

        // Function: drain
        // Description: Consumer only. Hands every item present at the call to fn,
        //              oldest first, releasing each slot after fn returns.
        // Outputs: Number of items handed over.
        template<typename Fn>
        size_t drain(Fn&& fn) {
            size_t tail = tail_.load(std::memory_order_relaxed);
            size_t head = head_.load(std::memory_order_acquire);
            size_t count = 0;
            while (tail != head) {
                fn(slots_[tail].value);
                tail = (tail + 1) & MASK;
                tail_.store(tail, std::memory_order_release);
                ++count;
            }
            return count;
        }

        bool empty() const {
            return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
        }

        size_t size() const {
            return (head_.load(std::memory_order_acquire) - tail_.load(std::memory_order_acquire)) & MASK;
        }

        uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

        static constexpr size_t capacity() { return Size - 1; }

    private:
        Slot slots_[Size];

        alignas(64) std::atomic<size_t> head_{0};
        alignas(64) std::atomic<size_t> tail_{0};
        std::atomic_flag producer_lock_ = ATOMIC_FLAG_INIT;
        std::atomic<uint64_t> dropped_{0};
    };

}
