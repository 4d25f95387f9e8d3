#pragma once

/**
 * Bounded MPMC Ring Buffer
 *
 * Fixed array of stamped slots driven by two cursors. A cursor packs
 *
 *     [ lap ........ | mark | index ]
 *                      ^ mark_bit = bit_ceil(capacity + 1)
 *
 * so one_lap = 2 * mark_bit. The mark bit of the tail is the closed flag;
 * the head never carries it. Laps make a slot's stamp unambiguous across
 * wrap-around: a writer of tail t only proceeds if the slot's stamp is
 * exactly t, i.e. the reader of the previous lap has released it.
 *
 * Guarantees:
 * - Lock-free push/pop, no allocation after construction
 * - Items delivered in the order their tail index was reserved
 * - After close(), queued items stay poppable until drained
 *
 * len/is_empty/is_full are point-in-time snapshots when read concurrently
 * with mutators.
 */

#include <atomic>
#include <bit>
#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "common.hpp"
#include "result.hpp"
#include "slot.hpp"

namespace sluice {

template<typename T>
class Bounded {
    static_assert(std::is_nothrow_move_constructible_v<T>,
                  "queued type must be nothrow move constructible");
    static_assert(std::is_nothrow_destructible_v<T>,
                  "queued type must be nothrow destructible");

    using Slot = detail::Slot<T>;

public:
    explicit Bounded(size_t capacity)
        : capacity_(checked_capacity(capacity))
        , mark_bit_(std::bit_ceil(capacity_ + 1))
        , one_lap_(mark_bit_ * 2)
        , buffer_(std::make_unique<Slot[]>(capacity_))
        , head_(0)
        , tail_(0)
    {
        // Slot i is ready for the writer of index i, lap 0
        for (size_t i = 0; i < capacity_; ++i) {
            buffer_[i].stamp.store(i, std::memory_order_relaxed);
        }
    }

    ~Bounded() {
        const size_t head = head_.load(std::memory_order_relaxed);
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t hix = head & (mark_bit_ - 1);
        const size_t count = snapshot_len(head, tail);

        for (size_t i = 0; i < count; ++i) {
            const size_t index = hix + i < capacity_ ? hix + i : hix + i - capacity_;
            buffer_[index].destroy();
        }
    }

    Bounded(const Bounded&) = delete;
    Bounded& operator=(const Bounded&) = delete;

    PushResult<T> push(T value) {
        const PushStatus status = push_or_else(value,
            [this](size_t tail, size_t, Slot&) {
                const size_t head = head_.load(std::memory_order_relaxed);
                // Full only if the head is exactly one lap behind
                return head + one_lap_ == tail;
            });

        switch (status) {
            case PushStatus::OK: return PushResult<T>::ok();
            case PushStatus::FULL: return PushResult<T>::full(std::move(value));
            case PushStatus::CLOSED: return PushResult<T>::closed(std::move(value));
        }
        return PushResult<T>::closed(std::move(value));
    }

    /**
     * Push that never reports FULL
     *
     * On a full ring the oldest item is displaced: the head is advanced past
     * it, its slot is refilled with the new value and re-stamped for the next
     * lap, and the old value is handed back.
     */
    ForcePushResult<T> force_push(T value) {
        std::optional<T> displaced;

        const PushStatus status = push_or_else(value,
            [this, &value, &displaced](size_t tail, size_t new_tail, Slot& slot) {
                size_t head = tail - one_lap_;
                const size_t new_head = new_tail - one_lap_;

                if (!head_.compare_exchange_weak(head, new_head,
                        std::memory_order_seq_cst, std::memory_order_relaxed)) {
                    return false;
                }

                // Only close() can touch the tail here; keep its mark bit
                Backoff backoff;
                size_t current = tail_.load(std::memory_order_relaxed);
                while (!tail_.compare_exchange_weak(current, new_tail | (current & mark_bit_),
                        std::memory_order_seq_cst, std::memory_order_relaxed)) {
                    backoff.spin();
                }

                displaced.emplace(slot.take());
                slot.construct(std::move(value));
                slot.publish(tail + 1);
                return true;
            });

        switch (status) {
            case PushStatus::OK: return ForcePushResult<T>::ok();
            case PushStatus::FULL: return ForcePushResult<T>::displaced(std::move(*displaced));
            case PushStatus::CLOSED: return ForcePushResult<T>::closed(std::move(value));
        }
        return ForcePushResult<T>::closed(std::move(value));
    }

    PopResult<T> pop() {
        Backoff backoff;
        size_t head = head_.load(std::memory_order_relaxed);

        while (true) {
            const size_t index = head & (mark_bit_ - 1);
            const size_t lap = head & ~(one_lap_ - 1);
            Slot& slot = buffer_[index];
            const size_t stamp = slot.stamp.load(std::memory_order_acquire);

            if (SLUICE_LIKELY(head + 1 == stamp)) {
                const size_t new_head = index + 1 < capacity_ ? head + 1 : lap + one_lap_;

                if (head_.compare_exchange_weak(head, new_head,
                        std::memory_order_seq_cst, std::memory_order_relaxed)) {
                    T value = slot.take();
                    slot.publish(head + one_lap_);
                    return PopResult<T>::ok(std::move(value));
                }
                backoff.spin();
            } else if (stamp == head) {
                std::atomic_thread_fence(std::memory_order_seq_cst);
                const size_t tail = tail_.load(std::memory_order_relaxed);

                if ((tail & ~mark_bit_) == head) {
                    return (tail & mark_bit_) != 0 ? PopResult<T>::closed()
                                                   : PopResult<T>::empty();
                }

                // A writer reserved this slot but has not published it yet
                backoff.snooze();
                head = head_.load(std::memory_order_relaxed);
            } else {
                backoff.snooze();
                head = head_.load(std::memory_order_relaxed);
            }
        }
    }

    size_t len() const noexcept {
        while (true) {
            const size_t tail = tail_.load(std::memory_order_seq_cst);
            const size_t head = head_.load(std::memory_order_seq_cst);

            // Retry until both cursors were read against the same tail
            if (tail_.load(std::memory_order_seq_cst) == tail) {
                return snapshot_len(head, tail);
            }
        }
    }

    bool is_empty() const noexcept {
        const size_t head = head_.load(std::memory_order_seq_cst);
        const size_t tail = tail_.load(std::memory_order_seq_cst);
        return (tail & ~mark_bit_) == head;
    }

    bool is_full() const noexcept {
        const size_t tail = tail_.load(std::memory_order_seq_cst);
        const size_t head = head_.load(std::memory_order_seq_cst);
        return head + one_lap_ == (tail & ~mark_bit_);
    }

    size_t capacity() const noexcept { return capacity_; }

    // True only for the call that set the mark bit
    bool close() noexcept {
        const size_t tail = tail_.fetch_or(mark_bit_, std::memory_order_seq_cst);
        return (tail & mark_bit_) == 0;
    }

    bool is_closed() const noexcept {
        return (tail_.load(std::memory_order_seq_cst) & mark_bit_) != 0;
    }

private:
    static size_t checked_capacity(size_t capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("capacity must be positive");
        }
        if (capacity > std::numeric_limits<size_t>::max() / 4) {
            throw std::invalid_argument("capacity is too large");
        }
        return capacity;
    }

    size_t snapshot_len(size_t head, size_t tail) const noexcept {
        const size_t hix = head & (mark_bit_ - 1);
        const size_t tix = tail & (mark_bit_ - 1);

        if (hix < tix) {
            return tix - hix;
        } else if (hix > tix) {
            return capacity_ - hix + tix;
        } else if ((tail & ~mark_bit_) == head) {
            return 0;
        }
        return capacity_;
    }

    /**
     * Reserve the tail slot and move `value` into it
     *
     * on_full(tail, new_tail, slot) runs when the tail slot still holds an
     * item from the previous lap and the closed bit is still clear after the
     * fence. Returning true stops with FULL; returning
     * false reloads the tail and retries. `value` is left untouched unless
     * OK is returned or on_full consumed it.
     */
    template<typename OnFull>
    PushStatus push_or_else(T& value, OnFull&& on_full) {
        Backoff backoff;
        size_t tail = tail_.load(std::memory_order_relaxed);

        while (true) {
            if (SLUICE_UNLIKELY(tail & mark_bit_)) {
                return PushStatus::CLOSED;
            }

            const size_t index = tail & (mark_bit_ - 1);
            const size_t lap = tail & ~(one_lap_ - 1);
            const size_t new_tail = index + 1 < capacity_ ? tail + 1 : lap + one_lap_;

            Slot& slot = buffer_[index];
            const size_t stamp = slot.stamp.load(std::memory_order_acquire);

            if (tail == stamp) {
                if (tail_.compare_exchange_weak(tail, new_tail,
                        std::memory_order_seq_cst, std::memory_order_relaxed)) {
                    slot.construct(std::move(value));
                    slot.publish(tail + 1);
                    return PushStatus::OK;
                }
                backoff.spin();
            } else if (stamp + one_lap_ == tail + 1) {
                std::atomic_thread_fence(std::memory_order_seq_cst);
                // A close() that landed after the tail load wins over FULL
                if (SLUICE_UNLIKELY(tail_.load(std::memory_order_seq_cst) & mark_bit_)) {
                    return PushStatus::CLOSED;
                }
                if (on_full(tail, new_tail, slot)) {
                    return PushStatus::FULL;
                }
                backoff.spin();
                tail = tail_.load(std::memory_order_relaxed);
            } else {
                backoff.snooze();
                tail = tail_.load(std::memory_order_relaxed);
            }
        }
    }

    const size_t capacity_;
    const size_t mark_bit_;
    const size_t one_lap_;
    std::unique_ptr<Slot[]> buffer_;

    alignas(CACHE_LINE_SIZE) std::atomic<size_t> head_;
    alignas(CACHE_LINE_SIZE) std::atomic<size_t> tail_;
};

} // namespace sluice
