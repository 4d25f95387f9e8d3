#pragma once

/**
 * Stamped storage cell shared by the bounded and unbounded engines
 *
 * A slot is raw, suitably aligned storage for one T plus an atomic stamp.
 * The stamp says whose turn it is:
 *
 *   Bounded ring, logical index i (i carries the lap in its high bits):
 *     - stamp == i              -> empty, writer of i may construct
 *     - stamp == i + 1          -> full, reader of i may take
 *     - reader stores i + lap   -> empty for the writer one lap later
 *
 *   Unbounded block (slots are never reused, the block is retired instead):
 *     - stamp == 0              -> not yet written
 *     - stamp & WRITE           -> written, reader may take
 *
 * The value store always happens before the release-store of the stamp, and
 * the reader's acquire-load of the stamp happens before the value load, so a
 * reader can never see a partially constructed T.
 */

#include <atomic>
#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

#include "common.hpp"

namespace sluice::detail {

template<typename T>
struct Slot {
    std::atomic<size_t> stamp{0};
    alignas(T) unsigned char storage[sizeof(T)];

    T* ptr() noexcept {
        return std::launder(reinterpret_cast<T*>(storage));
    }

    template<typename U>
    void construct(U&& value) noexcept {
        ::new (static_cast<void*>(storage)) T(std::forward<U>(value));
    }

    // Move the value out and end its lifetime in the slot
    T take() noexcept {
        T* p = ptr();
        T value(std::move(*p));
        p->~T();
        return value;
    }

    void destroy() noexcept {
        ptr()->~T();
    }

    void publish(size_t next_stamp) noexcept {
        stamp.store(next_stamp, std::memory_order_release);
    }

    // Wait until the writer that reserved this slot has published it
    void wait_for_bits(size_t bits) const noexcept {
        Backoff backoff;
        while ((stamp.load(std::memory_order_acquire) & bits) == 0) {
            backoff.snooze();
        }
    }
};

} // namespace sluice::detail
