#pragma once

/**
 * Concurrent MPMC Queue
 *
 * One interface over two engines:
 *   bounded(n)   -> Bounded<T>, a fixed ring of n slots
 *   unbounded()  -> Unbounded<T>, a growable chain of blocks
 *
 * The engine is held in a tagged union and every call is a plain branch on
 * the discriminant. The facade has no state of its own: the closed flag
 * lives in the engine's tail cursor.
 *
 * Nothing here blocks. Full, empty and closed are reported through the
 * returned result; waiting and wakeups belong to whatever is layered on top.
 *
 * Usage:
 *   auto q = sluice::ConcurrentQueue<int>::bounded(128);
 *   if (auto r = q.push(1); !r) { ... r.take_item() ... }
 *   if (auto r = q.pop(); r) { use(r.value()); }
 *   q.close();
 *   for (int& v : q.try_iter()) { ... }  // drains what is left
 */

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <new>
#include <optional>
#include <ostream>
#include <utility>

#include "bounded.hpp"
#include "config.hpp"
#include "result.hpp"
#include "unbounded.hpp"

namespace sluice {

template<typename T>
class ConcurrentQueue {
public:
    using value_type = T;

    enum class Flavor : uint8_t { BOUNDED = 0, UNBOUNDED = 1 };

    class TryIter;

    // Throws std::invalid_argument when capacity == 0
    static ConcurrentQueue bounded(size_t capacity) {
        return ConcurrentQueue(QueueConfig::bounded(capacity));
    }

    static ConcurrentQueue unbounded() {
        return ConcurrentQueue(QueueConfig::unbounded());
    }

    explicit ConcurrentQueue(const QueueConfig& config)
        : flavor_(config.is_bounded() ? Flavor::BOUNDED : Flavor::UNBOUNDED)
    {
        config.validate();
        if (flavor_ == Flavor::BOUNDED) {
            ::new (static_cast<void*>(&bounded_)) Bounded<T>(*config.capacity);
        } else {
            ::new (static_cast<void*>(&unbounded_)) Unbounded<T>();
        }
    }

    ~ConcurrentQueue() {
        if (flavor_ == Flavor::BOUNDED) {
            std::destroy_at(&bounded_);
        } else {
            std::destroy_at(&unbounded_);
        }
    }

    ConcurrentQueue(const ConcurrentQueue&) = delete;
    ConcurrentQueue& operator=(const ConcurrentQueue&) = delete;
    ConcurrentQueue(ConcurrentQueue&&) = delete;
    ConcurrentQueue& operator=(ConcurrentQueue&&) = delete;

    /**
     * Push an item
     *
     * OK on success; FULL (bounded only) or CLOSED otherwise, with the item
     * handed back through the result.
     */
    PushResult<T> push(T value) {
        return dispatch([&](auto& engine) { return engine.push(std::move(value)); });
    }

    /**
     * Push an item, displacing the oldest one if the queue is full
     *
     * Never reports FULL. The displaced item, if any, comes back through
     * item(). On a closed queue the pushed item comes back instead.
     */
    ForcePushResult<T> force_push(T value) {
        return dispatch([&](auto& engine) { return engine.force_push(std::move(value)); });
    }

    /**
     * Pop the oldest item
     *
     * EMPTY when nothing is available right now. CLOSED only once the queue
     * is closed and every item pushed before the close has been popped.
     */
    PopResult<T> pop() {
        return dispatch([](auto& engine) { return engine.pop(); });
    }

    // True only for the one call that closed the queue
    bool close() noexcept {
        return dispatch([](auto& engine) { return engine.close(); });
    }

    bool is_closed() const noexcept {
        return dispatch([](const auto& engine) { return engine.is_closed(); });
    }

    bool is_empty() const noexcept {
        return dispatch([](const auto& engine) { return engine.is_empty(); });
    }

    // Always false for an unbounded queue
    bool is_full() const noexcept {
        return dispatch([](const auto& engine) { return engine.is_full(); });
    }

    size_t len() const noexcept {
        return dispatch([](const auto& engine) { return engine.len(); });
    }

    // Empty for an unbounded queue
    std::optional<size_t> capacity() const noexcept {
        if (flavor_ == Flavor::BOUNDED) {
            return bounded_.capacity();
        }
        return std::nullopt;
    }

    Flavor flavor() const noexcept { return flavor_; }

    // Range that pops until the queue reports EMPTY or CLOSED
    TryIter try_iter() noexcept { return TryIter(*this); }

private:
    template<typename F>
    decltype(auto) dispatch(F&& f) {
        if (flavor_ == Flavor::BOUNDED) {
            return f(bounded_);
        }
        return f(unbounded_);
    }

    template<typename F>
    decltype(auto) dispatch(F&& f) const {
        if (flavor_ == Flavor::BOUNDED) {
            return f(bounded_);
        }
        return f(unbounded_);
    }

    const Flavor flavor_;
    union {
        Bounded<T> bounded_;
        Unbounded<T> unbounded_;
    };
};

//=============================================================================
// DRAINING ITERATION
//=============================================================================

/**
 * Input range over a queue
 *
 * Each increment is one pop(). The range ends at the first EMPTY or CLOSED,
 * so it never waits for producers; items pushed while iterating may or may
 * not be seen.
 */
template<typename T>
class ConcurrentQueue<T>::TryIter {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = T*;
        using reference = T&;

        iterator() = default;

        explicit iterator(ConcurrentQueue* queue) : queue_(queue) {
            advance();
        }

        reference operator*() { return *current_; }
        pointer operator->() { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        bool operator==(const iterator& other) const noexcept { return queue_ == other.queue_; }
        bool operator!=(const iterator& other) const noexcept { return queue_ != other.queue_; }

    private:
        void advance() {
            current_.reset();
            PopResult<T> result = queue_->pop();
            if (result) {
                current_.emplace(std::move(result).value());
            } else {
                queue_ = nullptr;
            }
        }

        ConcurrentQueue* queue_ = nullptr;
        std::optional<T> current_;
    };

    explicit TryIter(ConcurrentQueue& queue) noexcept : queue_(&queue) {}

    iterator begin() { return iterator(queue_); }
    iterator end() noexcept { return iterator(); }

private:
    ConcurrentQueue* queue_;
};

template<typename T>
std::ostream& operator<<(std::ostream& os, const ConcurrentQueue<T>& queue) {
    os << "ConcurrentQueue { len: " << queue.len() << ", capacity: ";
    if (const auto cap = queue.capacity()) {
        os << *cap;
    } else {
        os << "unbounded";
    }
    return os << ", is_closed: " << (queue.is_closed() ? "true" : "false") << " }";
}

} // namespace sluice
