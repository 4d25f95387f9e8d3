#pragma once

/**
 * Unbounded MPMC Queue of Linked Blocks
 *
 * Items live in fixed-size blocks of BLOCK_CAP slots. The head and tail each
 * hold an index and a block pointer. An index is
 *
 *     position << SHIFT | flag
 *
 * where position % LAP is the offset inside the current block. Offset
 * BLOCK_CAP (== LAP - 1) is never a real slot: a cursor sitting there means
 * "some thread is moving this cursor to the next block, wait".
 *
 *   tail flag (MARK_BIT): queue is closed
 *   head flag (HAS_NEXT): the head block is known to have a successor, so
 *                         pop can skip comparing against the tail
 *
 * Block lifecycle:
 * - The writer that reserves the last slot of a block is the only thread
 *   that links the next block. It allocates the block before reserving, so
 *   two writers can never both extend the chain.
 * - Every block starts with pending_reads == BLOCK_CAP. Each reader releases
 *   one unit after moving its value out. The reader that releases the last
 *   unit frees the block: at that point every slot has been written and
 *   read, both cursors have moved on, and every other thread's last access
 *   to the block happened before its own release.
 */

#include <atomic>
#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>

#include "common.hpp"
#include "result.hpp"
#include "slot.hpp"

namespace sluice {

namespace detail {

// Positions per block, including the sentinel offset
constexpr size_t LAP = 32;

// Real slots per block
constexpr size_t BLOCK_CAP = LAP - 1;

// Low index bits reserved for flags
constexpr size_t SHIFT = 1;

constexpr size_t MARK_BIT = 1;
constexpr size_t HAS_NEXT = 1;

// Slot stamp bit: value has been written
constexpr size_t WRITE = 1;

template<typename T>
struct Block {
    std::atomic<Block*> next{nullptr};
    std::atomic<size_t> pending_reads{BLOCK_CAP};
    Slot<T> slots[BLOCK_CAP];

    // Wait until the writer of the last slot links the successor
    Block* wait_next() const noexcept {
        Backoff backoff;
        while (true) {
            Block* n = next.load(std::memory_order_acquire);
            if (n != nullptr) {
                return n;
            }
            backoff.snooze();
        }
    }

    // True for the caller that released the final outstanding read
    bool release_read() noexcept {
        return pending_reads.fetch_sub(1, std::memory_order_acq_rel) == 1;
    }
};

template<typename T>
struct Position {
    std::atomic<size_t> index{0};
    std::atomic<Block<T>*> block{nullptr};
};

} // namespace detail

template<typename T>
class Unbounded {
    static_assert(std::is_nothrow_move_constructible_v<T>,
                  "queued type must be nothrow move constructible");
    static_assert(std::is_nothrow_destructible_v<T>,
                  "queued type must be nothrow destructible");

    using Block = detail::Block<T>;
    using Slot = detail::Slot<T>;

    static constexpr size_t LAP = detail::LAP;
    static constexpr size_t BLOCK_CAP = detail::BLOCK_CAP;
    static constexpr size_t SHIFT = detail::SHIFT;
    static constexpr size_t MARK_BIT = detail::MARK_BIT;
    static constexpr size_t HAS_NEXT = detail::HAS_NEXT;
    static constexpr size_t ONE = size_t{1} << SHIFT;

public:
    Unbounded() = default;

    ~Unbounded() {
        size_t head = head_->index.load(std::memory_order_relaxed) & ~(ONE - 1);
        const size_t tail = tail_->index.load(std::memory_order_relaxed) & ~(ONE - 1);
        Block* block = head_->block.load(std::memory_order_relaxed);

        // Destroy queued values, freeing each block as the walk leaves it
        while (head != tail) {
            const size_t offset = (head >> SHIFT) % LAP;

            if (offset < BLOCK_CAP) {
                block->slots[offset].destroy();
            } else {
                Block* next = block->next.load(std::memory_order_relaxed);
                delete block;
                block = next;
            }
            head += ONE;
        }

        delete block;
    }

    Unbounded(const Unbounded&) = delete;
    Unbounded& operator=(const Unbounded&) = delete;

    PushResult<T> push(T value) {
        Backoff backoff;
        size_t tail = tail_->index.load(std::memory_order_acquire);
        Block* block = tail_->block.load(std::memory_order_acquire);
        std::unique_ptr<Block> next_block;

        while (true) {
            if (SLUICE_UNLIKELY(tail & MARK_BIT)) {
                return PushResult<T>::closed(std::move(value));
            }

            const size_t offset = (tail >> SHIFT) % LAP;

            // Another writer is installing the next block
            if (offset == BLOCK_CAP) {
                backoff.snooze();
                tail = tail_->index.load(std::memory_order_acquire);
                block = tail_->block.load(std::memory_order_acquire);
                continue;
            }

            // Allocate before reserving so the successor can be linked at once
            if (offset + 1 == BLOCK_CAP && !next_block) {
                next_block = std::make_unique<Block>();
            }

            // First push ever: install the first block
            if (block == nullptr) {
                auto first = std::make_unique<Block>();
                Block* expected = nullptr;

                if (tail_->block.compare_exchange_strong(expected, first.get(),
                        std::memory_order_release, std::memory_order_relaxed)) {
                    block = first.release();
                    head_->block.store(block, std::memory_order_release);
                } else {
                    next_block = std::move(first);
                    tail = tail_->index.load(std::memory_order_acquire);
                    block = tail_->block.load(std::memory_order_acquire);
                    continue;
                }
            }

            const size_t new_tail = tail + ONE;

            if (tail_->index.compare_exchange_weak(tail, new_tail,
                    std::memory_order_seq_cst, std::memory_order_acquire)) {
                if (offset + 1 == BLOCK_CAP) {
                    Block* next = next_block.release();
                    tail_->block.store(next, std::memory_order_release);
                    // Step over the sentinel; fetch_add keeps a racing close() mark
                    tail_->index.fetch_add(ONE, std::memory_order_release);
                    block->next.store(next, std::memory_order_release);
                }

                Slot& slot = block->slots[offset];
                slot.construct(std::move(value));
                slot.stamp.fetch_or(detail::WRITE, std::memory_order_release);
                return PushResult<T>::ok();
            }

            block = tail_->block.load(std::memory_order_acquire);
            backoff.spin();
        }
    }

    // Never full: identical to push apart from the result type
    ForcePushResult<T> force_push(T value) {
        PushResult<T> result = push(std::move(value));
        if (result.is_ok()) {
            return ForcePushResult<T>::ok();
        }
        return ForcePushResult<T>::closed(std::move(*result.item()));
    }

    PopResult<T> pop() {
        Backoff backoff;
        size_t head = head_->index.load(std::memory_order_acquire);
        Block* block = head_->block.load(std::memory_order_acquire);

        while (true) {
            const size_t offset = (head >> SHIFT) % LAP;

            // Another reader is moving the head to the next block
            if (offset == BLOCK_CAP) {
                backoff.snooze();
                head = head_->index.load(std::memory_order_acquire);
                block = head_->block.load(std::memory_order_acquire);
                continue;
            }

            size_t new_head = head + ONE;

            if ((new_head & HAS_NEXT) == 0) {
                std::atomic_thread_fence(std::memory_order_seq_cst);
                const size_t tail = tail_->index.load(std::memory_order_relaxed);

                if ((head >> SHIFT) == (tail >> SHIFT)) {
                    return (tail & MARK_BIT) != 0 ? PopResult<T>::closed()
                                                  : PopResult<T>::empty();
                }

                // Tail is in a later block, so this block has a successor
                if ((head >> SHIFT) / LAP != (tail >> SHIFT) / LAP) {
                    new_head |= HAS_NEXT;
                }
            }

            // First block not installed yet
            if (block == nullptr) {
                backoff.snooze();
                head = head_->index.load(std::memory_order_acquire);
                block = head_->block.load(std::memory_order_acquire);
                continue;
            }

            if (head_->index.compare_exchange_weak(head, new_head,
                    std::memory_order_seq_cst, std::memory_order_acquire)) {
                if (offset + 1 == BLOCK_CAP) {
                    Block* next = block->wait_next();
                    size_t next_index = (new_head & ~HAS_NEXT) + ONE;
                    if (next->next.load(std::memory_order_relaxed) != nullptr) {
                        next_index |= HAS_NEXT;
                    }

                    head_->block.store(next, std::memory_order_release);
                    head_->index.store(next_index, std::memory_order_release);
                }

                Slot& slot = block->slots[offset];
                slot.wait_for_bits(detail::WRITE);
                T value = slot.take();

                if (block->release_read()) {
                    delete block;
                }
                return PopResult<T>::ok(std::move(value));
            }

            block = head_->block.load(std::memory_order_acquire);
            backoff.spin();
        }
    }

    size_t len() const noexcept {
        while (true) {
            size_t tail = tail_->index.load(std::memory_order_seq_cst);
            size_t head = head_->index.load(std::memory_order_seq_cst);

            if (tail_->index.load(std::memory_order_seq_cst) != tail) {
                continue;
            }

            tail &= ~(ONE - 1);
            head &= ~(ONE - 1);

            // A cursor parked on the sentinel counts as the next block's start
            if (((tail >> SHIFT) & (LAP - 1)) == LAP - 1) {
                tail += ONE;
            }
            if (((head >> SHIFT) & (LAP - 1)) == LAP - 1) {
                head += ONE;
            }

            // Rebase both onto the head's block to keep the numbers small
            const size_t lap = (head >> SHIFT) / LAP;
            tail -= (lap * LAP) << SHIFT;
            head -= (lap * LAP) << SHIFT;

            tail >>= SHIFT;
            head >>= SHIFT;

            // Every full block in between contributes one sentinel position
            return tail - head - tail / LAP;
        }
    }

    bool is_empty() const noexcept {
        const size_t head = head_->index.load(std::memory_order_seq_cst);
        const size_t tail = tail_->index.load(std::memory_order_seq_cst);
        return (head >> SHIFT) == (tail >> SHIFT);
    }

    bool is_full() const noexcept { return false; }

    bool close() noexcept {
        const size_t tail = tail_->index.fetch_or(MARK_BIT, std::memory_order_seq_cst);
        return (tail & MARK_BIT) == 0;
    }

    bool is_closed() const noexcept {
        return (tail_->index.load(std::memory_order_seq_cst) & MARK_BIT) != 0;
    }

private:
    CacheAligned<detail::Position<T>> head_;
    CacheAligned<detail::Position<T>> tail_;
};

} // namespace sluice
