#pragma once

/**
 * Shared building blocks for the sluice queue engines
 *
 * - Cache line constants and an aligned wrapper to keep cursors apart
 * - Platform pause instruction
 * - Backoff: bounded exponential spinning that degrades to yielding
 *
 * Every retry loop in the engines goes through Backoff, so no loop spins
 * unconditionally: past SPIN_LIMIT the thread hands its time slice back to
 * the scheduler.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <thread>
#include <utility>

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
#include <immintrin.h>
#define SLUICE_PAUSE() _mm_pause()
#elif defined(__aarch64__) || defined(__arm__)
#define SLUICE_PAUSE() asm volatile("yield" ::: "memory")
#else
#define SLUICE_PAUSE() std::atomic_signal_fence(std::memory_order_seq_cst)
#endif

#if defined(__GNUC__) || defined(__clang__)
#define SLUICE_LIKELY(x) __builtin_expect(!!(x), 1)
#define SLUICE_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define SLUICE_LIKELY(x) (x)
#define SLUICE_UNLIKELY(x) (x)
#endif

namespace sluice {

//=============================================================================
// CONSTANTS
//=============================================================================

// Cache line size for x86-64 (Intel/AMD)
constexpr size_t CACHE_LINE_SIZE = 64;

// Pause bursts grow as 1 << step up to this step
constexpr uint32_t SPIN_LIMIT = 6;

// snooze() stops growing its step here; is_completed() reports true past it
constexpr uint32_t YIELD_LIMIT = 10;

/**
 * Cache-line aligned and padded wrapper
 * Prevents false sharing between adjacent data
 */
template<typename T>
struct alignas(CACHE_LINE_SIZE) CacheAligned {
    T value;

    CacheAligned() : value{} {}
    explicit CacheAligned(const T& v) : value(v) {}
    explicit CacheAligned(T&& v) : value(std::move(v)) {}

    T* operator->() { return &value; }
    const T* operator->() const { return &value; }
};

//=============================================================================
// BACKOFF
//=============================================================================

/**
 * Exponential backoff for lock-free retry loops
 *
 * spin():   after a lost CAS. Short pause bursts with jitter so that threads
 *           that collided do not retry in lockstep, then yield.
 * snooze(): while waiting for another thread to finish its half of a
 *           handshake (publish a slot, link a block). Pause first, then
 *           yield to the scheduler so the other thread can run.
 */
class Backoff {
public:
    Backoff() noexcept : step_(0), seed_(0x9E3779B9u) {}

    void spin() noexcept {
        if (step_ <= SPIN_LIMIT) {
            const uint32_t base = 1u << step_;
            const uint32_t spins = base + (next_jitter() & (base - 1));
            for (uint32_t i = 0; i < spins; ++i) {
                SLUICE_PAUSE();
            }
            ++step_;
        } else {
            std::this_thread::yield();
        }
    }

    void snooze() noexcept {
        if (step_ <= SPIN_LIMIT) {
            for (uint32_t i = 0; i < (1u << step_); ++i) {
                SLUICE_PAUSE();
            }
        } else {
            std::this_thread::yield();
        }

        if (step_ <= YIELD_LIMIT) {
            ++step_;
        }
    }

    // Past this point waiting any longer only burns scheduler time
    bool is_completed() const noexcept { return step_ > YIELD_LIMIT; }

private:
    // Xorshift32: cheap, no shared state
    uint32_t next_jitter() noexcept {
        seed_ ^= seed_ << 13;
        seed_ ^= seed_ >> 17;
        seed_ ^= seed_ << 5;
        return seed_;
    }

    uint32_t step_;
    uint32_t seed_;
};

} // namespace sluice
