#pragma once

/**
 * Outcomes of queue operations
 *
 * Full, empty and closed are ordinary results, not exceptions. A rejected
 * push always hands the item back so the caller keeps ownership.
 *
 *   push        -> PushResult<T>:      OK | FULL(item) | CLOSED(item)
 *   force_push  -> ForcePushResult<T>: OK | OK(displaced) | CLOSED(item)
 *   pop         -> PopResult<T>:       OK(value) | EMPTY | CLOSED
 */

#include <cstdint>
#include <optional>
#include <ostream>
#include <utility>

namespace sluice {

enum class PushStatus : uint8_t { OK = 0, FULL = 1, CLOSED = 2 };
enum class PopStatus : uint8_t { OK = 0, EMPTY = 1, CLOSED = 2 };

const char* to_string(PushStatus status) noexcept;
const char* to_string(PopStatus status) noexcept;

std::ostream& operator<<(std::ostream& os, PushStatus status);
std::ostream& operator<<(std::ostream& os, PopStatus status);

//=============================================================================
// PUSH
//=============================================================================

template<typename T>
class PushResult {
public:
    static PushResult ok() noexcept { return PushResult(PushStatus::OK, std::nullopt); }
    static PushResult full(T&& item) { return PushResult(PushStatus::FULL, std::move(item)); }
    static PushResult closed(T&& item) { return PushResult(PushStatus::CLOSED, std::move(item)); }

    PushStatus status() const noexcept { return status_; }

    bool is_ok() const noexcept { return status_ == PushStatus::OK; }
    bool is_full() const noexcept { return status_ == PushStatus::FULL; }
    bool is_closed() const noexcept { return status_ == PushStatus::CLOSED; }

    explicit operator bool() const noexcept { return is_ok(); }

    // The rejected item; empty when the push succeeded
    std::optional<T>& item() noexcept { return item_; }
    const std::optional<T>& item() const noexcept { return item_; }

    std::optional<T> take_item() {
        std::optional<T> out = std::move(item_);
        item_.reset();
        return out;
    }

private:
    PushResult(PushStatus status, std::optional<T> item)
        : status_(status), item_(std::move(item)) {}

    PushStatus status_;
    std::optional<T> item_;
};

/**
 * force_push never reports FULL. On a full bounded queue the oldest item is
 * displaced and handed back through item(); on a closed queue the pushed
 * item itself comes back.
 */
template<typename T>
class ForcePushResult {
public:
    static ForcePushResult ok() noexcept { return ForcePushResult(false, std::nullopt); }
    static ForcePushResult displaced(T&& old) { return ForcePushResult(false, std::move(old)); }
    static ForcePushResult closed(T&& item) { return ForcePushResult(true, std::move(item)); }

    PushStatus status() const noexcept { return closed_ ? PushStatus::CLOSED : PushStatus::OK; }

    bool is_ok() const noexcept { return !closed_; }
    bool is_closed() const noexcept { return closed_; }
    bool has_displaced() const noexcept { return !closed_ && item_.has_value(); }

    explicit operator bool() const noexcept { return is_ok(); }

    std::optional<T>& item() noexcept { return item_; }
    const std::optional<T>& item() const noexcept { return item_; }

    std::optional<T> take_item() {
        std::optional<T> out = std::move(item_);
        item_.reset();
        return out;
    }

private:
    ForcePushResult(bool closed, std::optional<T> item)
        : closed_(closed), item_(std::move(item)) {}

    bool closed_;
    std::optional<T> item_;
};

//=============================================================================
// POP
//=============================================================================

template<typename T>
class PopResult {
public:
    static PopResult ok(T&& value) { return PopResult(PopStatus::OK, std::move(value)); }
    static PopResult empty() noexcept { return PopResult(PopStatus::EMPTY, std::nullopt); }
    static PopResult closed() noexcept { return PopResult(PopStatus::CLOSED, std::nullopt); }

    PopStatus status() const noexcept { return status_; }

    bool is_ok() const noexcept { return status_ == PopStatus::OK; }
    bool is_empty() const noexcept { return status_ == PopStatus::EMPTY; }
    bool is_closed() const noexcept { return status_ == PopStatus::CLOSED; }

    explicit operator bool() const noexcept { return is_ok(); }

    // Throws std::bad_optional_access unless is_ok()
    T& value() & { return value_.value(); }
    const T& value() const & { return value_.value(); }
    T&& value() && { return std::move(value_.value()); }

    std::optional<T> take() {
        std::optional<T> out = std::move(value_);
        value_.reset();
        return out;
    }

private:
    PopResult(PopStatus status, std::optional<T> value)
        : status_(status), value_(std::move(value)) {}

    PopStatus status_;
    std::optional<T> value_;
};

template<typename T>
std::ostream& operator<<(std::ostream& os, const PushResult<T>& result) {
    return os << result.status();
}

template<typename T>
std::ostream& operator<<(std::ostream& os, const ForcePushResult<T>& result) {
    if (result.has_displaced()) {
        return os << "Ok(displaced)";
    }
    return os << result.status();
}

template<typename T>
std::ostream& operator<<(std::ostream& os, const PopResult<T>& result) {
    return os << result.status();
}

} // namespace sluice
