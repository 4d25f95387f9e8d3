#pragma once

#include <cstddef>
#include <optional>

namespace sluice {

/**
 * Queue construction parameters
 *
 * capacity set   -> fixed-size ring of that many slots
 * capacity empty -> unbounded chain of blocks
 */
struct QueueConfig {
    std::optional<size_t> capacity;

    static QueueConfig bounded(size_t capacity) { return QueueConfig{capacity}; }
    static QueueConfig unbounded() { return QueueConfig{std::nullopt}; }

    bool is_bounded() const noexcept { return capacity.has_value(); }

    // Throws std::invalid_argument for a zero capacity
    void validate() const;
};

} // namespace sluice
