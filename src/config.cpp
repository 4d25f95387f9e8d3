#include "sluice/config.hpp"
#include <stdexcept>

namespace sluice {

void QueueConfig::validate() const {
    if (capacity && *capacity == 0) {
        throw std::invalid_argument("capacity must be positive");
    }
}

} // namespace sluice
