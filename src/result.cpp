#include "sluice/result.hpp"

namespace sluice {

const char* to_string(PushStatus status) noexcept {
    switch (status) {
        case PushStatus::OK: return "Ok";
        case PushStatus::FULL: return "Full";
        case PushStatus::CLOSED: return "Closed";
        default: return "unknown";
    }
}

const char* to_string(PopStatus status) noexcept {
    switch (status) {
        case PopStatus::OK: return "Ok";
        case PopStatus::EMPTY: return "Empty";
        case PopStatus::CLOSED: return "Closed";
        default: return "unknown";
    }
}

std::ostream& operator<<(std::ostream& os, PushStatus status) {
    return os << to_string(status);
}

std::ostream& operator<<(std::ostream& os, PopStatus status) {
    return os << to_string(status);
}

} // namespace sluice
