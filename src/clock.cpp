#include "clock.hpp"

#include <chrono>
#include <limits>
#include <stdexcept>

namespace lf {

Timestamp SystemClock::now() const {
    auto since = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(since).count());
}

void ManualClock::set(Timestamp value) {
    if (value < now_) {
        throw std::invalid_argument("ManualClock cannot move backwards");
    }
    now_ = value;
}

void ManualClock::advance(Timestamp seconds) {
    if (seconds > std::numeric_limits<Timestamp>::max() - now_) {
        throw std::overflow_error("ManualClock advance overflows the timestamp range");
    }
    now_ += seconds;
}

} // namespace lf
