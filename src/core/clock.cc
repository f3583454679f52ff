#include "clock.hh"
#include <chrono>

namespace mesh {

timestamp_t SystemClock::now() const {
    return std::chrono::duration_cast<timestamp_t>(
        std::chrono::system_clock::now().time_since_epoch());
}

}  // namespace mesh
