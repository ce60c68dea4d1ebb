#include "flakelib/flake/clock.hpp"

namespace flakelib::flake {

uint64_t epoch_millis(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    auto since_epoch = duration_cast<nanoseconds>(tp.time_since_epoch());
    if (since_epoch.count() < 0) {
        since_epoch = -since_epoch;
    }
    auto secs = duration_cast<seconds>(since_epoch);
    auto subsec_nanos = (since_epoch - secs).count();
    return static_cast<uint64_t>(secs.count()) * 1000 + static_cast<uint64_t>(subsec_nanos / 1000000);
}

uint64_t SystemClock::now_ms() {
    return epoch_millis(std::chrono::system_clock::now());
}

} // namespace flakelib::flake
