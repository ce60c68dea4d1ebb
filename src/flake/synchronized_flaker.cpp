#include "flakelib/flake/synchronized_flaker.hpp"

namespace flakelib::flake {

SynchronizedFlaker::SynchronizedFlaker(Flaker flaker) : flaker_(std::move(flaker)) {}

Result<FlakeId> SynchronizedFlaker::get_id() {
    std::lock_guard<std::mutex> lock(mtx_);
    return flaker_.get_id();
}

Result<std::vector<FlakeId>> SynchronizedFlaker::get_ids(size_t n) {
    std::lock_guard<std::mutex> lock(mtx_);
    return flaker_.get_ids(n);
}

WorkerId SynchronizedFlaker::identifier() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return flaker_.identifier();
}

uint64_t SynchronizedFlaker::last_generated_time_ms() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return flaker_.last_generated_time_ms();
}

uint16_t SynchronizedFlaker::counter() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return flaker_.counter();
}

} // namespace flakelib::flake
