#pragma once

#include <mutex>
#include <vector>

#include "flakelib/flake/flaker.hpp"

namespace flakelib::flake {

/**
 * @brief 複数スレッドから共有できる Flaker
 *
 * 時刻・カウンタ・識別子は一体で不変条件を成すため、
 * get_id() 全体を単一のミューテックスで保護する。
 */
class SynchronizedFlaker {
public:
    explicit SynchronizedFlaker(Flaker flaker);

    Result<FlakeId> get_id();
    Result<std::vector<FlakeId>> get_ids(size_t n);

    WorkerId identifier() const;
    uint64_t last_generated_time_ms() const;
    uint16_t counter() const;

private:
    mutable std::mutex mtx_;
    Flaker flaker_;
};

} // namespace flakelib::flake
