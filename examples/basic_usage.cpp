#include <iostream>
#include <thread>
#include <vector>

#include "flakelib/flake/flake_id.hpp"
#include "flakelib/flake/flaker.hpp"
#include "flakelib/flake/synchronized_flaker.hpp"
#include "flakelib/utils/log_config.hpp"

using namespace flakelib::flake;

int main() {
    flakelib::utils::log_utils::setup_basic_logging(flakelib::utils::LogLevel::Debug);

    // 1. 単一スレッドでの利用
    auto flaker = Flaker::create(WorkerId{0x00, 0x1b, 0x44, 0x11, 0x3a, 0xb7}, Endianness::Big);
    if (!flaker) {
        std::cerr << "create failed: " << flaker.error().message() << std::endl;
        return 1;
    }
    for (int i = 0; i < 3; ++i) {
        auto id = flaker.value().get_id();
        if (!id) {
            std::cerr << "get_id failed: " << id.error().message() << std::endl;
            return 1;
        }
        FlakeFields f = unpack_id(id.value());
        std::cout << to_decimal_string(id.value()) << " ts=" << f.timestamp_ms
                  << " worker=" << format_worker_id(f.worker_id) << " seq=" << f.sequence << std::endl;
    }

    // 2. スレッド間で共有する場合
    SynchronizedFlaker shared(std::move(flaker).value());
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&shared] {
            auto ids = shared.get_ids(1000);
            if (!ids) std::cerr << "batch failed: " << ids.error().message() << std::endl;
        });
    }
    for (auto& w : workers) w.join();
    std::cout << "last timestamp: " << shared.last_generated_time_ms() << std::endl;
    return 0;
}
