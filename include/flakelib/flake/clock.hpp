#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace flakelib::flake {

/**
 * @brief system_clock の時刻をエポックミリ秒に変換
 *
 * 秒 * 1000 + 秒未満ナノ秒 / 1,000,000 で計算する。
 * エポック以前の時刻はエラーにせず、エポックからの差の絶対値を返す。
 * @param tp 時刻
 * @return エポックミリ秒
 */
uint64_t epoch_millis(std::chrono::system_clock::time_point tp);

/**
 * @brief 時刻取得の抽象インターフェース
 */
class Clock {
public:
    virtual ~Clock() = default;

    /**
     * @brief 現在時刻をエポックミリ秒で取得
     */
    virtual uint64_t now_ms() = 0;
};

/**
 * @brief 壁時計（std::chrono::system_clock）
 */
class SystemClock : public Clock {
public:
    uint64_t now_ms() override;
};

/**
 * @brief 手動で進める時計（テスト・再現用）
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(uint64_t start_ms = 0) : now_(start_ms) {}

    uint64_t now_ms() override { return now_.load(); }

    void set(uint64_t ms) { now_.store(ms); }
    void advance(uint64_t ms) { now_.fetch_add(ms); }
    void rewind(uint64_t ms) { now_.fetch_sub(ms); }

private:
    std::atomic<uint64_t> now_;
};

} // namespace flakelib::flake
