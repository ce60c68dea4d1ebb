#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "flakelib/expected.hpp"
#include "flakelib/flake/clock.hpp"
#include "flakelib/flake/flake_id.hpp"
#include "flakelib/flake/worker_id.hpp"

namespace flakelib::utils {
class Logger;
}

namespace flakelib::flake {

/**
 * @brief 同一ミリ秒内でカウンタが使い切られたときの扱い
 */
enum class SequencePolicy {
    Wrap,   ///< 16ビットで折り返す（65536件超で重複・逆順の可能性あり）
    Reject  ///< sequence_exhausted を返し、状態は変更しない
};

/**
 * @brief 時刻順の128ビットIDを生成するジェネレータ
 *
 * ID = [タイムスタンプ(ms) 64bit | ワーカー識別子 48bit | シーケンス 16bit]
 * 成功した get_id() の戻り値は128ビット符号なし整数として単調増加する。
 *
 * 内部でロックは取らない。スレッド間で共有する場合は SynchronizedFlaker を使う。
 * 状態の複製は重複IDを生むため、コピー不可・ムーブのみ。
 */
class Flaker {
public:
    /**
     * @brief ジェネレータを生成
     * @param identifier 6バイトのワーカー識別子
     * @param endianness identifier のバイト順（Big の場合は反転して格納）
     * @param clock 時刻取得元（nullptr で SystemClock）
     * @param policy カウンタ枯渇時の扱い
     */
    static Result<Flaker> create(const WorkerId& identifier,
                                 Endianness endianness,
                                 std::shared_ptr<Clock> clock = nullptr,
                                 SequencePolicy policy = SequencePolicy::Wrap);

    /**
     * @brief 長さを検証してジェネレータを生成
     * @return 6バイト以外は invalid_identifier
     */
    static Result<Flaker> create(std::span<const uint8_t> identifier,
                                 Endianness endianness,
                                 std::shared_ptr<Clock> clock = nullptr,
                                 SequencePolicy policy = SequencePolicy::Wrap);

    /**
     * @brief 可変長バイト列の先頭6バイトからリトルエンディアン前提で生成
     * @return 6バイト未満は invalid_identifier（7バイト目以降は無視）
     */
    static Result<Flaker> from_identifier(std::span<const uint8_t> identifier,
                                          std::shared_ptr<Clock> clock = nullptr);

    /// ムーブ元は以後 get_id() で moved_from を返す
    Flaker(Flaker&&) noexcept = default;
    Flaker& operator=(Flaker&&) noexcept = default;
    Flaker(const Flaker&) = delete;
    Flaker& operator=(const Flaker&) = delete;

    /**
     * @brief 次のIDを生成
     * @return ID、時計の逆行時は clock_is_running_backwards
     *         （Reject ポリシーでの枯渇時は sequence_exhausted、ムーブ元では moved_from）。
     *         失敗時は状態を変更しない。
     */
    Result<FlakeId> get_id();

    /**
     * @brief n件のIDを順に生成
     *
     * 途中で失敗した場合はそのエラーを返す。失敗までに進んだ状態は戻らない。
     */
    Result<std::vector<FlakeId>> get_ids(size_t n);

    /// 格納済み（リトルエンディアン正規化後）の識別子
    const WorkerId& identifier() const noexcept { return identifier_; }
    uint64_t last_generated_time_ms() const noexcept { return last_generated_time_ms_; }
    uint16_t counter() const noexcept { return counter_; }
    SequencePolicy sequence_policy() const noexcept { return policy_; }

private:
    Flaker(const WorkerId& identifier, std::shared_ptr<Clock> clock, SequencePolicy policy);

    std::error_code update();
    FlakeId construct_id() const;

    WorkerId identifier_;
    uint64_t last_generated_time_ms_ = 0;
    uint16_t counter_ = 0;
    SequencePolicy policy_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<utils::Logger> logger_;
};

std::string sequence_policy_to_string(SequencePolicy policy);
Result<SequencePolicy> parse_sequence_policy(std::string_view text);

} // namespace flakelib::flake
