#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

#include "flakelib/expected.hpp"
#include "flakelib/flake/worker_id.hpp"

namespace flakelib::flake {

/// 生成されるID（符号なし128ビット整数）
using FlakeId = boost::multiprecision::uint128_t;

/// IDのリトルエンディアン16バイト表現（[0]が最下位）
using FlakeBytes = std::array<uint8_t, 16>;

inline constexpr std::size_t kFlakeIdSize = 16;

// バイト配置（最下位バイトから）
//   0-1  : シーケンスカウンタ（下位バイト先）
//   2-7  : ワーカー識別子（格納順）
//   8-15 : エポックミリ秒（u64 リトルエンディアン）
// タイムスタンプが最上位に来るため、整数比較が時刻→シーケンス順の比較を兼ねる。
inline constexpr std::size_t kSequenceOffset = 0;
inline constexpr std::size_t kWorkerIdOffset = 2;
inline constexpr std::size_t kTimestampOffset = 8;

/**
 * @brief IDを構成するフィールド
 */
struct FlakeFields {
    uint64_t timestamp_ms = 0;
    WorkerId worker_id{};
    uint16_t sequence = 0;

    bool operator==(const FlakeFields&) const = default;
};

/**
 * @brief フィールドから16バイトバッファを組み立てる
 * @param fields フィールド（worker_id は格納順）
 * @return リトルエンディアン16バイト
 */
FlakeBytes pack_bytes(const FlakeFields& fields);

/**
 * @brief フィールドからIDを組み立てる
 */
FlakeId pack_id(const FlakeFields& fields);

/**
 * @brief IDをフィールドに分解
 */
FlakeFields unpack_id(const FlakeId& id);

FlakeBytes to_bytes_le(const FlakeId& id);
FlakeId from_bytes_le(const FlakeBytes& bytes);

/**
 * @brief 任意長バイト列からIDを復元
 * @param bytes ちょうど16バイトであること
 * @return ID、長さ不正時は invalid_id
 */
Result<FlakeId> decode_id_bytes(std::span<const uint8_t> bytes);

/**
 * @brief 32桁の小文字16進数（ゼロ埋め、接頭辞なし）
 */
std::string to_hex_string(const FlakeId& id);

/**
 * @brief 10進数文字列
 */
std::string to_decimal_string(const FlakeId& id);

/**
 * @brief 10進数または "0x" 接頭辞付き16進数を解析
 * @param text 入力文字列
 * @return ID、空・不正文字・128ビット超過時は invalid_id
 */
Result<FlakeId> parse_id(std::string_view text);

} // namespace flakelib::flake
