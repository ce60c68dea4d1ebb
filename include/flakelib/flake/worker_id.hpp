#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "flakelib/expected.hpp"

namespace flakelib::flake {

/// ワーカー識別子のバイト長（48ビット）
inline constexpr std::size_t kWorkerIdSize = 6;

/// ワーカー識別子（6バイト固定）
using WorkerId = std::array<uint8_t, kWorkerIdSize>;

/**
 * @brief 識別子バイト列の並び順
 *
 * Big で渡された識別子は格納時に反転され、内部では常にリトルエンディアンとして扱う。
 */
enum class Endianness {
    Little,
    Big
};

/**
 * @brief ワーカー識別子文字列を解析
 * @param text "aa:bb:cc:dd:ee:ff" / "aa-bb-cc-dd-ee-ff" / 12桁の16進数
 * @return 記述順のバイト列、形式不正時は invalid_identifier
 */
Result<WorkerId> parse_worker_id(std::string_view text);

/**
 * @brief ワーカー識別子を "aa:bb:cc:dd:ee:ff" 形式に整形
 */
std::string format_worker_id(const WorkerId& id);

/**
 * @brief エンディアン指定文字列を解析（"little"/"le"/"big"/"be"、大文字小文字無視）
 */
Result<Endianness> parse_endianness(std::string_view text);

std::string endianness_to_string(Endianness endianness);

} // namespace flakelib::flake
