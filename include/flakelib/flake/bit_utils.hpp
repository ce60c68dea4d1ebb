#pragma once

#include <array>
#include <cstdint>
#include <span>

#include <boost/multiprecision/cpp_int.hpp>

namespace flakelib::flake {

/**
 * @brief 16ビット値をリトルエンディアンで読み込み
 * @param data データポインタ
 * @return 16ビット値
 */
uint16_t read_le16(const uint8_t* data);

/**
 * @brief 64ビット値をリトルエンディアンで読み込み
 * @param data データポインタ
 * @return 64ビット値
 */
uint64_t read_le64(const uint8_t* data);

/**
 * @brief 16ビット値をリトルエンディアンで書き込み
 * @param data データポインタ
 * @param value 書き込む値
 */
void write_le16(uint8_t* data, uint16_t value);

/**
 * @brief 64ビット値をリトルエンディアンで書き込み
 * @param data データポインタ
 * @param value 書き込む値
 */
void write_le64(uint8_t* data, uint64_t value);

/**
 * @brief 16バイトをリトルエンディアンの128ビット整数として解釈
 * @param data 16バイト（data[0]が最下位）
 * @return 128ビット値
 */
boost::multiprecision::uint128_t load_le128(std::span<const uint8_t, 16> data);

/**
 * @brief 128ビット整数を16バイトのリトルエンディアン列に展開
 * @param value 128ビット値
 * @return 16バイト（[0]が最下位）
 */
std::array<uint8_t, 16> store_le128(const boost::multiprecision::uint128_t& value);

/**
 * @brief バイト列の順序を反転
 * @param data 対象バイト列
 */
void reverse_bytes(std::span<uint8_t> data);

} // namespace flakelib::flake
