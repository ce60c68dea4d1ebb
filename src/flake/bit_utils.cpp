#include "flakelib/flake/bit_utils.hpp"
#include <algorithm>

namespace flakelib::flake {

using boost::multiprecision::uint128_t;

uint16_t read_le16(const uint8_t* data) {
    return static_cast<uint16_t>(data[0]) | (static_cast<uint16_t>(data[1]) << 8);
}

uint64_t read_le64(const uint8_t* data) {
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | static_cast<uint64_t>(data[i]);
    }
    return value;
}

void write_le16(uint8_t* data, uint16_t value) {
    data[0] = static_cast<uint8_t>(value & 0xFF);
    data[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

void write_le64(uint8_t* data, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        data[i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
}

uint128_t load_le128(std::span<const uint8_t, 16> data) {
    uint128_t bits = 0;
    for (size_t i = 0; i < 16; ++i) {
        bits |= static_cast<uint128_t>(data[i]) << (i * 8);
    }
    return bits;
}

std::array<uint8_t, 16> store_le128(const uint128_t& value) {
    std::array<uint8_t, 16> bytes{};
    for (size_t i = 0; i < 16; ++i) {
        // 範囲外変換は飽和するので先にマスクする
        bytes[i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
    return bytes;
}

void reverse_bytes(std::span<uint8_t> data) {
    std::reverse(data.begin(), data.end());
}

} // namespace flakelib::flake
