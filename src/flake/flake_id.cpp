#include "flakelib/flake/flake_id.hpp"

#include <algorithm>
#include <limits>

#include "flakelib/error.hpp"
#include "flakelib/flake/bit_utils.hpp"

namespace flakelib::flake {

FlakeBytes pack_bytes(const FlakeFields& fields) {
    FlakeBytes bytes{};
    write_le16(bytes.data() + kSequenceOffset, fields.sequence);
    std::copy(fields.worker_id.begin(), fields.worker_id.end(), bytes.begin() + kWorkerIdOffset);
    write_le64(bytes.data() + kTimestampOffset, fields.timestamp_ms);
    return bytes;
}

FlakeId pack_id(const FlakeFields& fields) {
    return from_bytes_le(pack_bytes(fields));
}

FlakeFields unpack_id(const FlakeId& id) {
    FlakeBytes bytes = to_bytes_le(id);
    FlakeFields fields;
    fields.sequence = read_le16(bytes.data() + kSequenceOffset);
    std::copy_n(bytes.begin() + kWorkerIdOffset, kWorkerIdSize, fields.worker_id.begin());
    fields.timestamp_ms = read_le64(bytes.data() + kTimestampOffset);
    return fields;
}

FlakeBytes to_bytes_le(const FlakeId& id) {
    return store_le128(id);
}

FlakeId from_bytes_le(const FlakeBytes& bytes) {
    return load_le128(std::span<const uint8_t, 16>(bytes));
}

Result<FlakeId> decode_id_bytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != kFlakeIdSize) {
        return make_error_code(FlakeErrc::invalid_id);
    }
    return load_le128(bytes.first<16>());
}

std::string to_hex_string(const FlakeId& id) {
    static const char digits[] = "0123456789abcdef";
    FlakeBytes bytes = to_bytes_le(id);
    std::string out;
    out.reserve(kFlakeIdSize * 2);
    for (size_t i = kFlakeIdSize; i-- > 0;) {
        out += digits[bytes[i] >> 4];
        out += digits[bytes[i] & 0x0F];
    }
    return out;
}

std::string to_decimal_string(const FlakeId& id) {
    return id.str();
}

Result<FlakeId> parse_id(std::string_view text) {
    unsigned base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base = 16;
        text.remove_prefix(2);
    }
    if (text.empty()) {
        return make_error_code(FlakeErrc::invalid_id);
    }

    const FlakeId max_value = std::numeric_limits<FlakeId>::max();
    FlakeId value = 0;
    for (char c : text) {
        unsigned digit;
        if (c >= '0' && c <= '9') digit = static_cast<unsigned>(c - '0');
        else if (base == 16 && c >= 'a' && c <= 'f') digit = static_cast<unsigned>(c - 'a' + 10);
        else if (base == 16 && c >= 'A' && c <= 'F') digit = static_cast<unsigned>(c - 'A' + 10);
        else return make_error_code(FlakeErrc::invalid_id);

        // value * base + digit が 2^128-1 を超えないこと
        if (value > (max_value - digit) / base) {
            return make_error_code(FlakeErrc::invalid_id);
        }
        value = value * base + digit;
    }
    return value;
}

} // namespace flakelib::flake
