#include "flakelib/flake/worker_id.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

#include "flakelib/error.hpp"

namespace flakelib::flake {

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Result<WorkerId> parse_worker_id(std::string_view text) {
    // 区切り文字なし（12桁）か、2桁ごとに ':' または '-' で区切られた形式
    bool separated = text.size() == kWorkerIdSize * 3 - 1;
    if (!separated && text.size() != kWorkerIdSize * 2) {
        return make_error_code(FlakeErrc::invalid_identifier);
    }
    char sep = separated ? text[2] : '\0';
    if (separated && sep != ':' && sep != '-') {
        return make_error_code(FlakeErrc::invalid_identifier);
    }

    WorkerId id{};
    size_t pos = 0;
    for (size_t i = 0; i < kWorkerIdSize; ++i) {
        if (separated && i > 0) {
            if (text[pos] != sep) return make_error_code(FlakeErrc::invalid_identifier);
            ++pos;
        }
        int hi = hex_value(text[pos]);
        int lo = hex_value(text[pos + 1]);
        if (hi < 0 || lo < 0) return make_error_code(FlakeErrc::invalid_identifier);
        id[i] = static_cast<uint8_t>((hi << 4) | lo);
        pos += 2;
    }
    return id;
}

std::string format_worker_id(const WorkerId& id) {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < id.size(); ++i) {
        if (i > 0) ss << ':';
        ss << std::setw(2) << static_cast<unsigned>(id[i]);
    }
    return ss.str();
}

Result<Endianness> parse_endianness(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "little" || lower == "le") return Endianness::Little;
    if (lower == "big" || lower == "be") return Endianness::Big;
    return make_error_code(FlakeErrc::invalid_config);
}

std::string endianness_to_string(Endianness endianness) {
    return endianness == Endianness::Big ? "big" : "little";
}

} // namespace flakelib::flake
