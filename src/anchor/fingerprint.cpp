#include "anchor/fingerprint.hpp"

#include "anchor/lines.hpp"
#include "common/crc32c.hpp"

namespace vcm::anchor {

std::string LineFingerprint::to_hex() const {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out(8, '0');
    uint32_t v = value;
    for (int i = 7; i >= 0; --i) {
        out[static_cast<size_t>(i)] = HEX[v & 0xF];
        v >>= 4;
    }
    return out;
}

std::optional<LineFingerprint> LineFingerprint::from_hex(std::string_view hex) {
    if (hex.size() != 8) {
        return std::nullopt;
    }
    uint32_t v = 0;
    for (char c : hex) {
        uint32_t digit;
        if (c >= '0' && c <= '9') {
            digit = static_cast<uint32_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            digit = static_cast<uint32_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            digit = static_cast<uint32_t>(c - 'A' + 10);
        } else {
            return std::nullopt;
        }
        v = (v << 4) | digit;
    }
    return LineFingerprint{v};
}

LineFingerprint fingerprint(std::string_view line) {
    return LineFingerprint{vcm::crc32c(trim(line))};
}

} // namespace vcm::anchor
