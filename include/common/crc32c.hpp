//! # CRC32C
//!
//! Castagnoli CRC32C over a byte range. Line fingerprints are CRC32C
//! digests of trimmed line content, so the function has to stay stable
//! across releases: stored anchors depend on it.
//!
//! ```cpp
//! uint32_t h = vcm::crc32c(std::string_view{"return 1"});
//! ```

#ifndef VCM_COMMON_CRC32C_HPP
#define VCM_COMMON_CRC32C_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace vcm {

// ============================================================================
// Lookup Table (Castagnoli polynomial 0x1EDC6F41, reflected 0x82F63B78)
// ============================================================================

namespace detail {

struct Crc32cTable {
    uint32_t entries[256];
};

constexpr Crc32cTable make_crc32c_table() {
    Crc32cTable table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 1) ? (crc >> 1) ^ 0x82F63B78u : crc >> 1;
        }
        table.entries[i] = crc;
    }
    return table;
}

} // namespace detail

inline constexpr detail::Crc32cTable CRC32C_TABLE = detail::make_crc32c_table();

static_assert(CRC32C_TABLE.entries[1] == 0xF26B8303u);
static_assert(CRC32C_TABLE.entries[128] == 0x82F63B78u);

/// CRC32C of `len` bytes at `data`. The empty range hashes to 0.
[[nodiscard]] inline uint32_t crc32c(const void* data, size_t len) noexcept {
    const auto* bytes = static_cast<const uint8_t*>(data);
    uint32_t crc = 0xFFFFFFFF;
    for (size_t i = 0; i < len; ++i) {
        crc = CRC32C_TABLE.entries[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

[[nodiscard]] inline uint32_t crc32c(std::string_view str) noexcept {
    return crc32c(str.data(), str.size());
}

} // namespace vcm

#endif // VCM_COMMON_CRC32C_HPP
