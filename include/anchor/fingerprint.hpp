//! # Line Fingerprints
//!
//! 32-bit CRC32C digests of trimmed line content. Anchors key comments to
//! what a line says, not where it is, so a fingerprint carries no position
//! and ignores indentation. Identical lines collide by construction; the
//! injector separates them with context fingerprints.
//!
//! Uses CRC32C (Castagnoli) from `common/crc32c.hpp`.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vcm::anchor {

/// Digest of one trimmed line.
///
/// The default value is the zero line: the fingerprint of an empty or
/// all-whitespace line, also used as the anchor of comments in a file that
/// has no code at all.
struct LineFingerprint {
    uint32_t value = 0;

    bool operator==(const LineFingerprint& other) const = default;
    bool operator!=(const LineFingerprint& other) const = default;

    [[nodiscard]] bool is_zero() const {
        return value == 0;
    }

    /// 8 lowercase hex digits, the on-disk form.
    [[nodiscard]] std::string to_hex() const;

    /// Parses exactly 8 hex digits (either case). Anything else is nullopt.
    [[nodiscard]] static std::optional<LineFingerprint> from_hex(std::string_view hex);
};

/// Hasher for unordered containers keyed by fingerprint.
struct LineFingerprintHash {
    size_t operator()(const LineFingerprint& fp) const noexcept {
        return static_cast<size_t>(fp.value);
    }
};

/// Fingerprint of `line` with surrounding whitespace removed.
[[nodiscard]] LineFingerprint fingerprint(std::string_view line);

} // namespace vcm::anchor
