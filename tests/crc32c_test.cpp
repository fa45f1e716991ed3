// CRC32C and line fingerprint tests
//
// The checksum under every anchor, and the fingerprint built on it.

#include "anchor/fingerprint.hpp"
#include "common/crc32c.hpp"

#include <gtest/gtest.h>

using namespace vcm;
using anchor::fingerprint;
using anchor::LineFingerprint;

// ============================================================================
// crc32c()
// ============================================================================

TEST(Crc32c, StandardCheckValue) {
    EXPECT_EQ(crc32c(std::string_view{"123456789"}), 0xE3069283u);
}

TEST(Crc32c, EmptyInputIsZero) {
    EXPECT_EQ(crc32c(std::string_view{}), 0u);
}

TEST(Crc32c, PointerAndViewAgree) {
    std::string s = "return 1";
    EXPECT_EQ(crc32c(s.data(), s.size()), crc32c(std::string_view{s}));
}

// ============================================================================
// fingerprint()
// ============================================================================

TEST(LineFingerprint, IgnoresSurroundingWhitespace) {
    EXPECT_EQ(fingerprint("return 1"), fingerprint("    return 1"));
    EXPECT_EQ(fingerprint("return 1"), fingerprint("\treturn 1  \r"));
}

TEST(LineFingerprint, InnerWhitespaceMatters) {
    EXPECT_NE(fingerprint("x = 1"), fingerprint("x  = 1"));
}

TEST(LineFingerprint, BlankLineIsZero) {
    EXPECT_TRUE(fingerprint("").is_zero());
    EXPECT_TRUE(fingerprint("   \t ").is_zero());
    EXPECT_FALSE(fingerprint("x").is_zero());
}

TEST(LineFingerprint, HexRoundTrip) {
    auto fp = fingerprint("def f():");
    auto hex = fp.to_hex();
    EXPECT_EQ(hex.size(), 8u);

    auto parsed = LineFingerprint::from_hex(hex);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, fp);
}

TEST(LineFingerprint, HexFormat) {
    EXPECT_EQ(LineFingerprint{0}.to_hex(), "00000000");
    EXPECT_EQ(LineFingerprint{0xE3069283u}.to_hex(), "e3069283");
    EXPECT_EQ(LineFingerprint::from_hex("E3069283")->value, 0xE3069283u);
}

TEST(LineFingerprint, RejectsBadHex) {
    EXPECT_FALSE(LineFingerprint::from_hex("1234567").has_value());
    EXPECT_FALSE(LineFingerprint::from_hex("123456789").has_value());
    EXPECT_FALSE(LineFingerprint::from_hex("1234567g").has_value());
}
