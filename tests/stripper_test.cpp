// Stripper tests
//
// Which comments leave the text, and that nothing else changes.

#include "anchor/extractor.hpp"
#include "anchor/stripper.hpp"

#include <gtest/gtest.h>

using namespace vcm::anchor;

class StripperTest : public ::testing::Test {
protected:
    CommentClassifier py = CommentClassifier::for_file_type("py");

    // Three blocks and one inline comment
    std::string text = "# keep\nx = 1\n# mine\ny = 2  # tail\n# shared\nz = 3\n";
    std::vector<CommentRecord> stored = extract(text, "py");

    void SetUp() override {
        ASSERT_EQ(stored.size(), 4u);
        stored[0].always_visible = true;
        stored[1].is_private = true;
    }
};

TEST_F(StripperTest, WithoutStoredSetEverythingGoes) {
    EXPECT_EQ(strip(text, py, {}), "x = 1\ny = 2\nz = 3\n");
}

TEST_F(StripperTest, KeepsAlwaysVisible) {
    EXPECT_EQ(strip(text, py, stored), "# keep\nx = 1\ny = 2\nz = 3\n");
}

TEST_F(StripperTest, KeepPrivate) {
    StripOptions options;
    options.keep_private = true;
    EXPECT_EQ(strip(text, py, stored, options), "# keep\nx = 1\n# mine\ny = 2\nz = 3\n");
}

TEST_F(StripperTest, PrivateOnlyScope) {
    StripOptions options;
    options.scope = StripScope::PrivateOnly;
    EXPECT_EQ(strip(text, py, stored, options),
              "# keep\nx = 1\ny = 2  # tail\n# shared\nz = 3\n");
}

TEST_F(StripperTest, UnknownCommentsAreRemoved) {
    std::string edited = "# keep\n# added\nx = 1\n";
    // The edited block differs in text but keeps the always-visible anchor
    EXPECT_EQ(strip(edited, py, stored), "# keep\n# added\nx = 1\n");
    EXPECT_EQ(strip("w = 0  # new\n", py, stored), "w = 0\n");
}

TEST_F(StripperTest, Idempotent) {
    auto once = strip(text, py, stored);
    EXPECT_EQ(strip(once, py, stored), once);
}

TEST(Stripper, SpacersGoWithTheirBlock) {
    std::string text = "a = 1\n\n# one\n\n# two\n\nb = 2\n";
    EXPECT_EQ(strip(text, "py", {}, false), "a = 1\n\n\nb = 2\n");
}

TEST(Stripper, KeepsStringsWithMarkers) {
    std::string text = "s = \"# not a comment\"\n";
    EXPECT_EQ(strip(text, "py", {}, false), text);
}

TEST(Stripper, CommentOnlyFile) {
    EXPECT_EQ(strip("# a\n# b\n", "py", {}, false), "");
}
