// Reconciler tests
//
// Commented and Clean reconciliation, mode detection, clean-payload merge
// and record flags.

#include "anchor/extractor.hpp"
#include "anchor/reconciler.hpp"

#include <gtest/gtest.h>

using namespace vcm;
using namespace vcm::anchor;

namespace {

PersistedCommentSet set_of(const std::string& text, const char* file = "a.py") {
    PersistedCommentSet set;
    set.file = file;
    set.records = extract(text, file_type_for_path(file));
    return set;
}

BlockPayload block_of(std::initializer_list<const char*> lines) {
    CommentClassifier py = CommentClassifier::for_file_type("py");
    BlockPayload block;
    size_t n = 0;
    for (const char* line : lines) {
        auto parts = py.split_comment_line(line);
        block.push_back(BlockLine{parts.indent, parts.marker, parts.text, n++});
    }
    return block;
}

} // namespace

class ReconcilerTest : public ::testing::Test {
protected:
    CommentClassifier py = CommentClassifier::for_file_type("py");
};

// ============================================================================
// Commented mode
// ============================================================================

TEST_F(ReconcilerTest, CommentedTakesTextAndKeepsFlags) {
    auto persisted = set_of("# keep\nx = 1\n# mine\ny = 2\n");
    persisted.records[0].always_visible = true;
    persisted.records[1].is_private = true;

    auto result = reconcile("# keep\nx = 1\n# mine, edited\ny = 2\n# fresh\nz = 3\n", py,
                            persisted, Mode::Commented);

    ASSERT_EQ(result.records.size(), 3u);
    EXPECT_TRUE(result.records[0].always_visible);
    EXPECT_TRUE(result.records[1].is_private);
    EXPECT_EQ(payload_text(result.records[1].payload), "# mine, edited");
    EXPECT_FALSE(result.records[2].is_private);
    EXPECT_FALSE(result.records[2].always_visible);
    EXPECT_EQ(result.file, "a.py");
}

TEST_F(ReconcilerTest, CommentedKeepsFlagsWhenAnchorLineEdited) {
    auto persisted = set_of("# keep\nx = 1\n");
    persisted.records[0].always_visible = true;

    auto result = reconcile("# keep\nx = 2\n", py, persisted, Mode::Commented);

    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_TRUE(result.records[0].always_visible);
    EXPECT_EQ(result.records[0].anchor, fingerprint("x = 2"));
}

TEST_F(ReconcilerTest, CommentedDeletesRemovedComments) {
    auto persisted = set_of("# a\nx = 1\n# b\ny = 2\n");
    auto result = reconcile("# a\nx = 1\ny = 2\n", py, persisted, Mode::Commented);
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(payload_text(result.records[0].payload), "# a");
}

TEST_F(ReconcilerTest, CommentedKeepsHiddenPrivate) {
    auto persisted = set_of("# shared\nx = 1\n# mine\ny = 2\n");
    persisted.records[1].is_private = true;

    ReconcileOptions options;
    options.private_visible = false;
    auto result = reconcile("# shared\nx = 1\ny = 2\n", py, persisted, Mode::Commented, options);

    ASSERT_EQ(result.records.size(), 2u);
    EXPECT_FALSE(result.records[0].is_private);
    EXPECT_TRUE(result.records[1].is_private);
    EXPECT_EQ(payload_text(result.records[1].payload), "# mine");
}

TEST_F(ReconcilerTest, CommentedDropsCleanPayloads) {
    auto persisted = set_of("# a\nx = 1\n");
    persisted.records[0].clean_mode_payload = block_of({"# pending"});

    auto result = reconcile("# a\nx = 1\n", py, persisted, Mode::Commented);
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_FALSE(result.records[0].clean_mode_payload.has_value());
}

TEST_F(ReconcilerTest, ReconcileTwiceIsStable) {
    auto persisted = set_of("# a\nx = 1\ny = 2  # b\n");
    std::string text = "# a\nx = 1\n# c\ny = 2  # b\n";

    auto once = reconcile(text, py, persisted, Mode::Commented);
    auto twice = reconcile(text, py, once, Mode::Commented);
    EXPECT_EQ(once.records, twice.records);
}

// ============================================================================
// Clean mode
// ============================================================================

TEST_F(ReconcilerTest, CleanRoutesNoteIntoHiddenRecord) {
    auto persisted = set_of("def f():\n    # explain\n    return 1\n");

    auto result =
        reconcile("def f():\n    # note\n    return 1\n", py, persisted, Mode::Clean);

    ASSERT_EQ(result.records.size(), 1u);
    const auto& r = result.records[0];
    EXPECT_EQ(payload_text(r.payload), "    # explain");
    ASSERT_TRUE(r.clean_mode_payload.has_value());
    EXPECT_EQ(payload_text(*r.clean_mode_payload), "    # note");
}

TEST_F(ReconcilerTest, CleanCreatesRecordForNewAnchor) {
    auto persisted = set_of("# explain\nx = 1\ny = 2\n");

    auto result = reconcile("x = 1\n# new\ny = 2\n", py, persisted, Mode::Clean);

    ASSERT_EQ(result.records.size(), 2u);
    EXPECT_EQ(payload_text(result.records[0].payload), "# explain");
    EXPECT_FALSE(result.records[0].clean_mode_payload.has_value());

    const auto& added = result.records[1];
    EXPECT_FALSE(added.has_payload());
    EXPECT_TRUE(added.is_block());
    EXPECT_EQ(payload_text(*added.clean_mode_payload), "# new");
    EXPECT_EQ(added.anchor, fingerprint("y = 2"));
}

TEST_F(ReconcilerTest, CleanEditsAlwaysVisibleInPlace) {
    auto persisted = set_of("# keep\nx = 1\n");
    persisted.records[0].always_visible = true;

    auto result = reconcile("# keep it\nx = 1\n", py, persisted, Mode::Clean);

    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_TRUE(result.records[0].always_visible);
    EXPECT_EQ(payload_text(result.records[0].payload), "# keep it");
    EXPECT_FALSE(result.records[0].clean_mode_payload.has_value());
}

TEST_F(ReconcilerTest, CleanDropsDeletedVisibleRecord) {
    auto persisted = set_of("# keep\nx = 1\n# hidden\ny = 2\n");
    persisted.records[0].always_visible = true;

    auto result = reconcile("x = 1\ny = 2\n", py, persisted, Mode::Clean);

    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(payload_text(result.records[0].payload), "# hidden");
}

TEST_F(ReconcilerTest, CleanClearsRemovedNote) {
    auto persisted = set_of("# explain\nx = 1\n");
    persisted.records[0].clean_mode_payload = block_of({"# note"});

    auto result = reconcile("x = 1\n", py, persisted, Mode::Clean);

    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_FALSE(result.records[0].clean_mode_payload.has_value());
}

TEST_F(ReconcilerTest, CleanPrunesEmptyRecords) {
    PersistedCommentSet persisted = set_of("# x\nx = 1\n");
    persisted.records[0].payload = BlockPayload{};
    persisted.records[0].clean_mode_payload = block_of({"# typed"});

    // The note typed in the clean view was deleted again
    auto result = reconcile("x = 1\n", py, persisted, Mode::Clean);
    EXPECT_TRUE(result.records.empty());
}

// ============================================================================
// detect_mode() / detect_private_visible()
// ============================================================================

TEST_F(ReconcilerTest, DetectModeFromPayloadPresence) {
    auto persisted = set_of("# explain\nx = 1\n");
    EXPECT_EQ(detect_mode("# explain\nx = 1\n", py, &persisted), Mode::Commented);
    EXPECT_EQ(detect_mode("x = 1\n", py, &persisted), Mode::Clean);
}

TEST_F(ReconcilerTest, DetectModeWithoutSet) {
    EXPECT_EQ(detect_mode("x = 1\n", py, nullptr), Mode::Clean);
    EXPECT_EQ(detect_mode("# a\nx = 1\n", py, nullptr), Mode::Commented);
    EXPECT_EQ(detect_mode("# a\nx = 1\n", nullptr), Mode::Commented);
}

TEST_F(ReconcilerTest, DetectModeUsesMajority) {
    auto persisted = set_of("# a\nx = 1\n# b\ny = 2\n# c\nz = 3\n");
    EXPECT_EQ(detect_mode("# a\nx = 1\n# b\ny = 2\n# c\nz = 3\n", py, &persisted),
              Mode::Commented);
    EXPECT_EQ(detect_mode("# a\nx = 1\ny = 2\nz = 3\n", py, &persisted), Mode::Clean);
}

TEST_F(ReconcilerTest, DetectModeIgnoresPrivateAndAlwaysVisible) {
    auto persisted = set_of("# keep\nx = 1\n# mine\ny = 2\n# hidden\nz = 3\n");
    persisted.records[0].always_visible = true;
    persisted.records[1].is_private = true;

    EXPECT_EQ(detect_mode("# keep\nx = 1\n# mine\ny = 2\nz = 3\n", py, &persisted), Mode::Clean);
}

TEST_F(ReconcilerTest, DetectPrivateVisible) {
    auto persisted = set_of("# shared\nx = 1\n# mine\ny = 2\n");
    EXPECT_FALSE(detect_private_visible("x = 1\n", persisted).has_value());

    persisted.records[1].is_private = true;
    EXPECT_EQ(detect_private_visible("# shared\nx = 1\n# mine\ny = 2\n", persisted), true);
    EXPECT_EQ(detect_private_visible("# shared\nx = 1\ny = 2\n", persisted), false);
}

// ============================================================================
// merge_clean_mode_payloads()
// ============================================================================

TEST(MergeCleanPayloads, BlockNoteGoesFirst) {
    PersistedCommentSet set;
    CommentRecord r;
    r.payload = block_of({"# old"});
    r.clean_mode_payload = block_of({"# new"});
    set.records.push_back(r);

    auto merged = merge_clean_mode_payloads(set);
    EXPECT_EQ(payload_text(merged.records[0].payload), "# new\n# old");
    EXPECT_FALSE(merged.records[0].clean_mode_payload.has_value());
}

TEST(MergeCleanPayloads, SkipsLinesAlreadyPresent) {
    PersistedCommentSet set;
    CommentRecord r;
    r.payload = block_of({"# old"});
    r.clean_mode_payload = block_of({"  # old  ", "# extra"});
    set.records.push_back(r);

    auto merged = merge_clean_mode_payloads(set);
    EXPECT_EQ(payload_text(merged.records[0].payload), "# extra\n# old");
}

TEST(MergeCleanPayloads, Inline) {
    PersistedCommentSet set;
    CommentRecord a;
    a.payload = InlinePayload("  # a");
    a.clean_mode_payload = InlinePayload("  # b");
    CommentRecord same;
    same.payload = InlinePayload("  # a");
    same.clean_mode_payload = InlinePayload(" # a");
    set.records = {a, same};

    auto merged = merge_clean_mode_payloads(set);
    EXPECT_EQ(merged.records[0].inline_text(), "  # b  # a");
    EXPECT_EQ(merged.records[1].inline_text(), "  # a");
    EXPECT_FALSE(merged.records[1].clean_mode_payload.has_value());
}

// ============================================================================
// mark_record()
// ============================================================================

TEST_F(ReconcilerTest, MarkStartsNewSet) {
    std::string text = "# a\nx = 1  # b\n";
    auto marked = mark_record(text, py, nullptr, "f.py", 1, RecordFlag::Private, true);
    ASSERT_TRUE(is_ok(marked));

    const auto& set = unwrap(marked);
    EXPECT_EQ(set.file, "f.py");
    ASSERT_EQ(set.records.size(), 1u);
    EXPECT_TRUE(set.records[0].is_inline());
    EXPECT_TRUE(set.records[0].is_private);
}

TEST_F(ReconcilerTest, MarkUpdatesStoredRecord) {
    std::string text = "# a\n# a2\nx = 1\n# c\ny = 2\n";
    auto persisted = set_of(text);

    auto marked =
        mark_record(text, py, &persisted, "a.py", 1, RecordFlag::AlwaysVisible, true);
    ASSERT_TRUE(is_ok(marked));
    const auto& set = unwrap(marked);
    ASSERT_EQ(set.records.size(), 2u);
    EXPECT_TRUE(set.records[0].always_visible);
    EXPECT_FALSE(set.records[1].always_visible);

    auto unmarked = mark_record(text, py, &set, "a.py", 0, RecordFlag::AlwaysVisible, false);
    ASSERT_TRUE(is_ok(unmarked));
    EXPECT_FALSE(unwrap(unmarked).records[0].always_visible);
}

TEST_F(ReconcilerTest, MarkLineWithoutComment) {
    auto marked = mark_record("x = 1\n", py, nullptr, "a.py", 0, RecordFlag::Private, true);
    ASSERT_TRUE(is_err(marked));
    EXPECT_NE(unwrap_err(marked).find("line 1"), std::string::npos);
}
