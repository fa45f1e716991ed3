// Scenario tests
//
// Whole edit sessions run through the pure engine: hide, edit, show again.

#include "anchor/extractor.hpp"
#include "anchor/injector.hpp"
#include "anchor/reconciler.hpp"
#include "anchor/stripper.hpp"

#include <gtest/gtest.h>

using namespace vcm::anchor;

namespace {

PersistedCommentSet persist_text(const std::string& text) {
    PersistedCommentSet set;
    set.file = "src/a.py";
    set.records = extract(text, "py");
    return set;
}

/// Clean text back to Commented the way a toggle does it.
InjectResult show(const std::string& clean_text, const PersistedCommentSet& persisted,
                  bool private_visible = false) {
    auto classifier = CommentClassifier::for_file_type("py");
    ReconcileOptions options{private_visible};
    auto reconciled = merge_clean_mode_payloads(
        reconcile(clean_text, classifier, persisted, Mode::Clean, options));
    auto base = strip(clean_text, classifier, reconciled.records, {});
    InjectOptions inject_options;
    inject_options.include_private = private_visible;
    inject_options.classifier = &classifier;
    return inject(base, reconciled.records, inject_options);
}

} // namespace

TEST(Scenario, HideAndShow) {
    std::string text = "def f():\n    # explain\n    return 1\n";
    auto persisted = persist_text(text);

    auto clean = strip(text, "py", persisted.records, false);
    EXPECT_EQ(clean, "def f():\n    return 1\n");
    EXPECT_EQ(detect_mode(clean, &persisted), Mode::Clean);

    auto shown = show(clean, persisted);
    EXPECT_EQ(shown.text, text);
    EXPECT_TRUE(shown.orphans.empty());
    EXPECT_EQ(detect_mode(shown.text, &persisted), Mode::Commented);
}

TEST(Scenario, DuplicateLinesKeepTheirComments) {
    std::string text = "a = 0\n# first\nx = 1\nb = 0\n# second\nx = 1\n";
    auto persisted = persist_text(text);

    auto clean = strip(text, "py", persisted.records, false);
    EXPECT_EQ(clean, "a = 0\nx = 1\nb = 0\nx = 1\n");
    EXPECT_EQ(show(clean, persisted).text, text);
}

TEST(Scenario, NoteTypedWhileCleanComesFirst) {
    auto persisted = persist_text("def f():\n    # explain\n    return 1\n");

    // Saved while clean: the note is collected, the payload untouched
    std::string edited = "def f():\n    # note\n    return 1\n";
    auto saved = reconcile(edited, "py", persisted, Mode::Clean);
    ASSERT_EQ(saved.records.size(), 1u);
    EXPECT_EQ(payload_text(saved.records[0].payload), "    # explain");

    auto shown = show(edited, saved);
    EXPECT_EQ(shown.text, "def f():\n    # note\n    # explain\n    return 1\n");
}

TEST(Scenario, CodeMovedWhileClean) {
    auto persisted = persist_text("# explain\nx = 1\ny = 2\n");

    auto shown = show("z = 0\ny = 2\nx = 1\n", persisted);
    EXPECT_EQ(shown.text, "z = 0\ny = 2\n# explain\nx = 1\n");
    EXPECT_EQ(shown.placed, 1u);
}

TEST(Scenario, AnchorDeletedWhileClean) {
    auto persisted = persist_text("# explain\nx = 1\ny = 2\n");

    auto shown = show("y = 2\n", persisted);
    EXPECT_EQ(shown.text, "y = 2\n");
    ASSERT_EQ(shown.orphans.size(), 1u);
    EXPECT_EQ(payload_text(shown.orphans[0].payload), "# explain");
}

TEST(Scenario, PrivateCommentsStayOutOfSharedView) {
    std::string text = "# shared\nx = 1\n# mine\ny = 2\n";
    auto persisted = persist_text(text);
    persisted.records[1].is_private = true;

    auto clean = strip(text, "py", persisted.records, false);
    EXPECT_EQ(clean, "x = 1\ny = 2\n");

    EXPECT_EQ(show(clean, persisted, false).text, "# shared\nx = 1\ny = 2\n");
    EXPECT_EQ(show(clean, persisted, true).text, text);

    ASSERT_EQ(persisted.shared_records().size(), 1u);
    ASSERT_EQ(persisted.private_records().size(), 1u);
    EXPECT_EQ(payload_text(persisted.private_records()[0].payload), "# mine");
}

TEST(Scenario, AlwaysVisibleSurvivesHiding) {
    std::string text = "# License: MIT\nimport os\n# why\nx = os.sep\n";
    auto persisted = persist_text(text);
    persisted.records[0].always_visible = true;

    auto clean = strip(text, "py", persisted.records, false);
    EXPECT_EQ(clean, "# License: MIT\nimport os\nx = os.sep\n");
    EXPECT_EQ(show(clean, persisted).text, text);
}

TEST(Scenario, StripIsIdempotent) {
    std::string text = "# a\n\nx = 1  # b\n# c\ny = 2\n";
    auto persisted = persist_text(text);
    auto once = strip(text, "py", persisted.records, false);
    EXPECT_EQ(strip(once, "py", persisted.records, false), once);
}
