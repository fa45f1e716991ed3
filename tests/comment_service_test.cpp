// Comment service tests
//
// Editor-level flows against a real store in a temporary workspace.

#include "session/comment_service.hpp"
#include "test_support.hpp"

using namespace vcm;
using namespace vcm::session;
using anchor::Mode;
using anchor::RecordFlag;
using vcm::log::LogLevel;

namespace {

constexpr const char* COMMENTED = "def f():\n    # explain\n    return 1\n";
constexpr const char* CLEAN = "def f():\n    return 1\n";

} // namespace

class CommentServiceTest : public vcm::testing::TempWorkspace {
protected:
    std::unique_ptr<CommentService> service;

    void SetUp() override {
        TempWorkspace::SetUp();
        service = std::make_unique<CommentService>(store::CommentStore(root));
    }

    anchor::PersistedCommentSet stored(const std::string& rel) const {
        auto loaded = service->store().load(rel);
        EXPECT_TRUE(is_ok(loaded));
        return is_ok(loaded) ? unwrap(loaded) : anchor::PersistedCommentSet{};
    }

    std::string toggled(const std::string& rel, std::string_view text) {
        auto outcome = service->toggle(rel, text);
        EXPECT_TRUE(is_ok(outcome)) << unwrap_err(outcome).to_string();
        return is_ok(outcome) ? unwrap(outcome).text : std::string();
    }
};

// ============================================================================
// Save
// ============================================================================

TEST_F(CommentServiceTest, FirstSaveStoresComments) {
    auto saved = service->on_save("a.py", COMMENTED);
    ASSERT_TRUE(is_ok(saved));
    EXPECT_TRUE(unwrap(saved).persisted);
    EXPECT_EQ(unwrap(saved).records, 1u);
    EXPECT_EQ(stored("a.py").records.size(), 1u);
}

TEST_F(CommentServiceTest, SaveWithoutCommentsStoresNothing) {
    auto saved = service->on_save("a.py", CLEAN);
    ASSERT_TRUE(is_ok(saved));
    EXPECT_FALSE(unwrap(saved).persisted);
    EXPECT_FALSE(service->store().exists("a.py"));
}

TEST_F(CommentServiceTest, UnchangedSaveIsNotWritten) {
    ASSERT_TRUE(is_ok(service->on_save("a.py", COMMENTED)));
    auto again = service->on_save("a.py", COMMENTED);
    ASSERT_TRUE(is_ok(again));
    EXPECT_FALSE(unwrap(again).persisted);
    EXPECT_EQ(unwrap(again).records, 1u);
}

TEST_F(CommentServiceTest, SaveSkippedWhileSuppressed) {
    auto session = service->sessions().open("a.py");
    {
        SyncSuppressor suppress(*session);
        auto saved = service->on_save("a.py", COMMENTED);
        ASSERT_TRUE(is_ok(saved));
        EXPECT_FALSE(unwrap(saved).persisted);
    }
    EXPECT_FALSE(session->sync_suppressed);
    EXPECT_FALSE(service->store().exists("a.py"));
}

TEST_F(CommentServiceTest, MalformedSetIsReplaced) {
    write(".vcm/shared/a.py.vcm.json", "{ broken");
    vcm::testing::LogCapture capture;

    auto saved = service->on_save("a.py", COMMENTED);
    ASSERT_TRUE(is_ok(saved));
    EXPECT_TRUE(unwrap(saved).persisted);
    EXPECT_TRUE(capture.sink().contains(LogLevel::Warn, "session", "unreadable comment set"));
    EXPECT_EQ(stored("a.py").records.size(), 1u);
}

// ============================================================================
// Toggle
// ============================================================================

TEST_F(CommentServiceTest, ToggleRoundTrip) {
    ASSERT_TRUE(is_ok(service->on_save("a.py", COMMENTED)));

    auto hidden = service->toggle("a.py", COMMENTED);
    ASSERT_TRUE(is_ok(hidden));
    EXPECT_EQ(unwrap(hidden).text, CLEAN);
    EXPECT_EQ(unwrap(hidden).mode, Mode::Clean);

    // The editor saves what we wrote: that echo is ignored
    auto echo = service->on_save("a.py", CLEAN);
    ASSERT_TRUE(is_ok(echo));
    EXPECT_FALSE(unwrap(echo).persisted);
    EXPECT_EQ(stored("a.py").records.size(), 1u);

    auto shown = service->toggle("a.py", CLEAN);
    ASSERT_TRUE(is_ok(shown));
    EXPECT_EQ(unwrap(shown).text, COMMENTED);
    EXPECT_EQ(unwrap(shown).mode, Mode::Commented);
    EXPECT_EQ(unwrap(shown).placed, 1u);
    EXPECT_TRUE(unwrap(shown).orphans.empty());
}

TEST_F(CommentServiceTest, ToggleWithoutDataFails) {
    auto outcome = service->toggle("a.py", CLEAN);
    ASSERT_TRUE(is_err(outcome));
    EXPECT_EQ(unwrap_err(outcome).kind, VcmErrorKind::NoPersistedSet);
    EXPECT_NE(unwrap_err(outcome).message.find("save once while comments are visible"),
              std::string::npos);
}

TEST_F(CommentServiceTest, ToggleBeforeFirstSave) {
    EXPECT_EQ(toggled("a.py", COMMENTED), CLEAN);
    EXPECT_EQ(stored("a.py").records.size(), 1u);
    EXPECT_EQ(toggled("a.py", CLEAN), COMMENTED);
}

TEST_F(CommentServiceTest, FreshSessionDetectsCleanView) {
    ASSERT_TRUE(is_ok(service->on_save("a.py", COMMENTED)));

    // A new editor session opens the file while it is clean
    CommentService other{store::CommentStore(root)};
    auto outcome = other.toggle("a.py", CLEAN);
    ASSERT_TRUE(is_ok(outcome));
    EXPECT_EQ(unwrap(outcome).text, COMMENTED);
}

TEST_F(CommentServiceTest, NoteTypedWhileClean) {
    EXPECT_EQ(toggled("a.py", COMMENTED), CLEAN);

    std::string edited = "def f():\n    # note\n    return 1\n";
    auto saved = service->on_save("a.py", edited);
    ASSERT_TRUE(is_ok(saved));
    EXPECT_TRUE(unwrap(saved).persisted);

    auto status = service->status("a.py", edited);
    ASSERT_TRUE(is_ok(status));
    EXPECT_EQ(unwrap(status).pending_clean, 1u);

    EXPECT_EQ(toggled("a.py", edited), "def f():\n    # note\n    # explain\n    return 1\n");
    EXPECT_FALSE(stored("a.py").records[0].has_clean_mode_payload());
}

TEST_F(CommentServiceTest, OrphansAreReported) {
    ASSERT_TRUE(is_ok(service->on_save("a.py", COMMENTED)));
    EXPECT_EQ(toggled("a.py", COMMENTED), CLEAN);

    vcm::testing::LogCapture capture;
    auto shown = service->toggle("a.py", "def f():\n    return 2\n");
    ASSERT_TRUE(is_ok(shown));
    EXPECT_EQ(unwrap(shown).text, "def f():\n    return 2\n");
    EXPECT_EQ(unwrap(shown).orphans.size(), 1u);
    EXPECT_TRUE(capture.sink().contains(LogLevel::Warn, "session", "could not be re-anchored"));

    // Orphans stay stored for a later match
    EXPECT_EQ(stored("a.py").records.size(), 1u);
}

// ============================================================================
// Private Comments
// ============================================================================

TEST_F(CommentServiceTest, PrivateCommentsHideAndShow) {
    std::string text = "# shared\nx = 1\n# mine\ny = 2\n";
    ASSERT_TRUE(is_ok(service->on_save("a.py", text)));
    ASSERT_TRUE(is_ok(service->mark("a.py", text, 2, RecordFlag::Private, true)));

    auto shared_doc = read(".vcm/shared/a.py.vcm.json");
    EXPECT_EQ(shared_doc.find("# mine"), std::string::npos);
    EXPECT_NE(read(".vcm/private/a.py.vcm.json").find("# mine"), std::string::npos);

    auto hidden = service->set_private_visible("a.py", text, false);
    ASSERT_TRUE(is_ok(hidden));
    EXPECT_EQ(unwrap(hidden).text, "# shared\nx = 1\ny = 2\n");

    auto shown = service->set_private_visible("a.py", unwrap(hidden).text, true);
    ASSERT_TRUE(is_ok(shown));
    EXPECT_EQ(unwrap(shown).text, text);

    auto status = service->status("a.py", text);
    ASSERT_TRUE(is_ok(status));
    EXPECT_TRUE(unwrap(status).private_visible);
    EXPECT_EQ(unwrap(status).shared, 1u);
    EXPECT_EQ(unwrap(status).private_records, 1u);
}

TEST_F(CommentServiceTest, HiddenPrivateSurvivesSave) {
    std::string text = "# shared\nx = 1\n# mine\ny = 2\n";
    ASSERT_TRUE(is_ok(service->on_save("a.py", text)));
    ASSERT_TRUE(is_ok(service->mark("a.py", text, 2, RecordFlag::Private, true)));

    auto hidden = service->set_private_visible("a.py", text, false);
    ASSERT_TRUE(is_ok(hidden));

    std::string edited = "# shared, edited\nx = 1\ny = 2\n";
    ASSERT_TRUE(is_ok(service->on_save("a.py", edited)));
    auto set = stored("a.py");
    ASSERT_EQ(set.records.size(), 2u);
    EXPECT_EQ(set.private_count(), 1u);
}

TEST_F(CommentServiceTest, DuplicateAnchorsKeepOrderAcrossPartitions) {
    // Both comments sit above an identical line with identical neighbours
    std::string text = "y\n# p\nx\ny\n# s\nx\ny\n";
    ASSERT_TRUE(is_ok(service->on_save("a.py", text)));
    ASSERT_TRUE(is_ok(service->mark("a.py", text, 1, RecordFlag::Private, true)));

    auto set = stored("a.py");
    ASSERT_EQ(set.records.size(), 2u);
    EXPECT_TRUE(set.records[0].is_private);
    EXPECT_LT(set.records[0].original_line, set.records[1].original_line);

    auto again = service->on_save("a.py", text);
    ASSERT_TRUE(is_ok(again));
    EXPECT_FALSE(unwrap(again).persisted);

    auto clean = toggled("a.py", text);
    EXPECT_EQ(clean, "y\n# p\nx\ny\nx\ny\n");
    EXPECT_EQ(toggled("a.py", clean), text);
}

TEST_F(CommentServiceTest, PrivateVisibilityWithoutPrivateRecords) {
    ASSERT_TRUE(is_ok(service->on_save("a.py", COMMENTED)));
    auto outcome = service->set_private_visible("a.py", COMMENTED, true);
    ASSERT_TRUE(is_ok(outcome));
    EXPECT_EQ(unwrap(outcome).text, COMMENTED);
    EXPECT_TRUE(service->sessions().find("a.py")->private_visible);
}

// ============================================================================
// Flags, Status and Forget
// ============================================================================

TEST_F(CommentServiceTest, AlwaysVisibleStaysInCleanView) {
    std::string text = "# License: MIT\nimport os\n# why\nx = os.sep\n";
    ASSERT_TRUE(is_ok(service->mark("a.py", text, 0, RecordFlag::AlwaysVisible, true)));

    EXPECT_EQ(toggled("a.py", text), "# License: MIT\nimport os\nx = os.sep\n");
    EXPECT_EQ(toggled("a.py", "# License: MIT\nimport os\nx = os.sep\n"), text);

    auto status = service->status("a.py", text);
    ASSERT_TRUE(is_ok(status));
    EXPECT_EQ(unwrap(status).always_visible, 1u);
}

TEST_F(CommentServiceTest, MarkLineWithoutComment) {
    auto marked = service->mark("a.py", CLEAN, 0, RecordFlag::Private, true);
    ASSERT_TRUE(is_err(marked));
    EXPECT_EQ(unwrap_err(marked).kind, VcmErrorKind::CommentNotFound);
    EXPECT_NE(unwrap_err(marked).message.find("line 1"), std::string::npos);
}

TEST_F(CommentServiceTest, StatusWithoutData) {
    auto status = service->status("a.py", COMMENTED);
    ASSERT_TRUE(is_ok(status));
    EXPECT_FALSE(unwrap(status).stored);
    EXPECT_EQ(unwrap(status).mode, Mode::Commented);
    EXPECT_EQ(unwrap(status).shared, 0u);
}

TEST_F(CommentServiceTest, Forget) {
    ASSERT_TRUE(is_ok(service->on_save("a.py", COMMENTED)));
    EXPECT_EQ(service->sessions().size(), 1u);

    auto forgotten = service->forget("a.py");
    ASSERT_TRUE(is_ok(forgotten));
    EXPECT_TRUE(unwrap(forgotten));
    EXPECT_FALSE(service->store().exists("a.py"));
    EXPECT_EQ(service->sessions().size(), 0u);

    auto again = service->forget("a.py");
    ASSERT_TRUE(is_ok(again));
    EXPECT_FALSE(unwrap(again));
}

// ============================================================================
// SessionRegistry
// ============================================================================

TEST(SessionRegistryTest, OpenFindClose) {
    SessionRegistry registry(true);
    EXPECT_EQ(registry.find("a.py"), nullptr);

    auto session = registry.open("a.py");
    EXPECT_EQ(registry.open("a.py"), session);
    EXPECT_EQ(registry.find("a.py"), session);
    EXPECT_TRUE(session->private_visible);
    EXPECT_FALSE(session->mode.has_value());
    EXPECT_EQ(registry.size(), 1u);

    EXPECT_TRUE(registry.close("a.py"));
    EXPECT_FALSE(registry.close("a.py"));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(SessionRegistryTest, SuppressorRestoresPreviousValue) {
    DocumentSession session("a.py", false);
    {
        SyncSuppressor outer(session);
        {
            SyncSuppressor inner(session);
        }
        EXPECT_TRUE(session.sync_suppressed);
    }
    EXPECT_FALSE(session.sync_suppressed);
}

TEST(VcmErrorTest, ToStringNamesKind) {
    auto error = VcmError::make(VcmErrorKind::AnchorNotFound, "gone");
    EXPECT_NE(error.to_string().find("gone"), std::string::npos);
    EXPECT_NE(error.to_string().find(error_kind_name(VcmErrorKind::AnchorNotFound)),
              std::string::npos);
}
