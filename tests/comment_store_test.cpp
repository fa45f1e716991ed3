// Comment store tests
//
// Partition layout, split and join of private records, atomic writes and
// error reporting.

#include "anchor/extractor.hpp"
#include "store/comment_store.hpp"
#include "test_support.hpp"

#include <regex>

using namespace vcm;
using namespace vcm::anchor;
using namespace vcm::store;

class CommentStoreTest : public vcm::testing::TempWorkspace {
protected:
    PersistedCommentSet make_set(const std::string& rel, bool second_private) const {
        PersistedCommentSet set;
        set.file = rel;
        set.records = extract("# shared\nx = 1\n# mine\ny = 2\n", "py");
        set.records[1].is_private = second_private;
        return set;
    }
};

TEST_F(CommentStoreTest, PartitionPaths) {
    CommentStore store(root);
    EXPECT_EQ(store.storage_root(), root / ".vcm");
    EXPECT_EQ(store.shared_path("src/a.py"), root / ".vcm" / "shared" / "src" / "a.py.vcm.json");
    EXPECT_EQ(store.private_path("src/a.py"),
              root / ".vcm" / "private" / "src" / "a.py.vcm.json");

    CommentStore custom(root, "notes");
    EXPECT_EQ(custom.shared_path("a.py"), root / "notes" / "shared" / "a.py.vcm.json");
}

TEST_F(CommentStoreTest, RelativePath) {
    CommentStore store(root);
    EXPECT_EQ(store.relative_path(root / "src" / "a.py"), "src/a.py");
    EXPECT_EQ(store.relative_path(root / "src" / ".." / "b.py"), "b.py");

    auto outside = root.parent_path() / "elsewhere.py";
    EXPECT_EQ(store.relative_path(outside), outside.generic_string());
}

TEST_F(CommentStoreTest, MissingSetIsNotFound) {
    CommentStore store(root);
    EXPECT_FALSE(store.exists("a.py"));
    auto loaded = store.load("a.py");
    ASSERT_TRUE(is_err(loaded));
    EXPECT_EQ(unwrap_err(loaded).kind, StoreErrorKind::NotFound);
}

TEST_F(CommentStoreTest, SaveSplitsAndLoadJoins) {
    CommentStore store(root);
    auto set = make_set("src/a.py", true);
    ASSERT_TRUE(is_ok(store.save(set)));
    EXPECT_FALSE(set.last_modified.empty());

    auto shared_doc = read(".vcm/shared/src/a.py.vcm.json");
    auto private_doc = read(".vcm/private/src/a.py.vcm.json");
    EXPECT_NE(shared_doc.find("# shared"), std::string::npos);
    EXPECT_EQ(shared_doc.find("# mine"), std::string::npos);
    EXPECT_NE(private_doc.find("# mine"), std::string::npos);
    EXPECT_EQ(private_doc.find("# shared"), std::string::npos);

    auto loaded = store.load("src/a.py");
    ASSERT_TRUE(is_ok(loaded));
    const auto& back = unwrap(loaded);
    EXPECT_EQ(back.file, "src/a.py");
    EXPECT_EQ(back.records, set.records);
    EXPECT_EQ(back.last_modified, set.last_modified);
}

TEST_F(CommentStoreTest, PrivateFileOnlyWhenNeeded) {
    CommentStore store(root);
    auto set = make_set("a.py", false);
    ASSERT_TRUE(is_ok(store.save(set)));
    EXPECT_TRUE(fs::exists(store.shared_path("a.py")));
    EXPECT_FALSE(fs::exists(store.private_path("a.py")));

    // Once written, the private partition is kept up to date even when empty
    set.records[1].is_private = true;
    ASSERT_TRUE(is_ok(store.save(set)));
    set.records.pop_back();
    ASSERT_TRUE(is_ok(store.save(set)));
    ASSERT_TRUE(fs::exists(store.private_path("a.py")));
    EXPECT_EQ(read(".vcm/private/a.py.vcm.json").find("# mine"), std::string::npos);

    auto loaded = store.load("a.py");
    ASSERT_TRUE(is_ok(loaded));
    EXPECT_EQ(unwrap(loaded).records.size(), 1u);
}

TEST_F(CommentStoreTest, DocumentFormat) {
    CommentStore store(root);
    auto set = make_set("a.py", false);
    ASSERT_TRUE(is_ok(store.save(set)));

    auto doc = read(".vcm/shared/a.py.vcm.json");
    EXPECT_EQ(doc.back(), '\n');
    EXPECT_NE(doc.find("\"file\": \"a.py\""), std::string::npos);
    EXPECT_NE(doc.find("\"comments\": ["), std::string::npos);
    EXPECT_EQ(doc.find("isPrivate"), std::string::npos);
    EXPECT_TRUE(std::regex_match(set.last_modified,
                                 std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)")));
    EXPECT_FALSE(fs::exists(root / ".vcm" / "shared" / "a.py.vcm.json.tmp"));
}

TEST_F(CommentStoreTest, MalformedPartition) {
    write(".vcm/shared/a.py.vcm.json", "{ not json");
    CommentStore store(root);
    EXPECT_TRUE(store.exists("a.py"));

    auto loaded = store.load("a.py");
    ASSERT_TRUE(is_err(loaded));
    EXPECT_EQ(unwrap_err(loaded).kind, StoreErrorKind::Malformed);
    EXPECT_NE(unwrap_err(loaded).to_string().find("malformed"), std::string::npos);
}

TEST_F(CommentStoreTest, PrivateOnlySetLoads) {
    CommentStore store(root);
    auto set = make_set("a.py", true);
    set.records.erase(set.records.begin());
    ASSERT_TRUE(is_ok(store.save(set)));

    // The shared partition is always written, here with no records
    fs::remove(store.shared_path("a.py"));
    auto loaded = store.load("a.py");
    ASSERT_TRUE(is_ok(loaded));
    ASSERT_EQ(unwrap(loaded).records.size(), 1u);
    EXPECT_TRUE(unwrap(loaded).records[0].is_private);
}

TEST_F(CommentStoreTest, Remove) {
    CommentStore store(root);
    auto set = make_set("a.py", true);
    ASSERT_TRUE(is_ok(store.save(set)));

    auto removed = store.remove("a.py");
    ASSERT_TRUE(is_ok(removed));
    EXPECT_TRUE(unwrap(removed));
    EXPECT_FALSE(store.exists("a.py"));

    auto again = store.remove("a.py");
    ASSERT_TRUE(is_ok(again));
    EXPECT_FALSE(unwrap(again));
}

TEST_F(CommentStoreTest, AtomicWriteReplacesContent) {
    auto path = root / "deep" / "dir" / "file.txt";
    ASSERT_TRUE(is_ok(write_file_atomic(path, "first")));
    ASSERT_TRUE(is_ok(write_file_atomic(path, "second")));
    EXPECT_EQ(slurp(path), "second");
    EXPECT_FALSE(fs::exists(root / "deep" / "dir" / "file.txt.tmp"));

    auto content = read_file(path);
    ASSERT_TRUE(is_ok(content));
    EXPECT_EQ(unwrap(content), "second");

    auto missing = read_file(root / "nope");
    ASSERT_TRUE(is_err(missing));
    EXPECT_EQ(unwrap_err(missing).kind, StoreErrorKind::Io);
}
