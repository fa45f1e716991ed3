//! # Comment Store
//!
//! Per-file persistence of comment sets under the workspace root:
//!
//! ```text
//! <root>/<storage>/shared/<rel>.vcm.json    shared partition
//! <root>/<storage>/private/<rel>.vcm.json   private partition
//! ```
//!
//! A set is split at save time by `is_private` and joined again at load
//! time. Files are written to a temporary sibling and renamed into place, so
//! a reader never sees half a document.

#ifndef VCM_STORE_COMMENT_STORE_HPP
#define VCM_STORE_COMMENT_STORE_HPP

#include "anchor/record.hpp"
#include "common.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace vcm::store {

namespace fs = std::filesystem;

enum class StoreErrorKind : uint8_t {
    NotFound,  ///< Neither partition exists
    Malformed, ///< A partition exists but does not parse
    Io         ///< Read, write or delete failed
};

struct StoreError {
    StoreErrorKind kind;
    std::string message;

    [[nodiscard]] std::string to_string() const;
};

/// Default storage directory under the workspace root.
inline constexpr const char* DEFAULT_STORAGE_DIR = ".vcm";

class CommentStore {
public:
    explicit CommentStore(fs::path root, std::string storage_dir = DEFAULT_STORAGE_DIR);

    [[nodiscard]] const fs::path& root() const {
        return root_;
    }

    [[nodiscard]] fs::path storage_root() const {
        return root_ / storage_dir_;
    }

    [[nodiscard]] fs::path shared_path(const std::string& rel) const;
    [[nodiscard]] fs::path private_path(const std::string& rel) const;

    /// Workspace-relative form of `file` with forward slashes. Paths outside
    /// the root are returned as given.
    [[nodiscard]] std::string relative_path(const fs::path& file) const;

    [[nodiscard]] bool exists(const std::string& rel) const;

    /// Both partitions joined, shared records first.
    [[nodiscard]] Result<anchor::PersistedCommentSet, StoreError> load(const std::string& rel) const;

    /// Writes the shared partition, and the private one when it has records
    /// or already exists. Stamps `last_modified` on success.
    Result<bool, StoreError> save(anchor::PersistedCommentSet& set) const;

    /// Deletes both partitions. Returns false when there was nothing to delete.
    Result<bool, StoreError> remove(const std::string& rel) const;

private:
    fs::path root_;
    std::string storage_dir_;

    [[nodiscard]] fs::path partition_path(const char* partition, const std::string& rel) const;
};

/// Current UTC time as ISO-8601, e.g. "2026-01-01T00:00:00Z".
[[nodiscard]] std::string utc_timestamp();

/// Writes `content` to a temporary sibling of `path` and renames it over
/// `path`, creating parent directories as needed.
Result<bool, StoreError> write_file_atomic(const fs::path& path, const std::string& content);

[[nodiscard]] Result<std::string, StoreError> read_file(const fs::path& path);

} // namespace vcm::store

#endif // VCM_STORE_COMMENT_STORE_HPP
