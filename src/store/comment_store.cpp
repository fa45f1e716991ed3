//! # Comment Store
//!
//! Partitioned JSON files with atomic replacement. A malformed partition is
//! reported, never overwritten here: callers decide whether to start over.

#include "store/comment_store.hpp"

#include "log/log.hpp"
#include "store/record_json.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace vcm::store {

using anchor::PersistedCommentSet;

namespace {

constexpr const char* FILE_SUFFIX = ".vcm.json";

const char* error_kind_name(StoreErrorKind kind) {
    switch (kind) {
    case StoreErrorKind::NotFound:
        return "not found";
    case StoreErrorKind::Malformed:
        return "malformed";
    case StoreErrorKind::Io:
        return "I/O error";
    }
    return "unknown";
}

StoreError io_error(const std::string& what, const fs::path& path, const std::error_code& ec) {
    return StoreError{StoreErrorKind::Io,
                      what + " " + path.string() + (ec ? ": " + ec.message() : std::string())};
}

/// Reads one partition. Ok(nullopt) when the file does not exist.
Result<std::optional<PersistedCommentSet>, StoreError> load_partition(const fs::path& path,
                                                                      bool is_private) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::optional<PersistedCommentSet>();
    }
    auto content = read_file(path);
    if (is_err(content)) {
        return unwrap_err(content);
    }
    auto parsed = parse_comment_set(unwrap(content), is_private);
    if (is_err(parsed)) {
        return StoreError{StoreErrorKind::Malformed,
                          path.string() + ": " + unwrap_err(parsed).to_string()};
    }
    return std::optional<PersistedCommentSet>(std::move(unwrap(parsed)));
}

std::string render(const PersistedCommentSet& set, std::vector<anchor::CommentRecord> records) {
    PersistedCommentSet part;
    part.file = set.file;
    part.last_modified = set.last_modified;
    part.records = std::move(records);
    return set_to_json(part).to_string_pretty() + "\n";
}

} // namespace

std::string StoreError::to_string() const {
    return std::string(error_kind_name(kind)) + ": " + message;
}

// ============================================================================
// File Helpers
// ============================================================================

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

Result<std::string, StoreError> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return io_error("cannot open", path, {});
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return io_error("cannot read", path, {});
    }
    return buffer.str();
}

Result<bool, StoreError> write_file_atomic(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return io_error("cannot create directory for", path, ec);
        }
    }

    auto temp_file = path;
    temp_file += ".tmp";
    {
        std::ofstream out(temp_file, std::ios::binary | std::ios::trunc);
        if (!out) {
            return io_error("cannot open", temp_file, {});
        }
        out << content;
        out.flush();
        if (!out.good()) {
            fs::remove(temp_file, ec);
            return io_error("cannot write", temp_file, {});
        }
    }

    fs::rename(temp_file, path, ec);
    if (ec) {
        // Fallback: copy + remove
        std::error_code copy_ec;
        fs::copy_file(temp_file, path, fs::copy_options::overwrite_existing, copy_ec);
        std::error_code remove_ec;
        fs::remove(temp_file, remove_ec);
        if (copy_ec) {
            return io_error("cannot replace", path, copy_ec);
        }
    }
    return true;
}

// ============================================================================
// CommentStore
// ============================================================================

CommentStore::CommentStore(fs::path root, std::string storage_dir)
    : root_(std::move(root)), storage_dir_(std::move(storage_dir)) {}

fs::path CommentStore::partition_path(const char* partition, const std::string& rel) const {
    return storage_root() / partition / fs::path(rel + FILE_SUFFIX);
}

fs::path CommentStore::shared_path(const std::string& rel) const {
    return partition_path("shared", rel);
}

fs::path CommentStore::private_path(const std::string& rel) const {
    return partition_path("private", rel);
}

std::string CommentStore::relative_path(const fs::path& file) const {
    std::error_code ec;
    auto absolute_root = fs::weakly_canonical(fs::absolute(root_, ec), ec);
    auto absolute_file = fs::weakly_canonical(fs::absolute(file, ec), ec);
    auto rel = absolute_file.lexically_relative(absolute_root);
    if (ec || rel.empty() || rel.begin()->string() == "..") {
        return file.generic_string();
    }
    return rel.generic_string();
}

bool CommentStore::exists(const std::string& rel) const {
    std::error_code ec;
    return fs::exists(shared_path(rel), ec) || fs::exists(private_path(rel), ec);
}

Result<PersistedCommentSet, StoreError> CommentStore::load(const std::string& rel) const {
    auto shared = load_partition(shared_path(rel), false);
    if (is_err(shared)) {
        return unwrap_err(shared);
    }
    auto priv = load_partition(private_path(rel), true);
    if (is_err(priv)) {
        return unwrap_err(priv);
    }

    auto& shared_set = unwrap(shared);
    auto& private_set = unwrap(priv);
    if (!shared_set && !private_set) {
        return StoreError{StoreErrorKind::NotFound, "no stored comments for " + rel};
    }

    PersistedCommentSet set;
    set.file = rel;
    if (shared_set) {
        set.last_modified = shared_set->last_modified;
        set.records = std::move(shared_set->records);
    }
    if (private_set) {
        if (private_set->last_modified > set.last_modified) {
            set.last_modified = private_set->last_modified;
        }
        for (auto& record : private_set->records) {
            set.records.push_back(std::move(record));
        }
        // Partitions are merged back into document order
        std::stable_sort(set.records.begin(), set.records.end(),
                         [](const anchor::CommentRecord& a, const anchor::CommentRecord& b) {
                             return a.original_line < b.original_line;
                         });
    }

    VCM_LOG_DEBUG("store", "Loaded " << set.records.size() << " records for " << rel);
    return set;
}

Result<bool, StoreError> CommentStore::save(PersistedCommentSet& set) const {
    auto stamp = utc_timestamp();
    PersistedCommentSet stamped = set;
    stamped.last_modified = stamp;

    auto shared = set.shared_records();
    auto priv = set.private_records();

    auto written = write_file_atomic(shared_path(set.file), render(stamped, shared));
    if (is_err(written)) {
        VCM_LOG_ERROR("store", unwrap_err(written).to_string());
        return written;
    }

    std::error_code ec;
    auto private_file = private_path(set.file);
    if (!priv.empty() || fs::exists(private_file, ec)) {
        written = write_file_atomic(private_file, render(stamped, priv));
        if (is_err(written)) {
            VCM_LOG_ERROR("store", unwrap_err(written).to_string());
            return written;
        }
    }

    set.last_modified = stamp;
    VCM_LOG_INFO("store", "Wrote " << shared.size() << " shared and " << priv.size()
                                   << " private records for " << set.file);
    return true;
}

Result<bool, StoreError> CommentStore::remove(const std::string& rel) const {
    bool removed = false;
    for (const auto& path : {shared_path(rel), private_path(rel)}) {
        std::error_code ec;
        bool existed = fs::remove(path, ec);
        if (ec) {
            return io_error("cannot delete", path, ec);
        }
        removed = removed || existed;
    }
    if (removed) {
        VCM_LOG_INFO("store", "Removed stored comments for " << rel);
    }
    return removed;
}

} // namespace vcm::store
