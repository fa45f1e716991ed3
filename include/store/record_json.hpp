//! # Record JSON
//!
//! Conversion between `PersistedCommentSet` and the on-disk JSON document.
//!
//! ```json
//! {
//!   "file": "src/app.py",
//!   "lastModified": "2026-01-01T00:00:00Z",
//!   "comments": [
//!     {"kind": "inline", "anchor": "1a2b3c4d", "contextPrev": null,
//!      "contextNext": "9f8e7d6c", "payload": "  # note", "originalLine": 4}
//!   ]
//! }
//! ```
//!
//! `isPrivate` is not part of the document: the store decides it by the
//! partition a file was read from.

#ifndef VCM_STORE_RECORD_JSON_HPP
#define VCM_STORE_RECORD_JSON_HPP

#include "anchor/record.hpp"
#include "common.hpp"
#include "json/json.hpp"

namespace vcm::store {

[[nodiscard]] json::JsonValue record_to_json(const anchor::CommentRecord& record);

[[nodiscard]] json::JsonValue set_to_json(const anchor::PersistedCommentSet& set);

/// Validates shape and field types; every record gets `is_private`.
[[nodiscard]] Result<anchor::CommentRecord, json::JsonError>
record_from_json(const json::JsonValue& value, bool is_private);

[[nodiscard]] Result<anchor::PersistedCommentSet, json::JsonError>
set_from_json(const json::JsonValue& value, bool is_private);

/// Parses and converts a whole document.
[[nodiscard]] Result<anchor::PersistedCommentSet, json::JsonError>
parse_comment_set(std::string_view text, bool is_private);

} // namespace vcm::store

#endif // VCM_STORE_RECORD_JSON_HPP
