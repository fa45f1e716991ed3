//! # Comment Records
//!
//! The unit that is extracted from text, persisted and injected back.
//!
//! A record is either a **block** (whole-line comments above a code line,
//! kept line by line with their exact indentation and marker) or an
//! **inline** comment (the verbatim tail of a code line, starting at the
//! whitespace gap). Both are attached to their code line by the line's
//! fingerprint, its *anchor*, plus the fingerprints of the nearest code
//! lines around it for telling duplicate anchors apart.
//!
//! `payload` is the comment as last seen in the commented view.
//! `clean_mode_payload` collects comments typed while the view was clean;
//! it is merged in front of `payload` when the view returns to commented.

#ifndef VCM_ANCHOR_RECORD_HPP
#define VCM_ANCHOR_RECORD_HPP

#include "anchor/fingerprint.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace vcm::anchor {

enum class RecordKind : uint8_t { Block, Inline };

[[nodiscard]] const char* kind_name(RecordKind kind);

[[nodiscard]] std::optional<RecordKind> parse_kind(std::string_view name);

/// One physical line of a block comment.
///
/// Blank lines inside a block are kept as spacers: empty `marker`, the
/// verbatim blank line in `text`.
struct BlockLine {
    std::string indent;
    std::string marker;
    std::string text;
    size_t original_line = 0;

    bool operator==(const BlockLine& other) const = default;

    [[nodiscard]] std::string raw() const {
        return indent + marker + text;
    }

    [[nodiscard]] bool is_spacer() const {
        return marker.empty();
    }
};

using BlockPayload = std::vector<BlockLine>;
using InlinePayload = std::string;
using Payload = std::variant<BlockPayload, InlinePayload>;

struct CommentRecord {
    LineFingerprint anchor;
    std::optional<LineFingerprint> context_prev;
    std::optional<LineFingerprint> context_next;
    Payload payload;
    std::optional<Payload> clean_mode_payload;
    bool always_visible = false;
    bool is_private = false;
    size_t leading_blank_count = 0;  ///< Block only
    size_t trailing_blank_count = 0; ///< Block only
    size_t original_line = 0;        ///< First comment line (block) or the code line (inline)

    bool operator==(const CommentRecord& other) const = default;

    [[nodiscard]] RecordKind kind() const {
        return payload.index() == 0 ? RecordKind::Block : RecordKind::Inline;
    }

    [[nodiscard]] bool is_block() const {
        return kind() == RecordKind::Block;
    }

    [[nodiscard]] bool is_inline() const {
        return kind() == RecordKind::Inline;
    }

    [[nodiscard]] const BlockPayload& block() const {
        return std::get<BlockPayload>(payload);
    }

    [[nodiscard]] const InlinePayload& inline_text() const {
        return std::get<InlinePayload>(payload);
    }

    [[nodiscard]] bool has_payload() const;

    [[nodiscard]] bool has_clean_mode_payload() const;

    /// Visible in the clean view: always-visible shared records, and private
    /// records while private comments are shown.
    [[nodiscard]] bool visible_when_clean(bool private_visible) const {
        return is_private ? private_visible : always_visible;
    }
};

/// Empty payload of the given kind.
[[nodiscard]] Payload empty_payload(RecordKind kind);

[[nodiscard]] bool payload_empty(const Payload& payload);

/// Verbatim text: block lines joined with `\n`, or the inline tail.
[[nodiscard]] std::string payload_text(const Payload& payload);

/// Text of the first real comment line, trimmed. Used to probe whether a
/// record is physically present in a text.
[[nodiscard]] std::string payload_probe(const Payload& payload);

/// All comments of one source file.
struct PersistedCommentSet {
    std::string file;          ///< Workspace-relative path, forward slashes
    std::string last_modified; ///< ISO-8601 UTC, stamped by the store
    std::vector<CommentRecord> records;

    bool operator==(const PersistedCommentSet& other) const = default;

    [[nodiscard]] bool empty() const {
        return records.empty();
    }

    [[nodiscard]] std::vector<CommentRecord> shared_records() const;

    [[nodiscard]] std::vector<CommentRecord> private_records() const;

    [[nodiscard]] size_t private_count() const;
};

} // namespace vcm::anchor

#endif // VCM_ANCHOR_RECORD_HPP
