//! # Record JSON
//!
//! Field names follow the on-disk format; see `record_json.hpp`.

#include "store/record_json.hpp"

namespace vcm::store {

using anchor::BlockLine;
using anchor::BlockPayload;
using anchor::CommentRecord;
using anchor::LineFingerprint;
using anchor::Payload;
using anchor::PersistedCommentSet;
using json::JsonError;
using json::JsonValue;

namespace {

JsonValue fingerprint_to_json(const std::optional<LineFingerprint>& fp) {
    return fp ? json::json_string(fp->to_hex()) : json::json_null();
}

JsonValue payload_to_json(const Payload& payload) {
    if (const auto* text = std::get_if<anchor::InlinePayload>(&payload)) {
        return json::json_string(*text);
    }
    JsonValue lines = json::json_array();
    for (const auto& line : std::get<BlockPayload>(payload)) {
        JsonValue entry = json::json_object();
        entry.set("indent", json::json_string(line.indent));
        entry.set("marker", json::json_string(line.marker));
        entry.set("text", json::json_string(line.text));
        entry.set("originalLine", json::json_int(static_cast<int64_t>(line.original_line)));
        lines.push(std::move(entry));
    }
    return lines;
}

// ============================================================================
// Field Readers
// ============================================================================

Result<std::string, JsonError> read_string(const JsonValue& obj, const std::string& key) {
    const auto* value = obj.get(key);
    const auto* str = value ? value->try_as_string() : nullptr;
    if (!str) {
        return JsonError::make("'" + key + "' must be a string");
    }
    return *str;
}

Result<size_t, JsonError> read_count(const JsonValue& obj, const std::string& key) {
    const auto* value = obj.get(key);
    if (!value) {
        return size_t{0};
    }
    auto n = value->try_as_i64();
    if (!n || *n < 0) {
        return JsonError::make("'" + key + "' must be a non-negative integer");
    }
    return static_cast<size_t>(*n);
}

Result<bool, JsonError> read_flag(const JsonValue& obj, const std::string& key) {
    const auto* value = obj.get(key);
    if (!value || value->is_null()) {
        return false;
    }
    auto b = value->try_as_bool();
    if (!b) {
        return JsonError::make("'" + key + "' must be a boolean");
    }
    return *b;
}

Result<LineFingerprint, JsonError> read_fingerprint(const JsonValue& value,
                                                    const std::string& key) {
    const auto* str = value.try_as_string();
    auto fp = str ? LineFingerprint::from_hex(*str) : std::nullopt;
    if (!fp) {
        return JsonError::make("'" + key + "' must be an 8-digit hex fingerprint");
    }
    return *fp;
}

Result<std::optional<LineFingerprint>, JsonError> read_context(const JsonValue& obj,
                                                               const std::string& key) {
    const auto* value = obj.get(key);
    if (!value || value->is_null()) {
        return std::optional<LineFingerprint>();
    }
    auto fp = read_fingerprint(*value, key);
    if (is_err(fp)) {
        return unwrap_err(fp);
    }
    return std::optional<LineFingerprint>(unwrap(fp));
}

Result<Payload, JsonError> read_payload(const JsonValue& value, anchor::RecordKind kind,
                                        const std::string& key) {
    if (kind == anchor::RecordKind::Inline) {
        const auto* text = value.try_as_string();
        if (!text) {
            return JsonError::make("'" + key + "' of an inline comment must be a string");
        }
        return Payload(*text);
    }

    if (!value.is_array()) {
        return JsonError::make("'" + key + "' of a block comment must be an array");
    }
    BlockPayload lines;
    for (const auto& entry : value.as_array()) {
        if (!entry.is_object()) {
            return JsonError::make("block lines must be objects");
        }
        BlockLine line;
        auto indent = read_string(entry, "indent");
        auto marker = read_string(entry, "marker");
        auto text = read_string(entry, "text");
        auto original = read_count(entry, "originalLine");
        if (is_err(indent)) {
            return unwrap_err(indent);
        }
        if (is_err(marker)) {
            return unwrap_err(marker);
        }
        if (is_err(text)) {
            return unwrap_err(text);
        }
        if (is_err(original)) {
            return unwrap_err(original);
        }
        line.indent = std::move(unwrap(indent));
        line.marker = std::move(unwrap(marker));
        line.text = std::move(unwrap(text));
        line.original_line = unwrap(original);
        lines.push_back(std::move(line));
    }
    return Payload(std::move(lines));
}

JsonError in_record(size_t index, const JsonError& error) {
    return JsonError::make("comments[" + std::to_string(index) + "]: " + error.message);
}

} // namespace

// ============================================================================
// Serialization
// ============================================================================

JsonValue record_to_json(const CommentRecord& record) {
    JsonValue obj = json::json_object();
    obj.set("kind", json::json_string(anchor::kind_name(record.kind())));
    obj.set("anchor", json::json_string(record.anchor.to_hex()));
    obj.set("contextPrev", fingerprint_to_json(record.context_prev));
    obj.set("contextNext", fingerprint_to_json(record.context_next));
    obj.set("payload", payload_to_json(record.payload));
    if (record.clean_mode_payload) {
        obj.set("cleanModePayload", payload_to_json(*record.clean_mode_payload));
    }
    if (record.always_visible) {
        obj.set("alwaysVisible", json::json_bool(true));
    }
    if (record.is_block()) {
        obj.set("leadingBlankCount",
                json::json_int(static_cast<int64_t>(record.leading_blank_count)));
        obj.set("trailingBlankCount",
                json::json_int(static_cast<int64_t>(record.trailing_blank_count)));
    }
    obj.set("originalLine", json::json_int(static_cast<int64_t>(record.original_line)));
    return obj;
}

JsonValue set_to_json(const PersistedCommentSet& set) {
    JsonValue comments = json::json_array();
    for (const auto& record : set.records) {
        comments.push(record_to_json(record));
    }
    JsonValue doc = json::json_object();
    doc.set("file", json::json_string(set.file));
    doc.set("lastModified", json::json_string(set.last_modified));
    doc.set("comments", std::move(comments));
    return doc;
}

// ============================================================================
// Deserialization
// ============================================================================

Result<CommentRecord, JsonError> record_from_json(const JsonValue& value, bool is_private) {
    if (!value.is_object()) {
        return JsonError::make("comment must be an object");
    }

    auto kind_str = read_string(value, "kind");
    if (is_err(kind_str)) {
        return unwrap_err(kind_str);
    }
    auto kind = anchor::parse_kind(unwrap(kind_str));
    if (!kind) {
        return JsonError::make("unknown comment kind '" + unwrap(kind_str) + "'");
    }

    const auto* anchor_value = value.get("anchor");
    if (!anchor_value) {
        return JsonError::make("'anchor' is missing");
    }
    auto anchor_fp = read_fingerprint(*anchor_value, "anchor");
    if (is_err(anchor_fp)) {
        return unwrap_err(anchor_fp);
    }

    CommentRecord record;
    record.anchor = unwrap(anchor_fp);
    record.is_private = is_private;

    auto prev = read_context(value, "contextPrev");
    if (is_err(prev)) {
        return unwrap_err(prev);
    }
    auto next = read_context(value, "contextNext");
    if (is_err(next)) {
        return unwrap_err(next);
    }
    record.context_prev = unwrap(prev);
    record.context_next = unwrap(next);

    const auto* payload_value = value.get("payload");
    if (!payload_value) {
        return JsonError::make("'payload' is missing");
    }
    auto payload = read_payload(*payload_value, *kind, "payload");
    if (is_err(payload)) {
        return unwrap_err(payload);
    }
    record.payload = std::move(unwrap(payload));

    if (const auto* clean = value.get("cleanModePayload"); clean && !clean->is_null()) {
        auto clean_payload = read_payload(*clean, *kind, "cleanModePayload");
        if (is_err(clean_payload)) {
            return unwrap_err(clean_payload);
        }
        record.clean_mode_payload = std::move(unwrap(clean_payload));
    }

    auto always = read_flag(value, "alwaysVisible");
    auto leading = read_count(value, "leadingBlankCount");
    auto trailing = read_count(value, "trailingBlankCount");
    auto original = read_count(value, "originalLine");
    if (is_err(always)) {
        return unwrap_err(always);
    }
    if (is_err(leading)) {
        return unwrap_err(leading);
    }
    if (is_err(trailing)) {
        return unwrap_err(trailing);
    }
    if (is_err(original)) {
        return unwrap_err(original);
    }
    record.always_visible = unwrap(always);
    record.leading_blank_count = unwrap(leading);
    record.trailing_blank_count = unwrap(trailing);
    record.original_line = unwrap(original);
    return record;
}

Result<PersistedCommentSet, JsonError> set_from_json(const JsonValue& value, bool is_private) {
    if (!value.is_object()) {
        return JsonError::make("comment set must be an object");
    }

    PersistedCommentSet set;
    auto file = read_string(value, "file");
    if (is_err(file)) {
        return unwrap_err(file);
    }
    set.file = std::move(unwrap(file));

    if (const auto* modified = value.get("lastModified")) {
        if (const auto* str = modified->try_as_string()) {
            set.last_modified = *str;
        }
    }

    const auto* comments = value.get("comments");
    if (!comments || !comments->is_array()) {
        return JsonError::make("'comments' must be an array");
    }
    const auto& entries = comments->as_array();
    set.records.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        auto record = record_from_json(entries[i], is_private);
        if (is_err(record)) {
            return in_record(i, unwrap_err(record));
        }
        set.records.push_back(std::move(unwrap(record)));
    }
    return set;
}

Result<PersistedCommentSet, JsonError> parse_comment_set(std::string_view text, bool is_private) {
    auto parsed = json::parse_json(text);
    if (is_err(parsed)) {
        return unwrap_err(parsed);
    }
    return set_from_json(unwrap(parsed), is_private);
}

} // namespace vcm::store
